#include "TextAssetCommands.h"
#include "CommandBinding.h"
#include "Utils/FileUtils.h"
#include "Utils/PayloadCodec.h"
#include "Utils/StringUtils.h"
#include <algorithm>
#include <sstream>
#include <vector>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace Conduit::Bridge {

namespace {

// Split "A.B.C" into identifiers; empty result when any part is invalid
std::vector<std::string> SplitNamespace(const std::string& ns) {
    std::vector<std::string> parts;
    std::string current;
    std::istringstream stream(ns);
    while (std::getline(stream, current, '.')) {
        if (!Utils::IsIdentifier(current)) {
            return {};
        }
        parts.push_back(current);
    }
    if (!ns.empty() && ns.back() == '.') {
        return {};
    }
    return parts;
}

} // namespace

std::string GenerateScriptSkeleton(const std::string& name, const std::string& kind,
                                   const std::string& namespaceName) {
    const std::string lowered = Utils::ToLowerCopy(kind);
    std::ostringstream out;

    out << "local " << name << " = {}\n";

    if (lowered.empty() || lowered == "behavior") {
        out << "\n"
            << "-- Called once when the behavior is attached\n"
            << "function " << name << ":OnStart()\n"
            << "end\n"
            << "\n"
            << "-- Called every frame\n"
            << "function " << name << ":OnUpdate(dt)\n"
            << "end\n";
    } else if (lowered == "editortool") {
        out << "\n"
            << "function " << name << ":OnGUI()\n"
            << "end\n"
            << "\n"
            << "function " << name << ":OnSelectionChanged(selection)\n"
            << "end\n";
    }

    const auto parts = SplitNamespace(namespaceName);
    if (!parts.empty()) {
        out << "\n";
        std::string prefix;
        for (const auto& part : parts) {
            prefix = prefix.empty() ? part : prefix + "." + part;
            out << prefix << " = " << prefix << " or {}\n";
        }
        out << prefix << "." << name << " = " << name << "\n";
    }

    out << "\nreturn " << name << "\n";
    return out.str();
}

Result<json> ViewTextAsset(BridgeContext& ctx, const ViewTextAssetCommand& cmd) {
    const auto path = ctx.paths.Normalize(cmd.path);

    if (!Utils::FileExists(path.physical)) {
        if (cmd.requireExists) {
            return Result<json>::Err(ErrorCode::NotFound, "Text asset not found: " + path.logical);
        }
        return Result<json>::Ok(json{{"exists", false}, {"path", path.logical}});
    }

    auto text = Utils::ReadTextFile(path.physical);
    if (text.IsErr()) {
        return Result<json>::Err(text.Error());
    }

    auto record = Utils::EncodeIfLarge(std::move(text.Value()));
    json data{
        {"exists", true},
        {"path", path.logical},
        {"contentEncoded", record.isEncoded}
    };
    data[record.isEncoded ? "encodedContent" : "content"] = std::move(record.payload);
    return Result<json>::Ok(std::move(data));
}

Result<json> CreateTextAsset(BridgeContext& ctx, const CreateTextAssetCommand& cmd) {
    if (!Utils::IsIdentifier(cmd.name)) {
        return Result<json>::Err(ErrorCode::InvalidName,
                                 "Invalid name '" + cmd.name + "'",
                                 "use letters, digits and underscores, not starting with a digit");
    }
    if (!cmd.namespaceName.empty() && SplitNamespace(cmd.namespaceName).empty()) {
        return Result<json>::Err(ErrorCode::InvalidName,
                                 "Invalid namespace '" + cmd.namespaceName + "'",
                                 "expected dot-separated identifiers");
    }

    // The asset root itself is never a script folder
    auto folder = ctx.paths.Normalize(cmd.folder.empty() ? ctx.scriptsFolder : cmd.folder);
    if (folder.IsRoot()) {
        folder = ctx.paths.Normalize(ctx.scriptsFolder);
    }
    const auto file = ctx.paths.Join(folder.logical, cmd.name + ctx.scriptExtension);

    if (Utils::FileExists(file.physical) && !cmd.overwrite) {
        return Result<json>::Err(ErrorCode::AlreadyExists,
                                 "Text asset already exists: " + file.logical,
                                 "pass overwrite=true to replace it");
    }

    auto dir = ctx.paths.EnsureDirectory(folder);
    if (dir.IsErr()) {
        return Result<json>::Err(dir.Error());
    }

    const std::string content = cmd.content.empty()
        ? GenerateScriptSkeleton(cmd.name, cmd.kind, cmd.namespaceName)
        : cmd.content;

    auto written = Utils::WriteTextFile(file.physical, content);
    if (written.IsErr()) {
        return Result<json>::Err(written.Error());
    }

    spdlog::info("Created text asset {}", file.logical);
    return Result<json>::Ok(json{{"path", file.logical}});
}

Result<json> UpdateTextAsset(BridgeContext& ctx, const UpdateTextAssetCommand& cmd) {
    const auto file = ctx.paths.Normalize(cmd.path);
    if (file.IsRoot()) {
        return Result<json>::Err(ErrorCode::InvalidName, "Path does not name a file: " + cmd.path);
    }

    const auto folder = ctx.paths.Normalize(file.ParentLogical());
    if (!Utils::DirectoryExists(folder.physical)) {
        if (!cmd.createFolderIfMissing) {
            return Result<json>::Err(ErrorCode::NotFound, "Folder does not exist: " + folder.logical);
        }
        // A missing folder holds no file; refuse before creating anything
        if (!cmd.createIfMissing) {
            return Result<json>::Err(ErrorCode::NotFound, "Text asset not found: " + file.logical,
                                     "createIfMissing is false");
        }
        auto dir = ctx.paths.EnsureDirectory(folder);
        if (dir.IsErr()) {
            return Result<json>::Err(dir.Error());
        }
    }

    const bool existed = Utils::FileExists(file.physical);
    if (!existed && !cmd.createIfMissing) {
        return Result<json>::Err(ErrorCode::NotFound, "Text asset not found: " + file.logical);
    }

    auto written = Utils::WriteTextFile(file.physical, cmd.content);
    if (written.IsErr()) {
        return Result<json>::Err(written.Error());
    }

    spdlog::info("{} text asset {}", existed ? "Updated" : "Created", file.logical);
    return Result<json>::Ok(json{{"path", file.logical}, {"created", !existed}});
}

Result<json> ListTextAssets(BridgeContext& ctx, const ListTextAssetsCommand& cmd) {
    const auto folder = ctx.paths.Normalize(cmd.folderPath);

    auto files = Utils::ListFilesWithExtension(folder.physical, ctx.scriptExtension);
    if (files.IsErr()) {
        return Result<json>::Err(ErrorCode::NotFound, "Folder not found: " + folder.logical,
                                 files.Error().detail);
    }

    std::vector<std::string> logical;
    logical.reserve(files.Value().size());
    for (const auto& p : files.Value()) {
        logical.push_back(ctx.paths.ToLogical(p));
    }
    std::sort(logical.begin(), logical.end());

    return Result<json>::Ok(json{{"folder", folder.logical}, {"paths", logical}});
}

void RegisterTextAssetCommands(CommandRouter& router, BridgeContext& ctx) {
    router.Register("view-text-asset",
                    BindCommand<ViewTextAssetCommand>(ctx, &CommandDecoder::ViewTextAsset, &ViewTextAsset),
                    "Read a text asset; large content is returned base64-encoded");
    router.Register("create-text-asset",
                    BindCommand<CreateTextAssetCommand>(ctx, &CommandDecoder::CreateTextAsset, &CreateTextAsset),
                    "Create a script asset, generating a skeleton when no content is given");
    router.Register("update-text-asset",
                    BindCommand<UpdateTextAssetCommand>(ctx, &CommandDecoder::UpdateTextAsset, &UpdateTextAsset),
                    "Replace the content of a text asset");
    router.Register("list-text-assets",
                    BindCommand<ListTextAssetsCommand>(ctx, &CommandDecoder::ListTextAssets, &ListTextAssets),
                    "List script assets under a folder");
}

} // namespace Conduit::Bridge
