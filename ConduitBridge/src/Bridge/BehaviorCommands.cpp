#include "BehaviorCommands.h"
#include "CommandBinding.h"
#include "Utils/FileUtils.h"
#include "Utils/StringUtils.h"
#include <algorithm>
#include <filesystem>
#include <optional>

using json = nlohmann::json;

namespace Conduit::Bridge {

namespace {

// "Scripts/Spin.lua" -> "Spin"
std::string ComponentNameOf(const std::string& behaviorName, const std::string& extension) {
    std::string slashed = behaviorName;
    std::replace(slashed.begin(), slashed.end(), '\\', '/');
    std::string name = std::filesystem::path(slashed).filename().string();
    if (name.size() > extension.size() &&
        Utils::EqualsIgnoreCase(std::string_view(name).substr(name.size() - extension.size()), extension)) {
        name.resize(name.size() - extension.size());
    }
    return name;
}

std::optional<Assets::AssetPath> FindScript(BridgeContext& ctx, const std::string& behaviorPath,
                                            const std::string& componentName) {
    if (!behaviorPath.empty()) {
        auto path = ctx.paths.Normalize(behaviorPath);
        if (Utils::FileExists(path.physical)) {
            return path;
        }
        if (path.physical.extension().empty()) {
            auto withExt = ctx.paths.Normalize(path.logical + ctx.scriptExtension);
            if (Utils::FileExists(withExt.physical)) {
                return withExt;
            }
        }
    }

    auto scripts = Utils::ListFilesWithExtension(ctx.paths.RootDirectory(), ctx.scriptExtension);
    if (scripts.IsErr()) {
        return std::nullopt;
    }
    const std::string wanted = componentName + ctx.scriptExtension;
    for (const auto& p : scripts.Value()) {
        if (Utils::EqualsIgnoreCase(p.filename().string(), wanted)) {
            return ctx.paths.Normalize(ctx.paths.ToLogical(p));
        }
    }
    return std::nullopt;
}

} // namespace

Result<json> AttachBehavior(BridgeContext& ctx, const AttachBehaviorCommand& cmd) {
    auto entity = ctx.scene.FindObject(cmd.targetName);
    if (!entity) {
        return Result<json>::Err(ErrorCode::NotFound, "Object '" + cmd.targetName + "' not found");
    }

    const std::string componentName = ComponentNameOf(cmd.behaviorName, ctx.scriptExtension);
    if (componentName.empty()) {
        return Result<json>::Err(ErrorCode::InvalidName, "Invalid behavior name '" + cmd.behaviorName + "'");
    }

    Scene::BehaviorInstance instance;
    if (const auto* factory = ctx.behaviors.Find(componentName)) {
        instance = (*factory)();
    } else {
        auto script = FindScript(ctx, cmd.behaviorPath, componentName);
        if (!script) {
            std::string registered;
            for (const auto& n : ctx.behaviors.GetNames()) {
                registered += registered.empty() ? n : ", " + n;
            }
            return Result<json>::Err(ErrorCode::NotFound,
                                     "Behavior '" + componentName + "' not found",
                                     "no script asset with that name; registered: " + registered);
        }
        instance.name = componentName;
        instance.source = script->logical;
    }

    if (ctx.scene.HasBehavior(*entity, instance.name)) {
        return Result<json>::Ok(json{
            {"componentName", instance.name},
            {"alreadyAttached", true}
        });
    }

    json data{
        {"componentName", instance.name},
        {"alreadyAttached", false},
        {"source", instance.source}
    };
    ctx.scene.AddBehavior(*entity, std::move(instance));
    spdlog::info("Attached behavior {} to '{}'", data["componentName"].get<std::string>(), cmd.targetName);
    return Result<json>::Ok(std::move(data));
}

void RegisterBehaviorCommands(CommandRouter& router, BridgeContext& ctx) {
    router.Register("attach-behavior",
                    BindCommand<AttachBehaviorCommand>(ctx, &CommandDecoder::AttachBehavior, &AttachBehavior),
                    "Attach a built-in or scripted behavior to an object");
}

} // namespace Conduit::Bridge
