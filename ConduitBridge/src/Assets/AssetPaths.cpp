#include "AssetPaths.h"
#include "Utils/FileUtils.h"
#include "Utils/StringUtils.h"
#include <algorithm>
#include <vector>

namespace Conduit::Assets {

namespace {

std::vector<std::string> SplitSegments(std::string_view path) {
    std::vector<std::string> segments;
    std::string current;
    auto flush = [&]() {
        // Drive letters and stream names would re-root the physical path
        if (current.empty() || current == "." || current.find(':') != std::string::npos) {
            // skip
        } else if (current == "..") {
            if (!segments.empty()) {
                segments.pop_back();
            }
        } else {
            segments.push_back(current);
        }
        current.clear();
    };

    for (char c : path) {
        if (c == '/' || c == '\\') {
            flush();
        } else {
            current.push_back(c);
        }
    }
    flush();
    return segments;
}

} // namespace

std::string AssetPath::FileName() const {
    auto pos = logical.find_last_of('/');
    return pos == std::string::npos ? logical : logical.substr(pos + 1);
}

std::string AssetPath::ParentLogical() const {
    auto pos = logical.find_last_of('/');
    return pos == std::string::npos ? logical : logical.substr(0, pos);
}

AssetPaths::AssetPaths(std::string rootName, std::filesystem::path rootDirectory)
    : m_rootName(std::move(rootName))
    , m_rootDirectory(std::move(rootDirectory)) {
    // The root name itself must be a single segment
    auto segments = SplitSegments(m_rootName);
    m_rootName = segments.empty() ? std::string("Assets") : segments.front();
}

AssetPath AssetPaths::Normalize(std::string_view userPath) const {
    auto segments = SplitSegments(userPath);

    auto firstKept = std::find_if(segments.begin(), segments.end(), [&](const std::string& s) {
        return !Utils::EqualsIgnoreCase(s, m_rootName);
    });

    AssetPath result;
    result.logical = m_rootName;
    result.physical = m_rootDirectory;
    for (auto it = firstKept; it != segments.end(); ++it) {
        if (!result.relative.empty()) {
            result.relative.push_back('/');
        }
        result.relative += *it;
        result.physical /= *it;
    }
    if (!result.relative.empty()) {
        result.logical += "/" + result.relative;
    }
    return result;
}

AssetPath AssetPaths::Join(std::string_view folder, std::string_view fileName) const {
    std::string combined(folder);
    combined.push_back('/');
    combined += fileName;
    return Normalize(combined);
}

std::string AssetPaths::ToLogical(const std::filesystem::path& physical) const {
    auto rel = physical.lexically_normal().lexically_relative(m_rootDirectory.lexically_normal());
    if (rel.empty() || rel == ".") {
        return m_rootName;
    }
    return Normalize(rel.generic_string()).logical;
}

Result<void> AssetPaths::EnsureDirectory(const AssetPath& folder) const {
    if (Utils::DirectoryExists(folder.physical)) {
        return Result<void>::Ok();
    }
    auto created = Utils::CreateDirectories(folder.physical);
    if (created.IsErr()) {
        const auto& err = created.Error();
        return Result<void>::Err(ErrorCode::DirectoryCreateFailed,
                                 "Failed to create folder " + folder.logical,
                                 err.detail.empty() ? err.message : err.detail);
    }
    return Result<void>::Ok();
}

Result<void> AssetPaths::EnsureParentDirectory(const AssetPath& file) const {
    return EnsureDirectory(Normalize(file.ParentLogical()));
}

} // namespace Conduit::Assets
