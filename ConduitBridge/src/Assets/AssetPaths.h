#pragma once

#include <string>
#include <string_view>
#include <filesystem>
#include "Utils/Result.h"

namespace Conduit::Assets {

// A user-supplied asset path in both of its canonical forms.
struct AssetPath {
    std::string logical;            // "<root>/<relative>", forward slashes
    std::string relative;           // portion after the root prefix, may be empty
    std::filesystem::path physical; // root directory joined with relative

    bool IsRoot() const { return relative.empty(); }
    // Last path segment, or the root name for the root itself
    std::string FileName() const;
    // Logical path of the containing folder (the root is its own parent)
    std::string ParentLogical() const;
};

// Maps user paths (any slash style, with or without the root prefix) onto
// the project's asset root.
//
// Normalization is lexical: backslashes become '/', empty and "." segments
// are dropped, ".." removes the previous segment and is clamped at the root,
// and any run of leading root-name segments (case-insensitive) collapses to
// a single canonical prefix. The result is idempotent.
class AssetPaths {
public:
    AssetPaths(std::string rootName, std::filesystem::path rootDirectory);

    [[nodiscard]] AssetPath Normalize(std::string_view userPath) const;

    // Normalize "<folder>/<fileName>"
    [[nodiscard]] AssetPath Join(std::string_view folder, std::string_view fileName) const;

    // Logical form of a filesystem path located under the root directory
    [[nodiscard]] std::string ToLogical(const std::filesystem::path& physical) const;

    // Create the directory (and parents) backing a logical folder path
    Result<void> EnsureDirectory(const AssetPath& folder) const;
    Result<void> EnsureParentDirectory(const AssetPath& file) const;

    const std::string& RootName() const { return m_rootName; }
    const std::filesystem::path& RootDirectory() const { return m_rootDirectory; }

private:
    std::string m_rootName;
    std::filesystem::path m_rootDirectory;
};

} // namespace Conduit::Assets
