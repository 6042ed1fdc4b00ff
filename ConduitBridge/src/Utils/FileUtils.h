#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "Result.h"

namespace Conduit::Utils {

// Read text file
Result<std::string> ReadTextFile(const std::filesystem::path& path);

// Write (truncate) a text file; the parent directory must already exist
Result<void> WriteTextFile(const std::filesystem::path& path, const std::string& content);

// Create a directory and any missing parents
Result<void> CreateDirectories(const std::filesystem::path& path);

// Check if file exists
bool FileExists(const std::filesystem::path& path);

bool DirectoryExists(const std::filesystem::path& path);

// Recursively collect regular files whose extension matches (case-insensitive)
Result<std::vector<std::filesystem::path>> ListFilesWithExtension(const std::filesystem::path& directory,
                                                                  const std::string& extension);

} // namespace Conduit::Utils
