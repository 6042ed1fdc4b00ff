#include "FileUtils.h"
#include "StringUtils.h"
#include <fstream>
#include <algorithm>
#include <system_error>
#include <spdlog/spdlog.h>

namespace Conduit::Utils {

Result<std::string> ReadTextFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);

    if (!file.is_open()) {
        return Result<std::string>::Err(ErrorCode::NotFound, "Failed to open file: " + path.string());
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());

    if (file.bad()) {
        return Result<std::string>::Err(ErrorCode::Unknown, "Failed to read file: " + path.string());
    }

    return Result<std::string>::Ok(std::move(content));
}

Result<void> WriteTextFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);

    if (!file.is_open()) {
        return Result<void>::Err(ErrorCode::WriteFailed, "Failed to open file for writing: " + path.string());
    }

    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.flush();
    if (!file) {
        return Result<void>::Err(ErrorCode::WriteFailed, "Failed to write file: " + path.string());
    }

    spdlog::debug("Wrote {} bytes to {}", content.size(), path.string());
    return Result<void>::Ok();
}

Result<void> CreateDirectories(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) {
        return Result<void>::Err(ErrorCode::DirectoryCreateFailed,
                                 "Failed to create directory: " + path.string(), ec.message());
    }
    // create_directories reports success without creating anything when a
    // regular file already occupies the path.
    if (!std::filesystem::is_directory(path, ec)) {
        return Result<void>::Err(ErrorCode::DirectoryCreateFailed,
                                 "Failed to create directory: " + path.string(),
                                 "path exists and is not a directory");
    }
    return Result<void>::Ok();
}

bool FileExists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

bool DirectoryExists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_directory(path, ec);
}

Result<std::vector<std::filesystem::path>> ListFilesWithExtension(const std::filesystem::path& directory,
                                                                  const std::string& extension) {
    using PathList = std::vector<std::filesystem::path>;
    if (!DirectoryExists(directory)) {
        return Result<PathList>::Err(ErrorCode::NotFound, "Folder not found: " + directory.string());
    }

    const std::string wanted = ToLowerCopy(extension);
    PathList files;

    std::error_code ec;
    std::filesystem::recursive_directory_iterator it(directory, ec);
    const std::filesystem::recursive_directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
        std::error_code entryError;
        if (!it->is_regular_file(entryError) || entryError) {
            continue;
        }
        if (ToLowerCopy(it->path().extension().string()) == wanted) {
            files.push_back(it->path());
        }
    }

    if (ec) {
        return Result<PathList>::Err(ErrorCode::Unknown,
                                     "Error listing files in " + directory.string(), ec.message());
    }

    std::sort(files.begin(), files.end());
    return Result<PathList>::Ok(std::move(files));
}

} // namespace Conduit::Utils
