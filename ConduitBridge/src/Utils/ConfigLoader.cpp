// ConfigLoader.cpp
// Implementation of JSON configuration loading for the bridge host.

#include "ConfigLoader.h"
#include <fstream>
#include <spdlog/spdlog.h>

namespace Conduit::Utils {

Result<nlohmann::json> ConfigLoader::ReadJsonFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<nlohmann::json>::Err(ErrorCode::NotFound, "Failed to open config file: " + path);
    }

    try {
        nlohmann::json j;
        file >> j;
        return Result<nlohmann::json>::Ok(std::move(j));
    } catch (const nlohmann::json::parse_error& e) {
        return Result<nlohmann::json>::Err(ErrorCode::MalformedRequest,
                                           "JSON parse error in " + path, e.what());
    }
}

Result<BridgeConfig> ConfigLoader::LoadBridgeConfig(const std::string& basePath) {
    std::string path = basePath + "/bridge_defaults.json";
    auto jsonResult = ReadJsonFile(path);

    // If file doesn't exist or can't be parsed, return defaults
    if (jsonResult.IsErr()) {
        spdlog::warn("Could not load {}: {}. Using defaults.", path, jsonResult.Error().message);
        return Result<BridgeConfig>::Ok(BridgeConfig{});
    }

    const auto& j = jsonResult.Value();
    BridgeConfig config;

    // Parse project layout
    if (j.contains("project")) {
        const auto& p = j["project"];
        config.project.assetRootName = GetOr(p, "assetRootName", config.project.assetRootName);
        config.project.assetRootPath = GetOr(p, "assetRootPath", config.project.assetRootPath);
        config.project.materialsFolder = GetOr(p, "materialsFolder", config.project.materialsFolder);
        config.project.scriptsFolder = GetOr(p, "scriptsFolder", config.project.scriptsFolder);
        config.project.scriptExtension = GetOr(p, "scriptExtension", config.project.scriptExtension);
    }

    if (j.contains("pipeline")) {
        config.pipeline.active = GetOr(j["pipeline"], "active", config.pipeline.active);
    }

    if (j.contains("scene")) {
        config.scene.path = GetOr(j["scene"], "path", config.scene.path);
    }

    // Parse logging settings
    if (j.contains("logging")) {
        const auto& l = j["logging"];
        config.logging.level = GetOr(l, "level", config.logging.level);
        config.logging.file = GetOr(l, "file", config.logging.file);
    }

    if (config.project.assetRootName.empty()) {
        spdlog::warn("project.assetRootName is empty, falling back to 'Assets'");
        config.project.assetRootName = "Assets";
    }
    if (!config.project.scriptExtension.empty() && config.project.scriptExtension.front() != '.') {
        config.project.scriptExtension.insert(config.project.scriptExtension.begin(), '.');
    }

    spdlog::info("Loaded bridge config from {}", path);
    return Result<BridgeConfig>::Ok(std::move(config));
}

} // namespace Conduit::Utils
