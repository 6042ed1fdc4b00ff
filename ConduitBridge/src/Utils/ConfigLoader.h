#pragma once

// ConfigLoader.h
// Loads the bridge's JSON configuration with per-key defaults.

#include <string>
#include <nlohmann/json.hpp>
#include "Utils/Result.h"

namespace Conduit {
namespace Utils {

// Configuration data structures loaded from JSON
struct BridgeConfig {
    // Project layout
    struct Project {
        std::string assetRootName = "Assets";     // logical prefix of every asset path
        std::string assetRootPath = "Assets";     // filesystem location of the asset root
        std::string materialsFolder = "Materials";
        std::string scriptsFolder = "Scripts";
        std::string scriptExtension = ".lua";
    } project;

    // Render pipeline the project is configured for
    struct Pipeline {
        std::string active = "universal";   // legacy | universal | high-definition
    } pipeline;

    struct Scene {
        std::string path;   // optional scene description, empty for an empty graph
    } scene;

    struct Logging {
        std::string level = "info";
        std::string file;
    } logging;
};

// ConfigLoader - loads and parses JSON configuration files
class ConfigLoader {
public:
    // Load bridge defaults from <basePath>/bridge_defaults.json. A missing or
    // unparsable file yields the built-in defaults.
    static Result<BridgeConfig> LoadBridgeConfig(const std::string& basePath = "assets/config");

    // Helper to read JSON file
    static Result<nlohmann::json> ReadJsonFile(const std::string& path);

private:
    // Parse helpers with defaults
    template<typename T>
    static T GetOr(const nlohmann::json& j, const std::string& key, T defaultValue) {
        if (j.is_object() && j.contains(key)) {
            try {
                return j[key].get<T>();
            } catch (const nlohmann::json::exception&) {
                return defaultValue;
            }
        }
        return defaultValue;
    }
};

} // namespace Utils
} // namespace Conduit
