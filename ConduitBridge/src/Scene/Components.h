#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "Materials/Material.h"

namespace Conduit::Scene {

// Tag Component - Object name used for lookups
struct TagComponent {
    std::string tag;

    TagComponent() = default;
    explicit TagComponent(std::string t) : tag(std::move(t)) {}
};

// Renderer Component - the material currently assigned to an object.
// materialPath is empty for per-object instance materials that are not
// stored as assets.
struct RendererComponent {
    Materials::Material material;
    std::string materialPath;
    bool hasMaterial = false;
};

// A behavior attached to an object
struct BehaviorInstance {
    std::string name;
    std::string source;             // "builtin" or the logical path of its script
    nlohmann::json properties = nlohmann::json::object();
};

struct BehaviorListComponent {
    std::vector<BehaviorInstance> behaviors;
};

} // namespace Conduit::Scene
