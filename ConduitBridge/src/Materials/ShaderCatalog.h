#pragma once

#include "Material.h"
#include <string>
#include <string_view>
#include <vector>

namespace Conduit::Materials {

// A shader the project knows about and the property names it declares.
struct ShaderInfo {
    std::string name;
    ShadingBackend backend = ShadingBackend::Legacy;
    std::vector<std::string> properties;
};

class ShaderCatalog {
public:
    // Find a shader by (case-insensitive) name. Returns nullptr if not found.
    static const ShaderInfo* FindShader(std::string_view shaderName);

    // Lit shader new materials receive on the given backend
    static const ShaderInfo& DefaultLitShader(ShadingBackend backend);

    // Backend of an arbitrary shader identity, known to the catalog or not
    static ShadingBackend Classify(std::string_view shaderName);

    static const std::vector<ShaderInfo>& GetAllShaders();
};

} // namespace Conduit::Materials
