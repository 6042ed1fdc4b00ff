#include "Material.h"
#include "ShaderCatalog.h"
#include "Utils/StringUtils.h"

namespace Conduit::Materials {

const char* ShadingBackendName(ShadingBackend backend) {
    switch (backend) {
        case ShadingBackend::Legacy:         return "legacy";
        case ShadingBackend::Universal:      return "universal";
        case ShadingBackend::HighDefinition: return "high-definition";
    }
    return "legacy";
}

std::optional<ShadingBackend> ParseShadingBackend(std::string_view name) {
    const std::string key = Utils::ToLowerCopy(Utils::TrimCopy(name));
    if (key == "legacy" || key == "builtin" || key == "built-in") {
        return ShadingBackend::Legacy;
    }
    if (key == "universal" || key == "urp") {
        return ShadingBackend::Universal;
    }
    if (key == "high-definition" || key == "highdefinition" || key == "hdrp") {
        return ShadingBackend::HighDefinition;
    }
    return std::nullopt;
}

const char* GlobalIlluminationName(GlobalIllumination gi) {
    switch (gi) {
        case GlobalIllumination::None:             return "none";
        case GlobalIllumination::RealtimeEmissive: return "realtime";
        case GlobalIllumination::BakedEmissive:    return "baked";
    }
    return "none";
}

std::optional<GlobalIllumination> ParseGlobalIllumination(std::string_view name) {
    const std::string key = Utils::ToLowerCopy(name);
    if (key == "none") return GlobalIllumination::None;
    if (key == "realtime") return GlobalIllumination::RealtimeEmissive;
    if (key == "baked") return GlobalIllumination::BakedEmissive;
    return std::nullopt;
}

std::optional<float> Material::GetFloat(const std::string& key) const {
    auto it = properties.find(key);
    if (it == properties.end()) {
        return std::nullopt;
    }
    if (const auto* f = std::get_if<float>(&it->second)) {
        return *f;
    }
    if (const auto* i = std::get_if<int32_t>(&it->second)) {
        return static_cast<float>(*i);
    }
    return std::nullopt;
}

std::optional<int32_t> Material::GetInt(const std::string& key) const {
    auto it = properties.find(key);
    if (it == properties.end()) {
        return std::nullopt;
    }
    if (const auto* i = std::get_if<int32_t>(&it->second)) {
        return *i;
    }
    if (const auto* f = std::get_if<float>(&it->second)) {
        return static_cast<int32_t>(*f);
    }
    return std::nullopt;
}

std::optional<glm::vec4> Material::GetColor(const std::string& key) const {
    auto it = properties.find(key);
    if (it == properties.end()) {
        return std::nullopt;
    }
    if (const auto* c = std::get_if<glm::vec4>(&it->second)) {
        return *c;
    }
    return std::nullopt;
}

const TextureBinding* Material::GetTexture(const std::string& key) const {
    auto it = properties.find(key);
    if (it == properties.end()) {
        return nullptr;
    }
    return std::get_if<TextureBinding>(&it->second);
}

void Material::ApplyShader(const ShaderInfo& shader) {
    shaderName = shader.name;
    backend = shader.backend;
    capabilities.clear();
    capabilities.insert(shader.properties.begin(), shader.properties.end());
}

} // namespace Conduit::Materials
