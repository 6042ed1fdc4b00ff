#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <glm/glm.hpp>

namespace Conduit::Materials {

// Family of shader conventions a material follows. Decides which concrete
// property names exist on it.
enum class ShadingBackend : uint8_t {
    Legacy,
    Universal,
    HighDefinition
};

const char* ShadingBackendName(ShadingBackend backend);
// Accepts "legacy"/"builtin", "universal"/"urp", "high-definition"/"hdrp"
std::optional<ShadingBackend> ParseShadingBackend(std::string_view name);

enum class GlobalIllumination : uint8_t {
    None,
    RealtimeEmissive,
    BakedEmissive
};

const char* GlobalIlluminationName(GlobalIllumination gi);
std::optional<GlobalIllumination> ParseGlobalIllumination(std::string_view name);

struct TextureBinding {
    std::string texturePath;    // logical asset path
    glm::vec2 tiling{1.0f, 1.0f};
    glm::vec2 offset{0.0f, 0.0f};
};

using MaterialValue = std::variant<float, int32_t, glm::vec4, TextureBinding>;

struct ShaderInfo;

struct Material {
    std::string name;
    std::string shaderName;
    ShadingBackend backend = ShadingBackend::Legacy;

    // Property names declared by the shader
    std::set<std::string> capabilities;

    std::map<std::string, MaterialValue> properties;
    std::set<std::string> keywords;
    int32_t renderQueue = -1;   // -1 = shader default
    GlobalIllumination globalIllumination = GlobalIllumination::None;

    bool IsKeywordEnabled(const std::string& keyword) const { return keywords.count(keyword) != 0; }

    void SetFloat(const std::string& key, float value) { properties[key] = value; }
    void SetInt(const std::string& key, int32_t value) { properties[key] = value; }
    void SetColor(const std::string& key, const glm::vec4& value) { properties[key] = value; }
    void SetTexture(const std::string& key, TextureBinding binding) { properties[key] = std::move(binding); }

    void EnableKeyword(const std::string& keyword) { keywords.insert(keyword); }
    void DisableKeyword(const std::string& keyword) { keywords.erase(keyword); }

    std::optional<float> GetFloat(const std::string& key) const;
    std::optional<int32_t> GetInt(const std::string& key) const;
    std::optional<glm::vec4> GetColor(const std::string& key) const;
    const TextureBinding* GetTexture(const std::string& key) const;

    // Switch to a shader; backend and capability set follow it. Existing
    // property values are kept.
    void ApplyShader(const ShaderInfo& shader);
};

} // namespace Conduit::Materials
