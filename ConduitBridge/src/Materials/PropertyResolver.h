#pragma once

#include "Material.h"
#include <array>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace Conduit::Materials {

// Pipeline-independent material inputs. The first block are texture slots
// addressable by name from commands; the rest are scalar/color inputs used
// by property writes and templates.
enum class MaterialSlot : uint8_t {
    Albedo,
    Normal,
    Metallic,
    Smoothness,
    Occlusion,
    Height,
    Emission,
    DetailMask,
    DetailAlbedo,
    DetailNormal,

    BaseColor,
    MetallicValue,
    SmoothnessValue,
    NormalScale,
    OcclusionStrength,
    HeightScale,
    EmissionColor
};

// Ordered candidate property keys for one slot, per backend
struct SlotDescriptor {
    MaterialSlot slot = MaterialSlot::Albedo;
    std::string name;
    bool isTexture = false;
    std::array<std::vector<std::string>, 3> candidates;   // indexed by ShadingBackend
};

class PropertyResolver {
public:
    // Texture slot by (case-insensitive) name or alias, e.g. "albedo",
    // "diffuse", "bump", "ao". Scalar slots are not addressable this way.
    static std::optional<MaterialSlot> ParseTextureSlot(std::string_view slotName);

    static const SlotDescriptor& Describe(MaterialSlot slot);
    static const std::vector<std::string>& Candidates(MaterialSlot slot, ShadingBackend backend);

    // First candidate declared in capabilities, or nullopt when the material
    // has none of them.
    static std::optional<std::string> Resolve(MaterialSlot slot,
                                              ShadingBackend backend,
                                              const std::set<std::string>& capabilities);

    static std::optional<std::string> Resolve(MaterialSlot slot, const Material& material) {
        return Resolve(slot, material.backend, material.capabilities);
    }

    // Canonical texture slot names, in table order
    static std::vector<std::string> TextureSlotNames();
};

} // namespace Conduit::Materials
