#include "PropertyResolver.h"
#include "Utils/StringUtils.h"
#include <utility>

namespace Conduit::Materials {

namespace {

using Keys = std::vector<std::string>;

SlotDescriptor Slot(MaterialSlot slot, std::string name, bool isTexture,
                    Keys legacy, Keys universal, Keys highDefinition) {
    SlotDescriptor d;
    d.slot = slot;
    d.name = std::move(name);
    d.isTexture = isTexture;
    d.candidates[static_cast<size_t>(ShadingBackend::Legacy)] = std::move(legacy);
    d.candidates[static_cast<size_t>(ShadingBackend::Universal)] = std::move(universal);
    d.candidates[static_cast<size_t>(ShadingBackend::HighDefinition)] = std::move(highDefinition);
    return d;
}

SlotDescriptor Slot(MaterialSlot slot, std::string name, bool isTexture, const Keys& all) {
    return Slot(slot, std::move(name), isTexture, all, all, all);
}

// Indexed by MaterialSlot. High-definition materials use the legacy texture
// names; their native maps (_BaseColorMap, _MaskMap, ...) are not addressed.
std::vector<SlotDescriptor> BuildSlots() {
    std::vector<SlotDescriptor> slots;
    slots.reserve(17);

    // Texture slots
    slots.push_back(Slot(MaterialSlot::Albedo, "albedo", true,
                         {"_MainTex"}, {"_BaseMap", "_MainTex"}, {"_MainTex"}));
    slots.push_back(Slot(MaterialSlot::Normal, "normal", true, {"_BumpMap", "_NormalMap"}));
    slots.push_back(Slot(MaterialSlot::Metallic, "metallic", true,
                         {"_MetallicMap"}, {"_MetallicGlossMap", "_MetallicMap"}, {"_MetallicMap"}));
    slots.push_back(Slot(MaterialSlot::Smoothness, "smoothness", true, {"_SpecGlossMap", "_SmoothnessMap"}));
    slots.push_back(Slot(MaterialSlot::Occlusion, "occlusion", true, {"_OcclusionMap"}));
    slots.push_back(Slot(MaterialSlot::Height, "height", true, {"_ParallaxMap", "_HeightMap"}));
    slots.push_back(Slot(MaterialSlot::Emission, "emission", true, {"_EmissionMap", "_EmissiveMap"}));
    slots.push_back(Slot(MaterialSlot::DetailMask, "detail_mask", true, {"_DetailMask"}));
    slots.push_back(Slot(MaterialSlot::DetailAlbedo, "detail_albedo", true, {"_DetailAlbedoMap"}));
    slots.push_back(Slot(MaterialSlot::DetailNormal, "detail_normal", true, {"_DetailNormalMap"}));

    // Scalar and color inputs
    slots.push_back(Slot(MaterialSlot::BaseColor, "baseColor", false,
                         {"_Color"}, {"_BaseColor", "_Color"}, {"_BaseColor", "_Color"}));
    slots.push_back(Slot(MaterialSlot::MetallicValue, "metallic", false, {"_Metallic"}));
    slots.push_back(Slot(MaterialSlot::SmoothnessValue, "smoothness", false, {"_Smoothness", "_Glossiness"}));
    slots.push_back(Slot(MaterialSlot::NormalScale, "normalScale", false, {"_BumpScale"}));
    slots.push_back(Slot(MaterialSlot::OcclusionStrength, "occlusionStrength", false, {"_OcclusionStrength"}));
    slots.push_back(Slot(MaterialSlot::HeightScale, "heightScale", false, {"_Parallax"}));
    slots.push_back(Slot(MaterialSlot::EmissionColor, "emissionColor", false, {"_EmissionColor"}));

    return slots;
}

const std::vector<SlotDescriptor>& GetSlotStorage() {
    static const std::vector<SlotDescriptor> slots = BuildSlots();
    return slots;
}

struct SlotAlias {
    const char* alias;
    MaterialSlot slot;
};

constexpr SlotAlias kTextureAliases[] = {
    {"diffuse", MaterialSlot::Albedo},
    {"main", MaterialSlot::Albedo},
    {"bump", MaterialSlot::Normal},
    {"roughness", MaterialSlot::Smoothness},
    {"ao", MaterialSlot::Occlusion},
    {"parallax", MaterialSlot::Height},
    {"emissive", MaterialSlot::Emission},
    {"detail", MaterialSlot::DetailMask},
    {"detail_diffuse", MaterialSlot::DetailAlbedo},
};

} // namespace

std::optional<MaterialSlot> PropertyResolver::ParseTextureSlot(std::string_view slotName) {
    const std::string key = Utils::ToLowerCopy(Utils::TrimCopy(slotName));
    for (const auto& d : GetSlotStorage()) {
        if (d.isTexture && d.name == key) {
            return d.slot;
        }
    }
    for (const auto& a : kTextureAliases) {
        if (key == a.alias) {
            return a.slot;
        }
    }
    return std::nullopt;
}

const SlotDescriptor& PropertyResolver::Describe(MaterialSlot slot) {
    return GetSlotStorage()[static_cast<size_t>(slot)];
}

const std::vector<std::string>& PropertyResolver::Candidates(MaterialSlot slot, ShadingBackend backend) {
    return Describe(slot).candidates[static_cast<size_t>(backend)];
}

std::optional<std::string> PropertyResolver::Resolve(MaterialSlot slot,
                                                     ShadingBackend backend,
                                                     const std::set<std::string>& capabilities) {
    for (const auto& key : Candidates(slot, backend)) {
        if (capabilities.count(key) != 0) {
            return key;
        }
    }
    return std::nullopt;
}

std::vector<std::string> PropertyResolver::TextureSlotNames() {
    std::vector<std::string> names;
    for (const auto& d : GetSlotStorage()) {
        if (d.isTexture) {
            names.push_back(d.name);
        }
    }
    return names;
}

} // namespace Conduit::Materials
