#include "MaterialTemplates.h"
#include "ShaderCatalog.h"
#include "Utils/StringUtils.h"
#include <spdlog/fmt/fmt.h>

namespace Conduit::Materials {

namespace {

// Blend factors as stored in _SrcBlend/_DstBlend
constexpr int32_t kBlendZero = 0;
constexpr int32_t kBlendOne = 1;
constexpr int32_t kBlendSrcAlpha = 5;
constexpr int32_t kBlendOneMinusSrcAlpha = 10;

constexpr int32_t kQueueDefault = -1;
constexpr int32_t kQueueAlphaTest = 2450;
constexpr int32_t kQueueTransparent = 3000;

TemplateStep SlotColor(MaterialSlot slot, const glm::vec4& c) {
    return TemplateStep{slot, MaterialWrite::Color({}, c)};
}

TemplateStep SlotFloat(MaterialSlot slot, float v) {
    return TemplateStep{slot, MaterialWrite::Float({}, v)};
}

TemplateStep Raw(MaterialWrite write) {
    return TemplateStep{std::nullopt, std::move(write)};
}

// Every preset starts with metallic, smoothness and base color
MaterialTemplate Preset(std::string name, float metallic, float smoothness, const glm::vec4& color) {
    MaterialTemplate t;
    t.name = std::move(name);
    t.steps.push_back(SlotFloat(MaterialSlot::MetallicValue, metallic));
    t.steps.push_back(SlotFloat(MaterialSlot::SmoothnessValue, smoothness));
    t.steps.push_back(SlotColor(MaterialSlot::BaseColor, color));
    return t;
}

std::vector<MaterialTemplate> BuildTemplates() {
    std::vector<MaterialTemplate> templates;
    templates.reserve(7);

    templates.push_back(Preset("metal", 1.0f, 0.8f, glm::vec4(0.77f, 0.78f, 0.8f, 1.0f)));
    templates.push_back(Preset("plastic", 0.0f, 0.9f, glm::vec4(0.9f, 0.9f, 0.9f, 1.0f)));
    templates.push_back(Preset("wood", 0.0f, 0.3f, glm::vec4(0.7f, 0.5f, 0.3f, 1.0f)));

    // Glass: translucent base color, then premultiplied-style blending
    {
        MaterialTemplate t = Preset("glass", 0.0f, 1.0f, glm::vec4(0.9f, 0.9f, 0.9f, 0.2f));
        t.steps.push_back(Raw(MaterialWrite::Float("_Mode", 3.0f)));
        t.steps.push_back(Raw(MaterialWrite::Int("_SrcBlend", kBlendOne)));
        t.steps.push_back(Raw(MaterialWrite::Int("_DstBlend", kBlendOneMinusSrcAlpha)));
        t.steps.push_back(Raw(MaterialWrite::Int("_ZWrite", 0)));
        t.steps.push_back(Raw(MaterialWrite::Disable("_ALPHATEST_ON")));
        t.steps.push_back(Raw(MaterialWrite::Enable("_ALPHABLEND_ON")));
        t.steps.push_back(Raw(MaterialWrite::Disable("_ALPHAPREMULTIPLY_ON")));
        t.steps.push_back(Raw(MaterialWrite::RenderQueue(kQueueTransparent)));
        templates.push_back(std::move(t));
    }

    // Emissive: orange glow at intensity 2
    {
        MaterialTemplate t = Preset("emissive", 0.0f, 0.5f, glm::vec4(0.2f, 0.2f, 0.2f, 1.0f));
        t.steps.push_back(Raw(MaterialWrite::Enable("_EMISSION")));
        t.steps.push_back(Raw(MaterialWrite::GI(GlobalIllumination::RealtimeEmissive)));
        t.steps.push_back(SlotColor(MaterialSlot::EmissionColor, glm::vec4(2.0f, 0.5f, 0.0f, 1.0f)));
        templates.push_back(std::move(t));
    }

    templates.push_back(Preset("fabric", 0.0f, 0.1f, glm::vec4(0.6f, 0.6f, 0.8f, 1.0f)));
    templates.push_back(Preset("skin", 0.0f, 0.3f, glm::vec4(0.9f, 0.7f, 0.6f, 1.0f)));

    return templates;
}

const std::vector<MaterialTemplate>& GetTemplatesStorage() {
    static const std::vector<MaterialTemplate> templates = BuildTemplates();
    return templates;
}

} // namespace

MaterialWrite MaterialWrite::Float(std::string key, float v) {
    MaterialWrite w;
    w.kind = Kind::SetFloat;
    w.key = std::move(key);
    w.floatValue = v;
    return w;
}

MaterialWrite MaterialWrite::Int(std::string key, int32_t v) {
    MaterialWrite w;
    w.kind = Kind::SetInt;
    w.key = std::move(key);
    w.intValue = v;
    return w;
}

MaterialWrite MaterialWrite::Color(std::string key, const glm::vec4& v) {
    MaterialWrite w;
    w.kind = Kind::SetColor;
    w.key = std::move(key);
    w.colorValue = v;
    return w;
}

MaterialWrite MaterialWrite::Enable(std::string keyword) {
    MaterialWrite w;
    w.kind = Kind::EnableKeyword;
    w.key = std::move(keyword);
    return w;
}

MaterialWrite MaterialWrite::Disable(std::string keyword) {
    MaterialWrite w;
    w.kind = Kind::DisableKeyword;
    w.key = std::move(keyword);
    return w;
}

MaterialWrite MaterialWrite::RenderQueue(int32_t queue) {
    MaterialWrite w;
    w.kind = Kind::SetRenderQueue;
    w.intValue = queue;
    return w;
}

MaterialWrite MaterialWrite::GI(GlobalIllumination gi) {
    MaterialWrite w;
    w.kind = Kind::SetGlobalIllumination;
    w.intValue = static_cast<int32_t>(gi);
    return w;
}

std::string MaterialWrite::ToString() const {
    switch (kind) {
        case Kind::SetFloat:
            return fmt::format("{} = {}", key, floatValue);
        case Kind::SetInt:
            return fmt::format("{} = {}", key, intValue);
        case Kind::SetColor:
            return fmt::format("{} = ({}, {}, {}, {})", key,
                               colorValue.r, colorValue.g, colorValue.b, colorValue.a);
        case Kind::EnableKeyword:
            return "enable " + key;
        case Kind::DisableKeyword:
            return "disable " + key;
        case Kind::SetRenderQueue:
            return fmt::format("renderQueue = {}", intValue);
        case Kind::SetGlobalIllumination:
            return std::string("gi = ") + GlobalIlluminationName(static_cast<GlobalIllumination>(intValue));
    }
    return {};
}

RenderMode ParseRenderMode(std::string_view name) {
    const std::string key = Utils::ToLowerCopy(name);
    if (key == "transparent") {
        return RenderMode::Transparent;
    }
    if (key == "cutout") {
        return RenderMode::Cutout;
    }
    return RenderMode::Opaque;
}

const char* RenderModeName(RenderMode mode) {
    switch (mode) {
        case RenderMode::Opaque:      return "Opaque";
        case RenderMode::Cutout:      return "Cutout";
        case RenderMode::Transparent: return "Transparent";
    }
    return "Opaque";
}

const MaterialTemplate* MaterialTemplates::FindTemplate(std::string_view templateName) {
    const std::string key = Utils::ToLowerCopy(Utils::TrimCopy(templateName));
    for (const auto& t : GetTemplatesStorage()) {
        if (t.name == key) {
            return &t;
        }
    }
    return nullptr;
}

const std::vector<MaterialTemplate>& MaterialTemplates::GetAllTemplates() {
    return GetTemplatesStorage();
}

Result<std::vector<MaterialWrite>> MaterialTemplates::Instantiate(std::string_view templateName,
                                                                  ShadingBackend backend) {
    const auto& shader = ShaderCatalog::DefaultLitShader(backend);
    const std::set<std::string> capabilities(shader.properties.begin(), shader.properties.end());
    return Instantiate(templateName, backend, capabilities);
}

Result<std::vector<MaterialWrite>> MaterialTemplates::Instantiate(std::string_view templateName,
                                                                  ShadingBackend backend,
                                                                  const std::set<std::string>& capabilities) {
    using WriteList = std::vector<MaterialWrite>;

    const MaterialTemplate* tmpl = FindTemplate(templateName);
    if (!tmpl) {
        return Result<WriteList>::Err(ErrorCode::UnknownTemplate,
                                      "Unknown material template: " + std::string(templateName));
    }

    WriteList writes;
    writes.reserve(tmpl->steps.size());
    for (const auto& step : tmpl->steps) {
        MaterialWrite write = step.write;
        if (step.slot) {
            auto key = PropertyResolver::Resolve(*step.slot, backend, capabilities);
            if (!key) {
                return Result<WriteList>::Err(
                    ErrorCode::UnsupportedSlot,
                    fmt::format("Template '{}' needs slot '{}' which the {} shader does not declare",
                                tmpl->name, PropertyResolver::Describe(*step.slot).name,
                                ShadingBackendName(backend)));
            }
            write.key = *key;
        }
        writes.push_back(std::move(write));
    }
    return Result<WriteList>::Ok(std::move(writes));
}

std::vector<MaterialWrite> MaterialTemplates::RenderModeWrites(RenderMode mode) {
    std::vector<MaterialWrite> writes;
    switch (mode) {
        case RenderMode::Transparent:
            writes.push_back(MaterialWrite::Float("_Mode", 3.0f));
            writes.push_back(MaterialWrite::Int("_SrcBlend", kBlendSrcAlpha));
            writes.push_back(MaterialWrite::Int("_DstBlend", kBlendOneMinusSrcAlpha));
            writes.push_back(MaterialWrite::Int("_ZWrite", 0));
            writes.push_back(MaterialWrite::Disable("_ALPHATEST_ON"));
            writes.push_back(MaterialWrite::Enable("_ALPHABLEND_ON"));
            writes.push_back(MaterialWrite::Disable("_ALPHAPREMULTIPLY_ON"));
            writes.push_back(MaterialWrite::RenderQueue(kQueueTransparent));
            break;
        case RenderMode::Cutout:
            writes.push_back(MaterialWrite::Float("_Mode", 1.0f));
            writes.push_back(MaterialWrite::Int("_SrcBlend", kBlendOne));
            writes.push_back(MaterialWrite::Int("_DstBlend", kBlendZero));
            writes.push_back(MaterialWrite::Int("_ZWrite", 1));
            writes.push_back(MaterialWrite::Enable("_ALPHATEST_ON"));
            writes.push_back(MaterialWrite::Disable("_ALPHABLEND_ON"));
            writes.push_back(MaterialWrite::Disable("_ALPHAPREMULTIPLY_ON"));
            writes.push_back(MaterialWrite::RenderQueue(kQueueAlphaTest));
            break;
        case RenderMode::Opaque:
            writes.push_back(MaterialWrite::Float("_Mode", 0.0f));
            writes.push_back(MaterialWrite::Int("_SrcBlend", kBlendOne));
            writes.push_back(MaterialWrite::Int("_DstBlend", kBlendZero));
            writes.push_back(MaterialWrite::Int("_ZWrite", 1));
            writes.push_back(MaterialWrite::Disable("_ALPHATEST_ON"));
            writes.push_back(MaterialWrite::Disable("_ALPHABLEND_ON"));
            writes.push_back(MaterialWrite::Disable("_ALPHAPREMULTIPLY_ON"));
            writes.push_back(MaterialWrite::RenderQueue(kQueueDefault));
            break;
    }
    return writes;
}

void MaterialTemplates::Apply(Material& material, const std::vector<MaterialWrite>& writes) {
    for (const auto& w : writes) {
        switch (w.kind) {
            case MaterialWrite::Kind::SetFloat:
                material.SetFloat(w.key, w.floatValue);
                break;
            case MaterialWrite::Kind::SetInt:
                material.SetInt(w.key, w.intValue);
                break;
            case MaterialWrite::Kind::SetColor:
                material.SetColor(w.key, w.colorValue);
                break;
            case MaterialWrite::Kind::EnableKeyword:
                material.EnableKeyword(w.key);
                break;
            case MaterialWrite::Kind::DisableKeyword:
                material.DisableKeyword(w.key);
                break;
            case MaterialWrite::Kind::SetRenderQueue:
                material.renderQueue = w.intValue;
                break;
            case MaterialWrite::Kind::SetGlobalIllumination:
                material.globalIllumination = static_cast<GlobalIllumination>(w.intValue);
                break;
        }
    }
}

} // namespace Conduit::Materials
