#include "ShaderCatalog.h"
#include "Utils/StringUtils.h"

namespace Conduit::Materials {

namespace {

std::vector<ShaderInfo> BuildShaders() {
    std::vector<ShaderInfo> shaders;
    shaders.reserve(7);

    // Built-in metallic workflow
    shaders.push_back({"Standard", ShadingBackend::Legacy, {
        "_Color", "_MainTex", "_Cutoff", "_Glossiness", "_GlossMapScale",
        "_SmoothnessTextureChannel", "_Metallic", "_MetallicGlossMap",
        "_SpecularHighlights", "_GlossyReflections", "_BumpScale", "_BumpMap",
        "_Parallax", "_ParallaxMap", "_OcclusionStrength", "_OcclusionMap",
        "_EmissionColor", "_EmissionMap", "_DetailMask", "_DetailAlbedoMap",
        "_DetailNormalMapScale", "_DetailNormalMap", "_UVSec",
        "_Mode", "_SrcBlend", "_DstBlend", "_ZWrite"
    }});

    // Built-in specular workflow: no metallic inputs
    shaders.push_back({"Standard (Specular setup)", ShadingBackend::Legacy, {
        "_Color", "_MainTex", "_Cutoff", "_Glossiness", "_GlossMapScale",
        "_SmoothnessTextureChannel", "_SpecColor", "_SpecGlossMap",
        "_SpecularHighlights", "_GlossyReflections", "_BumpScale", "_BumpMap",
        "_Parallax", "_ParallaxMap", "_OcclusionStrength", "_OcclusionMap",
        "_EmissionColor", "_EmissionMap", "_DetailMask", "_DetailAlbedoMap",
        "_DetailNormalMapScale", "_DetailNormalMap", "_UVSec",
        "_Mode", "_SrcBlend", "_DstBlend", "_ZWrite"
    }});

    // URP shaders keep hidden _MainTex/_Color for compatibility
    shaders.push_back({"Universal Render Pipeline/Lit", ShadingBackend::Universal, {
        "_BaseMap", "_BaseColor", "_Cutoff", "_Smoothness", "_Metallic",
        "_MetallicGlossMap", "_SpecColor", "_SpecGlossMap", "_BumpScale", "_BumpMap",
        "_Parallax", "_ParallaxMap", "_OcclusionStrength", "_OcclusionMap",
        "_EmissionColor", "_EmissionMap", "_DetailMask", "_DetailAlbedoMapScale",
        "_DetailAlbedoMap", "_DetailNormalMapScale", "_DetailNormalMap",
        "_Surface", "_Blend", "_SrcBlend", "_DstBlend", "_ZWrite", "_Cull",
        "_MainTex", "_Color"
    }});

    shaders.push_back({"Universal Render Pipeline/Simple Lit", ShadingBackend::Universal, {
        "_BaseMap", "_BaseColor", "_Cutoff", "_Smoothness", "_SpecColor",
        "_SpecGlossMap", "_BumpMap", "_EmissionColor", "_EmissionMap",
        "_Surface", "_Blend", "_SrcBlend", "_DstBlend", "_ZWrite", "_Cull",
        "_MainTex", "_Color"
    }});

    shaders.push_back({"Universal Render Pipeline/Unlit", ShadingBackend::Universal, {
        "_BaseMap", "_BaseColor", "_Cutoff", "_Surface", "_Blend",
        "_SrcBlend", "_DstBlend", "_ZWrite", "_Cull", "_MainTex", "_Color"
    }});

    shaders.push_back({"HDRP/Lit", ShadingBackend::HighDefinition, {
        "_BaseColorMap", "_BaseColor", "_Metallic", "_Smoothness", "_MaskMap",
        "_NormalMap", "_NormalScale", "_HeightMap", "_DetailMap",
        "_EmissiveColor", "_EmissiveColorMap", "_EmissionColor", "_AlphaCutoff",
        "_SurfaceType", "_BlendMode", "_SrcBlend", "_DstBlend", "_ZWrite",
        "_MainTex", "_Color"
    }});

    shaders.push_back({"HDRP/Unlit", ShadingBackend::HighDefinition, {
        "_UnlitColor", "_UnlitColorMap", "_EmissiveColor", "_EmissiveColorMap",
        "_AlphaCutoff", "_SurfaceType", "_BlendMode", "_SrcBlend", "_DstBlend",
        "_ZWrite", "_MainTex", "_Color"
    }});

    return shaders;
}

const std::vector<ShaderInfo>& GetShaderStorage() {
    static const std::vector<ShaderInfo> shaders = BuildShaders();
    return shaders;
}

} // namespace

const ShaderInfo* ShaderCatalog::FindShader(std::string_view shaderName) {
    for (const auto& s : GetShaderStorage()) {
        if (Utils::EqualsIgnoreCase(s.name, shaderName)) {
            return &s;
        }
    }
    return nullptr;
}

const ShaderInfo& ShaderCatalog::DefaultLitShader(ShadingBackend backend) {
    const auto& shaders = GetShaderStorage();
    switch (backend) {
        case ShadingBackend::Universal:      return shaders[2];
        case ShadingBackend::HighDefinition: return shaders[5];
        case ShadingBackend::Legacy:         break;
    }
    return shaders[0];
}

ShadingBackend ShaderCatalog::Classify(std::string_view shaderName) {
    if (shaderName.find("Universal Render Pipeline") != std::string_view::npos) {
        return ShadingBackend::Universal;
    }
    if (shaderName.find("HDRP") != std::string_view::npos) {
        return ShadingBackend::HighDefinition;
    }
    return ShadingBackend::Legacy;
}

const std::vector<ShaderInfo>& ShaderCatalog::GetAllShaders() {
    return GetShaderStorage();
}

} // namespace Conduit::Materials
