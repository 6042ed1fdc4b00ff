// test_property_resolver.cpp
// Unit tests for backend-aware material property resolution and templates
//
// These tests verify that:
// 1. Slot candidates are tried in the documented order per backend
// 2. A slot with no declared candidate resolves to nothing
// 3. Shader identities classify into the right backend
// 4. Templates resolve through the catalog and keep their write order
// 5. Render-mode write sequences match the blend-state table

#include "Materials/MaterialTemplates.h"
#include "Materials/PropertyResolver.h"
#include "Materials/ShaderCatalog.h"
#include <algorithm>
#include <iostream>
#include <set>
#include <string>
#include <spdlog/spdlog.h>

using namespace Conduit;
using namespace Conduit::Materials;

// ============================================================================
// Test Framework (minimal)
// ============================================================================

static int g_testsPassed = 0;
static int g_testsFailed = 0;

#define TEST_ASSERT(condition, message) \
    do { \
        if (!(condition)) { \
            std::cerr << "[FAIL] " << __FUNCTION__ << ": " << message << std::endl; \
            g_testsFailed++; \
            return false; \
        } \
    } while(0)

#define TEST_PASS() \
    do { \
        std::cout << "[PASS] " << __FUNCTION__ << std::endl; \
        g_testsPassed++; \
        return true; \
    } while(0)

static std::set<std::string> Caps(std::initializer_list<const char*> keys) {
    return std::set<std::string>(keys.begin(), keys.end());
}

static std::set<std::string> ShaderCaps(const char* shaderName) {
    const auto* s = ShaderCatalog::FindShader(shaderName);
    return s ? std::set<std::string>(s->properties.begin(), s->properties.end()) : std::set<std::string>{};
}

static size_t IndexOf(const std::vector<MaterialWrite>& writes, MaterialWrite::Kind kind, const std::string& key) {
    for (size_t i = 0; i < writes.size(); ++i) {
        if (writes[i].kind == kind && writes[i].key == key) {
            return i;
        }
    }
    return writes.size();
}

// ============================================================================
// Slot parsing
// ============================================================================

bool test_parse_slot_names_and_aliases() {
    TEST_ASSERT(PropertyResolver::ParseTextureSlot("albedo") == MaterialSlot::Albedo, "albedo");
    TEST_ASSERT(PropertyResolver::ParseTextureSlot("Diffuse") == MaterialSlot::Albedo, "diffuse alias");
    TEST_ASSERT(PropertyResolver::ParseTextureSlot("MAIN") == MaterialSlot::Albedo, "main alias");
    TEST_ASSERT(PropertyResolver::ParseTextureSlot("bump") == MaterialSlot::Normal, "bump alias");
    TEST_ASSERT(PropertyResolver::ParseTextureSlot("roughness") == MaterialSlot::Smoothness, "roughness alias");
    TEST_ASSERT(PropertyResolver::ParseTextureSlot("ao") == MaterialSlot::Occlusion, "ao alias");
    TEST_ASSERT(PropertyResolver::ParseTextureSlot("parallax") == MaterialSlot::Height, "parallax alias");
    TEST_ASSERT(PropertyResolver::ParseTextureSlot("emissive") == MaterialSlot::Emission, "emissive alias");
    TEST_ASSERT(PropertyResolver::ParseTextureSlot("detail") == MaterialSlot::DetailMask, "detail alias");
    TEST_ASSERT(PropertyResolver::ParseTextureSlot("detail_diffuse") == MaterialSlot::DetailAlbedo, "detail_diffuse");
    TEST_ASSERT(PropertyResolver::ParseTextureSlot("detail_normal") == MaterialSlot::DetailNormal, "detail_normal");
    TEST_ASSERT(!PropertyResolver::ParseTextureSlot("sparkle").has_value(), "unknown slot");
    TEST_ASSERT(!PropertyResolver::ParseTextureSlot("baseColor").has_value(), "scalar slots are not texture slots");
    TEST_PASS();
}

// ============================================================================
// Resolution precedence
// ============================================================================

bool test_albedo_prefers_base_map_on_universal() {
    auto caps = Caps({"_BaseMap", "_MainTex"});
    auto key = PropertyResolver::Resolve(MaterialSlot::Albedo, ShadingBackend::Universal, caps);
    TEST_ASSERT(key && *key == "_BaseMap", "universal should pick _BaseMap first");

    auto legacy = PropertyResolver::Resolve(MaterialSlot::Albedo, ShadingBackend::Legacy, caps);
    TEST_ASSERT(legacy && *legacy == "_MainTex", "legacy never uses _BaseMap");
    TEST_PASS();
}

bool test_universal_falls_back_to_legacy_name() {
    auto caps = Caps({"_MainTex"});
    auto key = PropertyResolver::Resolve(MaterialSlot::Albedo, ShadingBackend::Universal, caps);
    TEST_ASSERT(key && *key == "_MainTex", "fallback to _MainTex");
    TEST_PASS();
}

bool test_metallic_map_per_backend() {
    auto caps = Caps({"_MetallicGlossMap", "_MetallicMap"});
    auto u = PropertyResolver::Resolve(MaterialSlot::Metallic, ShadingBackend::Universal, caps);
    auto l = PropertyResolver::Resolve(MaterialSlot::Metallic, ShadingBackend::Legacy, caps);
    auto h = PropertyResolver::Resolve(MaterialSlot::Metallic, ShadingBackend::HighDefinition, caps);
    TEST_ASSERT(u && *u == "_MetallicGlossMap", "universal metallic");
    TEST_ASSERT(l && *l == "_MetallicMap", "legacy metallic");
    TEST_ASSERT(h && *h == "_MetallicMap", "high-definition uses the legacy list");
    TEST_PASS();
}

bool test_ordered_candidates() {
    TEST_ASSERT(*PropertyResolver::Resolve(MaterialSlot::Normal, ShadingBackend::Legacy,
                                           Caps({"_NormalMap", "_BumpMap"})) == "_BumpMap", "normal order");
    TEST_ASSERT(*PropertyResolver::Resolve(MaterialSlot::Normal, ShadingBackend::Legacy,
                                           Caps({"_NormalMap"})) == "_NormalMap", "normal fallback");
    TEST_ASSERT(*PropertyResolver::Resolve(MaterialSlot::Height, ShadingBackend::Universal,
                                           Caps({"_HeightMap", "_ParallaxMap"})) == "_ParallaxMap", "height order");
    TEST_ASSERT(*PropertyResolver::Resolve(MaterialSlot::Emission, ShadingBackend::Legacy,
                                           Caps({"_EmissiveMap"})) == "_EmissiveMap", "emission fallback");
    TEST_ASSERT(*PropertyResolver::Resolve(MaterialSlot::Smoothness, ShadingBackend::Legacy,
                                           Caps({"_SmoothnessMap"})) == "_SmoothnessMap", "smoothness fallback");
    TEST_PASS();
}

bool test_no_candidate_resolves_to_nothing() {
    auto caps = ShaderCaps("Universal Render Pipeline/Unlit");
    TEST_ASSERT(!caps.empty(), "catalog lookup");
    auto key = PropertyResolver::Resolve(MaterialSlot::Normal, ShadingBackend::Universal, caps);
    TEST_ASSERT(!key.has_value(), "unlit has no normal map");
    auto occ = PropertyResolver::Resolve(MaterialSlot::Occlusion, ShadingBackend::Universal, Caps({}));
    TEST_ASSERT(!occ.has_value(), "empty capability set");
    TEST_PASS();
}

bool test_resolution_is_deterministic() {
    auto caps = ShaderCaps("Standard");
    auto first = PropertyResolver::Resolve(MaterialSlot::Albedo, ShadingBackend::Legacy, caps);
    for (int i = 0; i < 50; ++i) {
        auto again = PropertyResolver::Resolve(MaterialSlot::Albedo, ShadingBackend::Legacy, caps);
        TEST_ASSERT(again == first, "result changed between calls");
    }
    TEST_PASS();
}

bool test_scalar_slots() {
    auto standard = ShaderCaps("Standard");
    auto urp = ShaderCaps("Universal Render Pipeline/Lit");
    TEST_ASSERT(*PropertyResolver::Resolve(MaterialSlot::BaseColor, ShadingBackend::Legacy, standard) == "_Color",
                "legacy base color");
    TEST_ASSERT(*PropertyResolver::Resolve(MaterialSlot::BaseColor, ShadingBackend::Universal, urp) == "_BaseColor",
                "universal base color");
    TEST_ASSERT(*PropertyResolver::Resolve(MaterialSlot::SmoothnessValue, ShadingBackend::Legacy, standard) == "_Glossiness",
                "legacy smoothness");
    TEST_ASSERT(*PropertyResolver::Resolve(MaterialSlot::SmoothnessValue, ShadingBackend::Universal, urp) == "_Smoothness",
                "universal smoothness");

    auto specular = ShaderCaps("Standard (Specular setup)");
    TEST_ASSERT(!PropertyResolver::Resolve(MaterialSlot::MetallicValue, ShadingBackend::Legacy, specular),
                "specular setup has no metallic");
    TEST_PASS();
}

// ============================================================================
// Shader catalog
// ============================================================================

bool test_classify_shader_identity() {
    TEST_ASSERT(ShaderCatalog::Classify("Universal Render Pipeline/Lit") == ShadingBackend::Universal, "URP");
    TEST_ASSERT(ShaderCatalog::Classify("HDRP/Lit") == ShadingBackend::HighDefinition, "HDRP");
    TEST_ASSERT(ShaderCatalog::Classify("Standard") == ShadingBackend::Legacy, "Standard");
    TEST_ASSERT(ShaderCatalog::Classify("Custom/Toon") == ShadingBackend::Legacy, "unknown shaders are legacy");
    TEST_PASS();
}

bool test_default_lit_shaders() {
    TEST_ASSERT(ShaderCatalog::DefaultLitShader(ShadingBackend::Legacy).name == "Standard", "legacy default");
    TEST_ASSERT(ShaderCatalog::DefaultLitShader(ShadingBackend::Universal).name == "Universal Render Pipeline/Lit",
                "universal default");
    TEST_ASSERT(ShaderCatalog::DefaultLitShader(ShadingBackend::HighDefinition).name == "HDRP/Lit", "hd default");
    for (const auto& s : ShaderCatalog::GetAllShaders()) {
        TEST_ASSERT(ShaderCatalog::Classify(s.name) == s.backend, "catalog backend disagrees for " << s.name);
    }
    TEST_PASS();
}

// ============================================================================
// Templates
// ============================================================================

bool test_unknown_template() {
    auto result = MaterialTemplates::Instantiate("chrome", ShadingBackend::Universal);
    TEST_ASSERT(result.IsErr(), "unknown template must fail");
    TEST_ASSERT(result.Error().code == ErrorCode::UnknownTemplate, "expected UnknownTemplate");
    TEST_PASS();
}

bool test_template_lookup_case_insensitive() {
    TEST_ASSERT(MaterialTemplates::FindTemplate("Metal") != nullptr, "Metal");
    TEST_ASSERT(MaterialTemplates::FindTemplate("GLASS") != nullptr, "GLASS");
    TEST_ASSERT(MaterialTemplates::GetAllTemplates().size() == 7, "seven presets");
    TEST_PASS();
}

bool test_metal_resolves_per_backend() {
    auto urp = MaterialTemplates::Instantiate("metal", ShadingBackend::Universal);
    TEST_ASSERT(urp.IsOk(), "universal metal");
    TEST_ASSERT(urp.Value().size() == 3, "metal is three writes");
    TEST_ASSERT(urp.Value()[0].key == "_Metallic" && urp.Value()[0].floatValue == 1.0f, "metallic first");
    TEST_ASSERT(urp.Value()[1].key == "_Smoothness" && urp.Value()[1].floatValue == 0.8f, "smoothness second");
    TEST_ASSERT(urp.Value()[2].key == "_BaseColor", "universal color key");
    TEST_ASSERT(urp.Value()[2].colorValue == glm::vec4(0.77f, 0.78f, 0.8f, 1.0f), "metal color");

    auto legacy = MaterialTemplates::Instantiate("metal", ShadingBackend::Legacy);
    TEST_ASSERT(legacy.IsOk(), "legacy metal");
    TEST_ASSERT(legacy.Value()[1].key == "_Glossiness", "legacy smoothness key");
    TEST_ASSERT(legacy.Value()[2].key == "_Color", "legacy color key");
    TEST_PASS();
}

bool test_glass_blend_sequence_follows_base_color() {
    auto result = MaterialTemplates::Instantiate("glass", ShadingBackend::Legacy);
    TEST_ASSERT(result.IsOk(), "glass instantiation");
    const auto& w = result.Value();

    const size_t color = IndexOf(w, MaterialWrite::Kind::SetColor, "_Color");
    const size_t mode = IndexOf(w, MaterialWrite::Kind::SetFloat, "_Mode");
    const size_t src = IndexOf(w, MaterialWrite::Kind::SetInt, "_SrcBlend");
    const size_t dst = IndexOf(w, MaterialWrite::Kind::SetInt, "_DstBlend");
    const size_t zwrite = IndexOf(w, MaterialWrite::Kind::SetInt, "_ZWrite");
    TEST_ASSERT(color < w.size() && mode < w.size(), "glass writes color and mode");
    TEST_ASSERT(color < mode && mode < src && src < dst && dst < zwrite, "blend writes come after base color");
    TEST_ASSERT(w[color].colorValue.a == 0.2f, "glass alpha");
    TEST_ASSERT(w[mode].floatValue == 3.0f, "transparent mode");
    TEST_ASSERT(w[src].intValue == 1 && w[dst].intValue == 10 && w[zwrite].intValue == 0, "glass blend factors");
    TEST_ASSERT(w.back().kind == MaterialWrite::Kind::SetRenderQueue && w.back().intValue == 3000, "queue last");
    TEST_PASS();
}

bool test_emissive_template() {
    auto result = MaterialTemplates::Instantiate("emissive", ShadingBackend::Universal);
    TEST_ASSERT(result.IsOk(), "emissive instantiation");
    const auto& w = result.Value();
    TEST_ASSERT(IndexOf(w, MaterialWrite::Kind::EnableKeyword, "_EMISSION") < w.size(), "_EMISSION enabled");
    const size_t e = IndexOf(w, MaterialWrite::Kind::SetColor, "_EmissionColor");
    TEST_ASSERT(e < w.size(), "emission color written");
    TEST_ASSERT(w[e].colorValue == glm::vec4(2.0f, 0.5f, 0.0f, 1.0f), "orange glow");

    bool gi = std::any_of(w.begin(), w.end(), [](const MaterialWrite& m) {
        return m.kind == MaterialWrite::Kind::SetGlobalIllumination &&
               m.intValue == static_cast<int32_t>(GlobalIllumination::RealtimeEmissive);
    });
    TEST_ASSERT(gi, "realtime emissive GI");
    TEST_PASS();
}

bool test_template_unsupported_slot() {
    // A capability set without any metallic property
    auto result = MaterialTemplates::Instantiate("wood", ShadingBackend::Legacy, ShaderCaps("Standard (Specular setup)"));
    TEST_ASSERT(result.IsErr(), "missing metallic must fail");
    TEST_ASSERT(result.Error().code == ErrorCode::UnsupportedSlot, "expected UnsupportedSlot");
    TEST_PASS();
}

bool test_last_write_wins() {
    Material m;
    m.ApplyShader(ShaderCatalog::DefaultLitShader(ShadingBackend::Legacy));
    std::vector<MaterialWrite> writes = {
        MaterialWrite::Float("_Glossiness", 0.2f),
        MaterialWrite::Enable("_ALPHABLEND_ON"),
        MaterialWrite::Float("_Glossiness", 0.9f),
        MaterialWrite::Disable("_ALPHABLEND_ON"),
    };
    MaterialTemplates::Apply(m, writes);
    TEST_ASSERT(m.GetFloat("_Glossiness") == 0.9f, "later float wins");
    TEST_ASSERT(!m.IsKeywordEnabled("_ALPHABLEND_ON"), "later keyword write wins");
    TEST_PASS();
}

// ============================================================================
// Render modes
// ============================================================================

bool test_render_mode_parsing() {
    TEST_ASSERT(ParseRenderMode("Transparent") == RenderMode::Transparent, "Transparent");
    TEST_ASSERT(ParseRenderMode("CUTOUT") == RenderMode::Cutout, "CUTOUT");
    TEST_ASSERT(ParseRenderMode("opaque") == RenderMode::Opaque, "opaque");
    TEST_ASSERT(ParseRenderMode("Fade") == RenderMode::Opaque, "anything else is opaque");
    TEST_PASS();
}

bool test_render_mode_writes() {
    Material m;
    m.ApplyShader(ShaderCatalog::DefaultLitShader(ShadingBackend::Legacy));

    MaterialTemplates::Apply(m, MaterialTemplates::RenderModeWrites(RenderMode::Transparent));
    TEST_ASSERT(m.GetFloat("_Mode") == 3.0f, "transparent mode");
    TEST_ASSERT(m.GetInt("_SrcBlend") == 5 && m.GetInt("_DstBlend") == 10, "alpha blending");
    TEST_ASSERT(m.GetInt("_ZWrite") == 0, "no depth write");
    TEST_ASSERT(m.IsKeywordEnabled("_ALPHABLEND_ON") && !m.IsKeywordEnabled("_ALPHATEST_ON"), "keywords");
    TEST_ASSERT(m.renderQueue == 3000, "transparent queue");

    MaterialTemplates::Apply(m, MaterialTemplates::RenderModeWrites(RenderMode::Cutout));
    TEST_ASSERT(m.GetFloat("_Mode") == 1.0f, "cutout mode");
    TEST_ASSERT(m.GetInt("_SrcBlend") == 1 && m.GetInt("_DstBlend") == 0 && m.GetInt("_ZWrite") == 1, "cutout blend");
    TEST_ASSERT(m.IsKeywordEnabled("_ALPHATEST_ON") && !m.IsKeywordEnabled("_ALPHABLEND_ON"), "cutout keywords");
    TEST_ASSERT(m.renderQueue == 2450, "alpha test queue");

    MaterialTemplates::Apply(m, MaterialTemplates::RenderModeWrites(RenderMode::Opaque));
    TEST_ASSERT(m.GetFloat("_Mode") == 0.0f, "opaque mode");
    TEST_ASSERT(m.keywords.empty(), "all blend keywords off");
    TEST_ASSERT(m.renderQueue == -1, "shader default queue");
    TEST_PASS();
}

int main() {
    spdlog::set_level(spdlog::level::off);

    std::cout << "================================================" << std::endl;
    std::cout << "Material Property Resolution Unit Tests" << std::endl;
    std::cout << "================================================" << std::endl;

    test_parse_slot_names_and_aliases();

    std::cout << "\n--- Resolution ---" << std::endl;
    test_albedo_prefers_base_map_on_universal();
    test_universal_falls_back_to_legacy_name();
    test_metallic_map_per_backend();
    test_ordered_candidates();
    test_no_candidate_resolves_to_nothing();
    test_resolution_is_deterministic();
    test_scalar_slots();

    std::cout << "\n--- Shader Catalog ---" << std::endl;
    test_classify_shader_identity();
    test_default_lit_shaders();

    std::cout << "\n--- Templates ---" << std::endl;
    test_unknown_template();
    test_template_lookup_case_insensitive();
    test_metal_resolves_per_backend();
    test_glass_blend_sequence_follows_base_color();
    test_emissive_template();
    test_template_unsupported_slot();
    test_last_write_wins();

    std::cout << "\n--- Render Modes ---" << std::endl;
    test_render_mode_parsing();
    test_render_mode_writes();

    std::cout << "\n================================================" << std::endl;
    std::cout << "Results: " << g_testsPassed << " passed, " << g_testsFailed << " failed" << std::endl;
    std::cout << "================================================" << std::endl;

    return g_testsFailed > 0 ? 1 : 0;
}
