#include "MaterialCommands.h"
#include "CommandBinding.h"
#include "Materials/MaterialTemplates.h"
#include "Materials/PropertyResolver.h"
#include "Materials/ShaderCatalog.h"
#include "Utils/StringUtils.h"
#include <algorithm>
#include <optional>

using json = nlohmann::json;

namespace Conduit::Bridge {

using Materials::Material;
using Materials::MaterialSlot;
using Materials::MaterialTemplates;
using Materials::PropertyResolver;
using Materials::ShaderCatalog;

namespace {

constexpr const char* kMaterialExtension = ".mat";

// Material asset path for a user path, adding the extension when omitted
Assets::AssetPath MaterialAssetPath(const BridgeContext& ctx, const std::string& userPath) {
    auto path = ctx.paths.Normalize(userPath);
    if (!Utils::EqualsIgnoreCase(path.physical.extension().string(), kMaterialExtension)) {
        path = ctx.paths.Normalize(path.logical + kMaterialExtension);
    }
    return path;
}

Result<void> CheckMaterialName(const std::string& name) {
    if (!Utils::IsFileSafeName(name)) {
        return Result<void>::Err(ErrorCode::InvalidName, "Invalid material name '" + name + "'",
                                 "names may not be empty or contain path separators");
    }
    return Result<void>::Ok();
}

Material NewMaterial(const std::string& name, const Materials::ShaderInfo& shader) {
    Material m;
    m.name = name;
    m.ApplyShader(shader);
    return m;
}

json ColorToJson(const glm::vec4& c) {
    return json::array({c.r, c.g, c.b, c.a});
}

} // namespace

Result<json> SetMaterial(BridgeContext& ctx, const SetMaterialCommand& cmd) {
    if (!cmd.materialName.empty()) {
        auto valid = CheckMaterialName(cmd.materialName);
        if (valid.IsErr()) {
            return Result<json>::Err(valid.Error());
        }
    }

    auto entity = ctx.scene.FindObject(cmd.targetName);
    if (!entity) {
        return Result<json>::Err(ErrorCode::NotFound, "Object '" + cmd.targetName + "' not found");
    }
    if (!ctx.scene.HasRenderer(*entity)) {
        return Result<json>::Err(ErrorCode::NotFound, "Object '" + cmd.targetName + "' has no renderer");
    }

    const auto& defaultShader = ShaderCatalog::DefaultLitShader(ctx.backend);

    Material material;
    std::optional<Assets::AssetPath> path;
    bool create = false;

    if (!cmd.materialName.empty()) {
        path = ctx.paths.Join(ctx.materialsFolder, cmd.materialName + kMaterialExtension);
        if (ctx.assets.Exists(*path)) {
            auto loaded = ctx.assets.LoadMaterial(*path);
            if (loaded.IsErr()) {
                return Result<json>::Err(loaded.Error());
            }
            material = std::move(loaded.Value());
        } else if (cmd.createIfMissing) {
            material = NewMaterial(cmd.materialName, defaultShader);
            create = true;
        } else {
            return Result<json>::Err(ErrorCode::NotFound,
                                     "Material '" + cmd.materialName + "' not found",
                                     "createIfMissing is false");
        }
    } else {
        // Per-object instance, never stored as an asset
        material = NewMaterial(cmd.targetName + " (Instance)", defaultShader);
    }

    if (cmd.hasColor) {
        if (auto key = PropertyResolver::Resolve(MaterialSlot::BaseColor, material)) {
            material.SetColor(*key, cmd.color);
        } else {
            spdlog::debug("Material '{}' has no base color property, color ignored", material.name);
        }
    }

    if (path) {
        auto stored = create ? ctx.assets.CreateMaterial(*path, material)
                             : (cmd.hasColor ? ctx.assets.SaveMaterial(*path, material) : Result<void>::Ok());
        if (stored.IsErr()) {
            return Result<json>::Err(stored.Error());
        }
    }

    ctx.scene.AssignMaterial(*entity, material, path ? path->logical : std::string());

    return Result<json>::Ok(json{
        {"materialName", material.name},
        {"path", path ? json(path->logical) : json(nullptr)}
    });
}

Result<json> SetMaterialProperties(BridgeContext& ctx, const SetMaterialPropertiesCommand& cmd) {
    const auto path = MaterialAssetPath(ctx, cmd.materialPath);
    auto loaded = ctx.assets.LoadMaterial(path);
    if (loaded.IsErr()) {
        return Result<json>::Err(loaded.Error());
    }
    Material& material = loaded.Value();

    json applied = json::object();
    json skipped = json::array();

    auto setFloat = [&](const char* param, MaterialSlot slot, float value) {
        if (auto key = PropertyResolver::Resolve(slot, material)) {
            material.SetFloat(*key, value);
            applied[param] = *key;
        } else {
            skipped.push_back(param);
        }
    };
    auto setColor = [&](const char* param, MaterialSlot slot, const glm::vec4& value) {
        if (auto key = PropertyResolver::Resolve(slot, material)) {
            material.SetColor(*key, value);
            applied[param] = *key;
        } else {
            skipped.push_back(param);
        }
    };

    if (cmd.hasColor) {
        setColor("color", MaterialSlot::BaseColor, cmd.color);
    }
    if (cmd.hasMetallic) {
        setFloat("metallic", MaterialSlot::MetallicValue, std::clamp(cmd.metallic, 0.0f, 1.0f));
    }
    if (cmd.hasSmoothness) {
        setFloat("smoothness", MaterialSlot::SmoothnessValue, std::clamp(cmd.smoothness, 0.0f, 1.0f));
    }
    if (cmd.hasNormalScale) {
        setFloat("normalScale", MaterialSlot::NormalScale, cmd.normalScale);
    }
    if (cmd.hasOcclusionStrength) {
        setFloat("occlusionStrength", MaterialSlot::OcclusionStrength,
                 std::clamp(cmd.occlusionStrength, 0.0f, 1.0f));
    }
    if (cmd.hasHeightScale) {
        setFloat("heightScale", MaterialSlot::HeightScale, cmd.heightScale);
    }
    if (cmd.hasEmissionColor) {
        // Keyword is enabled even when the shader has no emission color
        material.EnableKeyword("_EMISSION");
        setColor("emissionColor", MaterialSlot::EmissionColor, cmd.emissionColor * cmd.emissionIntensity);
    }

    auto saved = ctx.assets.SaveMaterial(path, material);
    if (saved.IsErr()) {
        return Result<json>::Err(saved.Error());
    }

    return Result<json>::Ok(json{
        {"materialName", material.name},
        {"path", path.logical},
        {"applied", applied},
        {"skipped", skipped}
    });
}

Result<json> SetMaterialTexture(BridgeContext& ctx, const SetMaterialTextureCommand& cmd) {
    const auto path = MaterialAssetPath(ctx, cmd.materialPath);
    auto loaded = ctx.assets.LoadMaterial(path);
    if (loaded.IsErr()) {
        return Result<json>::Err(loaded.Error());
    }
    Material& material = loaded.Value();

    auto texture = ctx.assets.LoadTexture(ctx.paths.Normalize(cmd.texturePath));
    if (texture.IsErr()) {
        return Result<json>::Err(texture.Error());
    }

    auto slot = PropertyResolver::ParseTextureSlot(cmd.slotType);
    if (!slot) {
        std::string known;
        for (const auto& n : PropertyResolver::TextureSlotNames()) {
            known += known.empty() ? n : ", " + n;
        }
        return Result<json>::Err(ErrorCode::UnsupportedSlot,
                                 "Unknown texture slot '" + cmd.slotType + "'",
                                 "known slots: " + known);
    }

    auto key = PropertyResolver::Resolve(*slot, material);
    if (!key) {
        std::string tried;
        for (const auto& c : PropertyResolver::Candidates(*slot, material.backend)) {
            tried += tried.empty() ? c : ", " + c;
        }
        return Result<json>::Err(ErrorCode::UnsupportedSlot,
                                 "Material '" + material.name + "' (" + material.shaderName +
                                     ") has no property for slot '" + cmd.slotType + "'",
                                 "tried: " + tried);
    }

    Materials::TextureBinding binding;
    binding.texturePath = texture.Value().path;
    if (cmd.hasTiling) {
        binding.tiling = cmd.tiling;
    }
    if (cmd.hasOffset) {
        binding.offset = cmd.offset;
    }
    material.SetTexture(*key, std::move(binding));

    auto saved = ctx.assets.SaveMaterial(path, material);
    if (saved.IsErr()) {
        return Result<json>::Err(saved.Error());
    }

    return Result<json>::Ok(json{
        {"materialName", material.name},
        {"textureName", texture.Value().name},
        {"property", *key}
    });
}

Result<json> CreateMaterialFromTemplate(BridgeContext& ctx, const CreateMaterialFromTemplateCommand& cmd) {
    auto valid = CheckMaterialName(cmd.materialName);
    if (valid.IsErr()) {
        return Result<json>::Err(valid.Error());
    }

    auto writes = MaterialTemplates::Instantiate(cmd.templateName, ctx.backend);
    if (writes.IsErr()) {
        return Result<json>::Err(writes.Error());
    }

    const auto folder = cmd.savePath.empty() ? ctx.materialsFolder : cmd.savePath;
    const auto path = ctx.paths.Join(folder, cmd.materialName + kMaterialExtension);

    Material material = NewMaterial(cmd.materialName, ShaderCatalog::DefaultLitShader(ctx.backend));
    MaterialTemplates::Apply(material, writes.Value());

    // An existing asset at the path is replaced
    const bool replaced = ctx.assets.Exists(path);
    auto stored = replaced ? ctx.assets.SaveMaterial(path, material)
                           : ctx.assets.CreateMaterial(path, material);
    if (stored.IsErr()) {
        return Result<json>::Err(stored.Error());
    }

    return Result<json>::Ok(json{
        {"materialName", material.name},
        {"path", path.logical},
        {"template", MaterialTemplates::FindTemplate(cmd.templateName)->name},
        {"replaced", replaced}
    });
}

Result<json> CreateAdvancedMaterial(BridgeContext& ctx, const CreateAdvancedMaterialCommand& cmd) {
    auto valid = CheckMaterialName(cmd.materialName);
    if (valid.IsErr()) {
        return Result<json>::Err(valid.Error());
    }

    std::string shaderName;
    if (cmd.shaderType == "Standard") {
        shaderName = ShaderCatalog::DefaultLitShader(ctx.backend).name;
    } else {
        switch (ctx.backend) {
            case Materials::ShadingBackend::Universal:
                shaderName = "Universal Render Pipeline/" + cmd.shaderType;
                break;
            case Materials::ShadingBackend::HighDefinition:
                shaderName = "HDRP/" + cmd.shaderType;
                break;
            case Materials::ShadingBackend::Legacy:
                shaderName = cmd.shaderType;
                break;
        }
    }
    const auto* shader = ShaderCatalog::FindShader(shaderName);
    if (!shader) {
        return Result<json>::Err(ErrorCode::NotFound, "Shader '" + cmd.shaderType + "' not found",
                                 "looked up as '" + shaderName + "'");
    }

    const auto folder = cmd.savePath.empty() ? ctx.materialsFolder : cmd.savePath;
    const auto path = ctx.paths.Join(folder, cmd.materialName + kMaterialExtension);
    const bool exists = ctx.assets.Exists(path);
    if (exists && !cmd.createIfMissing) {
        return Result<json>::Err(ErrorCode::AlreadyExists,
                                 "Material '" + cmd.materialName + "' already exists",
                                 "createIfMissing is false");
    }

    Material material;
    if (exists) {
        auto loaded = ctx.assets.LoadMaterial(path);
        if (loaded.IsErr()) {
            return Result<json>::Err(loaded.Error());
        }
        material = std::move(loaded.Value());
        material.ApplyShader(*shader);
    } else {
        material = NewMaterial(cmd.materialName, *shader);
    }

    const auto mode = Materials::ParseRenderMode(cmd.renderMode);
    MaterialTemplates::Apply(material, MaterialTemplates::RenderModeWrites(mode));

    auto stored = exists ? ctx.assets.SaveMaterial(path, material)
                         : ctx.assets.CreateMaterial(path, material);
    if (stored.IsErr()) {
        return Result<json>::Err(stored.Error());
    }

    return Result<json>::Ok(json{
        {"materialName", material.name},
        {"path", path.logical},
        {"shader", material.shaderName},
        {"renderMode", Materials::RenderModeName(mode)}
    });
}

void RegisterMaterialCommands(CommandRouter& router, BridgeContext& ctx) {
    router.Register("set-material",
                    BindCommand<SetMaterialCommand>(ctx, &CommandDecoder::SetMaterial, &SetMaterial),
                    "Assign a named or per-object material to an object's renderer");
    router.Register("set-material-properties",
                    BindCommand<SetMaterialPropertiesCommand>(ctx, &CommandDecoder::SetMaterialProperties,
                                                              &SetMaterialProperties),
                    "Write scalar and color inputs of a material");
    router.Register("set-material-texture",
                    BindCommand<SetMaterialTextureCommand>(ctx, &CommandDecoder::SetMaterialTexture,
                                                           &SetMaterialTexture),
                    "Bind a texture to an abstract material slot");
    router.Register("create-material-from-template",
                    BindCommand<CreateMaterialFromTemplateCommand>(ctx, &CommandDecoder::CreateMaterialFromTemplate,
                                                                   &CreateMaterialFromTemplate),
                    "Create a material from a named appearance preset");
    router.Register("create-advanced-material",
                    BindCommand<CreateAdvancedMaterialCommand>(ctx, &CommandDecoder::CreateAdvancedMaterial,
                                                               &CreateAdvancedMaterial),
                    "Create or update a material with an explicit shader and render mode");
}

} // namespace Conduit::Bridge
