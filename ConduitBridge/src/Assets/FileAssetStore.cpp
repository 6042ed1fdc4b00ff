#include "FileAssetStore.h"
#include "Materials/ShaderCatalog.h"
#include "Utils/FileUtils.h"
#include "Utils/StringUtils.h"
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace Conduit::Assets {

using Materials::Material;
using Materials::MaterialValue;
using Materials::TextureBinding;

namespace {

json Vec2ToJson(const glm::vec2& v) {
    return json::array({v.x, v.y});
}

bool ReadVec2(const json& arr, glm::vec2& out) {
    if (!arr.is_array() || arr.size() != 2 || !arr[0].is_number() || !arr[1].is_number()) {
        return false;
    }
    out = glm::vec2(arr[0].get<float>(), arr[1].get<float>());
    return true;
}

json ValueToJson(const MaterialValue& value) {
    json j;
    if (const auto* f = std::get_if<float>(&value)) {
        j["type"] = "float";
        j["value"] = *f;
    } else if (const auto* i = std::get_if<int32_t>(&value)) {
        j["type"] = "int";
        j["value"] = *i;
    } else if (const auto* c = std::get_if<glm::vec4>(&value)) {
        j["type"] = "color";
        j["value"] = json::array({c->r, c->g, c->b, c->a});
    } else if (const auto* t = std::get_if<TextureBinding>(&value)) {
        j["type"] = "texture";
        j["path"] = t->texturePath;
        j["tiling"] = Vec2ToJson(t->tiling);
        j["offset"] = Vec2ToJson(t->offset);
    }
    return j;
}

bool ValueFromJson(const json& j, MaterialValue& out) {
    if (!j.is_object() || !j.contains("type") || !j["type"].is_string()) {
        return false;
    }
    const std::string type = j["type"].get<std::string>();
    const json value = j.value("value", json());

    if (type == "float" && value.is_number()) {
        out = value.get<float>();
        return true;
    }
    if (type == "int" && value.is_number_integer()) {
        out = value.get<int32_t>();
        return true;
    }
    if (type == "color" && value.is_array() && value.size() == 4) {
        glm::vec4 c(1.0f);
        for (size_t i = 0; i < 4; ++i) {
            if (!value[i].is_number()) {
                return false;
            }
            c[static_cast<glm::length_t>(i)] = value[i].get<float>();
        }
        out = c;
        return true;
    }
    if (type == "texture") {
        TextureBinding binding;
        binding.texturePath = j.value("path", std::string());
        if (j.contains("tiling") && !ReadVec2(j["tiling"], binding.tiling)) {
            return false;
        }
        if (j.contains("offset") && !ReadVec2(j["offset"], binding.offset)) {
            return false;
        }
        out = std::move(binding);
        return true;
    }
    return false;
}

} // namespace

bool FileAssetStore::IsTextureExtension(const std::string& extension) {
    static const char* kExtensions[] = {
        ".png", ".jpg", ".jpeg", ".tga", ".bmp", ".psd", ".exr", ".hdr", ".tif", ".tiff"
    };
    const std::string ext = Utils::ToLowerCopy(extension);
    for (const char* e : kExtensions) {
        if (ext == e) {
            return true;
        }
    }
    return false;
}

json FileAssetStore::MaterialToJson(const Material& material) {
    json j;
    j["name"] = material.name;
    j["shader"] = material.shaderName;
    j["renderQueue"] = material.renderQueue;
    j["globalIllumination"] = Materials::GlobalIlluminationName(material.globalIllumination);
    j["keywords"] = json::array();
    for (const auto& k : material.keywords) {
        j["keywords"].push_back(k);
    }
    j["properties"] = json::object();
    for (const auto& [key, value] : material.properties) {
        j["properties"][key] = ValueToJson(value);
    }
    return j;
}

Result<Material> FileAssetStore::MaterialFromJson(const json& j, const std::string& name) {
    if (!j.is_object()) {
        return Result<Material>::Err(ErrorCode::Unknown, "Material document is not an object", name);
    }

    Material material;
    material.name = name;
    material.shaderName = j.value("shader", std::string("Standard"));
    material.renderQueue = j.value("renderQueue", -1);

    if (j.contains("globalIllumination") && j["globalIllumination"].is_string()) {
        auto gi = Materials::ParseGlobalIllumination(j["globalIllumination"].get<std::string>());
        if (gi) {
            material.globalIllumination = *gi;
        }
    }

    if (j.contains("keywords") && j["keywords"].is_array()) {
        for (const auto& k : j["keywords"]) {
            if (k.is_string()) {
                material.keywords.insert(k.get<std::string>());
            }
        }
    }

    if (j.contains("properties") && j["properties"].is_object()) {
        for (auto it = j["properties"].begin(); it != j["properties"].end(); ++it) {
            MaterialValue value;
            if (!ValueFromJson(it.value(), value)) {
                spdlog::warn("Material '{}': ignoring malformed property '{}'", name, it.key());
                continue;
            }
            material.properties[it.key()] = std::move(value);
        }
    }

    // Capabilities come from the shader; for shaders outside the catalog the
    // stored properties are all that is known.
    if (const auto* shader = Materials::ShaderCatalog::FindShader(material.shaderName)) {
        material.ApplyShader(*shader);
    } else {
        material.backend = Materials::ShaderCatalog::Classify(material.shaderName);
        for (const auto& [key, value] : material.properties) {
            material.capabilities.insert(key);
        }
    }

    return Result<Material>::Ok(std::move(material));
}

bool FileAssetStore::Exists(const AssetPath& path) const {
    return Utils::FileExists(path.physical);
}

Result<Material> FileAssetStore::LoadMaterial(const AssetPath& path) {
    auto text = Utils::ReadTextFile(path.physical);
    if (text.IsErr()) {
        return Result<Material>::Err(ErrorCode::NotFound, "Material not found: " + path.logical);
    }

    json j = json::parse(text.Value(), nullptr, false);
    if (j.is_discarded()) {
        return Result<Material>::Err(ErrorCode::Unknown, "Material file is not valid JSON", path.logical);
    }
    return MaterialFromJson(j, path.physical.stem().string());
}

Result<void> FileAssetStore::CreateMaterial(const AssetPath& path, const Material& material) {
    if (Exists(path)) {
        return Result<void>::Err(ErrorCode::AlreadyExists, "Material already exists: " + path.logical);
    }
    auto dir = m_paths.EnsureParentDirectory(path);
    if (dir.IsErr()) {
        return dir;
    }
    auto written = WriteMaterial(path, material);
    if (written.IsOk()) {
        spdlog::info("Created material {} ({})", path.logical, material.shaderName);
    }
    return written;
}

Result<void> FileAssetStore::SaveMaterial(const AssetPath& path, const Material& material) {
    if (!Exists(path)) {
        return Result<void>::Err(ErrorCode::NotFound, "Material not found: " + path.logical);
    }
    auto written = WriteMaterial(path, material);
    if (written.IsOk()) {
        spdlog::info("Saved material {}", path.logical);
    }
    return written;
}

Result<TextureAsset> FileAssetStore::LoadTexture(const AssetPath& path) {
    if (!Utils::FileExists(path.physical) || !IsTextureExtension(path.physical.extension().string())) {
        return Result<TextureAsset>::Err(ErrorCode::NotFound, "Texture not found: " + path.logical);
    }
    TextureAsset texture;
    texture.path = path.logical;
    texture.name = path.physical.stem().string();
    return Result<TextureAsset>::Ok(std::move(texture));
}

Result<void> FileAssetStore::WriteMaterial(const AssetPath& path, const Material& material) {
    auto written = Utils::WriteTextFile(path.physical, MaterialToJson(material).dump(2) + "\n");
    if (written.IsErr()) {
        return Result<void>::Err(ErrorCode::WriteFailed, "Failed to write material " + path.logical,
                                 written.Error().message);
    }
    return Result<void>::Ok();
}

} // namespace Conduit::Assets
