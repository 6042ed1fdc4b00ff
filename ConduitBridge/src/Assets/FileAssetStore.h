#pragma once

#include "AssetStore.h"
#include <nlohmann/json.hpp>

namespace Conduit::Assets {

// Asset store backed by the project's asset root directory. Materials are
// JSON documents; textures are image files used as-is.
class FileAssetStore : public IAssetStore {
public:
    explicit FileAssetStore(const AssetPaths& paths) : m_paths(paths) {}

    bool Exists(const AssetPath& path) const override;
    Result<Materials::Material> LoadMaterial(const AssetPath& path) override;
    Result<void> CreateMaterial(const AssetPath& path, const Materials::Material& material) override;
    Result<void> SaveMaterial(const AssetPath& path, const Materials::Material& material) override;
    Result<TextureAsset> LoadTexture(const AssetPath& path) override;

    static bool IsTextureExtension(const std::string& extension);

    static nlohmann::json MaterialToJson(const Materials::Material& material);
    static Result<Materials::Material> MaterialFromJson(const nlohmann::json& j, const std::string& name);

private:
    Result<void> WriteMaterial(const AssetPath& path, const Materials::Material& material);

    const AssetPaths& m_paths;
};

} // namespace Conduit::Assets
