#pragma once

#include "AssetPaths.h"
#include "Materials/Material.h"
#include "Utils/Result.h"
#include <string>

namespace Conduit::Assets {

struct TextureAsset {
    std::string path;   // logical
    std::string name;   // file stem
};

// Persistent asset store the command handlers operate on. Paths passed in
// are already normalized.
class IAssetStore {
public:
    virtual ~IAssetStore() = default;

    virtual bool Exists(const AssetPath& path) const = 0;

    virtual Result<Materials::Material> LoadMaterial(const AssetPath& path) = 0;

    // Fails with AlreadyExists when something is stored at path
    virtual Result<void> CreateMaterial(const AssetPath& path, const Materials::Material& material) = 0;

    // Overwrite an existing material
    virtual Result<void> SaveMaterial(const AssetPath& path, const Materials::Material& material) = 0;

    virtual Result<TextureAsset> LoadTexture(const AssetPath& path) = 0;
};

} // namespace Conduit::Assets
