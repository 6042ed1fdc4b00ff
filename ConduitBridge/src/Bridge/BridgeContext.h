#pragma once

#include <string>
#include "Assets/AssetPaths.h"
#include "Assets/AssetStore.h"
#include "Materials/Material.h"
#include "Scene/BehaviorRegistry.h"
#include "Scene/SceneGraph.h"

namespace Conduit::Bridge {

// Collaborators and project settings shared by the command handlers.
// Owned by the host; handlers only hold references for one call.
struct BridgeContext {
    const Assets::AssetPaths& paths;
    Assets::IAssetStore& assets;
    Scene::ISceneGraph& scene;
    const Scene::BehaviorRegistry& behaviors;

    Materials::ShadingBackend backend = Materials::ShadingBackend::Universal;
    std::string materialsFolder = "Materials";
    std::string scriptsFolder = "Scripts";
    std::string scriptExtension = ".lua";
};

} // namespace Conduit::Bridge
