#pragma once

#include <iosfwd>
#include <memory>
#include <string>
#include "Assets/AssetPaths.h"
#include "Assets/FileAssetStore.h"
#include "Bridge/BridgeContext.h"
#include "Bridge/CommandRouter.h"
#include "Scene/BehaviorRegistry.h"
#include "Scene/SceneGraph.h"
#include "Utils/ConfigLoader.h"
#include "Utils/Result.h"

namespace Conduit {

// Owns the bridge's collaborators and its command table
class BridgeHost {
public:
    BridgeHost() = default;
    ~BridgeHost() = default;

    BridgeHost(const BridgeHost&) = delete;
    BridgeHost& operator=(const BridgeHost&) = delete;

    Result<void> Initialize(const Utils::BridgeConfig& config);

    // Serve line-delimited requests until end of input
    size_t Run(std::istream& in, std::ostream& out);

    const Bridge::CommandRouter& GetRouter() const { return m_router; }
    Scene::SceneGraph& GetScene() { return *m_scene; }
    Materials::ShadingBackend GetBackend() const { return m_backend; }

private:
    void RegisterCommands();

    Utils::BridgeConfig m_config;
    Materials::ShadingBackend m_backend = Materials::ShadingBackend::Universal;

    std::unique_ptr<Assets::AssetPaths> m_paths;
    std::unique_ptr<Assets::FileAssetStore> m_assets;
    std::unique_ptr<Scene::SceneGraph> m_scene;
    Scene::BehaviorRegistry m_behaviors;
    std::unique_ptr<Bridge::BridgeContext> m_context;
    Bridge::CommandRouter m_router;
};

} // namespace Conduit
