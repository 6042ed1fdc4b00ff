#include "BridgeHost.h"
#include "Bridge/BehaviorCommands.h"
#include "Bridge/MaterialCommands.h"
#include "Bridge/StdioTransport.h"
#include "Bridge/TextAssetCommands.h"
#include "Utils/FileUtils.h"
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace Conduit {

Result<void> BridgeHost::Initialize(const Utils::BridgeConfig& config) {
    m_config = config;

    spdlog::info("Initializing Conduit bridge...");

    auto backend = Materials::ParseShadingBackend(config.pipeline.active);
    if (!backend) {
        spdlog::warn("Unknown pipeline '{}', using universal", config.pipeline.active);
    }
    m_backend = backend.value_or(Materials::ShadingBackend::Universal);

    m_paths = std::make_unique<Assets::AssetPaths>(config.project.assetRootName,
                                                   config.project.assetRootPath);
    auto root = Utils::CreateDirectories(m_paths->RootDirectory());
    if (root.IsErr()) {
        return Result<void>::Err(ErrorCode::DirectoryCreateFailed,
                                 "Failed to prepare asset root: " + m_paths->RootDirectory().string(),
                                 root.Error().detail);
    }
    spdlog::info("  Asset root '{}' at {}", m_paths->RootName(), m_paths->RootDirectory().string());
    spdlog::info("  Shading backend: {}", Materials::ShadingBackendName(m_backend));

    m_assets = std::make_unique<Assets::FileAssetStore>(*m_paths);

    m_scene = std::make_unique<Scene::SceneGraph>();
    if (!config.scene.path.empty()) {
        auto loaded = m_scene->LoadFromFile(config.scene.path);
        if (loaded.IsErr()) {
            return Result<void>::Err(loaded.Error().code,
                                     "Failed to load scene " + config.scene.path + ": " + loaded.Error().message,
                                     loaded.Error().detail);
        }
    }

    Scene::BehaviorRegistry::RegisterBuiltins(m_behaviors);

    m_context = std::make_unique<Bridge::BridgeContext>(Bridge::BridgeContext{
        *m_paths, *m_assets, *m_scene, m_behaviors,
        m_backend,
        config.project.materialsFolder,
        config.project.scriptsFolder,
        config.project.scriptExtension
    });

    RegisterCommands();
    spdlog::info("  {} commands registered", m_router.GetCommandNames().size());
    return Result<void>::Ok();
}

void BridgeHost::RegisterCommands() {
    Bridge::RegisterTextAssetCommands(m_router, *m_context);
    Bridge::RegisterBehaviorCommands(m_router, *m_context);
    Bridge::RegisterMaterialCommands(m_router, *m_context);

    m_router.Register("list-commands", [this](const json&) -> Result<json> {
        json descriptions = json::object();
        const auto names = m_router.GetCommandNames();
        for (const auto& name : names) {
            descriptions[name] = m_router.GetDescription(name);
        }
        return Result<json>::Ok(json{{"commands", names}, {"descriptions", descriptions}});
    }, "List registered commands");
}

size_t BridgeHost::Run(std::istream& in, std::ostream& out) {
    Bridge::StdioTransport transport(m_router, in, out);
    return transport.Run();
}

} // namespace Conduit
