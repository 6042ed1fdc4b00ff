#pragma once

#include <entt/entt.hpp>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "Components.h"
#include "Utils/Result.h"

namespace Conduit::Scene {

// Live object graph as seen by the command handlers
class ISceneGraph {
public:
    virtual ~ISceneGraph() = default;

    virtual std::optional<entt::entity> FindObject(const std::string& name) const = 0;
    virtual bool HasRenderer(entt::entity entity) const = 0;
    virtual void AssignMaterial(entt::entity entity, const Materials::Material& material,
                                const std::string& materialPath) = 0;
    virtual bool HasBehavior(entt::entity entity, const std::string& behaviorName) const = 0;
    virtual void AddBehavior(entt::entity entity, BehaviorInstance behavior) = 0;
};

// Wrapper around EnTT registry holding the editor's named objects
class SceneGraph : public ISceneGraph {
public:
    SceneGraph() = default;
    ~SceneGraph() override = default;

    entt::entity CreateObject(const std::string& name, bool withRenderer = true);

    // Populate from {"objects":[{"name":..., "renderer":bool, "behaviors":[...]}]}
    Result<void> LoadFromJson(const nlohmann::json& description);
    Result<void> LoadFromFile(const std::string& path);

    std::optional<entt::entity> FindObject(const std::string& name) const override;
    bool HasRenderer(entt::entity entity) const override;
    void AssignMaterial(entt::entity entity, const Materials::Material& material,
                        const std::string& materialPath) override;
    bool HasBehavior(entt::entity entity, const std::string& behaviorName) const override;
    void AddBehavior(entt::entity entity, BehaviorInstance behavior) override;

    // nullptr when the object has no renderer
    const RendererComponent* GetRenderer(entt::entity entity) const;
    std::vector<BehaviorInstance> GetBehaviors(entt::entity entity) const;

private:
    entt::registry m_registry;
};

} // namespace Conduit::Scene
