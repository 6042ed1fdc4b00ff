#include "SceneGraph.h"
#include "Utils/ConfigLoader.h"
#include <spdlog/spdlog.h>

namespace Conduit::Scene {

entt::entity SceneGraph::CreateObject(const std::string& name, bool withRenderer) {
    entt::entity entity = m_registry.create();
    m_registry.emplace<TagComponent>(entity, name);
    m_registry.emplace<BehaviorListComponent>(entity);
    if (withRenderer) {
        m_registry.emplace<RendererComponent>(entity);
    }
    spdlog::debug("Object created: '{}' ({})", name, static_cast<uint32_t>(entity));
    return entity;
}

Result<void> SceneGraph::LoadFromJson(const nlohmann::json& description) {
    if (!description.is_object() || !description.contains("objects") || !description["objects"].is_array()) {
        return Result<void>::Err(ErrorCode::MalformedRequest, "Scene description must contain an 'objects' array");
    }

    size_t loaded = 0;
    for (const auto& obj : description["objects"]) {
        if (!obj.is_object() || !obj.contains("name") || !obj["name"].is_string()) {
            spdlog::warn("Scene object without a string 'name', skipping");
            continue;
        }
        const std::string name = obj["name"].get<std::string>();
        bool renderer = true;
        if (obj.contains("renderer") && obj["renderer"].is_boolean()) {
            renderer = obj["renderer"].get<bool>();
        }
        entt::entity e = CreateObject(name, renderer);

        if (obj.contains("behaviors") && obj["behaviors"].is_array()) {
            for (const auto& b : obj["behaviors"]) {
                if (b.is_string()) {
                    AddBehavior(e, BehaviorInstance{b.get<std::string>(), "scene"});
                }
            }
        }
        ++loaded;
    }

    spdlog::info("Scene loaded with {} objects", loaded);
    return Result<void>::Ok();
}

Result<void> SceneGraph::LoadFromFile(const std::string& path) {
    auto json = Utils::ConfigLoader::ReadJsonFile(path);
    if (json.IsErr()) {
        return Result<void>::Err(json.Error());
    }
    return LoadFromJson(json.Value());
}

std::optional<entt::entity> SceneGraph::FindObject(const std::string& name) const {
    auto view = m_registry.view<const TagComponent>();
    for (auto entity : view) {
        if (view.get<const TagComponent>(entity).tag == name) {
            return entity;
        }
    }
    return std::nullopt;
}

bool SceneGraph::HasRenderer(entt::entity entity) const {
    return m_registry.valid(entity) && m_registry.all_of<RendererComponent>(entity);
}

void SceneGraph::AssignMaterial(entt::entity entity, const Materials::Material& material,
                                const std::string& materialPath) {
    auto& renderer = m_registry.get_or_emplace<RendererComponent>(entity);
    renderer.material = material;
    renderer.materialPath = materialPath;
    renderer.hasMaterial = true;
}

bool SceneGraph::HasBehavior(entt::entity entity, const std::string& behaviorName) const {
    const auto* list = m_registry.try_get<BehaviorListComponent>(entity);
    if (!list) {
        return false;
    }
    for (const auto& b : list->behaviors) {
        if (b.name == behaviorName) {
            return true;
        }
    }
    return false;
}

void SceneGraph::AddBehavior(entt::entity entity, BehaviorInstance behavior) {
    auto& list = m_registry.get_or_emplace<BehaviorListComponent>(entity);
    list.behaviors.push_back(std::move(behavior));
}

const RendererComponent* SceneGraph::GetRenderer(entt::entity entity) const {
    return m_registry.try_get<RendererComponent>(entity);
}

std::vector<BehaviorInstance> SceneGraph::GetBehaviors(entt::entity entity) const {
    const auto* list = m_registry.try_get<BehaviorListComponent>(entity);
    return list ? list->behaviors : std::vector<BehaviorInstance>{};
}

} // namespace Conduit::Scene
