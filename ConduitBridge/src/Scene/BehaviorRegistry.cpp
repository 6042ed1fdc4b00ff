#include "BehaviorRegistry.h"
#include "Utils/StringUtils.h"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace Conduit::Scene {

void BehaviorRegistry::Register(const std::string& name, BehaviorFactory factory) {
    for (auto& e : m_entries) {
        if (Utils::EqualsIgnoreCase(e.name, name)) {
            spdlog::warn("Behavior '{}' registered twice, replacing factory", name);
            e.factory = std::move(factory);
            return;
        }
    }
    m_entries.push_back({name, std::move(factory)});
}

const BehaviorFactory* BehaviorRegistry::Find(const std::string& name) const {
    for (const auto& e : m_entries) {
        if (Utils::EqualsIgnoreCase(e.name, name)) {
            return &e.factory;
        }
    }
    return nullptr;
}

std::vector<std::string> BehaviorRegistry::GetNames() const {
    std::vector<std::string> names;
    names.reserve(m_entries.size());
    for (const auto& e : m_entries) {
        names.push_back(e.name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

void BehaviorRegistry::RegisterBuiltins(BehaviorRegistry& registry) {
    // Spins around an axis at a fixed rate (degrees per second)
    registry.Register("Rotator", [] {
        BehaviorInstance b{"Rotator", "builtin"};
        b.properties = {{"axis", {0.0f, 1.0f, 0.0f}}, {"speed", 45.0f}};
        return b;
    });

    // Bobs up and down along Y
    registry.Register("Hover", [] {
        BehaviorInstance b{"Hover", "builtin"};
        b.properties = {{"amplitude", 0.25f}, {"frequency", 1.0f}};
        return b;
    });

    registry.Register("Billboard", [] {
        BehaviorInstance b{"Billboard", "builtin"};
        b.properties = {{"lockVertical", true}};
        return b;
    });
}

} // namespace Conduit::Scene
