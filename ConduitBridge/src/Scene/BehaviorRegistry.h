#pragma once

#include <functional>
#include <string>
#include <vector>
#include "Components.h"

namespace Conduit::Scene {

using BehaviorFactory = std::function<BehaviorInstance()>;

// Name -> factory table for behaviors the host ships with. Populated once
// at startup and read-only afterwards.
class BehaviorRegistry {
public:
    void Register(const std::string& name, BehaviorFactory factory);

    // Case-insensitive lookup. Returns nullptr if not registered.
    const BehaviorFactory* Find(const std::string& name) const;

    // Registered names, sorted
    std::vector<std::string> GetNames() const;

    // Rotator, Hover, Billboard
    static void RegisterBuiltins(BehaviorRegistry& registry);

private:
    struct Entry {
        std::string name;
        BehaviorFactory factory;
    };
    std::vector<Entry> m_entries;
};

} // namespace Conduit::Scene
