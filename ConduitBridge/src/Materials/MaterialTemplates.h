#pragma once

#include "Material.h"
#include "PropertyResolver.h"
#include "Utils/Result.h"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Conduit::Materials {

// A single concrete mutation of a material.
struct MaterialWrite {
    enum class Kind : uint8_t {
        SetFloat,
        SetInt,
        SetColor,
        EnableKeyword,
        DisableKeyword,
        SetRenderQueue,
        SetGlobalIllumination
    };

    Kind kind = Kind::SetFloat;
    std::string key;        // property or keyword name; unused for queue/GI
    float floatValue = 0.0f;
    int32_t intValue = 0;   // int property, render queue, or GlobalIllumination
    glm::vec4 colorValue{0.0f};

    static MaterialWrite Float(std::string key, float v);
    static MaterialWrite Int(std::string key, int32_t v);
    static MaterialWrite Color(std::string key, const glm::vec4& v);
    static MaterialWrite Enable(std::string keyword);
    static MaterialWrite Disable(std::string keyword);
    static MaterialWrite RenderQueue(int32_t queue);
    static MaterialWrite GI(GlobalIllumination gi);

    std::string ToString() const;
};

enum class RenderMode : uint8_t {
    Opaque,
    Cutout,
    Transparent
};

// "transparent"/"cutout" (case-insensitive); anything else is opaque
RenderMode ParseRenderMode(std::string_view name);
const char* RenderModeName(RenderMode mode);

// One step of a preset. Slot-addressed steps carry a key resolved per
// backend at instantiation; raw steps carry their concrete key already.
struct TemplateStep {
    std::optional<MaterialSlot> slot;
    MaterialWrite write;
};

struct MaterialTemplate {
    std::string name;
    std::vector<TemplateStep> steps;
};

class MaterialTemplates {
public:
    // Find a template by (case-insensitive) name. Returns nullptr if not found.
    static const MaterialTemplate* FindTemplate(std::string_view templateName);

    static const std::vector<MaterialTemplate>& GetAllTemplates();

    // Concrete writes for a preset on the backend's default lit shader
    static Result<std::vector<MaterialWrite>> Instantiate(std::string_view templateName,
                                                          ShadingBackend backend);

    // Concrete writes for a preset against an explicit capability set.
    // Fails with UnknownTemplate or UnsupportedSlot.
    static Result<std::vector<MaterialWrite>> Instantiate(std::string_view templateName,
                                                          ShadingBackend backend,
                                                          const std::set<std::string>& capabilities);

    // Blend-state sequence for a render mode
    static std::vector<MaterialWrite> RenderModeWrites(RenderMode mode);

    // Apply writes in order; a later write to the same key replaces an
    // earlier one.
    static void Apply(Material& material, const std::vector<MaterialWrite>& writes);
};

} // namespace Conduit::Materials
