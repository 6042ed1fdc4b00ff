#pragma once

#include <string>
#include <glm/glm.hpp>
#include <nlohmann/json.hpp>
#include "Utils/Result.h"

namespace Conduit::Bridge {

// Base for decoded command records
struct BridgeCommand {
    virtual ~BridgeCommand() = default;
    virtual std::string ToString() const = 0;
};

// ---- text assets -----------------------------------------------------------

struct ViewTextAssetCommand : public BridgeCommand {
    std::string path;
    bool requireExists = true;

    std::string ToString() const override;
};

struct CreateTextAssetCommand : public BridgeCommand {
    std::string name;               // identifier, extension appended by the handler
    std::string kind = "Behavior";  // Behavior | Data | EditorTool | other
    std::string namespaceName;
    std::string folder;             // empty = configured scripts folder
    bool overwrite = false;
    std::string content;            // empty = generate a skeleton

    std::string ToString() const override;
};

struct UpdateTextAssetCommand : public BridgeCommand {
    std::string path;
    std::string content;            // decoded text
    bool createIfMissing = false;
    bool createFolderIfMissing = false;
    bool contentEncoded = false;

    std::string ToString() const override;
};

struct ListTextAssetsCommand : public BridgeCommand {
    std::string folderPath;         // empty = asset root

    std::string ToString() const override;
};

// ---- objects ---------------------------------------------------------------

struct AttachBehaviorCommand : public BridgeCommand {
    std::string targetName;
    std::string behaviorName;
    std::string behaviorPath;

    std::string ToString() const override;
};

// ---- materials -------------------------------------------------------------

struct SetMaterialCommand : public BridgeCommand {
    std::string targetName;
    std::string materialName;       // empty = per-object instance material
    bool createIfMissing = true;
    bool hasColor = false;
    glm::vec4 color{1.0f};

    std::string ToString() const override;
};

struct SetMaterialPropertiesCommand : public BridgeCommand {
    std::string materialPath;

    bool hasColor = false;
    glm::vec4 color{1.0f};
    bool hasMetallic = false;
    float metallic = 0.0f;
    bool hasSmoothness = false;
    float smoothness = 0.5f;
    bool hasNormalScale = false;
    float normalScale = 1.0f;
    bool hasOcclusionStrength = false;
    float occlusionStrength = 1.0f;
    bool hasHeightScale = false;
    float heightScale = 0.02f;
    bool hasEmissionColor = false;
    glm::vec4 emissionColor{0.0f, 0.0f, 0.0f, 1.0f};
    float emissionIntensity = 1.0f;

    std::string ToString() const override;
};

struct SetMaterialTextureCommand : public BridgeCommand {
    std::string materialPath;
    std::string slotType;
    std::string texturePath;
    bool hasTiling = false;
    glm::vec2 tiling{1.0f, 1.0f};
    bool hasOffset = false;
    glm::vec2 offset{0.0f, 0.0f};

    std::string ToString() const override;
};

struct CreateMaterialFromTemplateCommand : public BridgeCommand {
    std::string materialName;
    std::string templateName;
    std::string savePath;           // empty = configured materials folder

    std::string ToString() const override;
};

struct CreateAdvancedMaterialCommand : public BridgeCommand {
    std::string materialName;
    std::string shaderType = "Standard";
    std::string renderMode = "Opaque";
    bool createIfMissing = true;
    std::string savePath;

    std::string ToString() const override;
};

// Decodes parameter objects into command records. Every decoder validates
// all of its fields before returning, so handlers only see well-typed input.
class CommandDecoder {
public:
    static Result<ViewTextAssetCommand> ViewTextAsset(const nlohmann::json& params);
    static Result<CreateTextAssetCommand> CreateTextAsset(const nlohmann::json& params);
    static Result<UpdateTextAssetCommand> UpdateTextAsset(const nlohmann::json& params);
    static Result<ListTextAssetsCommand> ListTextAssets(const nlohmann::json& params);
    static Result<AttachBehaviorCommand> AttachBehavior(const nlohmann::json& params);
    static Result<SetMaterialCommand> SetMaterial(const nlohmann::json& params);
    static Result<SetMaterialPropertiesCommand> SetMaterialProperties(const nlohmann::json& params);
    static Result<SetMaterialTextureCommand> SetMaterialTexture(const nlohmann::json& params);
    static Result<CreateMaterialFromTemplateCommand> CreateMaterialFromTemplate(const nlohmann::json& params);
    static Result<CreateAdvancedMaterialCommand> CreateAdvancedMaterial(const nlohmann::json& params);
};

} // namespace Conduit::Bridge
