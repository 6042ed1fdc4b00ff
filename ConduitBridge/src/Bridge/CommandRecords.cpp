#include "CommandRecords.h"
#include "ParamReader.h"
#include "Utils/PayloadCodec.h"

using json = nlohmann::json;

namespace Conduit::Bridge {

std::string ViewTextAssetCommand::ToString() const {
    return "ViewTextAsset: " + path;
}

std::string CreateTextAssetCommand::ToString() const {
    return "CreateTextAsset: " + name + " (" + kind + ")";
}

std::string UpdateTextAssetCommand::ToString() const {
    return "UpdateTextAsset: " + path + " (" + std::to_string(content.size()) + " bytes)";
}

std::string ListTextAssetsCommand::ToString() const {
    return "ListTextAssets: " + (folderPath.empty() ? std::string("<root>") : folderPath);
}

std::string AttachBehaviorCommand::ToString() const {
    return "AttachBehavior: " + behaviorName + " -> " + targetName;
}

std::string SetMaterialCommand::ToString() const {
    return "SetMaterial: " + targetName + (materialName.empty() ? std::string() : " <- " + materialName);
}

std::string SetMaterialPropertiesCommand::ToString() const {
    return "SetMaterialProperties: " + materialPath;
}

std::string SetMaterialTextureCommand::ToString() const {
    return "SetMaterialTexture: " + materialPath + " [" + slotType + "] <- " + texturePath;
}

std::string CreateMaterialFromTemplateCommand::ToString() const {
    return "CreateMaterialFromTemplate: " + materialName + " (" + templateName + ")";
}

std::string CreateAdvancedMaterialCommand::ToString() const {
    return "CreateAdvancedMaterial: " + materialName + " (" + shaderType + ", " + renderMode + ")";
}

Result<ViewTextAssetCommand> CommandDecoder::ViewTextAsset(const json& params) {
    ParamReader r(params);
    ViewTextAssetCommand cmd;
    r.Require("path", cmd.path);
    r.Optional("requireExists", cmd.requireExists);
    return r.Finish(std::move(cmd));
}

Result<CreateTextAssetCommand> CommandDecoder::CreateTextAsset(const json& params) {
    ParamReader r(params);
    CreateTextAssetCommand cmd;
    r.Require("name", cmd.name);
    r.Optional("kind", cmd.kind);
    r.Optional("namespace", cmd.namespaceName);
    r.Optional("folder", cmd.folder);
    r.Optional("overwrite", cmd.overwrite);
    r.Optional("content", cmd.content);
    return r.Finish(std::move(cmd));
}

Result<UpdateTextAssetCommand> CommandDecoder::UpdateTextAsset(const json& params) {
    ParamReader r(params);
    UpdateTextAssetCommand cmd;
    r.Require("path", cmd.path);
    r.Optional("createIfMissing", cmd.createIfMissing);
    r.Optional("createFolderIfMissing", cmd.createFolderIfMissing);
    r.Optional("contentEncoded", cmd.contentEncoded);

    if (cmd.contentEncoded) {
        // Encoded payload travels in encodedContent; content is accepted as
        // a fallback carrier.
        std::string payload;
        if (!r.Optional("encodedContent", payload)) {
            r.Require("content", payload);
        }
        if (r.HasError()) {
            return r.Finish(std::move(cmd));
        }
        auto decoded = Utils::DecodePayload(payload, true);
        if (decoded.IsErr()) {
            return Result<UpdateTextAssetCommand>::Err(decoded.Error());
        }
        cmd.content = std::move(decoded.Value());
    } else {
        r.Require("content", cmd.content);
    }
    return r.Finish(std::move(cmd));
}

Result<ListTextAssetsCommand> CommandDecoder::ListTextAssets(const json& params) {
    ParamReader r(params);
    ListTextAssetsCommand cmd;
    r.Optional("folderPath", cmd.folderPath);
    return r.Finish(std::move(cmd));
}

Result<AttachBehaviorCommand> CommandDecoder::AttachBehavior(const json& params) {
    ParamReader r(params);
    AttachBehaviorCommand cmd;
    r.Require("targetName", cmd.targetName);
    r.Require("behaviorName", cmd.behaviorName);
    r.Optional("behaviorPath", cmd.behaviorPath);
    return r.Finish(std::move(cmd));
}

Result<SetMaterialCommand> CommandDecoder::SetMaterial(const json& params) {
    ParamReader r(params);
    SetMaterialCommand cmd;
    r.Require("targetName", cmd.targetName);
    r.Optional("materialName", cmd.materialName);
    r.Optional("createIfMissing", cmd.createIfMissing);
    cmd.hasColor = r.OptionalColor("color", cmd.color);
    return r.Finish(std::move(cmd));
}

Result<SetMaterialPropertiesCommand> CommandDecoder::SetMaterialProperties(const json& params) {
    ParamReader r(params);
    SetMaterialPropertiesCommand cmd;
    r.Require("materialPath", cmd.materialPath);
    cmd.hasColor = r.OptionalColor("color", cmd.color);
    cmd.hasMetallic = r.Optional("metallic", cmd.metallic);
    cmd.hasSmoothness = r.Optional("smoothness", cmd.smoothness);
    cmd.hasNormalScale = r.Optional("normalScale", cmd.normalScale);
    cmd.hasOcclusionStrength = r.Optional("occlusionStrength", cmd.occlusionStrength);
    cmd.hasHeightScale = r.Optional("heightScale", cmd.heightScale);
    cmd.hasEmissionColor = r.OptionalColor("emissionColor", cmd.emissionColor);
    r.Optional("emissionIntensity", cmd.emissionIntensity);
    return r.Finish(std::move(cmd));
}

Result<SetMaterialTextureCommand> CommandDecoder::SetMaterialTexture(const json& params) {
    ParamReader r(params);
    SetMaterialTextureCommand cmd;
    r.Require("materialPath", cmd.materialPath);
    r.Require("slotType", cmd.slotType);
    r.Require("texturePath", cmd.texturePath);
    cmd.hasTiling = r.OptionalVec2("tiling", cmd.tiling);
    cmd.hasOffset = r.OptionalVec2("offset", cmd.offset);
    return r.Finish(std::move(cmd));
}

Result<CreateMaterialFromTemplateCommand> CommandDecoder::CreateMaterialFromTemplate(const json& params) {
    ParamReader r(params);
    CreateMaterialFromTemplateCommand cmd;
    r.Require("materialName", cmd.materialName);
    r.Require("templateName", cmd.templateName);
    r.Optional("savePath", cmd.savePath);
    return r.Finish(std::move(cmd));
}

Result<CreateAdvancedMaterialCommand> CommandDecoder::CreateAdvancedMaterial(const json& params) {
    ParamReader r(params);
    CreateAdvancedMaterialCommand cmd;
    r.Require("materialName", cmd.materialName);
    r.Optional("shaderType", cmd.shaderType);
    r.Optional("renderMode", cmd.renderMode);
    r.Optional("createIfMissing", cmd.createIfMissing);
    r.Optional("savePath", cmd.savePath);
    return r.Finish(std::move(cmd));
}

} // namespace Conduit::Bridge
