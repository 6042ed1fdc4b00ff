#pragma once

#include <nlohmann/json.hpp>
#include "BridgeContext.h"
#include "CommandRecords.h"
#include "CommandRouter.h"

namespace Conduit::Bridge {

// set-material, set-material-properties, set-material-texture,
// create-material-from-template, create-advanced-material
void RegisterMaterialCommands(CommandRouter& router, BridgeContext& ctx);

Result<nlohmann::json> SetMaterial(BridgeContext& ctx, const SetMaterialCommand& cmd);

// Unsupported properties are skipped and listed under "skipped"
Result<nlohmann::json> SetMaterialProperties(BridgeContext& ctx, const SetMaterialPropertiesCommand& cmd);

// Fails with UnsupportedSlot, leaving the material untouched, when the slot
// is unknown or the material declares none of its candidate properties
Result<nlohmann::json> SetMaterialTexture(BridgeContext& ctx, const SetMaterialTextureCommand& cmd);

Result<nlohmann::json> CreateMaterialFromTemplate(BridgeContext& ctx, const CreateMaterialFromTemplateCommand& cmd);
Result<nlohmann::json> CreateAdvancedMaterial(BridgeContext& ctx, const CreateAdvancedMaterialCommand& cmd);

} // namespace Conduit::Bridge
