#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "BridgeContext.h"
#include "CommandRecords.h"
#include "CommandRouter.h"

namespace Conduit::Bridge {

// view-text-asset, create-text-asset, update-text-asset, list-text-assets
void RegisterTextAssetCommands(CommandRouter& router, BridgeContext& ctx);

Result<nlohmann::json> ViewTextAsset(BridgeContext& ctx, const ViewTextAssetCommand& cmd);
Result<nlohmann::json> CreateTextAsset(BridgeContext& ctx, const CreateTextAssetCommand& cmd);
Result<nlohmann::json> UpdateTextAsset(BridgeContext& ctx, const UpdateTextAssetCommand& cmd);
Result<nlohmann::json> ListTextAssets(BridgeContext& ctx, const ListTextAssetsCommand& cmd);

// Lua skeleton for a new script. kind selects the shape (Behavior, Data,
// EditorTool); a non-empty namespaceName ("Game.AI") nests the table.
std::string GenerateScriptSkeleton(const std::string& name, const std::string& kind,
                                   const std::string& namespaceName);

} // namespace Conduit::Bridge
