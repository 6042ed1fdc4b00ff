#pragma once

#include <nlohmann/json.hpp>
#include "BridgeContext.h"
#include "CommandRecords.h"
#include "CommandRouter.h"

namespace Conduit::Bridge {

// attach-behavior
void RegisterBehaviorCommands(CommandRouter& router, BridgeContext& ctx);

// Resolves the behavior as a registered factory, then the script at
// behaviorPath, then any script under the asset root with a matching file
// name. Re-attaching an attached behavior succeeds without changes.
Result<nlohmann::json> AttachBehavior(BridgeContext& ctx, const AttachBehaviorCommand& cmd);

} // namespace Conduit::Bridge
