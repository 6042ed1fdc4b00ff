#pragma once

#include <spdlog/spdlog.h>
#include "BridgeContext.h"
#include "CommandRouter.h"

namespace Conduit::Bridge {

// Adapts a decoder and a typed handler to the router's json signature
template<typename Command>
CommandHandler BindCommand(BridgeContext& ctx,
                           Result<Command> (*decode)(const nlohmann::json&),
                           Result<nlohmann::json> (*handle)(BridgeContext&, const Command&)) {
    return [&ctx, decode, handle](const nlohmann::json& params) -> Result<nlohmann::json> {
        auto cmd = decode(params);
        if (cmd.IsErr()) {
            return Result<nlohmann::json>::Err(cmd.Error());
        }
        spdlog::debug("{}", cmd.Value().ToString());
        return handle(ctx, cmd.Value());
    };
}

} // namespace Conduit::Bridge
