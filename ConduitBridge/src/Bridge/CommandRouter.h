#pragma once

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "Utils/Result.h"

namespace Conduit::Bridge {

// Outcome of one dispatched command. Exactly one of data/error is meaningful.
struct CommandResult {
    bool success = false;
    nlohmann::json data = nlohmann::json::object();
    BridgeError error;

    static CommandResult Success(nlohmann::json data);
    static CommandResult Failure(BridgeError error);

    // {"status":"success","result":{...}} or
    // {"status":"error","code":"...","error":"...","detail":"..."}
    nlohmann::json ToJson() const;
};

using CommandHandler = std::function<Result<nlohmann::json>(const nlohmann::json& params)>;

// Name -> handler table. Dispatch never throws: unknown names, handler
// errors and escaping exceptions all come back as a failed CommandResult.
class CommandRouter {
public:
    void Register(const std::string& name, CommandHandler handler, const std::string& description = "");

    [[nodiscard]] bool HasCommand(const std::string& name) const;

    // Registered names, sorted
    std::vector<std::string> GetCommandNames() const;
    std::string GetDescription(const std::string& name) const;

    CommandResult Dispatch(const std::string& name, const nlohmann::json& params) const;

private:
    struct Entry {
        CommandHandler handler;
        std::string description;
    };
    std::unordered_map<std::string, Entry> m_commands;
};

} // namespace Conduit::Bridge
