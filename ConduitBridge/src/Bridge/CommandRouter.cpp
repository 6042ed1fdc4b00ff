#include "CommandRouter.h"
#include <algorithm>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace Conduit::Bridge {

CommandResult CommandResult::Success(json data) {
    CommandResult r;
    r.success = true;
    r.data = data.is_null() ? json::object() : std::move(data);
    return r;
}

CommandResult CommandResult::Failure(BridgeError error) {
    CommandResult r;
    r.success = false;
    r.error = std::move(error);
    return r;
}

json CommandResult::ToJson() const {
    if (success) {
        return json{{"status", "success"}, {"result", data}};
    }
    json j{
        {"status", "error"},
        {"code", ErrorCodeName(error.code)},
        {"error", error.message}
    };
    if (!error.detail.empty()) {
        j["detail"] = error.detail;
    }
    return j;
}

void CommandRouter::Register(const std::string& name, CommandHandler handler, const std::string& description) {
    if (m_commands.count(name) != 0) {
        spdlog::warn("Command '{}' registered twice, replacing handler", name);
    }
    m_commands[name] = Entry{std::move(handler), description};
}

bool CommandRouter::HasCommand(const std::string& name) const {
    return m_commands.count(name) != 0;
}

std::vector<std::string> CommandRouter::GetCommandNames() const {
    std::vector<std::string> names;
    names.reserve(m_commands.size());
    for (const auto& [name, entry] : m_commands) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::string CommandRouter::GetDescription(const std::string& name) const {
    auto it = m_commands.find(name);
    return it == m_commands.end() ? std::string() : it->second.description;
}

CommandResult CommandRouter::Dispatch(const std::string& name, const json& params) const {
    auto it = m_commands.find(name);
    if (it == m_commands.end()) {
        spdlog::warn("Unknown command '{}'", name);
        return CommandResult::Failure(BridgeError(ErrorCode::UnknownCommand, "Unknown command: " + name));
    }

    // A missing parameter bag is an empty one
    const json empty = json::object();
    const json& bag = params.is_null() ? empty : params;
    if (!bag.is_object()) {
        return CommandResult::Failure(BridgeError(ErrorCode::TypeMismatch,
                                                  "Parameters for '" + name + "' must be an object",
                                                  std::string("got ") + bag.type_name()));
    }

    spdlog::debug("Dispatching '{}'", name);

    try {
        auto result = it->second.handler(bag);
        if (result.IsErr()) {
            const auto& err = result.Error();
            spdlog::warn("Command '{}' failed [{}]: {}", name, ErrorCodeName(err.code), err.message);
            return CommandResult::Failure(err);
        }
        return CommandResult::Success(std::move(result.Value()));
    } catch (const std::exception& e) {
        spdlog::error("Command '{}' threw: {}", name, e.what());
        return CommandResult::Failure(BridgeError(ErrorCode::Unknown,
                                                  "Unhandled error in '" + name + "'", e.what()));
    } catch (...) {
        spdlog::error("Command '{}' threw a non-standard exception", name);
        return CommandResult::Failure(BridgeError(ErrorCode::Unknown,
                                                  "Unhandled error in '" + name + "'",
                                                  "non-standard exception"));
    }
}

} // namespace Conduit::Bridge
