#include "StdioTransport.h"
#include "Utils/StringUtils.h"
#include <istream>
#include <ostream>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace Conduit::Bridge {

namespace {

json Malformed(const std::string& message, const std::string& detail = {}) {
    return CommandResult::Failure(BridgeError(ErrorCode::MalformedRequest, message, detail)).ToJson();
}

} // namespace

std::optional<json> StdioTransport::HandleLine(const std::string& line) const {
    if (Utils::TrimCopy(line).empty()) {
        return std::nullopt;
    }

    json request = json::parse(line, nullptr, false);
    if (request.is_discarded()) {
        return Malformed("Request is not valid JSON");
    }
    if (!request.is_object()) {
        return Malformed("Request must be a JSON object", std::string("got ") + request.type_name());
    }

    std::string name;
    for (const char* key : {"name", "type"}) {
        auto it = request.find(key);
        if (it != request.end() && it->is_string()) {
            name = it->get<std::string>();
            break;
        }
    }

    json envelope;
    if (name.empty()) {
        envelope = Malformed("Request has no command name", "expected a string 'name' field");
    } else {
        const json params = request.contains("params") ? request["params"] : json::object();
        envelope = m_router.Dispatch(name, params).ToJson();
    }

    if (request.contains("id")) {
        envelope["id"] = request["id"];
    }
    return envelope;
}

size_t StdioTransport::Run() {
    size_t handled = 0;
    std::string line;
    while (std::getline(m_in, line)) {
        auto envelope = HandleLine(line);
        if (!envelope) {
            continue;
        }
        // Replace invalid UTF-8 rather than throwing while serializing
        m_out << envelope->dump(-1, ' ', false, json::error_handler_t::replace) << '\n';
        m_out.flush();
        ++handled;
    }
    spdlog::info("Input closed after {} requests", handled);
    return handled;
}

} // namespace Conduit::Bridge
