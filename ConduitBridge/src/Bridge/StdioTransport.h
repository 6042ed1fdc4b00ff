#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "CommandRouter.h"

namespace Conduit::Bridge {

// Line-delimited JSON over a pair of streams. Each non-blank input line is
// one request {"name": ..., "params": {...}} ("type" is accepted in place of
// "name"); each produces exactly one envelope line on the output stream.
// An "id" field on the request is echoed back on its envelope.
class StdioTransport {
public:
    StdioTransport(const CommandRouter& router, std::istream& in, std::ostream& out)
        : m_router(router), m_in(in), m_out(out) {}

    // Envelope for one request line; nullopt for blank lines
    std::optional<nlohmann::json> HandleLine(const std::string& line) const;

    // Serve requests until end of input. Returns the number handled.
    size_t Run();

private:
    const CommandRouter& m_router;
    std::istream& m_in;
    std::ostream& m_out;
};

} // namespace Conduit::Bridge
