#include "ParamReader.h"
#include <cmath>
#include <limits>

using json = nlohmann::json;

namespace Conduit::Bridge {

const json* ParamReader::Find(const char* key) const {
    if (!m_params.is_object()) {
        return nullptr;
    }
    auto it = m_params.find(key);
    if (it == m_params.end() || it->is_null()) {
        return nullptr;
    }
    return &*it;
}

void ParamReader::Fail(ErrorCode code, std::string message, std::string detail) {
    if (!m_error) {
        m_error = BridgeError(code, std::move(message), std::move(detail));
    }
}

void ParamReader::Missing(const char* key) {
    Fail(ErrorCode::MissingParameter, std::string("Parameter '") + key + "' is required");
}

void ParamReader::Mismatch(const char* key, const char* expected, const json& actual) {
    Fail(ErrorCode::TypeMismatch,
         std::string("Parameter '") + key + "' must be " + expected,
         std::string("got ") + actual.type_name());
}

bool ParamReader::ToFloat(const char* key, const json& value, float& out) {
    const double d = value.get<double>();
    if (!std::isfinite(d) || std::fabs(d) > static_cast<double>(std::numeric_limits<float>::max())) {
        Fail(ErrorCode::TypeMismatch, std::string("Parameter '") + key + "' must be finite",
             "got " + value.dump());
        return false;
    }
    out = static_cast<float>(d);
    return true;
}

void ParamReader::Require(const char* key, std::string& out) {
    if (m_error) return;
    if (!Optional(key, out) && !m_error) {
        Missing(key);
    }
}

void ParamReader::Require(const char* key, bool& out) {
    if (m_error) return;
    if (!Optional(key, out) && !m_error) {
        Missing(key);
    }
}

void ParamReader::Require(const char* key, float& out) {
    if (m_error) return;
    if (!Optional(key, out) && !m_error) {
        Missing(key);
    }
}

bool ParamReader::Optional(const char* key, std::string& out) {
    if (m_error) return false;
    const json* v = Find(key);
    if (!v) {
        return false;
    }
    if (!v->is_string()) {
        Mismatch(key, "a string", *v);
        return false;
    }
    out = v->get<std::string>();
    return true;
}

bool ParamReader::Optional(const char* key, bool& out) {
    if (m_error) return false;
    const json* v = Find(key);
    if (!v) {
        return false;
    }
    if (!v->is_boolean()) {
        Mismatch(key, "a boolean", *v);
        return false;
    }
    out = v->get<bool>();
    return true;
}

bool ParamReader::Optional(const char* key, float& out) {
    if (m_error) return false;
    const json* v = Find(key);
    if (!v) {
        return false;
    }
    if (!v->is_number()) {
        Mismatch(key, "a number", *v);
        return false;
    }
    return ToFloat(key, *v, out);
}

bool ParamReader::ReadColor(const char* key, const json& value, glm::vec4& out) {
    if (!value.is_array()) {
        Mismatch(key, "an array of numbers", value);
        return false;
    }
    if (value.size() < 3 || value.size() > 4) {
        Fail(ErrorCode::InvalidArity,
             std::string("Parameter '") + key + "' must have 3 or 4 components",
             "got " + std::to_string(value.size()));
        return false;
    }
    glm::vec4 c(1.0f);
    for (size_t i = 0; i < value.size(); ++i) {
        if (!value[i].is_number()) {
            Mismatch(key, "an array of numbers", value[i]);
            return false;
        }
        if (!ToFloat(key, value[i], c[static_cast<glm::length_t>(i)])) {
            return false;
        }
    }
    out = c;
    return true;
}

bool ParamReader::OptionalColor(const char* key, glm::vec4& out) {
    if (m_error) return false;
    const json* v = Find(key);
    if (!v) {
        return false;
    }
    return ReadColor(key, *v, out);
}

bool ParamReader::OptionalVec2(const char* key, glm::vec2& out) {
    if (m_error) return false;
    const json* v = Find(key);
    if (!v) {
        return false;
    }
    if (!v->is_array()) {
        Mismatch(key, "an array of 2 numbers", *v);
        return false;
    }
    if (v->size() != 2) {
        Fail(ErrorCode::InvalidArity,
             std::string("Parameter '") + key + "' must have 2 components",
             "got " + std::to_string(v->size()));
        return false;
    }
    if (!(*v)[0].is_number() || !(*v)[1].is_number()) {
        Mismatch(key, "an array of 2 numbers", *v);
        return false;
    }
    glm::vec2 result(0.0f);
    if (!ToFloat(key, (*v)[0], result.x) || !ToFloat(key, (*v)[1], result.y)) {
        return false;
    }
    out = result;
    return true;
}

} // namespace Conduit::Bridge
