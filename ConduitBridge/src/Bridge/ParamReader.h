#pragma once

#include <optional>
#include <string>
#include <glm/glm.hpp>
#include <nlohmann/json.hpp>
#include "Utils/Result.h"

namespace Conduit::Bridge {

// Typed reads from a command's parameter object.
//
// The reader fails closed: the first missing or mistyped parameter is
// recorded and every later read becomes a no-op, so a decoder can read all
// of its fields and check HasError() once at the end. Null values count as
// absent. A present value of the wrong type is an error even for optional
// parameters.
class ParamReader {
public:
    explicit ParamReader(const nlohmann::json& params) : m_params(params) {}

    void Require(const char* key, std::string& out);
    void Require(const char* key, bool& out);
    void Require(const char* key, float& out);

    // Return true when the key was present and read into out
    bool Optional(const char* key, std::string& out);
    bool Optional(const char* key, bool& out);
    bool Optional(const char* key, float& out);

    // Numeric array of 3 (alpha = 1) or 4 components
    bool OptionalColor(const char* key, glm::vec4& out);

    // Numeric array of exactly 2 components
    bool OptionalVec2(const char* key, glm::vec2& out);

    [[nodiscard]] bool HasError() const { return m_error.has_value(); }
    [[nodiscard]] const BridgeError& Error() const { return *m_error; }

    // Wrap a decoded record, or the first recorded error
    template<typename T>
    Result<T> Finish(T record) const {
        if (m_error) {
            return Result<T>::Err(*m_error);
        }
        return Result<T>::Ok(std::move(record));
    }

private:
    const nlohmann::json* Find(const char* key) const;
    void Fail(ErrorCode code, std::string message, std::string detail = {});
    void Missing(const char* key);
    void Mismatch(const char* key, const char* expected, const nlohmann::json& actual);

    // Number to float; non-finite or out-of-range values are a TypeMismatch
    bool ToFloat(const char* key, const nlohmann::json& value, float& out);
    bool ReadColor(const char* key, const nlohmann::json& value, glm::vec4& out);

    const nlohmann::json& m_params;
    std::optional<BridgeError> m_error;
};

} // namespace Conduit::Bridge
