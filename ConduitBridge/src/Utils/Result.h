#pragma once

#include <string>
#include <variant>
#include <utility>
#include <cstdint>

namespace Conduit {

// Failure taxonomy shared by every command. The enumerator name is also the
// wire name reported in error envelopes (see ErrorCodeName).
enum class ErrorCode : uint8_t {
    MissingParameter,
    TypeMismatch,
    InvalidArity,
    InvalidName,
    NotFound,
    AlreadyExists,
    DirectoryCreateFailed,
    UnsupportedSlot,
    UnknownTemplate,
    UnknownCommand,
    MalformedRequest,
    DecodeFailed,
    WriteFailed,
    Unknown
};

inline const char* ErrorCodeName(ErrorCode code);

struct BridgeError {
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
    std::string detail;     // optional diagnostic context, empty when absent

    BridgeError() = default;
    BridgeError(ErrorCode c, std::string msg, std::string det = {})
        : code(c), message(std::move(msg)), detail(std::move(det)) {}
};

// Expected-style result; the error side defaults to BridgeError so handler
// code can return a classified failure without naming the type.
template<typename T, typename E = BridgeError>
class Result {
private:
    // Wrapper to disambiguate when T and E are the same type
    struct ErrorWrapper {
        E error;
        explicit ErrorWrapper(E e) : error(std::move(e)) {}
    };

public:
    static Result Ok(T value) {
        return Result(std::move(value), true);
    }

    static Result Err(E error) {
        return Result(ErrorWrapper(std::move(error)), false);
    }

    // Shorthand for the common BridgeError case
    static Result Err(ErrorCode code, std::string message, std::string detail = {}) {
        return Err(E(code, std::move(message), std::move(detail)));
    }

    [[nodiscard]] bool IsOk() const { return std::holds_alternative<T>(m_data); }
    [[nodiscard]] bool IsErr() const { return std::holds_alternative<ErrorWrapper>(m_data); }

    [[nodiscard]] T& Value() & { return std::get<T>(m_data); }
    [[nodiscard]] const T& Value() const& { return std::get<T>(m_data); }
    [[nodiscard]] T&& Value() && { return std::move(std::get<T>(m_data)); }

    [[nodiscard]] E& Error() & { return std::get<ErrorWrapper>(m_data).error; }
    [[nodiscard]] const E& Error() const& { return std::get<ErrorWrapper>(m_data).error; }

    [[nodiscard]] T ValueOr(T default_value) const& {
        return IsOk() ? Value() : std::move(default_value);
    }

private:
    explicit Result(T value, bool) : m_data(std::move(value)) {}
    explicit Result(ErrorWrapper error, bool) : m_data(std::move(error)) {}

    std::variant<T, ErrorWrapper> m_data;
};

template<typename E>
class Result<void, E> {
public:
    static Result Ok() { return Result(true); }
    static Result Err(E error) {
        Result r(false);
        r.m_error = std::move(error);
        return r;
    }
    static Result Err(ErrorCode code, std::string message, std::string detail = {}) {
        return Err(E(code, std::move(message), std::move(detail)));
    }

    [[nodiscard]] bool IsOk() const { return m_ok; }
    [[nodiscard]] bool IsErr() const { return !m_ok; }

    [[nodiscard]] const E& Error() const { return m_error; }

private:
    explicit Result(bool ok) : m_ok(ok) {}

    bool m_ok;
    E m_error{};
};

inline const char* ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::MissingParameter:      return "MissingParameter";
        case ErrorCode::TypeMismatch:          return "TypeMismatch";
        case ErrorCode::InvalidArity:          return "InvalidArity";
        case ErrorCode::InvalidName:           return "InvalidName";
        case ErrorCode::NotFound:              return "NotFound";
        case ErrorCode::AlreadyExists:         return "AlreadyExists";
        case ErrorCode::DirectoryCreateFailed: return "DirectoryCreateFailed";
        case ErrorCode::UnsupportedSlot:       return "UnsupportedSlot";
        case ErrorCode::UnknownTemplate:       return "UnknownTemplate";
        case ErrorCode::UnknownCommand:        return "UnknownCommand";
        case ErrorCode::MalformedRequest:      return "MalformedRequest";
        case ErrorCode::DecodeFailed:          return "DecodeFailed";
        case ErrorCode::WriteFailed:           return "WriteFailed";
        case ErrorCode::Unknown:               return "Unknown";
    }
    return "Unknown";
}

} // namespace Conduit
