#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <optional>
#include <string>
#include <utility>


///////////////////////////
///       ERRORS        ///
///////////////////////////
/**
 * @brief Caller-facing failure categories of core operations.
 *
 * None of these is fatal; the boundary layer maps them to its own status
 * signalling.
 */
enum class ErrorKind {
    DUPLICATE_ROOM, ///< Registering an id that already exists.
    ROOM_NOT_FOUND, ///< Lookup of an unknown room id.
    NO_AVAILABLE_ROOM, ///< Allocation filters left no candidate.
    INVALID_REQUEST ///< Missing or malformed request fields.
};

/// Stable display name, e.g. "NoAvailableRoomError".
const char* errorKindName(ErrorKind kind);

/**
 * @brief Error kind plus a human-readable explanation.
 */
struct EngineError {
    ErrorKind kind;
    std::string message;
};

/**
 * @brief Either a value of type T or an EngineError.
 *
 * Core operations return this instead of throwing for business conditions.
 */
template <typename T>
class Result {
public:
    static Result success(T value) {
        Result r;
        r.value_ = std::move(value);
        return r;
    }

    static Result failure(ErrorKind kind, std::string message) {
        Result r;
        r.error_ = EngineError{kind, std::move(message)};
        return r;
    }

    static Result failure(EngineError error) {
        Result r;
        r.error_ = std::move(error);
        return r;
    }

    bool ok() const { return value_.has_value(); }
    explicit operator bool() const { return ok(); }

    /// Precondition: ok().
    const T& value() const { return *value_; }
    T& value() { return *value_; }

    /// Precondition: !ok().
    const EngineError& error() const { return *error_; }

private:
    Result() = default;

    std::optional<T> value_;
    std::optional<EngineError> error_;
};
