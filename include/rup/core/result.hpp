#pragma once

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace rup {

/**
 * @brief Error taxonomy shared by every layer of the pipeline
 *
 * Transfer-level kinds (TransientTransfer, UnsupportedTransport, Conflict)
 * never leave the executor/scheduler; callers only ever see InvalidInput
 * or a task that ended in Failed.
 */
enum class ErrorKind {
    InvalidInput,         ///< Bad submission, never retried
    TransientTransfer,    ///< Network error, 5xx, timeout (retryable)
    UnsupportedTransport, ///< Chunk endpoint absent, triggers whole-file fallback
    Cancelled,            ///< Caller-initiated pause or cancel
    PersistentTransfer,   ///< Retries exhausted or non-retryable response
    Conflict,             ///< Destination already occupied
    Storage               ///< Durable state could not be read or written
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidInput: return "invalid_input";
        case ErrorKind::TransientTransfer: return "transient_transfer";
        case ErrorKind::UnsupportedTransport: return "unsupported_transport";
        case ErrorKind::Cancelled: return "cancelled";
        case ErrorKind::PersistentTransfer: return "persistent_transfer";
        case ErrorKind::Conflict: return "conflict";
        case ErrorKind::Storage: return "storage";
    }
    return "unknown";
}

struct Error {
    ErrorKind kind = ErrorKind::InvalidInput;
    std::string message;

    Error() = default;
    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}
};

// Helper wrapper types for disambiguation when T == E
template<typename T>
struct OkValue {
    T value;
    explicit OkValue(T v) : value(std::move(v)) {}
};

template<typename E>
struct ErrValue {
    E error;
    explicit ErrValue(E e) : error(std::move(e)) {}
};

template<typename T, typename E = Error>
class Result {
private:
    std::variant<T, E> data_;

public:
    Result(OkValue<T> ok) : data_(std::in_place_index<0>, std::move(ok.value)) {}

    Result(ErrValue<E> err) : data_(std::in_place_index<1>, std::move(err.error)) {}

    bool is_ok() const { return data_.index() == 0; }
    bool is_error() const { return data_.index() == 1; }

    T& value() { return std::get<0>(data_); }
    const T& value() const { return std::get<0>(data_); }

    E& error() { return std::get<1>(data_); }
    const E& error() const { return std::get<1>(data_); }

    T value_or(T default_value) const {
        return is_ok() ? value() : std::move(default_value);
    }
};

template<typename E>
class Result<void, E> {
public:
    Result() : error_(std::nullopt) {}
    Result(ErrValue<E> err) : error_(std::move(err.error)) {}

    bool is_ok() const { return !error_.has_value(); }
    bool is_error() const { return error_.has_value(); }

    const E& error() const { return error_.value(); }

private:
    std::optional<E> error_;
};

template<typename T>
Result<T> Ok(T value) { return Result<T>(OkValue<T>(std::move(value))); }

template<typename E = Error>
Result<void, E> Ok() { return Result<void, E>(); }

template<typename T, typename E = Error>
Result<T, E> Err(E error) { return Result<T, E>(ErrValue<E>(std::move(error))); }

template<typename T>
Result<T> Err(ErrorKind kind, std::string message) {
    return Result<T>(ErrValue<Error>(Error(kind, std::move(message))));
}

} // namespace rup
