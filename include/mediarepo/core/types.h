#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <spdlog/fmt/fmt.h>

namespace mediarepo {

// Type aliases
using Hash = std::string;
using ByteVector = std::vector<std::byte>;
using ByteSpan = std::span<const std::byte>;
using TimePoint = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;

// Error types
enum class ErrorCode {
    Success = 0,
    NotFound,
    Conflict,
    StorageUnavailable,
    IntegrityError,
    UpstreamDisconnected,
    InvalidArgument,
    InvalidState,
    DatabaseError,
    IOError,
    RenderFailed,
    ResourceExhausted,
    Timeout,
    InternalError,
    Unknown
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::Conflict: return "Conflict";
        case ErrorCode::StorageUnavailable: return "Storage unavailable";
        case ErrorCode::IntegrityError: return "Integrity error";
        case ErrorCode::UpstreamDisconnected: return "Upstream disconnected";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::DatabaseError: return "Database error";
        case ErrorCode::IOError: return "I/O error";
        case ErrorCode::RenderFailed: return "Render failed";
        case ErrorCode::ResourceExhausted: return "Resource exhausted";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::Unknown: return "Unknown error";
    }
    return "Unknown error";
}

// Error struct for detailed error information
struct Error {
    ErrorCode code;
    std::string message;

    Error() : code(ErrorCode::Success), message("") {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}

    bool operator==(ErrorCode c) const { return code == c; }

    bool operator!=(ErrorCode c) const { return code != c; }

    friend bool operator==(ErrorCode c, const Error& error) { return error.code == c; }

    friend bool operator!=(ErrorCode c, const Error& error) { return error.code != c; }
};

// Simple Result type for operations that can fail
template <typename T> class Result {
public:
    Result(T&& value) : data_(std::move(value)) {}
    Result(const T& value) : data_(value) {}
    Result(ErrorCode error) : data_(Error{error}) {}
    Result(Error error) : data_(std::move(error)) {}

    bool has_value() const noexcept { return std::holds_alternative<T>(data_); }

    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(data_);
    }

    T& value() & {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(std::move(data_));
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return std::get<Error>(data_);
    }

private:
    std::variant<T, Error> data_;
};

// Specialization for void
template <> class Result<void> {
public:
    Result() : error_() {}
    Result(ErrorCode error) : error_(Error{error}) {}
    Result(Error error) : error_(std::move(error)) {}

    bool has_value() const noexcept { return error_.code == ErrorCode::Success; }

    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + error_.message);
        }
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return error_;
    }

private:
    Error error_{ErrorCode::Success, ""};
};

/**
 * Early return on error for expressions yielding Result<void> (or any Result whose value is
 * not needed).
 */
#define MEDIAREPO_TRY(expr)                                                                        \
    do {                                                                                           \
        auto _mediarepo_try_result = (expr);                                                       \
        if (!_mediarepo_try_result.has_value()) {                                                  \
            return _mediarepo_try_result.error();                                                  \
        }                                                                                          \
    } while (0)

/**
 * Declare `var` from the value of a Result, returning the error if there is none.
 */
#define MEDIAREPO_TRY_UNWRAP(var, expr)                                                            \
    auto _mediarepo_res_##var = (expr);                                                            \
    if (!_mediarepo_res_##var.has_value()) {                                                       \
        return _mediarepo_res_##var.error();                                                       \
    }                                                                                              \
    auto var = std::move(_mediarepo_res_##var).value()

// Helpers for storing times as unix seconds
inline int64_t toUnixSeconds(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

inline TimePoint fromUnixSeconds(int64_t seconds) {
    return TimePoint{std::chrono::seconds{seconds}};
}

inline ByteVector toBytes(std::string_view text) {
    ByteVector out(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        out[i] = static_cast<std::byte>(text[i]);
    }
    return out;
}

inline std::string toString(ByteSpan bytes) {
    return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

// Common constants
inline constexpr size_t HASH_STRING_SIZE = 64; // SHA-256, hex encoded
inline constexpr size_t DEFAULT_BUFFER_SIZE = 64 * 1024;

} // namespace mediarepo

// fmt library support for ErrorCode (for spdlog)
template <> struct fmt::formatter<mediarepo::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(mediarepo::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", mediarepo::errorToString(error));
    }
};
