#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace s3pull {

using ByteSpan = std::span<const std::byte>;
using ByteVector = std::vector<std::byte>;

// Error codes shared by the transfer core, the storage provider and configuration
enum class ErrorCode {
    None = 0,
    InvalidArgument,
    NetworkError,
    Timeout,
    ServerError,
    Throttled,
    NotFound,
    PermissionDenied,
    IoError,
    SizeMismatch,
    SizeExceedsExpected,
    ChecksumMismatch,
    InvalidKey,
    Cancelled,
    ConfigError,
    Unknown
};

constexpr const char* errorToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "none";
        case ErrorCode::InvalidArgument: return "invalid_argument";
        case ErrorCode::NetworkError: return "network_error";
        case ErrorCode::Timeout: return "timeout";
        case ErrorCode::ServerError: return "server_error";
        case ErrorCode::Throttled: return "throttled";
        case ErrorCode::NotFound: return "not_found";
        case ErrorCode::PermissionDenied: return "permission_denied";
        case ErrorCode::IoError: return "io_error";
        case ErrorCode::SizeMismatch: return "size_mismatch";
        case ErrorCode::SizeExceedsExpected: return "size_exceeds_expected";
        case ErrorCode::ChecksumMismatch: return "checksum_mismatch";
        case ErrorCode::InvalidKey: return "invalid_key";
        case ErrorCode::Cancelled: return "cancelled";
        case ErrorCode::ConfigError: return "config_error";
        case ErrorCode::Unknown: return "unknown";
    }
    return "unknown";
}

/**
 * Transient errors are worth another attempt against the same byte offset:
 * connection resets, timeouts, throttling and provider-side 5xx.
 */
constexpr bool isTransient(ErrorCode code) {
    return code == ErrorCode::NetworkError || code == ErrorCode::Timeout ||
           code == ErrorCode::ServerError || code == ErrorCode::Throttled;
}

struct Error {
    ErrorCode code{ErrorCode::None};
    std::string message;
};

// =========================
// Lightweight Expected<T>
// =========================

/**
 * Minimal Expected<T> (header-only, no exceptions required).
 * - If ok() is true, value() is valid; otherwise error() is set.
 */
template <typename T> class Expected {
public:
    Expected() = default;
    Expected(const T& v) : _ok(true), _value(v) {}
    Expected(T&& v) noexcept : _ok(true), _value(std::move(v)) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    [[nodiscard]] const T& value() const& { return _value; }
    [[nodiscard]] T& value() & { return _value; }
    [[nodiscard]] T&& value() && { return std::move(_value); }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{false};
    T _value{};
    Error _error{};
};

// Specialization for Expected<void>
template <> class Expected<void> {
public:
    Expected() : _ok(true) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{true};
    Error _error{};
};

} // namespace s3pull

// fmt support for ErrorCode (for spdlog)
#include <spdlog/fmt/fmt.h>
template <> struct fmt::formatter<s3pull::ErrorCode> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(s3pull::ErrorCode code, FormatContext& ctx) const {
        return fmt::formatter<std::string_view>::format(s3pull::errorToString(code), ctx);
    }
};
