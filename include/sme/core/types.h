#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace sme {

// Type aliases
using Hash = std::string;
using TimePoint = std::chrono::system_clock::time_point;

// Error types
enum class ErrorCode {
    Success = 0,
    FileNotFound,
    PermissionDenied,
    CorruptedData,
    InvalidArgument,
    NetworkError,
    Timeout,
    ServiceUnavailable,
    InvalidState,
    InvalidData,
    InternalError,
    NotFound,
    NotSupported,
    NotInitialized,
    WriteError,
    ConfigurationError,
    MissingArtifact,
    Unknown
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success:
            return "Success";
        case ErrorCode::FileNotFound:
            return "File not found";
        case ErrorCode::PermissionDenied:
            return "Permission denied";
        case ErrorCode::CorruptedData:
            return "Corrupted data";
        case ErrorCode::InvalidArgument:
            return "Invalid argument";
        case ErrorCode::NetworkError:
            return "Network error";
        case ErrorCode::Timeout:
            return "Operation timed out";
        case ErrorCode::ServiceUnavailable:
            return "Service unavailable";
        case ErrorCode::InvalidState:
            return "Invalid state";
        case ErrorCode::InvalidData:
            return "Invalid data";
        case ErrorCode::InternalError:
            return "Internal error";
        case ErrorCode::NotFound:
            return "Not found";
        case ErrorCode::NotSupported:
            return "Not supported";
        case ErrorCode::NotInitialized:
            return "Not initialized";
        case ErrorCode::WriteError:
            return "Write error";
        case ErrorCode::ConfigurationError:
            return "Configuration error";
        case ErrorCode::MissingArtifact:
            return "Missing artifact";
        case ErrorCode::Unknown:
            return "Unknown error";
    }
    return "Unknown error";
}

// Errors that must abort an ingestion run or a retriever construction rather than
// skip the affected unit.
constexpr bool isFatal(ErrorCode error) {
    return error == ErrorCode::ConfigurationError || error == ErrorCode::MissingArtifact;
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

// Result type for operations that can fail
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

} // namespace sme

// Format support for ErrorCode
#if defined(SME_HAS_STD_FORMAT) && SME_HAS_STD_FORMAT
#include <format>
template <> struct std::formatter<sme::ErrorCode> {
    constexpr auto parse(std::format_parse_context& ctx) { return ctx.begin(); }

    auto format(sme::ErrorCode error, std::format_context& ctx) const {
        return std::format_to(ctx.out(), "{}", sme::errorToString(error));
    }
};
#endif

// fmt library support for ErrorCode (for spdlog)
#include <spdlog/fmt/fmt.h>
template <> struct fmt::formatter<sme::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(sme::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", sme::errorToString(error));
    }
};

namespace sme {

// Common constants
inline constexpr size_t SHA256_HEX_SIZE = 64;
inline constexpr size_t SHA1_HEX_SIZE = 40;
inline constexpr size_t DEFAULT_BUFFER_SIZE = 64 * 1024; // 64KB

} // namespace sme
