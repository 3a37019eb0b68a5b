#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace shelf {

// Error types
enum class ErrorCode {
    Success = 0,
    InvalidArgument,
    TransientNetworkError,
    AuthExpired,
    CorruptManifest,
    SizeMismatch,
    ChecksumMismatch,
    ArchiveCorrupt,
    FilesystemError,
    UnknownItem,
    FetchFailed,
    HttpError,
    InvalidData,
    OperationCancelled,
    NotSupported,
    Unknown
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::TransientNetworkError: return "Transient network error";
        case ErrorCode::AuthExpired: return "Authentication expired";
        case ErrorCode::CorruptManifest: return "Corrupt manifest";
        case ErrorCode::SizeMismatch: return "Size mismatch";
        case ErrorCode::ChecksumMismatch: return "Checksum mismatch";
        case ErrorCode::ArchiveCorrupt: return "Archive corrupt";
        case ErrorCode::FilesystemError: return "Filesystem error";
        case ErrorCode::UnknownItem: return "Unknown item";
        case ErrorCode::FetchFailed: return "Fetch failed";
        case ErrorCode::HttpError: return "HTTP error";
        case ErrorCode::InvalidData: return "Invalid data";
        case ErrorCode::OperationCancelled: return "Operation cancelled";
        case ErrorCode::NotSupported: return "Not supported";
        case ErrorCode::Unknown: return "Unknown error";
    }
    return "Unknown error";
}

// Errors that abort the whole run rather than one unit of work
constexpr bool isFatal(ErrorCode error) {
    return error == ErrorCode::CorruptManifest || error == ErrorCode::AuthExpired;
}

// Errors worth another attempt after a backoff
constexpr bool isTransient(ErrorCode error) {
    return error == ErrorCode::TransientNetworkError;
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
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(data_);
    }

    T& value() & {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
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
            throw std::runtime_error("Result contains error");
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

} // namespace shelf

// fmt library support for ErrorCode (for spdlog)
#include <fmt/format.h>
template <> struct fmt::formatter<shelf::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(shelf::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", shelf::errorToString(error));
    }
};
