#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace spindle {

enum class ErrorCode {
    Success = 0,
    FileNotFound,
    PermissionDenied,
    IoError,
    InvalidArgument,
    InvalidSpeed,
    OutOfRangeSpeed,
    InvalidData,
    WriteError,
    InternalError,
    Unknown
};

// Human-readable default message for a code
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::FileNotFound: return "File not found";
        case ErrorCode::PermissionDenied: return "Permission denied";
        case ErrorCode::IoError: return "I/O error";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InvalidSpeed: return "Invalid spindle speed";
        case ErrorCode::OutOfRangeSpeed: return "Spindle speed out of range";
        case ErrorCode::InvalidData: return "Invalid data";
        case ErrorCode::WriteError: return "Write error";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::Unknown: break;
    }
    return "Unknown error";
}

// Stable identifier written to JSON summaries and skip reasons
constexpr const char* errorCodeName(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::FileNotFound: return "FileNotFound";
        case ErrorCode::PermissionDenied: return "PermissionDenied";
        case ErrorCode::IoError: return "IOError";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidSpeed: return "InvalidSpeed";
        case ErrorCode::OutOfRangeSpeed: return "OutOfRangeSpeed";
        case ErrorCode::InvalidData: return "InvalidData";
        case ErrorCode::WriteError: return "WriteFailure";
        case ErrorCode::InternalError: return "InternalError";
        case ErrorCode::Unknown: break;
    }
    return "Unknown";
}

struct Error {
    ErrorCode code = ErrorCode::Unknown;
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}

    bool operator==(ErrorCode c) const { return code == c; }
    bool operator!=(ErrorCode c) const { return code != c; }
};

/**
 * Value-or-Error return used by every fallible operation. Accessing the wrong
 * alternative throws std::logic_error; callers test with has_value() or bool.
 */
template <typename T> class Result {
public:
    Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}
    Result(Error error) : data_(std::in_place_index<1>, std::move(error)) {}
    Result(ErrorCode code) : Result(Error{code}) {}

    bool has_value() const noexcept { return data_.index() == 0; }
    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& { return std::get<0>(checked()); }
    T& value() & { return std::get<0>(checked()); }
    T&& value() && { return std::get<0>(std::move(checked())); }

    const Error& error() const {
        if (has_value())
            throw std::logic_error("Result holds a value, not an error");
        return std::get<1>(data_);
    }

private:
    std::variant<T, Error>& checked() {
        if (!has_value())
            throw std::logic_error("Result holds an error: " + std::get<1>(data_).message);
        return data_;
    }
    const std::variant<T, Error>& checked() const {
        return const_cast<Result*>(this)->checked();
    }

    std::variant<T, Error> data_;
};

template <> class Result<void> {
public:
    Result() = default;
    Result(Error error) : error_(std::move(error)) {}
    Result(ErrorCode code) : error_(Error{code}) {}

    bool has_value() const noexcept { return !error_.has_value(); }
    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (error_)
            throw std::logic_error("Result holds an error: " + error_->message);
    }

    const Error& error() const {
        if (!error_)
            throw std::logic_error("Result holds a value, not an error");
        return *error_;
    }

private:
    std::optional<Error> error_;
};

} // namespace spindle
