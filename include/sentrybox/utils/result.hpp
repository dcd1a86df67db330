/**
 * @file result.hpp
 * @brief Value-or-error return type used across SentryBox components
 *
 * Gating operations (authentication, parsing, configuration loading) report
 * failure through a Result instead of throwing, so that "operation failed" and
 * "operation found nothing" stay distinct, testable states.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <utility>
#include <variant>
#include <stdexcept>

namespace sentrybox {
namespace utils {

/**
 * @enum ErrorCode
 * @brief Error taxonomy shared by every component
 */
enum class ErrorCode {
    AUTH_ERROR,               ///< Unknown principal, bad credential, invalid session
    PERMISSION_DENIED,        ///< Valid principal without a matching grant
    SCAN_BLOCKED,             ///< Static analysis verdict prohibits execution
    LAUNCH_FAILURE,           ///< Isolated context could not be created
    TIMEOUT,                  ///< Wall-clock deadline reached
    RESOURCE_LIMIT_EXCEEDED,  ///< OS-enforced ceiling hit
    CANCELLED,                ///< Caller cancelled the execution
    PARSE_ERROR,              ///< Input could not be parsed
    NOT_FOUND,                ///< Referenced entity does not exist
    INVALID_ARGUMENT,         ///< Malformed request
    INTERNAL_ERROR            ///< Unexpected fault
};

/**
 * @struct Error
 * @brief Error code plus a sanitized, user-presentable message
 */
struct Error {
    ErrorCode code{ErrorCode::INTERNAL_ERROR};
    std::string message;
};

std::string ErrorCodeToString(ErrorCode code);

/**
 * @class Result
 * @brief Holds either a value of type T or an Error
 *
 * **Usage Example**:
 * @code
 * Result<std::string> token = service.Authenticate("alice", "secret");
 * if (!token) {
 *     spdlog::warn("Login failed: {}", token.error().message);
 *     return;
 * }
 * UseToken(token.value());
 * @endcode
 */
template <typename T>
class Result {
public:
    Result(T value) : storage_(std::move(value)) {}
    Result(Error error) : storage_(std::move(error)) {}

    static Result Failure(ErrorCode code, std::string message) {
        return Result(Error{code, std::move(message)});
    }

    bool ok() const { return std::holds_alternative<T>(storage_); }
    explicit operator bool() const { return ok(); }

    const T& value() const& {
        if (!ok()) {
            throw std::logic_error("Result::value() called on error: " + error().message);
        }
        return std::get<T>(storage_);
    }

    T&& value() && {
        if (!ok()) {
            throw std::logic_error("Result::value() called on error: " + error().message);
        }
        return std::get<T>(std::move(storage_));
    }

    const Error& error() const {
        return std::get<Error>(storage_);
    }

    T value_or(T fallback) const {
        return ok() ? std::get<T>(storage_) : std::move(fallback);
    }

private:
    std::variant<T, Error> storage_;
};

/**
 * @class Status
 * @brief Result without a payload
 */
class Status {
public:
    Status() = default;
    Status(Error error) : error_(std::move(error)), ok_(false) {}

    static Status Ok() { return Status{}; }
    static Status Failure(ErrorCode code, std::string message) {
        return Status(Error{code, std::move(message)});
    }

    bool ok() const { return ok_; }
    explicit operator bool() const { return ok_; }
    const Error& error() const { return error_; }

private:
    Error error_;
    bool ok_{true};
};

} // namespace utils
} // namespace sentrybox
