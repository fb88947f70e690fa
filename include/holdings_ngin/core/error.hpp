// include/holdings_ngin/core/error.hpp

#pragma once

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>

namespace holdings_ngin {

/**
 * @brief Error codes for the consolidation engine
 * Defines all possible error conditions that can occur
 */
enum class ErrorCode {
    NONE = 0,
    UNKNOWN_ERROR = 1,
    INVALID_ARGUMENT = 2,
    NOT_INITIALIZED = 3,

    // Data errors
    DATABASE_ERROR = 4,
    DATA_NOT_FOUND = 5,
    INVALID_DATA = 6,
    CONVERSION_ERROR = 7,

    // Configuration errors
    INVALID_CONFIGURATION = 8,

    // System errors
    CONNECTION_ERROR = 16,
    TIMEOUT_ERROR = 17,
    API_ERROR = 18,

    // File and I/O errors
    FILE_NOT_FOUND = 20,
    FILE_IO_ERROR = 21,

    // JSON and parsing errors
    JSON_PARSE_ERROR = 23,

    // Custom error range
    CUSTOM_ERROR_START = 1000
};

inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:
            return "NONE";
        case ErrorCode::UNKNOWN_ERROR:
            return "UNKNOWN_ERROR";
        case ErrorCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case ErrorCode::NOT_INITIALIZED:
            return "NOT_INITIALIZED";
        case ErrorCode::DATABASE_ERROR:
            return "DATABASE_ERROR";
        case ErrorCode::DATA_NOT_FOUND:
            return "DATA_NOT_FOUND";
        case ErrorCode::INVALID_DATA:
            return "INVALID_DATA";
        case ErrorCode::CONVERSION_ERROR:
            return "CONVERSION_ERROR";
        case ErrorCode::INVALID_CONFIGURATION:
            return "INVALID_CONFIGURATION";
        case ErrorCode::CONNECTION_ERROR:
            return "CONNECTION_ERROR";
        case ErrorCode::TIMEOUT_ERROR:
            return "TIMEOUT_ERROR";
        case ErrorCode::API_ERROR:
            return "API_ERROR";
        case ErrorCode::FILE_NOT_FOUND:
            return "FILE_NOT_FOUND";
        case ErrorCode::FILE_IO_ERROR:
            return "FILE_IO_ERROR";
        case ErrorCode::JSON_PARSE_ERROR:
            return "JSON_PARSE_ERROR";
        default:
            return "CUSTOM_ERROR";
    }
}

/**
 * @brief Exception type carrying an error code and the failing component
 */
class HoldingsError : public std::runtime_error {
public:
    /**
     * @brief Constructor for HoldingsError
     * @param code The error code
     * @param message Detailed error message
     * @param component Component where error occurred
     */
    HoldingsError(ErrorCode code, const std::string& message, const std::string& component = "")
        : std::runtime_error(message), code_(code), component_(component) {}

    /**
     * @brief Get the error code
     * @return ErrorCode representing the type of error
     */
    ErrorCode code() const noexcept {
        return code_;
    }

    /**
     * @brief Get the component where error occurred
     * @return String identifying the component
     */
    const std::string& component() const noexcept {
        return component_;
    }

    /**
     * @brief Convert error to string representation
     * @return Formatted error string
     */
    std::string to_string() const {
        return "Error in " + component_ + ": " + what() +
               " (Code: " + std::to_string(static_cast<int>(code_)) + ")";
    }

private:
    ErrorCode code_;
    std::string component_;
};

/**
 * @brief Result type for operations that can fail
 * @tparam T The type of the successful result
 */
template <typename T>
class Result {
public:
    /**
     * @brief Constructor for success case
     * @param value The successful result
     * @tparam U The type of the successful result
     */
    template <typename U = T>
    Result(U&& value) : value_(std::forward<U>(value)), error_(nullptr) {}

    /**
     * @brief Constructor for error case
     * @param error The error that occurred
     */
    Result(std::unique_ptr<HoldingsError> error) : value_(), error_(std::move(error)) {}

    Result(Result&& other) noexcept
        : value_(std::move(other.value_)), error_(std::move(other.error_)) {}

    Result& operator=(Result&& other) noexcept {
        if (this != &other) {
            value_ = std::move(other.value_);
            error_ = std::move(other.error_);
        }
        return *this;
    }

    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;

    /**
     * @brief Check if result represents success
     * @return true if operation was successful
     */
    bool is_ok() const {
        return error_ == nullptr;
    }

    /**
     * @brief Check if result represents error
     * @return true if operation failed
     */
    bool is_error() const {
        return error_ != nullptr;
    }

    /**
     * @brief Get the success value
     * @return Reference to the contained value
     * @throws HoldingsError if result represents an error
     */
    const T& value() const {
        if (error_)
            throw *error_;
        return value_;
    }

    /**
     * @brief Move the success value out of the result
     * @throws HoldingsError if result represents an error
     */
    T take_value() {
        if (error_)
            throw *error_;
        return std::move(value_);
    }

    /**
     * @brief Get the error if present
     * @return Pointer to the error, or nullptr if success
     */
    const HoldingsError* error() const {
        return error_.get();
    }

private:
    T value_;
    std::unique_ptr<HoldingsError> error_;
};

// Specialization for void
template <>
class Result<void> {
public:
    Result() : error_(nullptr) {}
    Result(std::unique_ptr<HoldingsError> error) : error_(std::move(error)) {}

    bool is_ok() const {
        return error_ == nullptr;
    }
    bool is_error() const {
        return error_ != nullptr;
    }

    void value() const {
        if (error_)
            throw *error_;
    }

    const HoldingsError* error() const {
        return error_.get();
    }

private:
    std::unique_ptr<HoldingsError> error_;
};

/**
 * @brief Helper for creating error results
 * @tparam T The type of the successful result
 * @param code The error code
 * @param message The error message
 * @param component The component where error occurred
 * @return Result representing the error
 */
template <typename T>
Result<T> make_error(ErrorCode code, const std::string& message,
                     const std::string& component = "") {
    return Result<T>(std::make_unique<HoldingsError>(code, message, component));
}

}  // namespace holdings_ngin
