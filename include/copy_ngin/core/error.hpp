// include/copy_ngin/core/error.hpp

#pragma once

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace copy_ngin {

/**
 * @brief Error codes for the copy-trading engine
 */
enum class ErrorCode {
    NONE = 0,
    UNKNOWN_ERROR = 1,
    INVALID_ARGUMENT = 2,
    NOT_INITIALIZED = 3,

    // Data errors
    DATA_NOT_FOUND = 4,
    INVALID_DATA = 5,

    // Trading errors
    ORDER_REJECTED = 6,
    INVALID_ORDER = 7,

    // External capability errors
    CONNECTION_ERROR = 8,
    API_ERROR = 9,
    RATE_LIMITED = 10,

    // Market data errors
    MARKET_DATA_ERROR = 11,

    // File and I/O errors
    FILE_NOT_FOUND = 12,
    FILE_IO_ERROR = 13,

    // JSON and parsing errors
    JSON_PARSE_ERROR = 14,

    // Lookup errors surfaced to the request layer
    ACCOUNT_NOT_FOUND = 15,
    SESSION_NOT_FOUND = 16,

    CUSTOM_ERROR_START = 1000
};

/**
 * @brief Name of an error code as used in log lines
 * @param code Error code
 * @return Enumerator name, "CUSTOM_ERROR" for codes from CUSTOM_ERROR_START on
 */
inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:
            return "NONE";
        case ErrorCode::UNKNOWN_ERROR:
            return "UNKNOWN_ERROR";
        case ErrorCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case ErrorCode::NOT_INITIALIZED:
            return "NOT_INITIALIZED";
        case ErrorCode::DATA_NOT_FOUND:
            return "DATA_NOT_FOUND";
        case ErrorCode::INVALID_DATA:
            return "INVALID_DATA";
        case ErrorCode::ORDER_REJECTED:
            return "ORDER_REJECTED";
        case ErrorCode::INVALID_ORDER:
            return "INVALID_ORDER";
        case ErrorCode::CONNECTION_ERROR:
            return "CONNECTION_ERROR";
        case ErrorCode::API_ERROR:
            return "API_ERROR";
        case ErrorCode::RATE_LIMITED:
            return "RATE_LIMITED";
        case ErrorCode::MARKET_DATA_ERROR:
            return "MARKET_DATA_ERROR";
        case ErrorCode::FILE_NOT_FOUND:
            return "FILE_NOT_FOUND";
        case ErrorCode::FILE_IO_ERROR:
            return "FILE_IO_ERROR";
        case ErrorCode::JSON_PARSE_ERROR:
            return "JSON_PARSE_ERROR";
        case ErrorCode::ACCOUNT_NOT_FOUND:
            return "ACCOUNT_NOT_FOUND";
        case ErrorCode::SESSION_NOT_FOUND:
            return "SESSION_NOT_FOUND";
        case ErrorCode::CUSTOM_ERROR_START:
            break;
    }
    return "CUSTOM_ERROR";
}

/**
 * @brief Error carried by a failed Result, thrown by Result::value()
 */
class TradeError : public std::runtime_error {
public:
    /**
     * @brief Constructor
     * @param code Error code
     * @param message Human-readable description, returned by what()
     * @param component Component that raised the error
     */
    TradeError(ErrorCode code, const std::string& message, const std::string& component = "")
        : std::runtime_error(message), code_(code), component_(component) {}

    /**
     * @brief Get the error code
     * @return Error code
     */
    ErrorCode code() const noexcept {
        return code_;
    }

    /**
     * @brief Get the component that raised the error
     * @return Component name, may be empty
     */
    const std::string& component() const noexcept {
        return component_;
    }

    /**
     * @brief Log form, e.g. "[RATE_LIMITED] CopySessionManager: Backing off 0xabc"
     */
    std::string to_string() const {
        std::string text = std::string("[") + error_code_to_string(code_) + "] ";
        if (!component_.empty()) {
            text += component_ + ": ";
        }
        return text + what();
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
     * @brief Construct a successful result
     * @param value The success value
     */
    template <typename U = T>
    Result(U&& value) : value_(std::forward<U>(value)), error_(nullptr) {}

    /**
     * @brief Construct a failed result
     * @param error The error, owned by the result
     */
    Result(std::unique_ptr<TradeError> error) : value_(), error_(std::move(error)) {}

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
     * @return True if success, false if error
     */
    bool is_ok() const {
        return error_ == nullptr;
    }

    /**
     * @brief Check if result represents error
     * @return True if error, false if success
     */
    bool is_error() const {
        return error_ != nullptr;
    }

    /**
     * @brief Get the success value
     * @return Reference to the contained value
     * @throws TradeError if result represents an error
     */
    const T& value() const {
        if (error_)
            throw *error_;
        return value_;
    }

    /**
     * @brief Get the error if present
     * @return Pointer to the error, or nullptr if success
     */
    const TradeError* error() const {
        return error_.get();
    }

private:
    T value_;
    std::unique_ptr<TradeError> error_;
};

// Specialization for void
template <>
class Result<void> {
public:
    /**
     * @brief Construct a successful result
     */
    Result() : error_(nullptr) {}

    /**
     * @brief Construct a failed result
     * @param error The error, owned by the result
     */
    Result(std::unique_ptr<TradeError> error) : error_(std::move(error)) {}

    bool is_ok() const {
        return error_ == nullptr;
    }
    bool is_error() const {
        return error_ != nullptr;
    }

    /**
     * @brief Rethrow the error, if any
     * @throws TradeError if result represents an error
     */
    void value() const {
        if (error_)
            throw *error_;
    }

    /**
     * @brief Get the error if present
     * @return Pointer to the error, or nullptr if success
     */
    const TradeError* error() const {
        return error_.get();
    }

private:
    std::unique_ptr<TradeError> error_;
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
    return Result<T>(std::make_unique<TradeError>(code, message, component));
}

}  // namespace copy_ngin
