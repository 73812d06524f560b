// include/papertrade/core/error.hpp

#pragma once

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>

namespace papertrade {

/**
 * @brief Error codes for the paper trading engine
 * Order rejections are reported with their own codes so callers can
 * tell a risk breach from a malformed stop without parsing messages
 */
enum class ErrorCode {
    NONE = 0,
    UNKNOWN_ERROR = 1,
    INVALID_ARGUMENT = 2,
    NOT_INITIALIZED = 3,

    // Data errors
    DATA_NOT_FOUND = 4,
    INVALID_DATA = 5,
    INSUFFICIENT_DATA = 6,

    // Order rejections
    CONFIDENCE_BELOW_THRESHOLD = 7,
    POSITION_ALREADY_OPEN = 8,
    POSITION_LIMIT_EXCEEDED = 9,
    INVALID_STOP_PLACEMENT = 10,
    INSUFFICIENT_FUNDS = 11,
    NO_OPEN_POSITION = 12,
    INVALID_ORDER = 13,

    // Strategy errors
    STRATEGY_ERROR = 14,
    INVALID_SIGNAL = 15,

    // Scheduler errors
    CYCLE_IN_PROGRESS = 16,
    PROMOTION_REJECTED = 17,

    // Configuration errors
    INVALID_CONFIGURATION = 18,

    // File and parsing errors
    FILE_NOT_FOUND = 19,
    FILE_IO_ERROR = 20,
    JSON_PARSE_ERROR = 21,

    // Lifecycle errors
    INVALID_STATE_TRANSITION = 22,
    ALREADY_RUNNING = 23,

    CUSTOM_ERROR_START = 1000
};

/**
 * @brief Get a readable name for an error code
 * @param code Error code
 * @return Upper-case identifier of the code
 */
inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:
            return "NONE";
        case ErrorCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case ErrorCode::NOT_INITIALIZED:
            return "NOT_INITIALIZED";
        case ErrorCode::DATA_NOT_FOUND:
            return "DATA_NOT_FOUND";
        case ErrorCode::INVALID_DATA:
            return "INVALID_DATA";
        case ErrorCode::INSUFFICIENT_DATA:
            return "INSUFFICIENT_DATA";
        case ErrorCode::CONFIDENCE_BELOW_THRESHOLD:
            return "CONFIDENCE_BELOW_THRESHOLD";
        case ErrorCode::POSITION_ALREADY_OPEN:
            return "POSITION_ALREADY_OPEN";
        case ErrorCode::POSITION_LIMIT_EXCEEDED:
            return "POSITION_LIMIT_EXCEEDED";
        case ErrorCode::INVALID_STOP_PLACEMENT:
            return "INVALID_STOP_PLACEMENT";
        case ErrorCode::INSUFFICIENT_FUNDS:
            return "INSUFFICIENT_FUNDS";
        case ErrorCode::NO_OPEN_POSITION:
            return "NO_OPEN_POSITION";
        case ErrorCode::INVALID_ORDER:
            return "INVALID_ORDER";
        case ErrorCode::STRATEGY_ERROR:
            return "STRATEGY_ERROR";
        case ErrorCode::INVALID_SIGNAL:
            return "INVALID_SIGNAL";
        case ErrorCode::CYCLE_IN_PROGRESS:
            return "CYCLE_IN_PROGRESS";
        case ErrorCode::PROMOTION_REJECTED:
            return "PROMOTION_REJECTED";
        case ErrorCode::INVALID_CONFIGURATION:
            return "INVALID_CONFIGURATION";
        case ErrorCode::FILE_NOT_FOUND:
            return "FILE_NOT_FOUND";
        case ErrorCode::FILE_IO_ERROR:
            return "FILE_IO_ERROR";
        case ErrorCode::JSON_PARSE_ERROR:
            return "JSON_PARSE_ERROR";
        case ErrorCode::INVALID_STATE_TRANSITION:
            return "INVALID_STATE_TRANSITION";
        case ErrorCode::ALREADY_RUNNING:
            return "ALREADY_RUNNING";
        default:
            return "UNKNOWN_ERROR";
    }
}

/**
 * @brief Exception type carrying an error code and the failing component
 */
class TradeError : public std::runtime_error {
public:
    /**
     * @brief Constructor for TradeError
     * @param code The error code
     * @param message Detailed error message
     * @param component Component where error occurred
     */
    TradeError(ErrorCode code, const std::string& message, const std::string& component = "")
        : std::runtime_error(message), code_(code), component_(component) {}

    ErrorCode code() const noexcept {
        return code_;
    }

    const std::string& component() const noexcept {
        return component_;
    }

    /**
     * @brief Convert error to string representation
     * @return Formatted error string
     */
    std::string to_string() const {
        return "Error in " + component_ + ": " + what() + " (" + error_code_to_string(code_) +
               ")";
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
     */
    template <typename U = T>
    Result(U&& value) : value_(std::forward<U>(value)), error_(nullptr) {}

    /**
     * @brief Constructor for error case
     * @param error The error that occurred
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

    bool is_ok() const {
        return error_ == nullptr;
    }

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
     * @brief Move the success value out of the result
     * @throws TradeError if result represents an error
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
    Result() : error_(nullptr) {}
    Result(std::unique_ptr<TradeError> error) : error_(std::move(error)) {}

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

    const TradeError* error() const {
        return error_.get();
    }

private:
    std::unique_ptr<TradeError> error_;
};

/**
 * @brief Helper for creating error results
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

/**
 * @brief Re-wrap an error from one result type into another
 */
template <typename T, typename U>
Result<T> forward_error(const Result<U>& source) {
    const TradeError* err = source.error();
    return make_error<T>(err->code(), err->what(), err->component());
}

}  // namespace papertrade
