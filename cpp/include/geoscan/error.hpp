#pragma once

#include <stdexcept>
#include <string>

namespace geoscan {

/**
 * Structured error reporting for model serving.
 * Every failure carries a code, the function it was raised from and an
 * optional hint for the operator.
 */

enum class ErrorCode {
    INVALID_ARGUMENT = 1,

    // Configuration errors
    CONFIGURATION = 100,
    NO_PRECISION = 101,

    // Persistence errors
    IO_FAILURE = 300,
    NOT_FOUND = 301,
    ALREADY_EXISTS = 302,
    CORRUPT_DATA = 303
};

const char* error_code_name(ErrorCode code) noexcept;

class GeoscanException : public std::runtime_error {
public:
    explicit GeoscanException(ErrorCode code, const std::string& message,
                              const std::string& context = "",
                              const std::string& suggestion = "")
        : std::runtime_error(format_message(code, message, context, suggestion))
        , code_(code)
        , message_(message)
        , context_(context)
        , suggestion_(suggestion) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& message() const noexcept { return message_; }
    const std::string& context() const noexcept { return context_; }
    const std::string& suggestion() const noexcept { return suggestion_; }

private:
    static std::string format_message(ErrorCode code, const std::string& message,
                                      const std::string& context, const std::string& suggestion) {
        std::string result = std::string("Geoscan error [") + error_code_name(code) + "]: " + message;
        if (!context.empty()) {
            result += "\nContext: " + context;
        }
        if (!suggestion.empty()) {
            result += "\nSuggestion: " + suggestion;
        }
        return result;
    }

    ErrorCode code_;
    std::string message_;
    std::string context_;
    std::string suggestion_;
};

// Convenience exception types
class InvalidArgumentError : public GeoscanException {
public:
    explicit InvalidArgumentError(const std::string& message,
                                  const std::string& context = "",
                                  const std::string& suggestion = "")
        : GeoscanException(ErrorCode::INVALID_ARGUMENT, message, context, suggestion) {}
};

class ConfigurationError : public GeoscanException {
public:
    explicit ConfigurationError(const std::string& message,
                                const std::string& context = "",
                                const std::string& suggestion = "")
        : GeoscanException(ErrorCode::CONFIGURATION, message, context, suggestion) {}

protected:
    ConfigurationError(ErrorCode code, const std::string& message,
                       const std::string& context, const std::string& suggestion)
        : GeoscanException(code, message, context, suggestion) {}
};

// Raised when no index resolution satisfies the requested epsilon
class NoPrecisionError : public ConfigurationError {
public:
    explicit NoPrecisionError(const std::string& message,
                              const std::string& context = "",
                              const std::string& suggestion = "")
        : ConfigurationError(ErrorCode::NO_PRECISION, message, context, suggestion) {}
};

class IOError : public GeoscanException {
public:
    explicit IOError(const std::string& message,
                     const std::string& context = "",
                     const std::string& suggestion = "")
        : GeoscanException(ErrorCode::IO_FAILURE, message, context, suggestion) {}

protected:
    IOError(ErrorCode code, const std::string& message,
            const std::string& context, const std::string& suggestion)
        : GeoscanException(code, message, context, suggestion) {}
};

class AlreadyExistsError : public IOError {
public:
    explicit AlreadyExistsError(const std::string& message,
                                const std::string& context = "",
                                const std::string& suggestion = "")
        : IOError(ErrorCode::ALREADY_EXISTS, message, context, suggestion) {}
};

class NotFoundError : public GeoscanException {
public:
    explicit NotFoundError(const std::string& message,
                           const std::string& context = "",
                           const std::string& suggestion = "")
        : GeoscanException(ErrorCode::NOT_FOUND, message, context, suggestion) {}
};

class CorruptDataError : public GeoscanException {
public:
    explicit CorruptDataError(const std::string& message,
                              const std::string& context = "",
                              const std::string& suggestion = "")
        : GeoscanException(ErrorCode::CORRUPT_DATA, message, context, suggestion) {}
};

// Error handling utilities
class ErrorHandler {
public:
    static void check_argument(bool condition, const std::string& message,
                               const std::string& context = "") {
        if (!condition) {
            throw InvalidArgumentError(message, context);
        }
    }
};

// Throws InvalidArgumentError tagged with the calling function
#define GEOSCAN_CHECK_ARGUMENT(condition, message) \
    geoscan::ErrorHandler::check_argument(condition, message, __func__)

} // namespace geoscan
