/**
 * @file errors.hpp
 * @brief Exception types for geminiweb
 */

#ifndef GEMINIWEB_ERRORS_HPP
#define GEMINIWEB_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <optional>

namespace geminiweb {

/**
 * Base exception class for geminiweb errors
 */
class GeminiWebError : public std::runtime_error {
public:
    explicit GeminiWebError(const std::string& message, const std::string& code = "")
        : std::runtime_error(message), code_(code) {}

    const std::string& code() const { return code_; }

protected:
    std::string code_;
};

/**
 * Cookie handshake or rotation failed
 */
class AuthError : public GeminiWebError {
public:
    explicit AuthError(const std::string& message, std::optional<int> status_code = std::nullopt)
        : GeminiWebError(message, "AUTH_ERROR"), status_code_(status_code) {}

    std::optional<int> status_code() const { return status_code_; }

private:
    std::optional<int> status_code_;
};

/**
 * Non-200 status or a response whose structure could not be parsed
 */
class APIError : public GeminiWebError {
public:
    explicit APIError(
        const std::string& message,
        std::optional<int> status_code = std::nullopt,
        const std::string& endpoint = ""
    ) : GeminiWebError(message, "API_ERROR"),
        status_code_(status_code),
        endpoint_(endpoint) {}

    std::optional<int> status_code() const { return status_code_; }
    const std::string& endpoint() const { return endpoint_; }

protected:
    std::optional<int> status_code_;
    std::string endpoint_;
};

/**
 * Generated images were announced but never located in the response
 */
class ImageGenerationError : public GeminiWebError {
public:
    explicit ImageGenerationError(const std::string& message)
        : GeminiWebError(message, "IMAGE_GENERATION_ERROR") {}
};

/**
 * Response parsed but carried no usable output
 */
class GeminiError : public GeminiWebError {
public:
    explicit GeminiError(const std::string& message, const std::string& code = "GEMINI_ERROR")
        : GeminiWebError(message, code) {}
};

/**
 * Transport deadline exceeded
 */
class TimeoutError : public GeminiError {
public:
    explicit TimeoutError(const std::string& message, std::optional<double> timeout = std::nullopt)
        : GeminiError(message, "TIMEOUT_ERROR"), timeout_(timeout) {}

    std::optional<double> timeout() const { return timeout_; }

private:
    std::optional<double> timeout_;
};

/**
 * Request rejected by the service with a known error code
 */
class ServiceRejection : public GeminiError {
public:
    ServiceRejection(const std::string& message, int error_code, const std::string& code)
        : GeminiError(message, code), error_code_(error_code) {}

    int error_code() const { return error_code_; }

private:
    int error_code_;
};

class UsageLimitExceeded : public ServiceRejection {
public:
    UsageLimitExceeded(const std::string& message, int error_code)
        : ServiceRejection(message, error_code, "USAGE_LIMIT_EXCEEDED") {}
};

class ModelInvalid : public ServiceRejection {
public:
    ModelInvalid(const std::string& message, int error_code)
        : ServiceRejection(message, error_code, "MODEL_INVALID") {}
};

class TemporarilyBlocked : public ServiceRejection {
public:
    TemporarilyBlocked(const std::string& message, int error_code)
        : ServiceRejection(message, error_code, "TEMPORARILY_BLOCKED") {}
};

/**
 * Validation errors
 */
class ValidationError : public GeminiWebError {
public:
    ValidationError(
        const std::string& message,
        const std::string& field = "",
        const std::string& value = ""
    ) : GeminiWebError(message, "VALIDATION_ERROR"),
        field_(field),
        value_(value) {}

    const std::string& field() const { return field_; }
    const std::string& value() const { return value_; }

private:
    std::string field_;
    std::string value_;
};

/**
 * Configuration errors
 */
class ConfigurationError : public GeminiWebError {
public:
    ConfigurationError(const std::string& message, const std::string& config_key = "")
        : GeminiWebError(message, "CONFIGURATION_ERROR"), config_key_(config_key) {}

    const std::string& config_key() const { return config_key_; }

private:
    std::string config_key_;
};

} // namespace geminiweb

#endif // GEMINIWEB_ERRORS_HPP
