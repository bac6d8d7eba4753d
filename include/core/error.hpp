#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace credchain {

/**
 * @brief Error categories for credential resolution
 */
enum class ErrorCategory {
    NONE,
    UNKNOWN_PROVIDER,
    PROVIDER_ERROR,
    CREDENTIALS_NOT_LOADED,
    INVALID_CONFIGURATION,
    TRANSPORT_ERROR,
    SERVICE_ERROR,
    UNHANDLED,
    CANCELLED
};

[[nodiscard]] inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:                   return "none";
        case ErrorCategory::UNKNOWN_PROVIDER:       return "unknown_provider";
        case ErrorCategory::PROVIDER_ERROR:         return "provider_error";
        case ErrorCategory::CREDENTIALS_NOT_LOADED: return "credentials_not_loaded";
        case ErrorCategory::INVALID_CONFIGURATION:  return "invalid_configuration";
        case ErrorCategory::TRANSPORT_ERROR:        return "transport_error";
        case ErrorCategory::SERVICE_ERROR:          return "service_error";
        case ErrorCategory::UNHANDLED:              return "unhandled";
        case ErrorCategory::CANCELLED:              return "cancelled";
        default:                                    return "unknown";
    }
}

/**
 * @brief Error value carried by Result
 *
 * `source` names the provider or hop the failure is attributed to.
 * `cause` points at the underlying error (immutable, shared between copies).
 */
struct Error {
    ErrorCategory category = ErrorCategory::NONE;
    std::string message;
    std::string source;
    std::shared_ptr<const Error> cause;

    /**
     * @brief Wrap another error as the cause of a new one
     */
    [[nodiscard]] static Error wrap(ErrorCategory category, std::string message,
                                    std::string source, Error cause) {
        Error e;
        e.category = category;
        e.message = std::move(message);
        e.source = std::move(source);
        e.cause = std::make_shared<const Error>(std::move(cause));
        return e;
    }

    /**
     * @brief Innermost error of the cause chain (this error if it has no cause)
     */
    [[nodiscard]] const Error& root_cause() const {
        const Error* current = this;
        while (current->cause) current = current->cause.get();
        return *current;
    }

    /**
     * @brief "message: cause message: ..." down the whole chain
     */
    [[nodiscard]] std::string to_string() const {
        std::string out = message;
        for (const Error* c = cause.get(); c != nullptr; c = c->cause.get()) {
            out += ": ";
            out += c->message;
        }
        return out;
    }
};

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        Error e;
        e.category = category;
        e.message = std::move(message);
        return error(std::move(e));
    }

    static Result error(Error e) {
        Result r;
        r.success_ = false;
        r.error_ = std::move(e);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    const Error& error() const { return error_; }
    ErrorCategory error_category() const { return error_.category; }
    const std::string& error_message() const { return error_.message; }

private:
    bool success_ = false;
    std::optional<T> value_;
    Error error_;
};

} // namespace credchain
