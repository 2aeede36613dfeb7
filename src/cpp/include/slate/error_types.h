#pragma once

#include <string>
#include <exception>

namespace slate {

// Error types as constants
namespace ErrorType {
    constexpr const char* CONFLICT = "conflict";
    constexpr const char* PROCESS_ERROR = "process_error";
    constexpr const char* CONFIGURATION_ERROR = "configuration_error";
    constexpr const char* INTERNAL_ERROR = "internal_error";
}

// Base exception class for all Slate errors
class SlateException : public std::exception {
public:
    SlateException(const std::string& message, const std::string& type = ErrorType::INTERNAL_ERROR)
        : message_(message), type_(type) {}

    const char* what() const noexcept override {
        return message_.c_str();
    }

    const std::string& type() const { return type_; }

protected:
    std::string message_;
    std::string type_;
};

// Something else owns the server port, or a previous instance could not be reclaimed.
// Never retried: the user has to resolve it and relaunch.
class ConflictException : public SlateException {
public:
    ConflictException(const std::string& message)
        : SlateException(message, ErrorType::CONFLICT) {}
};

class ProcessException : public SlateException {
public:
    ProcessException(const std::string& message)
        : SlateException(message, ErrorType::PROCESS_ERROR) {}
};

class ConfigurationException : public SlateException {
public:
    ConfigurationException(const std::string& message)
        : SlateException("Configuration error: " + message, ErrorType::CONFIGURATION_ERROR) {}
};

} // namespace slate
