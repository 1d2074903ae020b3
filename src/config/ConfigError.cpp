#include "config/ConfigError.hpp"

#include <fmt/format.h>

namespace ferry::config {

std::string to_string(const ConfigErrorKind kind) {
    switch (kind) {
    case ConfigErrorKind::MissingField: return "MissingField";
    case ConfigErrorKind::InvalidPermissionCharacter: return "InvalidPermissionCharacter";
    case ConfigErrorKind::DuplicateUsername: return "DuplicateUsername";
    case ConfigErrorKind::PortOutOfRange: return "PortOutOfRange";
    case ConfigErrorKind::InvalidConnectionLimit: return "InvalidConnectionLimit";
    case ConfigErrorKind::InvalidPassivePortRange: return "InvalidPassivePortRange";
    case ConfigErrorKind::UnsupportedLanguage: return "UnsupportedLanguage";
    case ConfigErrorKind::InvalidFieldType: return "InvalidFieldType";
    case ConfigErrorKind::InvalidListenAddress: return "InvalidListenAddress";
    case ConfigErrorKind::InvalidLogLevel: return "InvalidLogLevel";
    case ConfigErrorKind::ConfigFileUnreadable: return "ConfigFileUnreadable";
    }
    return "Unknown";
}

ConfigError::ConfigError(const ConfigErrorKind kind, std::string detail, const std::string& message)
    : std::runtime_error(message), kind_(kind), detail_(std::move(detail)) {}

ConfigError ConfigError::missingField(const std::string& field, const std::size_t userIndex) {
    return {ConfigErrorKind::MissingField, field,
            fmt::format("User entry #{} is missing required field '{}'", userIndex + 1, field)};
}

ConfigError ConfigError::invalidPermissionCharacter(const char c) {
    return {ConfigErrorKind::InvalidPermissionCharacter, std::string(1, c),
            fmt::format("Invalid permission character '{}' (allowed: elradfmw)", c)};
}

ConfigError ConfigError::duplicateUsername(const std::string& username) {
    return {ConfigErrorKind::DuplicateUsername, username, fmt::format("Duplicate username '{}'", username)};
}

ConfigError ConfigError::portOutOfRange(const std::string& value) {
    return {ConfigErrorKind::PortOutOfRange, value,
            fmt::format("Port '{}' is invalid, must be an integer between 1 and 65535", value)};
}

ConfigError ConfigError::invalidConnectionLimit(const std::string& field, const std::string& value) {
    return {ConfigErrorKind::InvalidConnectionLimit, field,
            fmt::format("'{}' must be a positive integer, got '{}'", field, value)};
}

ConfigError ConfigError::invalidPassivePortRange(const std::string& value) {
    return {ConfigErrorKind::InvalidPassivePortRange, value,
            fmt::format("Passive port range {} is invalid, expected [start, end] with 1 <= start <= end <= 65535", value)};
}

ConfigError ConfigError::unsupportedLanguage(const std::string& tag) {
    return {ConfigErrorKind::UnsupportedLanguage, tag,
            fmt::format("Unsupported language '{}' (supported: zh_CN, en_US)", tag)};
}

ConfigError ConfigError::invalidFieldType(const std::string& field, const std::string& expected) {
    return {ConfigErrorKind::InvalidFieldType, field, fmt::format("'{}' must be {}", field, expected)};
}

ConfigError ConfigError::invalidListenAddress(const std::string& value) {
    return {ConfigErrorKind::InvalidListenAddress, value,
            fmt::format("Listen address '{}' is invalid, must be a non-empty string", value)};
}

ConfigError ConfigError::invalidLogLevel(const std::string& value) {
    return {ConfigErrorKind::InvalidLogLevel, value,
            fmt::format("Unknown log level '{}' (expected trace, debug, info, warn, error, critical or off)", value)};
}

ConfigError ConfigError::unreadable(const std::string& path, const std::string& reason) {
    return {ConfigErrorKind::ConfigFileUnreadable, path,
            fmt::format("Failed to read config file {}: {}", path, reason)};
}

}
