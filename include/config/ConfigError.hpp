#pragma once

#include <stdexcept>
#include <string>

namespace ferry::config {

enum class ConfigErrorKind {
    MissingField,
    InvalidPermissionCharacter,
    DuplicateUsername,
    PortOutOfRange,
    InvalidConnectionLimit,
    InvalidPassivePortRange,
    UnsupportedLanguage,
    InvalidFieldType,
    InvalidListenAddress,
    InvalidLogLevel,
    ConfigFileUnreadable,
};

std::string to_string(ConfigErrorKind kind);

class ConfigError : public std::runtime_error {
public:
    ConfigError(ConfigErrorKind kind, std::string detail, const std::string& message);

    [[nodiscard]] ConfigErrorKind kind() const noexcept { return kind_; }

    // Offending field name, character, username or value, depending on kind()
    [[nodiscard]] const std::string& detail() const noexcept { return detail_; }

    static ConfigError missingField(const std::string& field, std::size_t userIndex);
    static ConfigError invalidPermissionCharacter(char c);
    static ConfigError duplicateUsername(const std::string& username);
    static ConfigError portOutOfRange(const std::string& value);
    static ConfigError invalidConnectionLimit(const std::string& field, const std::string& value);
    static ConfigError invalidPassivePortRange(const std::string& value);
    static ConfigError unsupportedLanguage(const std::string& tag);
    static ConfigError invalidFieldType(const std::string& field, const std::string& expected);
    static ConfigError invalidListenAddress(const std::string& value);
    static ConfigError invalidLogLevel(const std::string& value);
    static ConfigError unreadable(const std::string& path, const std::string& reason);

private:
    ConfigErrorKind kind_;
    std::string detail_;
};

}
