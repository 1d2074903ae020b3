#pragma once

#include "types/Permission.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace ferry::types {

// Unvalidated user entry as read from the users section.
struct UserEntry {
    std::optional<std::string> username{}, password{}, perm{}, home{};
};

struct UserRecord {
    std::string username{}, password{};
    PermissionSet permissions{PermissionSet::full()};
    std::optional<std::filesystem::path> home_directory{std::nullopt}; // unset -> shared directory

    bool operator==(const UserRecord& other) const = default;
};

// Passwords are never serialized.
void to_json(nlohmann::json& j, const UserRecord& u);

}
