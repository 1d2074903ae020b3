#pragma once

#include "types/ServerConfig.hpp"

#include <cstdint>
#include <toml++/toml.hpp>

namespace ferry::config {

inline toml::array to_toml(const types::PassivePortRange& range) {
    return toml::array{static_cast<int64_t>(range.start), static_cast<int64_t>(range.end)};
}

inline toml::table to_toml(const types::UserRecord& user) {
    toml::table entry{
        {"username", user.username},
        {"password", user.password},
        {"perm", to_string(user.permissions)},
    };
    if (user.home_directory) entry.insert("home", user.home_directory->string());
    return entry;
}

}
