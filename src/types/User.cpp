#include "types/User.hpp"

#include <nlohmann/json.hpp>

namespace ferry::types {

void to_json(nlohmann::json& j, const UserRecord& u) {
    j = {
        {"username", u.username},
        {"password", "********"},
        {"perm", to_string(u.permissions)},
        {"permissions", u.permissions},
        {"home", u.home_directory ? nlohmann::json(u.home_directory->string()) : nlohmann::json(nullptr)}
    };
}

}
