#include "auth/UserRegistry.hpp"
#include "config/ConfigError.hpp"
#include "types/ServerConfig.hpp"
#include "util/fsPath.hpp"

#include <boost/algorithm/string/trim.hpp>

using namespace ferry::types;
using ferry::config::ConfigError;

namespace ferry::auth {

UserRegistry::UserRegistry(std::vector<UserRecord> users) : users_(std::move(users)) {
    for (std::size_t i = 0; i < users_.size(); ++i) {
        if (!index_.emplace(users_[i].username, i).second)
            throw ConfigError::duplicateUsername(users_[i].username);
    }
}

UserRegistry UserRegistry::build(const std::vector<UserEntry>& entries) {
    std::vector<UserRecord> records;
    records.reserve(entries.size());

    for (std::size_t i = 0; i < entries.size(); ++i) {
        const auto& entry = entries[i];

        UserRecord record;
        record.username = boost::algorithm::trim_copy(entry.username.value_or(""));
        if (record.username.empty()) throw ConfigError::missingField("username", i);

        record.password = boost::algorithm::trim_copy(entry.password.value_or(""));
        if (record.password.empty()) throw ConfigError::missingField("password", i);

        record.permissions = entry.perm ? parsePermissions(*entry.perm) : PermissionSet::full();

        if (entry.home && !boost::algorithm::trim_copy(*entry.home).empty())
            record.home_directory = util::resolveUserPath(boost::algorithm::trim_copy(*entry.home));

        records.push_back(std::move(record));
    }

    return UserRegistry(std::move(records));
}

UserRegistry UserRegistry::fromConfig(const ServerConfig& config) {
    return UserRegistry(config.users);
}

std::optional<UserRecord> UserRegistry::authenticate(const std::string& username, const std::string& password) const {
    const auto user = find(username);
    if (!user || user->password != password) return std::nullopt;
    return user;
}

std::optional<UserRecord> UserRegistry::find(const std::string& username) const {
    const auto it = index_.find(username);
    if (it == index_.end()) return std::nullopt;
    return users_[it->second];
}

std::filesystem::path resolveHome(const UserRecord& user, const std::filesystem::path& sharedDirectory) {
    return user.home_directory.value_or(sharedDirectory);
}

}
