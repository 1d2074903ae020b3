#include "types/Permission.hpp"
#include "config/ConfigError.hpp"

#include <array>
#include <nlohmann/json.hpp>

namespace ferry::types {

namespace {

constexpr std::array<PermissionFlag, 8> ALL_FLAGS = {
    PermissionFlag::EnterDirectory,
    PermissionFlag::List,
    PermissionFlag::Read,
    PermissionFlag::Append,
    PermissionFlag::Delete,
    PermissionFlag::Rename,
    PermissionFlag::MakeDirectory,
    PermissionFlag::Write,
};

}

PermissionSet parsePermissions(const std::string_view flags) {
    PermissionSet set;
    for (const char c : flags) {
        const auto pos = PERMISSION_LETTERS.find(c);
        if (pos == std::string_view::npos) throw config::ConfigError::invalidPermissionCharacter(c);
        set = with(set, ALL_FLAGS[pos]);
    }
    return set;
}

PermissionSet with(const PermissionSet set, const PermissionFlag flag) {
    return PermissionSet{static_cast<uint8_t>(set.mask | static_cast<uint8_t>(flag))};
}

char toLetter(const PermissionFlag flag) {
    switch (flag) {
    case PermissionFlag::EnterDirectory: return 'e';
    case PermissionFlag::List: return 'l';
    case PermissionFlag::Read: return 'r';
    case PermissionFlag::Append: return 'a';
    case PermissionFlag::Delete: return 'd';
    case PermissionFlag::Rename: return 'f';
    case PermissionFlag::MakeDirectory: return 'm';
    case PermissionFlag::Write: return 'w';
    }
    return '?';
}

std::string to_string(const PermissionFlag flag) {
    switch (flag) {
    case PermissionFlag::EnterDirectory: return "enter-directory";
    case PermissionFlag::List: return "list";
    case PermissionFlag::Read: return "read";
    case PermissionFlag::Append: return "append";
    case PermissionFlag::Delete: return "delete";
    case PermissionFlag::Rename: return "rename";
    case PermissionFlag::MakeDirectory: return "make-directory";
    case PermissionFlag::Write: return "write";
    }
    return "unknown-permission";
}

std::string to_string(const PermissionSet& set) {
    std::string out;
    out.reserve(ALL_FLAGS.size());
    for (const auto flag : ALL_FLAGS)
        if (allows(set, flag)) out += toLetter(flag);
    return out;
}

std::vector<PermissionFlag> flagsOf(const PermissionSet& set) {
    std::vector<PermissionFlag> result;
    for (const auto flag : ALL_FLAGS)
        if (allows(set, flag)) result.push_back(flag);
    return result;
}

void to_json(nlohmann::json& j, const PermissionSet& set) {
    j = nlohmann::json::object();
    for (const auto flag : ALL_FLAGS) j[to_string(flag)] = allows(set, flag);
}

}
