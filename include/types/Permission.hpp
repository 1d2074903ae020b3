#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace ferry::types {

enum class PermissionFlag : uint8_t {
    EnterDirectory  = 1U << 0, // e: change working directory
    List            = 1U << 1, // l: list directory contents
    Read            = 1U << 2, // r: retrieve files
    Append          = 1U << 3, // a: append to existing files
    Delete          = 1U << 4, // d: delete files and directories
    Rename          = 1U << 5, // f: rename files and directories
    MakeDirectory   = 1U << 6, // m: create directories
    Write           = 1U << 7, // w: store files
};

struct PermissionSet {
    static constexpr uint8_t FULL_MASK = 0xFF;

    uint8_t mask{};

    static PermissionSet full() { return PermissionSet{FULL_MASK}; }
    static PermissionSet none() { return PermissionSet{}; }

    [[nodiscard]] bool empty() const { return mask == 0; }

    bool operator==(const PermissionSet& other) const = default;
};

// Ordered letter encoding, one character per flag.
inline constexpr std::string_view PERMISSION_LETTERS = "elradfmw";

PermissionSet parsePermissions(std::string_view flags);

inline bool allows(const PermissionSet& set, const PermissionFlag flag) {
    return (set.mask & static_cast<uint8_t>(flag)) != 0;
}

PermissionSet with(PermissionSet set, PermissionFlag flag);

char toLetter(PermissionFlag flag);
std::string to_string(PermissionFlag flag);

// Canonical letter encoding (always in "elradfmw" order)
std::string to_string(const PermissionSet& set);

std::vector<PermissionFlag> flagsOf(const PermissionSet& set);

void to_json(nlohmann::json& j, const PermissionSet& set);

}
