#pragma once

#include <array>
#include <string>
#include <string_view>

namespace ferry::config {

inline constexpr std::array<std::string_view, 2> SUPPORTED_LANGUAGES = {"zh_CN", "en_US"};

// Maps zh_CN|zh|chinese -> zh_CN and en_US|en|english -> en_US (case-insensitive,
// '-' accepted in place of '_'). Throws ConfigError(UnsupportedLanguage) otherwise.
std::string normalizeLanguage(const std::string& tag);

}
