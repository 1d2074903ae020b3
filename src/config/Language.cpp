#include "config/Language.hpp"
#include "config/ConfigError.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <unordered_map>

namespace ferry::config {

std::string normalizeLanguage(const std::string& tag) {
    static const std::unordered_map<std::string, std::string> aliases = {
        {"zh_cn", "zh_CN"}, {"zh-cn", "zh_CN"}, {"zh", "zh_CN"}, {"chinese", "zh_CN"},
        {"en_us", "en_US"}, {"en-us", "en_US"}, {"en", "en_US"}, {"english", "en_US"},
    };

    const auto key = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(tag));
    if (const auto it = aliases.find(key); it != aliases.end()) return it->second;
    throw ConfigError::unsupportedLanguage(tag);
}

}
