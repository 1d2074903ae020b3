#include "cli/Options.hpp"
#include "config/ConfigError.hpp"
#include "config/ConfigFile.hpp"

#include <algorithm>
#include <charconv>
#include <ranges>
#include <fmt/format.h>
#include <boost/algorithm/string/trim.hpp>

using namespace ferry::cli;
using ferry::config::ConfigError;

namespace {

bool looks_glued_value(std::string_view tail) {
    if (tail.empty()) return false;
    return std::ranges::any_of(tail, [](const char c) {
        return c == '/' || c == '.' || c == ':' || c == '=' || (c >= '0' && c <= '9') || c == '~';
    });
}

}

std::vector<std::string> ferry::cli::normalize_args(const int argc, char** argv) {
    std::vector<std::string> out;
    if (argc > 1) out.reserve(static_cast<size_t>(argc) + 2);
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];

        if (a.rfind("--", 0) == 0 && a.size() > 2) {
            const auto eq = a.find('=');
            if (eq != std::string::npos) {
                out.emplace_back(a.substr(0, eq));
                out.emplace_back(a.substr(eq + 1));
            } else {
                out.emplace_back(std::move(a));
            }
            continue;
        }

        if (a.size() > 2 && a[0] == '-' && a[1] != '-') {
            std::string tail = a.substr(2);
            if (looks_glued_value(tail)) {
                out.emplace_back(std::string("-") + a[1]);
                if (tail[0] == '=') tail.erase(tail.begin());
                out.emplace_back(std::move(tail));
            } else {
                out.emplace_back(std::move(a));
            }
            continue;
        }

        out.emplace_back(std::move(a));
    }
    return out;
}

Options ferry::cli::parse(const int argc, char** argv) {
    const auto args = normalize_args(argc, argv);

    Options opts;
    opts.config_path = config::DEFAULT_CONFIG_NAME;

    for (size_t i = 0; i < args.size(); ++i) {
        const auto& a = args[i];

        const auto value = [&]() -> const std::string& {
            if (i + 1 >= args.size()) throw UsageError(fmt::format("Option '{}' requires a value", a));
            return args[++i];
        };

        if (a == "-h" || a == "--help") opts.help = true;
        else if (a == "--dump-config") opts.dump_config = true;
        else if (a == "-c" || a == "--config") opts.config_path = value();
        else if (a == "-s" || a == "--shared-dir") opts.shared_dir = std::filesystem::path(value());
        else if (a == "-p" || a == "--port") opts.port = value();
        else if (a == "-l" || a == "--language") opts.language = value();
        else throw UsageError(fmt::format("Unknown argument '{}'", a));
    }

    return opts;
}

ferry::config::Overrides Options::toOverrides() const {
    config::Overrides o;
    o.shared_dir = shared_dir;
    o.language = language;

    if (port) {
        const auto raw = boost::algorithm::trim_copy(*port);
        long long parsed = 0;
        const auto* first = raw.data();
        const auto* last = raw.data() + raw.size();
        const auto [ptr, ec] = std::from_chars(first, last, parsed);
        if (raw.empty() || ec != std::errc{} || ptr != last) throw ConfigError::portOutOfRange(raw);
        o.port = parsed;
    }

    return o;
}

std::string ferry::cli::usage(const std::string& program) {
    return fmt::format(
        "Usage: {} [options]\n"
        "\n"
        "Options:\n"
        "  -c, --config <path>       Configuration file (default: {})\n"
        "  -s, --shared-dir <path>   Root directory served to users without a home (default: ./{})\n"
        "  -p, --port <port>         Control port, overrides the configuration file\n"
        "  -l, --language <tag>      Interface language: zh_CN or en_US\n"
        "      --dump-config         Print the resolved configuration as JSON and exit\n"
        "  -h, --help                Show this help\n"
        "\n"
        "Signals: SIGINT/SIGTERM stop the server, SIGHUP reloads the configuration file.\n",
        program, config::DEFAULT_CONFIG_NAME, config::DEFAULT_SHARED_DIR);
}
