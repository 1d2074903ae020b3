#include "log/Registry.hpp"

#include <filesystem>
#include <stdexcept>
#include <vector>

namespace ferry::log {

void Registry::init(const types::LoggingConfig& config) {
    if (initialized_) {
        spdlog::warn("[Registry] Already initialized, ignoring second init()");
        return;
    }

    const auto level = spdlog::level::from_str(config.level);

    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    std::vector<spdlog::sink_ptr> sinks{console_sink_};

    if (config.dir) {
        namespace fs = std::filesystem;
        if (!fs::exists(*config.dir)) fs::create_directories(*config.dir);

        file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            (*config.dir / "ferry.log").string(), max_file_bytes_, max_files_);
        file_sink_->set_level(spdlog::level::debug);
        file_sink_->set_pattern(LOG_FORMAT);
        sinks.push_back(file_sink_);
    }

    auto makeLogger = [&](const std::string& name) {
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::trace);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    makeLogger("ferry");
    makeLogger("runtime");
    makeLogger("engine");
    makeLogger("cli");

    initialized_ = true;
    ferry()->debug("[Registry] Initialized");
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    if (!initialized_) return silent();

    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) return silent();
        throw std::runtime_error("[Registry] Logger not found: " + name);
    }
    return logger;
}

std::shared_ptr<spdlog::logger> Registry::silent() {
    static const auto logger = std::make_shared<spdlog::logger>("silent", std::make_shared<spdlog::sinks::null_sink_mt>());
    return logger;
}

void Registry::shutdown() {
    if (!initialized_.exchange(false)) return;
    spdlog::drop_all();
    console_sink_.reset();
    file_sink_.reset();
}

bool Registry::isInitialized() { return initialized_; }

void Registry::setLevel(const std::string& level) {
    if (!initialized_ || !console_sink_) return;
    console_sink_->set_level(spdlog::level::from_str(level));
}

}
