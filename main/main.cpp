#include "auth/UserRegistry.hpp"
#include "cli/ExitCode.hpp"
#include "cli/Options.hpp"
#include "config/ConfigError.hpp"
#include "config/ConfigFile.hpp"
#include "config/Resolver.hpp"
#include "engine/AsioTransferEngine.hpp"
#include "log/Registry.hpp"
#include "runtime/LifecycleController.hpp"
#include "types/ServerConfig.hpp"

#include <atomic>
#include <csignal>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

using namespace ferry;
using namespace ferry::cli;
using ferry::log::Registry;

namespace fs = std::filesystem;

namespace {

volatile std::sig_atomic_t stopRequested = 0;
volatile std::sig_atomic_t reloadRequested = 0;

void signalHandler(const int signum) {
    if (signum == SIGHUP) reloadRequested = 1;
    else stopRequested = 1;
}

struct Loaded {
    config::Resolution resolution;
    bool fileExisted{false};
};

Loaded loadAndResolve(const cli::Options& opts) {
    const auto file = config::loadConfigFile(opts.config_path);
    return {config::resolve(file, opts.toOverrides()), file.has_value()};
}

void prepareDirectories(const types::ServerConfig& cfg) {
    fs::create_directories(cfg.shared_directory);
    for (const auto& user : cfg.users)
        if (user.home_directory) fs::create_directories(*user.home_directory);
}

void logSummary(const cli::Options& opts, const types::ServerConfig& cfg, const uint16_t boundPort) {
    const auto log = Registry::ferry();
    log->info("[*] ferry listening on {}:{}", cfg.listen_address, boundPort);
    log->info("[*] Configuration file: {}", fs::absolute(opts.config_path).string());
    log->info("[*] Shared directory: {}", cfg.shared_directory.string());
    log->info("[*] Language: {}", cfg.language);
    log->info("[*] Connection limits: {} total, {} per address", cfg.max_connections, cfg.max_connections_per_ip);
    if (cfg.passive_ports)
        log->info("[*] Passive ports: {}-{}", cfg.passive_ports->start, cfg.passive_ports->end);
    for (const auto& user : cfg.users)
        log->info("[*] User '{}' ({}) -> {}", user.username, to_string(user.permissions),
                  auth::resolveHome(user, cfg.shared_directory).string());
    log->info("[*] Connect with ftp://<server-ip>:{}", boundPort);
}

// Re-reads the configuration and swaps it in. A configuration that fails to
// validate leaves the running server untouched. Throws LifecycleError when the
// new configuration cannot be served.
void reload(const cli::Options& opts, runtime::LifecycleController& controller) {
    const auto log = Registry::ferry();
    log->info("[*] SIGHUP received, reloading {}", opts.config_path.string());

    std::shared_ptr<const types::ServerConfig> cfg;
    std::shared_ptr<const auth::UserRegistry> registry;
    try {
        cfg = loadAndResolve(opts).resolution.config;
        registry = std::make_shared<const auth::UserRegistry>(auth::UserRegistry::fromConfig(*cfg));
        prepareDirectories(*cfg);
    } catch (const config::ConfigError& e) {
        log->error("[-] Reload rejected, keeping current configuration: {}", e.what());
        return;
    } catch (const fs::filesystem_error& e) {
        log->error("[-] Reload rejected, keeping current configuration: {}", e.what());
        return;
    }

    Registry::setLevel(cfg->logging.level);
    controller.restart(cfg, registry);
    if (const auto port = controller.boundPort()) logSummary(opts, *cfg, *port);
}

}

int main(int argc, char** argv) {
    cli::Options opts;
    try {
        opts = cli::parse(argc, argv);
    } catch (const cli::UsageError& e) {
        fmt::print(stderr, "{}\n\n{}", e.what(), cli::usage(argv[0]));
        return EXIT_CONFIG;
    }

    if (opts.help) {
        fmt::print("{}", cli::usage(argv[0]));
        return EXIT_OK;
    }

    Loaded loaded;
    std::shared_ptr<const auth::UserRegistry> registry;
    try {
        loaded = loadAndResolve(opts);
        registry = std::make_shared<const auth::UserRegistry>(auth::UserRegistry::fromConfig(*loaded.resolution.config));
    } catch (const config::ConfigError& e) {
        fmt::print(stderr, "[-] Invalid configuration ({}): {}\n", to_string(e.kind()), e.what());
        return EXIT_CONFIG;
    }

    const auto& cfg = loaded.resolution.config;

    if (opts.dump_config) {
        std::cout << nlohmann::json(*cfg).dump(2) << std::endl;
        return EXIT_OK;
    }

    try {
        Registry::init(cfg->logging);
    } catch (const std::exception& e) {
        fmt::print(stderr, "[-] Failed to initialize logging: {}\n", e.what());
        return EXIT_CONFIG;
    }

    const auto log = Registry::ferry();

    if (loaded.resolution.needs_persist) {
        if (!loaded.fileExisted) {
            try {
                config::writeConfigFile(opts.config_path, *cfg);
                log->info("[*] Wrote default configuration to {}", opts.config_path.string());
            } catch (const std::exception& e) {
                log->warn("[!] Could not write default configuration to {}: {}", opts.config_path.string(), e.what());
            }
        } else {
            log->warn("[!] {} defines no users section, serving the default account '{}'",
                      opts.config_path.string(), config::DEFAULT_USERNAME);
        }
    }

    try {
        prepareDirectories(*cfg);
    } catch (const fs::filesystem_error& e) {
        log->error("[-] Failed to prepare directories: {}", e.what());
        return EXIT_CONFIG;
    }

    try {
        runtime::LifecycleController controller(std::make_shared<engine::AsioTransferEngine>());
        controller.start(cfg, registry);
        if (const auto port = controller.boundPort()) logSummary(opts, *cfg, *port);

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);
        std::signal(SIGHUP, signalHandler);

        while (!stopRequested) {
            const auto state = controller.waitWhileRunning(std::chrono::milliseconds(500));
            if (state == runtime::LifecycleState::Failed) {
                const auto failure = controller.lastFailure();
                log->error("[-] Server failed: {}", failure ? failure->message : "unknown error");
                return failure ? exitCodeFor(failure->kind) : EXIT_ENGINE;
            }

            if (reloadRequested) {
                reloadRequested = 0;
                try {
                    reload(opts, controller);
                } catch (const runtime::LifecycleError& e) {
                    log->error("[-] Reload failed, server is down: {}", e.what());
                    return exitCodeFor(e.kind());
                }
            }
        }

        log->info("[!] Shutdown requested, stopping server...");
        controller.stop();
        log->info("[✓] ferry shut down cleanly.");
        return EXIT_OK;
    } catch (const runtime::LifecycleError& e) {
        log->error("[-] {}", e.what());
        return exitCodeFor(e.kind());
    } catch (const std::exception& e) {
        log->error("[-] Unexpected error: {}", e.what());
        return EXIT_ENGINE;
    }
}
