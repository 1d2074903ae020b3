#pragma once

#include "types/Permission.hpp"
#include "types/ServerConfig.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <system_error>

namespace ferry::engine {

struct BindRequest {
    std::string listen_address;
    uint16_t port{};
    unsigned int max_connections{};
    unsigned int max_connections_per_ip{};
    std::optional<types::PassivePortRange> passive_ports{std::nullopt};
    std::optional<std::string> banner{std::nullopt};

    static BindRequest fromConfig(const types::ServerConfig& config);
};

// Listening socket could not be established (port in use, permission denied, bad address).
class BindError : public std::system_error {
public:
    using std::system_error::system_error;
};

// Invoked from an engine-owned thread when the engine can no longer serve.
using FatalErrorHandler = std::function<void(const std::string& reason)>;

class EngineHandle {
public:
    virtual ~EngineHandle() = default;

    virtual void registerUser(const std::string& username,
                              const std::string& password,
                              const types::PermissionSet& permissions,
                              const std::filesystem::path& homeDirectory) = 0;

    // Closes the listener, terminates active sessions and blocks until they are gone.
    virtual void shutdown() = 0;

    [[nodiscard]] virtual uint16_t localPort() const = 0;
};

class TransferEngine {
public:
    virtual ~TransferEngine() = default;

    // Attempts the bind exactly once. Throws BindError on failure.
    virtual std::unique_ptr<EngineHandle> bind(const BindRequest& request, FatalErrorHandler onFatal) = 0;
};

}
