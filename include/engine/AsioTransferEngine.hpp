#pragma once

#include "engine/TransferEngine.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <utility>
#include <boost/asio.hpp>

namespace ferry::engine {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

constexpr static auto DEFAULT_BANNER = "ferry ready.";

// Listener that admits control connections within the configured limits, greets
// them and holds them until the peer leaves or the handle is shut down. Command
// handling is out of its scope.
class AsioTransferEngine final : public TransferEngine {
public:
    std::unique_ptr<EngineHandle> bind(const BindRequest& request, FatalErrorHandler onFatal) override;
};

// Accept failures that leave the listener usable: peer aborts and resource
// exhaustion (descriptor or buffer limits). The accept loop backs off and re-arms.
bool isTransientAcceptError(const boost::system::error_code& ec);

class AsioEngineHandle final : public EngineHandle {
public:
    AsioEngineHandle(const BindRequest& request, FatalErrorHandler onFatal);
    ~AsioEngineHandle() override;

    AsioEngineHandle(const AsioEngineHandle&) = delete;
    AsioEngineHandle& operator=(const AsioEngineHandle&) = delete;

    void registerUser(const std::string& username,
                      const std::string& password,
                      const types::PermissionSet& permissions,
                      const std::filesystem::path& homeDirectory) override;

    void shutdown() override;

    [[nodiscard]] uint16_t localPort() const override { return port_; }

    [[nodiscard]] std::size_t userCount() const;
    [[nodiscard]] std::size_t activeSessions() const { return sessionCount_.load(); }

private:
    class Session;

    struct Account {
        std::string password;
        types::PermissionSet permissions;
        std::filesystem::path home;
    };

    void doAccept();
    void scheduleAccept();
    void onAccept(tcp::socket socket);
    void reject(tcp::socket socket, std::string_view reply);
    void releaseSession(const std::shared_ptr<Session>& session);
    void closeAll();
    void reportFatal(const std::string& reason);

    [[nodiscard]] std::string greeting() const;

    BindRequest request_;
    FatalErrorHandler onFatal_;

    asio::io_context ioc_;
    tcp::acceptor acceptor_;
    asio::steady_timer acceptRetry_;
    uint16_t port_{};
    std::thread ioThread_;

    std::mutex shutdownMutex_;
    bool shutdown_{false};

    // io thread only
    bool stopping_{false};
    std::set<std::shared_ptr<Session>> sessions_;
    std::unordered_map<std::string, unsigned int> perIp_;

    std::atomic<std::size_t> sessionCount_{0};

    mutable std::mutex usersMutex_;
    std::unordered_map<std::string, Account> users_;
};

}
