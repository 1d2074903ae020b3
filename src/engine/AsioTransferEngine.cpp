#include "engine/AsioTransferEngine.hpp"
#include "protocols/TCPAcceptor.hpp"
#include "log/Registry.hpp"

#include <array>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <vector>

using namespace ferry::engine;
using ferry::log::Registry;
using ferry::protocols::endpointToString;

namespace {

constexpr std::string_view TOO_MANY_CONNECTIONS = "421 Too many connections.\r\n";
constexpr std::string_view TOO_MANY_FROM_HOST = "421 Too many connections from your IP address.\r\n";

constexpr auto ACCEPT_RETRY_DELAY = std::chrono::milliseconds(100);

}

bool ferry::engine::isTransientAcceptError(const boost::system::error_code& ec) {
    return ec == asio::error::connection_aborted ||
           ec == asio::error::connection_reset ||
           ec == asio::error::would_block ||
           ec == asio::error::try_again ||
           ec == asio::error::no_descriptors ||
           ec == asio::error::no_buffer_space ||
           ec == asio::error::no_memory ||
           ec == boost::system::errc::too_many_files_open_in_system;
}

class AsioEngineHandle::Session : public std::enable_shared_from_this<Session> {
public:
    Session(AsioEngineHandle& owner, tcp::socket socket, std::string remoteIp)
        : owner_(owner), socket_(std::move(socket)), remoteIp_(std::move(remoteIp)) {}

    void start(std::string greeting) {
        greeting_ = std::move(greeting);
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(greeting_),
            [self](const boost::system::error_code& ec, std::size_t) {
                if (ec) {
                    self->owner_.releaseSession(self);
                    return;
                }
                self->doRead();
            });
    }

    void close() {
        boost::system::error_code ec;
        socket_.shutdown(tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

    [[nodiscard]] const std::string& remoteIp() const { return remoteIp_; }

private:
    void doRead() {
        auto self = shared_from_this();
        socket_.async_read_some(asio::buffer(buffer_),
            [self](const boost::system::error_code& ec, std::size_t) {
                if (ec) {
                    self->owner_.releaseSession(self);
                    return;
                }
                self->doRead();
            });
    }

    AsioEngineHandle& owner_;
    tcp::socket socket_;
    std::string remoteIp_;
    std::string greeting_;
    std::array<char, 1024> buffer_{};
};

std::unique_ptr<EngineHandle> AsioTransferEngine::bind(const BindRequest& request, FatalErrorHandler onFatal) {
    return std::make_unique<AsioEngineHandle>(request, std::move(onFatal));
}

AsioEngineHandle::AsioEngineHandle(const BindRequest& request, FatalErrorHandler onFatal)
    : request_(request), onFatal_(std::move(onFatal)), acceptor_(ioc_), acceptRetry_(ioc_) {
    const auto endpoint = protocols::make_endpoint(request_.listen_address, request_.port);
    protocols::init_acceptor(acceptor_, endpoint);
    port_ = acceptor_.local_endpoint().port();

    Registry::engine()->info("[AsioEngine] Listening on {}", endpointToString(acceptor_.local_endpoint()));
    if (request_.passive_ports)
        Registry::engine()->info("[AsioEngine] Passive ports {}-{}", request_.passive_ports->start, request_.passive_ports->end);

    doAccept();

    ioThread_ = std::thread([this] {
        try {
            ioc_.run();
        } catch (const std::exception& e) {
            reportFatal(std::string("I/O loop terminated: ") + e.what());
        }
    });
}

AsioEngineHandle::~AsioEngineHandle() {
    shutdown();
}

void AsioEngineHandle::registerUser(const std::string& username,
                                    const std::string& password,
                                    const types::PermissionSet& permissions,
                                    const std::filesystem::path& homeDirectory) {
    std::lock_guard lock(usersMutex_);
    users_[username] = Account{password, permissions, homeDirectory};
    Registry::engine()->debug("[AsioEngine] Registered user {} (perm: {}) -> {}",
                              username, types::to_string(permissions), homeDirectory.string());
}

std::size_t AsioEngineHandle::userCount() const {
    std::lock_guard lock(usersMutex_);
    return users_.size();
}

void AsioEngineHandle::shutdown() {
    std::lock_guard lock(shutdownMutex_);
    if (shutdown_) return;
    shutdown_ = true;

    Registry::engine()->debug("[AsioEngine] Shutting down listener on port {}", port_);

    asio::post(ioc_, [this] { closeAll(); });
    if (ioThread_.joinable()) ioThread_.join();

    // The io loop may have exited on its own (fault path) before the posted close ran.
    closeAll();
    sessions_.clear();
    perIp_.clear();

    Registry::engine()->info("[AsioEngine] Listener on port {} stopped", port_);
}

void AsioEngineHandle::doAccept() {
    acceptor_.async_accept([this](const boost::system::error_code& ec, tcp::socket socket) {
        if (ec) {
            if (ec == asio::error::operation_aborted || stopping_) return;

            if (isTransientAcceptError(ec)) {
                Registry::engine()->warn("[AsioEngine] accept error, retrying: {}", ec.message());
                scheduleAccept();
                return;
            }

            reportFatal("accept failed: " + ec.message());
            return;
        }

        doAccept();
        onAccept(std::move(socket));
    });
}

void AsioEngineHandle::scheduleAccept() {
    acceptRetry_.expires_after(ACCEPT_RETRY_DELAY);
    acceptRetry_.async_wait([this](const boost::system::error_code& ec) {
        if (ec || stopping_) return;
        doAccept();
    });
}

void AsioEngineHandle::onAccept(tcp::socket socket) {
    if (stopping_) {
        boost::system::error_code ec;
        socket.close(ec);
        return;
    }

    boost::system::error_code ec;
    const auto remote = socket.remote_endpoint(ec);
    if (ec) {
        socket.close(ec);
        return;
    }

    const auto ip = remote.address().to_string();

    if (sessions_.size() >= request_.max_connections) {
        Registry::engine()->warn("[AsioEngine] Rejecting {}: connection limit {} reached", ip, request_.max_connections);
        reject(std::move(socket), TOO_MANY_CONNECTIONS);
        return;
    }

    if (perIp_[ip] >= request_.max_connections_per_ip) {
        Registry::engine()->warn("[AsioEngine] Rejecting {}: per-address limit {} reached", ip, request_.max_connections_per_ip);
        reject(std::move(socket), TOO_MANY_FROM_HOST);
        return;
    }

    const auto session = std::make_shared<Session>(*this, std::move(socket), ip);
    sessions_.insert(session);
    ++perIp_[ip];
    sessionCount_.store(sessions_.size());

    Registry::engine()->debug("[AsioEngine] Session opened from {}", ip);
    session->start(greeting());
}

void AsioEngineHandle::reject(tcp::socket socket, const std::string_view reply) {
    auto sock = std::make_shared<tcp::socket>(std::move(socket));
    asio::async_write(*sock, asio::buffer(reply.data(), reply.size()),
        [sock](const boost::system::error_code&, std::size_t) {
            boost::system::error_code ec;
            sock->shutdown(tcp::socket::shutdown_both, ec);
            sock->close(ec);
        });
}

void AsioEngineHandle::releaseSession(const std::shared_ptr<Session>& session) {
    if (sessions_.erase(session) == 0) return;

    session->close();
    if (const auto it = perIp_.find(session->remoteIp()); it != perIp_.end() && --it->second == 0) perIp_.erase(it);
    sessionCount_.store(sessions_.size());

    Registry::engine()->debug("[AsioEngine] Session from {} closed", session->remoteIp());
}

void AsioEngineHandle::closeAll() {
    stopping_ = true;

    acceptRetry_.cancel();

    boost::system::error_code ec;
    acceptor_.close(ec);

    for (const auto& session : sessions_) session->close();
}

void AsioEngineHandle::reportFatal(const std::string& reason) {
    Registry::engine()->error("[AsioEngine] Fatal: {}", reason);
    if (onFatal_) onFatal_(reason);
}

std::string AsioEngineHandle::greeting() const {
    std::vector<std::string> lines;
    boost::algorithm::split(lines, request_.banner.value_or(DEFAULT_BANNER), boost::algorithm::is_any_of("\r\n"),
                            boost::algorithm::token_compress_on);

    std::string out;
    for (std::size_t i = 0; i < lines.size(); ++i)
        out += (i + 1 < lines.size() ? "220-" : "220 ") + lines[i] + "\r\n";
    return out;
}
