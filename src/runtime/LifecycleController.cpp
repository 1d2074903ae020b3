#include "runtime/LifecycleController.hpp"
#include "auth/UserRegistry.hpp"
#include "engine/TransferEngine.hpp"
#include "types/ServerConfig.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>
#include <stdexcept>

using namespace ferry::runtime;
using namespace ferry::engine;
using ferry::log::Registry;

LifecycleController::LifecycleController(std::shared_ptr<TransferEngine> engine) : engine_(std::move(engine)) {
    if (!engine_) throw std::invalid_argument("LifecycleController requires a transfer engine");
    faultWatcher_ = std::make_unique<FaultWatcher>([this](const EngineFault& fault) { applyFault(fault); });
    faultWatcher_->start();
}

LifecycleController::~LifecycleController() {
    try {
        stop();
    } catch (const std::exception& e) {
        Registry::runtime()->error("[Lifecycle] Error while stopping during teardown: {}", e.what());
    }
    if (faultWatcher_) faultWatcher_->stop();
}

void LifecycleController::start(std::shared_ptr<const types::ServerConfig> config,
                                std::shared_ptr<const auth::UserRegistry> registry) {
    if (!config || !registry) throw std::invalid_argument("start() requires a configuration and a user registry");

    std::unique_lock lock(mutex_);

    const auto alreadyActive = [this] {
        return LifecycleError(LifecycleErrorKind::AlreadyActive,
                              fmt::format("Server is already {}", to_string(state_)));
    };

    if (state_ == LifecycleState::Starting || state_ == LifecycleState::Running) throw alreadyActive();

    cv_.wait(lock, [this] { return !busy_; });
    if (!isInactive(state_)) throw alreadyActive();

    busy_ = true;
    setState(LifecycleState::Starting);
    launch(lock, config, registry);
}

void LifecycleController::stop() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return !busy_; });

    if (state_ != LifecycleState::Running) {
        Registry::runtime()->debug("[Lifecycle] stop() while {}, nothing to do", to_string(state_));
        return;
    }

    busy_ = true;
    setState(LifecycleState::Stopping);
    drain(lock, std::move(handle_));

    config_.reset();
    registry_.reset();
    busy_ = false;
    setState(LifecycleState::Stopped);
    Registry::runtime()->info("[Lifecycle] Server stopped");
}

void LifecycleController::restart(std::shared_ptr<const types::ServerConfig> config,
                                  std::shared_ptr<const auth::UserRegistry> registry) {
    if (!config || !registry) throw std::invalid_argument("restart() requires a configuration and a user registry");

    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return !busy_; });

    busy_ = true;
    if (state_ == LifecycleState::Running) {
        Registry::runtime()->info("[Lifecycle] Restarting server");
        setState(LifecycleState::Stopping);
        drain(lock, std::move(handle_));
        config_.reset();
        registry_.reset();
    }

    setState(LifecycleState::Starting);
    launch(lock, config, registry);
}

LifecycleState LifecycleController::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

std::optional<LifecycleFailure> LifecycleController::lastFailure() const {
    std::lock_guard lock(mutex_);
    return lastFailure_;
}

std::shared_ptr<const ferry::types::ServerConfig> LifecycleController::currentConfig() const {
    std::lock_guard lock(mutex_);
    return config_;
}

std::optional<uint16_t> LifecycleController::boundPort() const {
    std::lock_guard lock(mutex_);
    if (state_ != LifecycleState::Running || !handle_) return std::nullopt;
    return handle_->localPort();
}

LifecycleState LifecycleController::waitWhileRunning(const std::chrono::milliseconds timeout) const {
    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return state_ != LifecycleState::Running; });
    return state_;
}

void LifecycleController::launch(std::unique_lock<std::mutex>& lock,
                                 const std::shared_ptr<const types::ServerConfig>& config,
                                 const std::shared_ptr<const auth::UserRegistry>& registry) {
    const auto generation = ++generation_;
    const auto request = BindRequest::fromConfig(*config);
    lock.unlock();

    Registry::runtime()->debug("[Lifecycle] Binding {}:{} (generation {})", request.listen_address, request.port, generation);

    std::unique_ptr<EngineHandle> handle;
    try {
        handle = engine_->bind(request, faultWatcher_->handlerFor(generation));
    } catch (const BindError& e) {
        lock.lock();
        fail(lock, {LifecycleErrorKind::EngineBindError,
                    fmt::format("Failed to bind {}:{}: {}", request.listen_address, request.port, e.what()),
                    e.code()});
    } catch (const std::exception& e) {
        lock.lock();
        fail(lock, {LifecycleErrorKind::EngineFatal, fmt::format("Engine failed during bind: {}", e.what())});
    }

    if (registry->empty())
        Registry::runtime()->warn("[Lifecycle] No users configured, nobody will be able to log in");

    try {
        for (const auto& user : registry->users())
            handle->registerUser(user.username, user.password, user.permissions,
                                 auth::resolveHome(user, config->shared_directory));
    } catch (const std::exception& e) {
        const std::string reason = fmt::format("Engine rejected user registration: {}", e.what());
        try {
            handle->shutdown();
        } catch (const std::exception& inner) {
            Registry::runtime()->error("[Lifecycle] Shutdown after failed registration also failed: {}", inner.what());
        }
        lock.lock();
        fail(lock, {LifecycleErrorKind::EngineFatal, reason});
    }

    lock.lock();
    handle_ = std::move(handle);
    config_ = config;
    registry_ = registry;
    lastFailure_.reset();
    busy_ = false;
    setState(LifecycleState::Running);

    Registry::runtime()->info("[Lifecycle] Server running on {}:{} with {} user(s)",
                              config->listen_address, handle_->localPort(), registry->size());
}

void LifecycleController::drain(std::unique_lock<std::mutex>& lock, std::unique_ptr<EngineHandle> handle) {
    lock.unlock();
    try {
        if (handle) handle->shutdown();
    } catch (const std::exception& e) {
        const std::string reason = fmt::format("Engine failed to shut down: {}", e.what());
        lock.lock();
        config_.reset();
        registry_.reset();
        fail(lock, {LifecycleErrorKind::EngineFatal, reason});
    }
    handle.reset();
    lock.lock();
}

void LifecycleController::fail(std::unique_lock<std::mutex>& lock, LifecycleFailure failure) {
    Registry::runtime()->debug("[Lifecycle] {}: {}", to_string(failure.kind), failure.message);

    lastFailure_ = failure;
    busy_ = false;
    setState(LifecycleState::Failed);
    lock.unlock();

    throw LifecycleError(failure.kind, failure.message, failure.code);
}

void LifecycleController::setState(const LifecycleState next) {
    Registry::runtime()->debug("[Lifecycle] {} -> {}", to_string(state_), to_string(next));
    state_ = next;
    cv_.notify_all();
}

void LifecycleController::applyFault(const EngineFault& fault) {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return !busy_; });

    if (fault.generation != generation_ || state_ != LifecycleState::Running) {
        Registry::runtime()->debug("[Lifecycle] Ignoring stale engine fault (generation {}, current {}, state {}): {}",
                                   fault.generation, generation_, to_string(state_), fault.reason);
        return;
    }

    lastFailure_ = LifecycleFailure{LifecycleErrorKind::EngineFatal, fault.reason};
    config_.reset();
    registry_.reset();
    busy_ = true;
    setState(LifecycleState::Failed);
    Registry::runtime()->debug("[Lifecycle] Engine reported a fatal error: {}", fault.reason);

    auto handle = std::move(handle_);
    lock.unlock();
    try {
        handle->shutdown();
    } catch (const std::exception& e) {
        Registry::runtime()->error("[Lifecycle] Failed to drain faulted engine: {}", e.what());
    }
    handle.reset();
    lock.lock();

    busy_ = false;
    cv_.notify_all();
}
