#pragma once

#include "runtime/LifecycleError.hpp"
#include "runtime/LifecycleState.hpp"
#include "runtime/FaultWatcher.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>

namespace ferry::types { struct ServerConfig; }
namespace ferry::auth { class UserRegistry; }
namespace ferry::engine { class TransferEngine; class EngineHandle; }

namespace ferry::runtime {

// Sole owner of the engine handle. Every transition is serialized through one
// mutex/condition pair; `busy_` marks a transition whose engine call is in flight.
//
//   start:   fails fast with AlreadyActive while Starting/Running, waits out Stopping.
//   stop:    waits out any transition, no-op unless Running, blocks until drained.
//   restart: waits out any transition, then Stopping -> Starting -> Running|Failed
//            without passing through Stopped.
//   faults:  delivered by the FaultWatcher thread and applied like any other transition.
class LifecycleController {
public:
    explicit LifecycleController(std::shared_ptr<engine::TransferEngine> engine);
    ~LifecycleController();

    LifecycleController(const LifecycleController&) = delete;
    LifecycleController& operator=(const LifecycleController&) = delete;

    void start(std::shared_ptr<const types::ServerConfig> config, std::shared_ptr<const auth::UserRegistry> registry);
    void stop();
    void restart(std::shared_ptr<const types::ServerConfig> config, std::shared_ptr<const auth::UserRegistry> registry);

    [[nodiscard]] LifecycleState state() const;
    [[nodiscard]] std::optional<LifecycleFailure> lastFailure() const;

    // Configuration currently being served; null unless Running.
    [[nodiscard]] std::shared_ptr<const types::ServerConfig> currentConfig() const;
    [[nodiscard]] std::optional<uint16_t> boundPort() const;

    // Returns the state once it is no longer Running, or after the timeout.
    LifecycleState waitWhileRunning(std::chrono::milliseconds timeout) const;

private:
    void launch(std::unique_lock<std::mutex>& lock,
                const std::shared_ptr<const types::ServerConfig>& config,
                const std::shared_ptr<const auth::UserRegistry>& registry);
    void drain(std::unique_lock<std::mutex>& lock, std::unique_ptr<engine::EngineHandle> handle);
    [[noreturn]] void fail(std::unique_lock<std::mutex>& lock, LifecycleFailure failure);
    void setState(LifecycleState next);
    void applyFault(const EngineFault& fault);

    std::shared_ptr<engine::TransferEngine> engine_;

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    LifecycleState state_{LifecycleState::Stopped};
    bool busy_{false};
    uint64_t generation_{0};

    std::unique_ptr<engine::EngineHandle> handle_;
    std::shared_ptr<const types::ServerConfig> config_;
    std::shared_ptr<const auth::UserRegistry> registry_;
    std::optional<LifecycleFailure> lastFailure_;

    std::unique_ptr<FaultWatcher> faultWatcher_;
};

}
