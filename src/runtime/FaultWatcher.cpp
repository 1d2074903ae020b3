#include "runtime/FaultWatcher.hpp"
#include "log/Registry.hpp"

#include <chrono>

using namespace ferry::runtime;
using ferry::log::Registry;

FaultWatcher::FaultWatcher(Sink sink)
    : AsyncService("FaultWatcher"),
      sink_(std::move(sink)),
      queue_(std::make_shared<concurrency::BlockingQueue<EngineFault>>()) {}

FaultWatcher::~FaultWatcher() {
    stop();
}

ferry::engine::FatalErrorHandler FaultWatcher::handlerFor(const uint64_t generation) const {
    return [queue = queue_, generation](const std::string& reason) {
        if (!queue->push(EngineFault{generation, reason}))
            Registry::runtime()->warn("[FaultWatcher] Dropped engine fault after shutdown: {}", reason);
    };
}

void FaultWatcher::stop() {
    interruptFlag_.store(true, std::memory_order_release);
    queue_->close();
    AsyncService::stop();
}

void FaultWatcher::runLoop() {
    while (!shouldStop()) {
        const auto fault = queue_->popFor(std::chrono::milliseconds(250));
        if (!fault) continue;

        Registry::runtime()->debug("[FaultWatcher] Delivering fault (generation {}): {}", fault->generation, fault->reason);
        sink_(*fault);
    }
}
