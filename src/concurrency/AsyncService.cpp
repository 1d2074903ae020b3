#include "concurrency/AsyncService.hpp"
#include "log/Registry.hpp"

using namespace ferry::concurrency;

AsyncService::AsyncService(const std::string& serviceName)
    : serviceName_(serviceName) {}

AsyncService::~AsyncService() {
    stop();
}

void AsyncService::start() {
    if (isRunning()) return;

    interruptFlag_.store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);

    worker_ = std::thread([this] {
        try {
            runLoop();
        } catch (const std::exception& e) {
            log::Registry::ferry()->error("[{}] Service error: {}", serviceName_, e.what());
        }

        running_.store(false, std::memory_order_release);
    });

    log::Registry::ferry()->debug("[{}] Service started.", serviceName_);
}

void AsyncService::stop() {
    if (!worker_.joinable()) return;

    log::Registry::ferry()->debug("[{}] Stopping service...", serviceName_);
    interruptFlag_.store(true, std::memory_order_release);

    if (std::this_thread::get_id() != worker_.get_id()) worker_.join();
    else worker_.detach();

    running_.store(false, std::memory_order_release);
    // Leave interruptFlag_ true until next start() resets it
    log::Registry::ferry()->debug("[{}] Service stopped.", serviceName_);
}
