#pragma once

#include "concurrency/AsyncService.hpp"
#include "concurrency/BlockingQueue.hpp"
#include "engine/TransferEngine.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace ferry::runtime {

struct EngineFault {
    uint64_t generation{};
    std::string reason;
};

// Turns asynchronous engine fault callbacks into queued events and delivers them,
// one at a time, to a single consumer.
class FaultWatcher final : public concurrency::AsyncService {
public:
    using Sink = std::function<void(const EngineFault&)>;

    explicit FaultWatcher(Sink sink);
    ~FaultWatcher() override;

    // Handler to pass to TransferEngine::bind for the given start generation.
    [[nodiscard]] engine::FatalErrorHandler handlerFor(uint64_t generation) const;

    void stop() override;

protected:
    void runLoop() override;

private:
    Sink sink_;
    std::shared_ptr<concurrency::BlockingQueue<EngineFault>> queue_;
};

}
