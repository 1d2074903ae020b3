#include <gtest/gtest.h>
#include "FakeTransferEngine.hpp"
#include "runtime/LifecycleController.hpp"
#include "auth/UserRegistry.hpp"
#include "types/ServerConfig.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <chrono>
#include <functional>
#include <sstream>
#include <spdlog/sinks/ostream_sink.h>
#include <thread>

using namespace ferry;
using namespace ferry::runtime;
using namespace std::chrono_literals;

class LifecycleControllerTest : public ::testing::Test {
protected:
    std::shared_ptr<test::FakeTransferEngine> engine = std::make_shared<test::FakeTransferEngine>();
    std::unique_ptr<LifecycleController> controller = std::make_unique<LifecycleController>(engine);

    static std::shared_ptr<const types::ServerConfig> config(const uint16_t port, const std::string& label) {
        types::ServerConfig cfg;
        cfg.port = port;
        cfg.banner = label;
        cfg.shared_directory = "/srv/ftp";
        cfg.users.push_back({.username = "user", .password = "123456"});
        cfg.users.push_back({.username = "ro", .password = "pw", .permissions = types::parsePermissions("elr"),
                             .home_directory = std::filesystem::path("/srv/ro")});
        return std::make_shared<const types::ServerConfig>(std::move(cfg));
    }

    static std::shared_ptr<const auth::UserRegistry> registryFor(const types::ServerConfig& cfg) {
        return std::make_shared<const auth::UserRegistry>(auth::UserRegistry::fromConfig(cfg));
    }

    void start(const uint16_t port, const std::string& label) const {
        const auto cfg = config(port, label);
        controller->start(cfg, registryFor(*cfg));
    }

    void restart(const uint16_t port, const std::string& label) const {
        const auto cfg = config(port, label);
        controller->restart(cfg, registryFor(*cfg));
    }

    static LifecycleErrorKind failureKind(const std::function<void()>& fn) {
        try {
            fn();
        } catch (const LifecycleError& e) {
            return e.kind();
        }
        ADD_FAILURE() << "expected LifecycleError";
        return LifecycleErrorKind::AlreadyActive;
    }
};

TEST_F(LifecycleControllerTest, InitiallyStopped) {
    EXPECT_EQ(controller->state(), LifecycleState::Stopped);
    EXPECT_FALSE(controller->lastFailure().has_value());
    EXPECT_EQ(controller->currentConfig(), nullptr);
    EXPECT_FALSE(controller->boundPort().has_value());
}

TEST_F(LifecycleControllerTest, StartRegistersUsersWithResolvedHomes) {
    start(2121, "A");

    EXPECT_EQ(controller->state(), LifecycleState::Running);
    EXPECT_EQ(controller->boundPort(), 2121);
    ASSERT_NE(controller->currentConfig(), nullptr);
    EXPECT_EQ(controller->currentConfig()->port, 2121);

    const auto regs = engine->registrations();
    ASSERT_EQ(regs.size(), 2u);
    EXPECT_EQ(regs[0].username, "user");
    EXPECT_EQ(regs[0].home, std::filesystem::path("/srv/ftp"));
    EXPECT_EQ(regs[0].permissions, types::PermissionSet::full());
    EXPECT_EQ(regs[1].username, "ro");
    EXPECT_EQ(regs[1].home, std::filesystem::path("/srv/ro"));
    EXPECT_EQ(regs[1].permissions, types::parsePermissions("elr"));

    const auto request = engine->lastRequest();
    EXPECT_EQ(request.listen_address, "0.0.0.0");
    EXPECT_EQ(request.max_connections, types::DEFAULT_MAX_CONNECTIONS);
}

TEST_F(LifecycleControllerTest, BindFailureThenFreePort) {
    engine->occupy(2121);

    try {
        start(2121, "A");
        FAIL() << "expected LifecycleError";
    } catch (const LifecycleError& e) {
        EXPECT_EQ(e.kind(), LifecycleErrorKind::EngineBindError);
        EXPECT_EQ(e.code(), std::make_error_code(std::errc::address_in_use));
    }

    EXPECT_EQ(controller->state(), LifecycleState::Failed);
    ASSERT_TRUE(controller->lastFailure().has_value());
    EXPECT_EQ(controller->lastFailure()->kind, LifecycleErrorKind::EngineBindError);
    EXPECT_TRUE(engine->registrations().empty());

    start(2122, "B");
    EXPECT_EQ(controller->state(), LifecycleState::Running);
    EXPECT_EQ(controller->boundPort(), 2122);
    EXPECT_FALSE(controller->lastFailure().has_value());
}

TEST_F(LifecycleControllerTest, FailuresAreLeftToTheCallerToReport) {
    std::ostringstream captured;
    const auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(captured);
    sink->set_level(spdlog::level::warn);

    const auto logger = ferry::log::Registry::runtime();
    logger->sinks().push_back(sink);

    engine->occupy(2121);
    EXPECT_EQ(failureKind([&] { start(2121, "A"); }), LifecycleErrorKind::EngineBindError);

    logger->sinks().pop_back();
    EXPECT_TRUE(captured.str().empty()) << captured.str();
}

TEST_F(LifecycleControllerTest, StartWhileRunningIsAlreadyActive) {
    start(2121, "A");
    EXPECT_EQ(failureKind([&] { start(2122, "B"); }), LifecycleErrorKind::AlreadyActive);
    EXPECT_EQ(controller->state(), LifecycleState::Running);
    EXPECT_EQ(controller->boundPort(), 2121);
}

TEST_F(LifecycleControllerTest, StopIsIdempotent) {
    controller->stop();
    EXPECT_EQ(controller->state(), LifecycleState::Stopped);

    start(2121, "A");
    controller->stop();
    EXPECT_EQ(controller->state(), LifecycleState::Stopped);
    controller->stop();
    EXPECT_EQ(controller->state(), LifecycleState::Stopped);

    EXPECT_EQ(engine->events(), (std::vector<std::string>{"bind:A", "register:user", "register:ro", "shutdown:A"}));
    EXPECT_EQ(controller->currentConfig(), nullptr);
}

TEST_F(LifecycleControllerTest, StopThenStartAgain) {
    start(2121, "A");
    controller->stop();
    start(2121, "A");
    EXPECT_EQ(controller->state(), LifecycleState::Running);
}

TEST_F(LifecycleControllerTest, RestartShutsDownBeforeRebinding) {
    start(2121, "A");
    engine->clearEvents();

    restart(2122, "B");

    EXPECT_EQ(controller->state(), LifecycleState::Running);
    EXPECT_EQ(controller->boundPort(), 2122);
    EXPECT_EQ(engine->events(), (std::vector<std::string>{"shutdown:A", "bind:B", "register:user", "register:ro"}));
}

TEST_F(LifecycleControllerTest, RestartOnSamePortReleasesFirst) {
    start(2121, "A");
    EXPECT_NO_THROW(restart(2121, "B"));
    EXPECT_EQ(controller->boundPort(), 2121);
}

TEST_F(LifecycleControllerTest, RestartFromStoppedStarts) {
    restart(2121, "A");
    EXPECT_EQ(controller->state(), LifecycleState::Running);
}

TEST_F(LifecycleControllerTest, RestartBindFailureLeavesFailed) {
    start(2121, "A");
    engine->occupy(2200);

    EXPECT_EQ(failureKind([&] { restart(2200, "B"); }), LifecycleErrorKind::EngineBindError);
    EXPECT_EQ(controller->state(), LifecycleState::Failed);
    EXPECT_EQ(controller->currentConfig(), nullptr);

    const auto events = engine->events();
    ASSERT_GE(events.size(), 2u);
    EXPECT_EQ(events[events.size() - 2], "shutdown:A");
    EXPECT_EQ(events.back(), "bind-failed:2200");
}

TEST_F(LifecycleControllerTest, StartDuringStartingFailsFast) {
    engine->holdBinds(true);
    std::thread first([&] { start(2121, "A"); });
    engine->waitForBindCount(1);

    EXPECT_EQ(controller->state(), LifecycleState::Starting);
    EXPECT_EQ(failureKind([&] { start(2122, "B"); }), LifecycleErrorKind::AlreadyActive);

    engine->holdBinds(false);
    first.join();
    EXPECT_EQ(controller->state(), LifecycleState::Running);
    EXPECT_EQ(controller->boundPort(), 2121);
}

TEST_F(LifecycleControllerTest, StopDuringStartingWaitsForTransition) {
    engine->holdBinds(true);
    std::thread starter([&] { start(2121, "A"); });
    engine->waitForBindCount(1);

    std::thread stopper([&] { controller->stop(); });
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(controller->state(), LifecycleState::Starting);

    engine->holdBinds(false);
    starter.join();
    stopper.join();

    EXPECT_EQ(controller->state(), LifecycleState::Stopped);
    EXPECT_EQ(engine->events().back(), "shutdown:A");
}

TEST_F(LifecycleControllerTest, RegistrationFailureShutsDownHandle) {
    engine->rejectRegistration(true);

    EXPECT_EQ(failureKind([&] { start(2121, "A"); }), LifecycleErrorKind::EngineFatal);
    EXPECT_EQ(controller->state(), LifecycleState::Failed);
    EXPECT_EQ(engine->events(), (std::vector<std::string>{"bind:A", "shutdown:A"}));

    engine->rejectRegistration(false);
    start(2121, "A");
    EXPECT_EQ(controller->state(), LifecycleState::Running);
}

TEST_F(LifecycleControllerTest, EngineFaultMovesToFailed) {
    start(2121, "A");
    engine->raiseFatal("listener died");

    EXPECT_EQ(controller->waitWhileRunning(5s), LifecycleState::Failed);
    ASSERT_TRUE(controller->lastFailure().has_value());
    EXPECT_EQ(controller->lastFailure()->kind, LifecycleErrorKind::EngineFatal);
    EXPECT_EQ(controller->lastFailure()->message, "listener died");

    // The faulted handle is drained before a new start is accepted.
    start(2121, "A");
    EXPECT_EQ(controller->state(), LifecycleState::Running);
    const auto events = engine->events();
    EXPECT_EQ(std::count(events.begin(), events.end(), "shutdown:A"), 1);
}

TEST_F(LifecycleControllerTest, StaleFaultIsIgnored) {
    start(2121, "A");
    const auto stale = engine->lastFatalHandler();
    restart(2122, "B");

    stale("old listener died");
    EXPECT_EQ(controller->waitWhileRunning(300ms), LifecycleState::Running);
    EXPECT_FALSE(controller->lastFailure().has_value());
}

TEST_F(LifecycleControllerTest, DestructorStopsRunningEngine) {
    start(2121, "A");
    controller.reset();
    EXPECT_EQ(engine->events().back(), "shutdown:A");
}
