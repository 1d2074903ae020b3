#include <gtest/gtest.h>
#include "FakeTransferEngine.hpp"
#include "log/Registry.hpp"
#include "runtime/LifecycleController.hpp"
#include "auth/UserRegistry.hpp"

#include <stdexcept>

using namespace ferry;
using ferry::log::Registry;

class LogRegistryTest : public ::testing::Test {
protected:
    void SetUp() override { Registry::shutdown(); }

    void TearDown() override {
        Registry::shutdown();
        types::LoggingConfig logging;
        logging.level = "warn";
        Registry::init(logging);
    }
};

TEST_F(LogRegistryTest, LoggingBeforeInitIsSilent) {
    EXPECT_FALSE(Registry::isInitialized());
    EXPECT_NO_THROW(Registry::ferry()->error("nobody hears this"));
    EXPECT_NO_THROW(Registry::runtime()->debug("or this"));
    EXPECT_NO_THROW(Registry::setLevel("debug"));
}

TEST_F(LogRegistryTest, UnknownLoggerAfterInitThrows) {
    Registry::init();
    EXPECT_TRUE(Registry::isInitialized());
    EXPECT_NE(Registry::engine(), nullptr);
    EXPECT_THROW((void)Registry::get("no-such-logger"), std::runtime_error);
}

TEST_F(LogRegistryTest, ControllerRunsWithoutLogging) {
    auto engine = std::make_shared<test::FakeTransferEngine>();

    types::ServerConfig cfg;
    cfg.users.push_back({.username = "user", .password = "123456"});
    const auto config = std::make_shared<const types::ServerConfig>(cfg);
    const auto registry = std::make_shared<const auth::UserRegistry>(auth::UserRegistry::fromConfig(*config));

    {
        runtime::LifecycleController controller(engine);
        controller.start(config, registry);
        EXPECT_EQ(controller.state(), runtime::LifecycleState::Running);
    }

    EXPECT_EQ(engine->events().back(), "shutdown:2121");
}

TEST_F(LogRegistryTest, ControllerRejectsMissingEngineWithoutLogging) {
    EXPECT_THROW(runtime::LifecycleController controller(nullptr), std::invalid_argument);
}
