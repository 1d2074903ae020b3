#include <gtest/gtest.h>
#include <iostream>

#include "log/Registry.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        ferry::types::LoggingConfig logging;
        logging.level = "warn";
        ferry::log::Registry::init(logging);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize ferry test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}
