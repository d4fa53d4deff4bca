#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include "digitloom/logging.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    // Suppress logs during tests unless explicitly needed
    digitloom::logging::init("error");
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    return RUN_ALL_TESTS();
}
