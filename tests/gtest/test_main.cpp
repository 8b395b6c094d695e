#include <gtest/gtest.h>

#include "chunkscribe/logging.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    // Keep test output readable; failures are asserted, not logged.
    chunkscribe::initialize_logging("critical");

    return RUN_ALL_TESTS();
}
