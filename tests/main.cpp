#include <gtest/gtest.h>
#include <iostream>

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    std::cout << "=== Reasoner Test Suite ===" << std::endl;
    std::cout << "Running value types, store, cache, then resolution..." << std::endl;

    return RUN_ALL_TESTS();
}
