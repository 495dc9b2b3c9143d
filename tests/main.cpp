#include <gtest/gtest.h>
#include <iostream>

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    std::cout << "=== Flow Graph Test Suite ===" << std::endl;
    std::cout << "Running node, scanner, lookup and analysis tests..." << std::endl;

    return RUN_ALL_TESTS();
}
