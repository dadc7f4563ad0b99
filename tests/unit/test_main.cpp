#include <gtest/gtest.h>

#include <iostream>

#ifndef SITECAL_VERSION
#define SITECAL_VERSION "0.0.0"
#endif

int main(int argc, char** argv) {
    std::cout << "========================================\n";
    std::cout << "sitecal Unit Tests\n";
    std::cout << "Version: " << SITECAL_VERSION << "\n";
    std::cout << "========================================\n\n";

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
