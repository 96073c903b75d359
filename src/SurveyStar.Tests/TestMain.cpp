#include "pch.h"

#include "SurveyStar.Core/version.h"

#include <filesystem>
#include <iostream>

// NOLINTNEXTLINE(bugprone-exception-escape)
int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);

    std::cout << "\nInitialising with a custom GTest main function.\n\n";
    std::cout << "API version....: " << sstar::core::Version::to_string() << "\n";
    std::cout << "Test location..: " << std::filesystem::current_path().string() << "\n\n";

    return RUN_ALL_TESTS();
}
