#include <gtest/gtest.h>
#include <CpnVision/CpnVision.h>

#include <iostream>

int main(int argc, char** argv) {
    // Print library info
    std::cout << "========================================\n";
    std::cout << "CpnVision Unit Tests\n";
    std::cout << "Version: " << Cpn::Vision::GetVersion() << "\n";
    std::cout << "Threads: " << Cpn::Vision::Platform::GetNumCores() << "\n";
    std::cout << "========================================\n\n";

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
