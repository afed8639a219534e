/**
 * @file test_diagnostics.cpp
 * @brief Unit tests for Platform/Diagnostics.h
 */

#include <CpnVision/Platform/Diagnostics.h>
#include <gtest/gtest.h>

#include <string>

using namespace Cpn::Vision::Platform;

class DiagnosticsTest : public ::testing::Test {
protected:
    void SetUp() override { previous_ = IsDiagnosticsEnabled(); }
    void TearDown() override { SetDiagnosticsEnabled(previous_); }

    bool previous_ = false;
};

TEST_F(DiagnosticsTest, OverrideSwitch) {
    SetDiagnosticsEnabled(true);
    EXPECT_TRUE(IsDiagnosticsEnabled());
    SetDiagnosticsEnabled(false);
    EXPECT_FALSE(IsDiagnosticsEnabled());
}

TEST_F(DiagnosticsTest, EnabledLineGoesToStderr) {
    SetDiagnosticsEnabled(true);
    testing::internal::CaptureStderr();
    CPNVISION_DIAG("Unit", "value=%d", 17);
    std::string output = testing::internal::GetCapturedStderr();
    EXPECT_EQ(output, "[Unit] value=17\n");
}

TEST_F(DiagnosticsTest, DisabledPrintsNothing) {
    SetDiagnosticsEnabled(false);
    testing::internal::CaptureStderr();
    CPNVISION_DIAG("Unit", "hidden %s", "line");
    EXPECT_TRUE(testing::internal::GetCapturedStderr().empty());
}
