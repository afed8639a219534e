/**
 * @file test_timer.cpp
 * @brief Unit tests for Platform/Timer.h
 */

#include <CpnVision/Platform/Timer.h>
#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>

using namespace Cpn::Vision::Platform;

TEST(StageTimerTest, StartsWithoutStages) {
    StageTimer timer;
    EXPECT_TRUE(timer.Stages().empty());
    EXPECT_DOUBLE_EQ(timer.TotalMs(), 0.0);
    EXPECT_EQ(timer.Summary(), "(total 0.00 ms)");
}

TEST(StageTimerTest, MarksConsecutiveStages) {
    StageTimer timer;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    double first = timer.Mark("decode");
    EXPECT_GE(first, 4.0);

    double second = timer.Mark("nms");
    EXPECT_GE(second, 0.0);
    EXPECT_LT(second, first + 1000.0);

    ASSERT_EQ(timer.Stages().size(), 2u);
    EXPECT_EQ(timer.Stages()[0].first, "decode");
    EXPECT_EQ(timer.Stages()[1].first, "nms");
    EXPECT_DOUBLE_EQ(timer.TotalMs(), first + second);
}

TEST(StageTimerTest, SummaryListsStagesInOrder) {
    StageTimer timer;
    timer.Mark("decode");
    timer.Mark("refine");
    std::string summary = timer.Summary();
    size_t decode = summary.find("decode ");
    size_t refine = summary.find(", refine ");
    ASSERT_NE(decode, std::string::npos);
    ASSERT_NE(refine, std::string::npos);
    EXPECT_LT(decode, refine);
    EXPECT_NE(summary.find("(total "), std::string::npos);
}

TEST(StageTimerTest, RestartClearsStages) {
    StageTimer timer;
    std::this_thread::sleep_for(std::chrono::milliseconds(3));
    timer.Mark("decode");
    timer.Restart();
    EXPECT_TRUE(timer.Stages().empty());
    EXPECT_LT(timer.SinceMarkMs(), 1000.0);
}
