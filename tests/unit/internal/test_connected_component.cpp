/**
 * @file test_connected_component.cpp
 * @brief Unit tests for ConnectedComponent module
 */

#include <gtest/gtest.h>
#include <CpnVision/Internal/ConnectedComponent.h>

#include <string>
#include <vector>

using namespace Cpn::Vision;
using namespace Cpn::Vision::Internal;

// =============================================================================
// Test Fixtures and Helpers
// =============================================================================

class ConnectedComponentTest : public ::testing::Test {
protected:
    // Build a mask from rows of '#' (foreground) and '.' (background)
    void SetMask(const std::vector<std::string>& rows) {
        height_ = static_cast<int32_t>(rows.size());
        width_ = static_cast<int32_t>(rows[0].size());
        mask_.assign(static_cast<size_t>(width_) * height_, 0);
        for (int32_t y = 0; y < height_; ++y) {
            for (int32_t x = 0; x < width_; ++x) {
                mask_[y * width_ + x] = rows[y][x] == '#' ? 1 : 0;
            }
        }
    }

    int32_t Label(Connectivity conn) {
        return LabelComponents(mask_.data(), width_, height_, conn, labels_);
    }

    int32_t LabelOf(int32_t x, int32_t y) const { return labels_[y * width_ + x]; }

    std::vector<uint8_t> mask_;
    std::vector<int32_t> labels_;
    int32_t width_ = 0;
    int32_t height_ = 0;
};

// =============================================================================
// Labeling
// =============================================================================

TEST_F(ConnectedComponentTest, EmptyMask) {
    SetMask({"....", "...."});
    EXPECT_EQ(Label(Connectivity::Eight), 0);
    for (int32_t v : labels_) {
        EXPECT_EQ(v, 0);
    }
}

TEST_F(ConnectedComponentTest, DiagonalNeighbors) {
    SetMask({"#...",
             ".#..",
             "..#."});
    EXPECT_EQ(Label(Connectivity::Eight), 1);
    EXPECT_EQ(Label(Connectivity::Four), 3);
}

TEST_F(ConnectedComponentTest, LabelsFollowFirstRasterPixel) {
    SetMask({"...##",
             "#..##",
             "#....",
             "#.#.."});
    ASSERT_EQ(Label(Connectivity::Four), 3);
    EXPECT_EQ(LabelOf(3, 0), 1);
    EXPECT_EQ(LabelOf(4, 1), 1);
    EXPECT_EQ(LabelOf(0, 1), 2);
    EXPECT_EQ(LabelOf(0, 3), 2);
    EXPECT_EQ(LabelOf(2, 3), 3);
}

TEST_F(ConnectedComponentTest, UShapeMergesLate) {
    // Two arms only connect on the last row
    SetMask({"#...#",
             "#...#",
             "#...#",
             "#####"});
    ASSERT_EQ(Label(Connectivity::Four), 1);
    EXPECT_EQ(LabelOf(0, 0), 1);
    EXPECT_EQ(LabelOf(4, 0), 1);
}

TEST_F(ConnectedComponentTest, ManyComponents) {
    // Checkerboard with 4-connectivity: every pixel is its own component
    std::vector<std::string> rows(32, std::string(32, '.'));
    for (int32_t y = 0; y < 32; ++y) {
        for (int32_t x = 0; x < 32; ++x) {
            if ((x + y) % 2 == 0) rows[y][x] = '#';
        }
    }
    SetMask(rows);
    EXPECT_EQ(Label(Connectivity::Four), 512);
    EXPECT_EQ(Label(Connectivity::Eight), 1);
}

// =============================================================================
// Statistics
// =============================================================================

TEST_F(ConnectedComponentTest, Stats) {
    SetMask({".....",
             ".##..",
             ".##.#",
             "....#"});
    int32_t n = Label(Connectivity::Eight);
    ASSERT_EQ(n, 2);
    auto stats = GetComponentStats(labels_, width_, height_, n);
    ASSERT_EQ(stats.size(), 2u);

    EXPECT_EQ(stats[0].label, 1);
    EXPECT_EQ(stats[0].area, 4);
    EXPECT_EQ(stats[0].firstPixel, Point2i(1, 1));
    EXPECT_EQ(stats[0].bbox.x, 1);
    EXPECT_EQ(stats[0].bbox.y, 1);
    EXPECT_EQ(stats[0].bbox.width, 2);
    EXPECT_EQ(stats[0].bbox.height, 2);

    EXPECT_EQ(stats[1].area, 2);
    EXPECT_EQ(stats[1].firstPixel, Point2i(4, 2));
    EXPECT_EQ(LargestComponent(stats), 0);
}

TEST_F(ConnectedComponentTest, LargestComponentTiesAndEmpty) {
    std::vector<ComponentStats> stats(3);
    stats[0].area = 2;
    stats[1].area = 5;
    stats[2].area = 5;
    EXPECT_EQ(LargestComponent(stats), 1);
    EXPECT_EQ(LargestComponent({}), -1);
}
