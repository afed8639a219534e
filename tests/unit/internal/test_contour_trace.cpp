/**
 * @file test_contour_trace.cpp
 * @brief Unit tests for ContourTrace module
 */

#include <gtest/gtest.h>
#include <CpnVision/Internal/ContourTrace.h>

#include <string>
#include <vector>

using namespace Cpn::Vision;
using namespace Cpn::Vision::Internal;

namespace {

struct Mask {
    std::vector<uint8_t> data;
    int32_t width = 0;
    int32_t height = 0;
};

Mask MakeMask(const std::vector<std::string>& rows) {
    Mask m;
    m.height = static_cast<int32_t>(rows.size());
    m.width = static_cast<int32_t>(rows[0].size());
    m.data.assign(static_cast<size_t>(m.width) * m.height, 0);
    for (int32_t y = 0; y < m.height; ++y) {
        for (int32_t x = 0; x < m.width; ++x) {
            m.data[y * m.width + x] = rows[y][x] == '#' ? 1 : 0;
        }
    }
    return m;
}

} // namespace

// =============================================================================
// TraceBoundary
// =============================================================================

TEST(ContourTraceTest, SinglePixel) {
    Mask m = MakeMask({"...", ".#.", "..."});
    auto boundary = TraceBoundary(m.data.data(), m.width, m.height, {1, 1});
    ASSERT_EQ(boundary.size(), 1u);
    EXPECT_EQ(boundary[0], Point2i(1, 1));
}

TEST(ContourTraceTest, StartOnBackgroundGivesNothing) {
    Mask m = MakeMask({"...", ".#.", "..."});
    EXPECT_TRUE(TraceBoundary(m.data.data(), m.width, m.height, {0, 0}).empty());
}

TEST(ContourTraceTest, SquareVisitsEachBorderPixelOnce) {
    Mask m = MakeMask({"###",
                       "###",
                       "###"});
    auto boundary = TraceBoundary(m.data.data(), m.width, m.height, {0, 0});
    ASSERT_EQ(boundary.size(), 8u);
    EXPECT_EQ(boundary[0], Point2i(0, 0));
    for (const auto& p : boundary) {
        EXPECT_FALSE(p == Point2i(1, 1));
    }
}

TEST(ContourTraceTest, TwoByTwoSquare) {
    Mask m = MakeMask({"##", "##"});
    EXPECT_EQ(TraceBoundary(m.data.data(), m.width, m.height, {0, 0}).size(), 4u);
}

TEST(ContourTraceTest, LineIsWalkedBothWays) {
    Mask m = MakeMask({"###"});
    auto boundary = TraceBoundary(m.data.data(), m.width, m.height, {0, 0});
    ASSERT_EQ(boundary.size(), 4u);
    EXPECT_EQ(boundary[1], Point2i(1, 0));
    EXPECT_EQ(boundary[2], Point2i(2, 0));
    EXPECT_EQ(boundary[3], Point2i(1, 0));
}

TEST(ContourTraceTest, BridgePixelsRevisited) {
    // Two blobs joined by a one pixel bridge; the trace must not stop at the
    // first return to a pixel on the bridge
    Mask m = MakeMask({"##...##",
                       "##...##",
                       "..###..",
                       "##...##",
                       "##...##"});
    auto boundary = TraceBoundary(m.data.data(), m.width, m.height, {0, 0});
    int bridgeVisits = 0;
    bool sawFarCorner = false;
    for (const auto& p : boundary) {
        if (p == Point2i(3, 2)) ++bridgeVisits;
        if (p == Point2i(6, 4)) sawFarCorner = true;
    }
    EXPECT_EQ(bridgeVisits, 2);
    EXPECT_TRUE(sawFarCorner);
}

// =============================================================================
// TraceContour
// =============================================================================

TEST(ContourTraceTest, ContourHasPositiveAreaAndKeepsStart) {
    Mask m = MakeMask({"....",
                       ".###",
                       ".###",
                       ".###"});
    QContour c = TraceContour(m.data.data(), m.width, m.height, {1, 1}, {10, 20});
    ASSERT_EQ(c.Size(), 8u);
    EXPECT_TRUE(c.IsClosed());
    EXPECT_EQ(c[0], Point2d(11, 21));
    EXPECT_DOUBLE_EQ(c.SignedArea(), 4.0);
    Rect2d box = c.BoundingBox();
    EXPECT_DOUBLE_EQ(box.x, 11.0);
    EXPECT_DOUBLE_EQ(box.y, 21.0);
    EXPECT_DOUBLE_EQ(box.width, 2.0);
}
