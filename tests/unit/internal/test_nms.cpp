/**
 * @file test_nms.cpp
 * @brief Unit tests for NonMaxSuppression module
 */

#include <gtest/gtest.h>
#include <CpnVision/Internal/NonMaxSuppression.h>
#include <CpnVision/Core/Exception.h>

#include <algorithm>
#include <vector>

using namespace Cpn::Vision;
using namespace Cpn::Vision::Internal;

// ============================================================================
// Fixture
// ============================================================================

class ContourNMSTest : public ::testing::Test {
protected:
    void AddSquare(double x, double y, double size, double score, int32_t classId = 1) {
        polygons_.push_back({{x, y}, {x + size, y}, {x + size, y + size}, {x, y + size}});
        meta_.push_back({score, classId});
    }

    std::vector<ScoredContour> Candidates() const {
        std::vector<ScoredContour> out;
        for (size_t i = 0; i < polygons_.size(); ++i) {
            ScoredContour c;
            c.points = &polygons_[i];
            c.score = meta_[i].first;
            c.classId = meta_[i].second;
            c.rankKey = static_cast<int64_t>(i);
            out.push_back(c);
        }
        return out;
    }

    std::vector<size_t> Run(double thresh, NmsMode mode = NmsMode::Greedy, bool perClass = true) {
        ContourNmsParams params;
        params.iouThreshold = thresh;
        params.mode = mode;
        params.perClass = perClass;
        return ContourNMS(Candidates(), params);
    }

    std::vector<std::vector<Point2d>> polygons_;
    std::vector<std::pair<double, int32_t>> meta_;
};

// ============================================================================
// Ranking
// ============================================================================

TEST_F(ContourNMSTest, RankByScoreStableTies) {
    AddSquare(0, 0, 1, 0.5);
    AddSquare(10, 0, 1, 0.9);
    AddSquare(20, 0, 1, 0.5);
    auto order = RankByScore(Candidates());
    ASSERT_EQ(order.size(), 3u);
    EXPECT_EQ(order[0], 1u);
    EXPECT_EQ(order[1], 0u);
    EXPECT_EQ(order[2], 2u);
}

// ============================================================================
// Suppression
// ============================================================================

TEST_F(ContourNMSTest, EmptyInput) {
    EXPECT_TRUE(Run(0.3).empty());
}

TEST_F(ContourNMSTest, OverlapThreshold) {
    // IoU of the pair is 9500 / 10500
    AddSquare(0, 0, 100, 0.9);
    AddSquare(5, 0, 100, 0.8);
    auto kept = Run(0.5);
    ASSERT_EQ(kept.size(), 1u);
    EXPECT_EQ(kept[0], 0u);
    EXPECT_EQ(Run(0.95).size(), 2u);
}

TEST_F(ContourNMSTest, ThresholdOneKeepsEverything) {
    AddSquare(0, 0, 10, 0.9);
    AddSquare(0, 0, 10, 0.8);
    EXPECT_EQ(Run(1.0).size(), 2u);
    EXPECT_EQ(Run(0.0).size(), 1u);
}

TEST_F(ContourNMSTest, PerClassCompetition) {
    AddSquare(0, 0, 10, 0.9, 1);
    AddSquare(0, 0, 10, 0.8, 2);
    EXPECT_EQ(Run(0.3, NmsMode::Greedy, true).size(), 2u);
    EXPECT_EQ(Run(0.3, NmsMode::Greedy, false).size(), 1u);
}

TEST_F(ContourNMSTest, GreedyVersusFastChain) {
    // A overlaps B, B overlaps C, A and C barely overlap
    AddSquare(0, 0, 100, 0.9);
    AddSquare(40, 0, 100, 0.8);
    AddSquare(80, 0, 100, 0.7);

    auto greedy = Run(0.3, NmsMode::Greedy);
    ASSERT_EQ(greedy.size(), 2u);
    EXPECT_EQ(greedy[0], 0u);
    EXPECT_EQ(greedy[1], 2u);

    auto fast = Run(0.3, NmsMode::Fast);
    ASSERT_EQ(fast.size(), 1u);
    EXPECT_EQ(fast[0], 0u);
}

TEST_F(ContourNMSTest, FastModeIsMonotoneInThreshold) {
    for (int i = 0; i < 6; ++i) {
        AddSquare(i * 15.0, (i % 2) * 7.0, 40, 0.9 - 0.1 * i);
    }
    std::vector<size_t> previous;
    for (double t = 0.0; t <= 1.0; t += 0.05) {
        auto kept = Run(t, NmsMode::Fast);
        std::vector<size_t> sortedKept = kept;
        std::sort(sortedKept.begin(), sortedKept.end());
        EXPECT_TRUE(std::includes(sortedKept.begin(), sortedKept.end(),
                                  previous.begin(), previous.end()))
            << "threshold " << t;
        previous = sortedKept;
    }
}

TEST_F(ContourNMSTest, Idempotent) {
    for (int i = 0; i < 8; ++i) {
        AddSquare(i * 9.0, i * 4.0, 30, 0.95 - 0.05 * i);
    }
    for (NmsMode mode : {NmsMode::Greedy, NmsMode::Fast}) {
        auto kept = Run(0.3, mode);

        auto all = Candidates();
        std::vector<ScoredContour> survivors;
        for (size_t idx : kept) {
            survivors.push_back(all[idx]);
        }
        ContourNmsParams params;
        params.mode = mode;
        auto again = ContourNMS(survivors, params);

        std::vector<size_t> mapped;
        for (size_t idx : again) {
            mapped.push_back(kept[idx]);
        }
        EXPECT_EQ(mapped, kept);
    }
}

TEST_F(ContourNMSTest, InvalidParameters) {
    AddSquare(0, 0, 10, 0.9);
    EXPECT_THROW(Run(1.5), InvalidArgumentException);
    EXPECT_THROW(Run(-0.1), InvalidArgumentException);

    ContourNmsParams params;
    params.supersample = 0;
    EXPECT_THROW(ContourNMS(Candidates(), params), InvalidArgumentException);
}

TEST_F(ContourNMSTest, NullPolygonIsKept) {
    AddSquare(0, 0, 10, 0.9);
    auto candidates = Candidates();
    ScoredContour empty;
    empty.score = 0.5;
    candidates.push_back(empty);
    EXPECT_EQ(ContourNMS(candidates, ContourNmsParams()).size(), 2u);
}
