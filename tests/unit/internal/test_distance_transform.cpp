/**
 * @file test_distance_transform.cpp
 * @brief Unit tests for DistanceTransform module
 */

#include <gtest/gtest.h>
#include <CpnVision/Internal/DistanceTransform.h>
#include <CpnVision/Core/Exception.h>

#include <cmath>
#include <vector>

using namespace Cpn::Vision;
using namespace Cpn::Vision::Internal;

// Brute force reference: nearest zero pixel
static std::vector<float> BruteForce(const std::vector<uint8_t>& mask, int32_t w, int32_t h) {
    std::vector<float> out(mask.size(), 0.0f);
    for (int32_t y = 0; y < h; ++y) {
        for (int32_t x = 0; x < w; ++x) {
            if (mask[y * w + x] == 0) continue;
            double best = 1e30;
            for (int32_t v = 0; v < h; ++v) {
                for (int32_t u = 0; u < w; ++u) {
                    if (mask[v * w + u] != 0) continue;
                    double d = std::hypot(u - x, v - y);
                    if (d < best) best = d;
                }
            }
            out[y * w + x] = static_cast<float>(best);
        }
    }
    return out;
}

TEST(DistanceTransformTest, SingleBackgroundPixel) {
    const int32_t w = 5, h = 5;
    std::vector<uint8_t> mask(w * h, 1);
    mask[2 * w + 2] = 0;
    auto dist = ComputeL2Distance(mask.data(), w, h, w);
    EXPECT_FLOAT_EQ(dist[2 * w + 2], 0.0f);
    EXPECT_FLOAT_EQ(dist[2 * w + 3], 1.0f);
    EXPECT_NEAR(dist[0], std::sqrt(8.0), 1e-5);
}

TEST(DistanceTransformTest, MatchesBruteForce) {
    const int32_t w = 17, h = 11;
    std::vector<uint8_t> mask(w * h, 1);
    // Deterministic scatter of background pixels
    for (int32_t i = 0; i < w * h; i += 7) {
        mask[i] = 0;
    }
    mask[5 * w + 9] = 0;
    auto dist = ComputeL2Distance(mask.data(), w, h, w);
    auto ref = BruteForce(mask, w, h);
    for (size_t i = 0; i < dist.size(); ++i) {
        EXPECT_NEAR(dist[i], ref[i], 1e-4) << "pixel " << i;
    }
}

TEST(DistanceTransformTest, BorderedTreatsOutsideAsBackground) {
    const int32_t w = 5, h = 5;
    std::vector<uint8_t> mask(w * h, 1);
    auto dist = BorderedL2Distance(mask.data(), w, h);
    EXPECT_FLOAT_EQ(dist[0], 1.0f);
    EXPECT_FLOAT_EQ(dist[2 * w + 2], 3.0f);
    EXPECT_FLOAT_EQ(dist[2 * w + 4], 1.0f);
}

TEST(DistanceTransformTest, ImageInterface) {
    QImage mask(4, 3, PixelType::UInt8);
    for (int32_t y = 0; y < 3; ++y) {
        for (int32_t x = 1; x < 4; ++x) {
            mask.SetAt(x, y, 255);
        }
    }
    QImage dist = DistanceTransformL2(mask);
    ASSERT_EQ(dist.Type(), PixelType::Float32);
    EXPECT_FLOAT_EQ(dist.Row<float>(1)[0], 0.0f);
    EXPECT_FLOAT_EQ(dist.Row<float>(1)[1], 1.0f);
    EXPECT_FLOAT_EQ(dist.Row<float>(1)[3], 3.0f);
    EXPECT_TRUE(DistanceTransformL2(QImage()).Empty());
}
