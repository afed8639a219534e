/**
 * @file test_contour_detector.cpp
 * @brief Unit tests for Detection/ContourDetector.h
 */

#include <gtest/gtest.h>
#include <CpnVision/Detection/ContourDetector.h>
#include <CpnVision/Core/Exception.h>

#include "test_helpers.h"

#include <algorithm>
#include <cmath>

using namespace Cpn::Vision;
using namespace TestHelpers;

namespace Det = Cpn::Vision::Detection;

class ContourDetectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.order = 2;
        config_.samples = 16;
        config_.scoreThresh = 0.9;
        config_.refinementBuckets = 6;
        config_.refinementMargin = 2.0;
        config_.refinementIterations = 4;
    }

    // Two overlapping circles and one isolated circle on a 40x40 grid
    Det::DenseOutput ThreeCircles() const {
        auto out = MakeZeroOutput(1, config_.order, 40, 40);
        SetCircleProposal(out, 10, 10, 0.93f, 6.0f);
        SetCircleProposal(out, 12, 10, 0.98f, 6.0f);
        SetCircleProposal(out, 28, 28, 0.95f, 5.0f);
        return out;
    }

    // Refinement tensor with tanh(dx) = value in every bucket and dy = 0
    static Inference::Tensor ConstantPush(int32_t buckets, int64_t height, int64_t width,
                                          float value) {
        Inference::Tensor t("refinement", {1, 2 * buckets, height, width});
        const int64_t plane = height * width;
        for (int32_t b = 0; b < buckets; ++b) {
            std::fill(t.data.begin() + 2 * b * plane, t.data.begin() + (2 * b + 1) * plane,
                      static_cast<float>(std::atanh(value)));
        }
        return t;
    }

    CpnConfig config_;
};

// =============================================================================
// ContourDetector
// =============================================================================

TEST_F(ContourDetectorTest, SuppressesAndOrdersByScore) {
    Det::ContourDetector detector(config_);
    EXPECT_DOUBLE_EQ(detector.Nms().iouThreshold, 0.3);
    EXPECT_EQ(detector.Nms().mode, Det::NmsMode::Greedy);

    auto detections = detector.Detect(ThreeCircles());
    ASSERT_EQ(detections.size(), 2u);
    EXPECT_NEAR(detections[0].score, 0.98, 1e-6);
    EXPECT_EQ(detections[0].location, Point2d(12, 10));
    EXPECT_NEAR(detections[1].score, 0.95, 1e-6);
    EXPECT_EQ(detections[1].classId, 1);
    EXPECT_TRUE(detections[0].contour.IsClosed());
    EXPECT_EQ(detections[0].contour.Size(), 16u);
}

TEST_F(ContourDetectorTest, NmsModeFromConfig) {
    config_.nmsMode = Det::NmsMode::Fast;
    Det::ContourDetector detector(config_);
    EXPECT_EQ(detector.Nms().mode, Det::NmsMode::Fast);
    EXPECT_EQ(detector.Detect(ThreeCircles()).size(), 2u);
}

TEST_F(ContourDetectorTest, HugeCoefficientsOverlapInsideGrid) {
    // Two near-identical circles far larger than the grid, and a small one
    auto out = MakeZeroOutput(1, config_.order, 40, 40);
    SetCircleProposal(out, 10, 10, 0.93f, 1e10f);
    SetCircleProposal(out, 11, 10, 0.98f, 1e10f);
    SetCircleProposal(out, 28, 28, 0.95f, 5.0f);

    Det::ContourDetector detector(config_);
    auto detections = detector.Detect(out);
    ASSERT_EQ(detections.size(), 2u);
    EXPECT_EQ(detections[0].location, Point2d(11, 10));
    EXPECT_EQ(detections[1].location, Point2d(28, 28));
}

TEST_F(ContourDetectorTest, NoRefinementWithoutTensorOrIterations) {
    Det::ProposalDecoder decoder(config_);
    auto decoded = Det::SuppressProposals(decoder.Decode(ThreeCircles()));

    Det::ContourDetector detector(config_);
    auto detections = detector.Detect(ThreeCircles());
    ASSERT_EQ(detections.size(), decoded.size());
    for (size_t i = 0; i < decoded.size(); ++i) {
        for (size_t m = 0; m < decoded[i].contour.size(); ++m) {
            EXPECT_EQ(detections[i].contour[m], decoded[i].contour[m]);
        }
    }

    // Tensor present, zero iterations
    config_.refinementIterations = 0;
    Det::ContourDetector unrefined(config_);
    auto out = ThreeCircles();
    out.refinement = ConstantPush(6, 40, 40, 0.5f);
    auto same = unrefined.Detect(out);
    ASSERT_EQ(same.size(), decoded.size());
    EXPECT_EQ(same[0].contour[0], decoded[0].contour[0]);
}

TEST_F(ContourDetectorTest, ZeroRefinementTensorKeepsContours) {
    Det::ContourDetector detector(config_);
    auto plain = detector.Detect(ThreeCircles());

    auto out = ThreeCircles();
    out.refinement = Inference::Tensor("refinement", {1, 12, 40, 40});
    auto refined = detector.Detect(out);
    ASSERT_EQ(refined.size(), plain.size());
    for (size_t i = 0; i < plain.size(); ++i) {
        for (size_t m = 0; m < plain[i].contour.Size(); ++m) {
            EXPECT_NEAR(refined[i].contour[m].x, plain[i].contour[m].x, 1e-12);
            EXPECT_NEAR(refined[i].contour[m].y, plain[i].contour[m].y, 1e-12);
        }
    }
}

TEST_F(ContourDetectorTest, ConstantRefinementShift) {
    Det::ContourDetector detector(config_);
    auto plain = detector.Detect(ThreeCircles());

    // margin 2 * tanh = 0.5 -> +1 per pass, 4 passes
    auto out = ThreeCircles();
    out.refinement = ConstantPush(6, 40, 40, 0.5f);
    auto refined = detector.Detect(out);
    ASSERT_EQ(refined.size(), plain.size());
    for (size_t i = 0; i < plain.size(); ++i) {
        for (size_t m = 0; m < plain[i].contour.Size(); ++m) {
            EXPECT_NEAR(refined[i].contour[m].x, plain[i].contour[m].x + 4.0, 1e-5);
            EXPECT_NEAR(refined[i].contour[m].y, plain[i].contour[m].y, 1e-9);
        }
    }

    auto wrongBuckets = ThreeCircles();
    wrongBuckets.refinement = ConstantPush(4, 40, 40, 0.5f);
    EXPECT_THROW(detector.Detect(wrongBuckets), ShapeMismatchException);
}

namespace {

class ShrinkField : public Det::RefinementField {
public:
    explicit ShrinkField(Point2d center) : center_(center) {}

    Point2d Offset(const Point2d& point, int32_t, const Point2d&) const override {
        return (center_ - point) * 0.5;
    }
    int32_t Buckets() const override { return 3; }
    Rect2d Domain() const override { return Rect2d(0, 0, 100, 100); }

private:
    Point2d center_;
};

} // anonymous namespace

TEST_F(ContourDetectorTest, ExternalField) {
    config_.refinementIterations = 1;
    Det::ContourDetector detector(config_);

    auto out = MakeZeroOutput(1, config_.order, 40, 40);
    SetCircleProposal(out, 20, 20, 0.99f, 8.0f);

    ShrinkField field(Point2d(20, 20));
    auto detections = detector.Detect(out, field);
    ASSERT_EQ(detections.size(), 1u);
    const QContour& contour = detections[0].contour;
    for (size_t m = 0; m < contour.Size(); ++m) {
        EXPECT_NEAR(contour[m].DistanceTo(Point2d(20, 20)), 4.0, 1e-5);
    }
}

TEST_F(ContourDetectorTest, DetectBatch) {
    config_.refinementIterations = 0;
    Det::ContourDetector detector(config_);

    Det::DenseOutput out;
    out.scores = Inference::Tensor("scores", {2, 1, 20, 20});
    out.fourier = Inference::Tensor("fourier", {2, 8, 20, 20});
    auto place = [&](int64_t n, int64_t x, int64_t y) {
        const int64_t cell = y * 20 + x;
        out.scores.data[n * 400 + cell] = 0.99f;
        out.fourier.data[n * 8 * 400 + cell] = 3.0f;
    };
    place(0, 5, 5);
    place(1, 5, 5);
    place(1, 15, 15);

    auto batches = detector.DetectBatch(out);
    ASSERT_EQ(batches.size(), 2u);
    EXPECT_EQ(batches[0].size(), 1u);
    EXPECT_EQ(batches[1].size(), 2u);

    EXPECT_THROW(detector.Detect(out), InvalidArgumentException);
}

TEST_F(ContourDetectorTest, InvalidConfiguration) {
    config_.nmsThresh = 2.0;
    EXPECT_THROW(Det::ContourDetector bad(config_), InvalidConfigurationException);
}

// =============================================================================
// Model outputs
// =============================================================================

TEST(MakeDenseOutputTest, ByName) {
    std::vector<Inference::Tensor> outputs = {
        Inference::Tensor("refinement", {1, 12, 4, 4}),
        Inference::Tensor("fourier", {1, 8, 4, 4}),
        Inference::Tensor("scores", {1, 1, 4, 4})};

    auto dense = Det::MakeDenseOutput(outputs);
    EXPECT_EQ(dense.scores.name, "scores");
    EXPECT_EQ(dense.fourier.name, "fourier");
    EXPECT_TRUE(dense.HasRefinement());
}

TEST(MakeDenseOutputTest, ByPosition) {
    std::vector<Inference::Tensor> outputs = {Inference::Tensor("out0", {1, 1, 4, 4}),
                                              Inference::Tensor("out1", {1, 8, 4, 4})};
    auto dense = Det::MakeDenseOutput(outputs);
    EXPECT_EQ(dense.scores.name, "out0");
    EXPECT_EQ(dense.fourier.name, "out1");
    EXPECT_FALSE(dense.HasRefinement());

    outputs.push_back(Inference::Tensor("out2", {1, 12, 4, 4}));
    EXPECT_TRUE(Det::MakeDenseOutput(outputs).HasRefinement());
}

TEST(MakeDenseOutputTest, Missing) {
    EXPECT_THROW(Det::MakeDenseOutput({Inference::Tensor("out0", {1, 1, 4, 4})}),
                 InvalidArgumentException);
    EXPECT_THROW(Det::MakeDenseOutput({Inference::Tensor("scores", {1, 1, 4, 4}),
                                       Inference::Tensor("other", {1, 8, 4, 4})}),
                 InvalidArgumentException);
}

// =============================================================================
// ContourProposalNetwork
// =============================================================================

TEST(ContourProposalNetworkTest, RequiresModel) {
    Det::ContourProposalNetwork network{CpnConfig()};
    EXPECT_FALSE(network.IsLoaded());
    EXPECT_THROW(network.Detect(QImage(16, 16)), InvalidArgumentException);
    EXPECT_THROW(network.Load(""), InvalidArgumentException);
    EXPECT_EQ(network.Detector().Config().order, 8);
}

#ifndef CPNVISION_HAS_ONNXRUNTIME
TEST(ContourProposalNetworkTest, LoadWithoutRuntime) {
    Det::ContourProposalNetwork network{CpnConfig()};
    EXPECT_THROW(network.Load("model.onnx"), UnsupportedException);
}
#endif
