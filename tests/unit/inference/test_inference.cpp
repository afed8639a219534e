/**
 * @file test_inference.cpp
 * @brief Unit tests for Inference/Inference.h (tensors; model errors)
 */

#include <gtest/gtest.h>
#include <CpnVision/Inference/Inference.h>

#include <algorithm>

using namespace Cpn::Vision;
using namespace Cpn::Vision::Inference;

// =============================================================================
// Tensor
// =============================================================================

TEST(TensorTest, ShapeConstructorZeroFills) {
    Tensor t("x", {1, 2, 3, 4});
    EXPECT_EQ(t.name, "x");
    EXPECT_EQ(t.Rank(), 4u);
    EXPECT_EQ(t.NumElements(), 24u);
    ASSERT_EQ(t.data.size(), 24u);
    EXPECT_FLOAT_EQ(t.data[23], 0.0f);
    EXPECT_TRUE(t.IsValid());
    EXPECT_FALSE(t.Empty());
    EXPECT_EQ(t.ShapeString(), "[1, 2, 3, 4]");
}

TEST(TensorTest, InvalidShapes) {
    Tensor empty;
    EXPECT_TRUE(empty.Empty());
    EXPECT_FALSE(empty.IsValid());
    EXPECT_EQ(empty.NumElements(), 0u);
    EXPECT_EQ(empty.ShapeString(), "[]");

    Tensor negative("x", {2, -1});
    EXPECT_EQ(negative.NumElements(), 0u);
    EXPECT_FALSE(negative.IsValid());

    Tensor mismatch("x", {2, 2}, {1, 2, 3});
    EXPECT_FALSE(mismatch.IsValid());
}

TEST(TensorTest, FromGrayImage) {
    QImage image(3, 2, PixelType::UInt8);
    image.SetAt(0, 0, 255);
    image.SetAt(2, 1, 51);

    Tensor t = Tensor::FromImage(image, "input");
    EXPECT_EQ(t.name, "input");
    EXPECT_EQ(t.shape, (std::vector<int64_t>{1, 1, 2, 3}));
    EXPECT_FLOAT_EQ(t.data[0], 1.0f);
    EXPECT_FLOAT_EQ(t.data[5], 0.2f);
    EXPECT_FLOAT_EQ(t.data[1], 0.0f);
}

TEST(TensorTest, FromRgbImageIsPlanar) {
    QImage image(2, 1, PixelType::UInt8, ChannelType::RGB);
    uint8_t* row = image.Row<uint8_t>(0);
    const uint8_t values[6] = {255, 0, 0, 0, 0, 255};
    std::copy(values, values + 6, row);

    Tensor t = Tensor::FromImage(image);
    EXPECT_EQ(t.shape, (std::vector<int64_t>{1, 3, 1, 2}));
    // Planes R, G, B
    EXPECT_FLOAT_EQ(t.data[0], 1.0f);
    EXPECT_FLOAT_EQ(t.data[1], 0.0f);
    EXPECT_FLOAT_EQ(t.data[4], 0.0f);
    EXPECT_FLOAT_EQ(t.data[5], 1.0f);
}

TEST(TensorTest, FromFloatImage) {
    QImage image(2, 2, PixelType::Float32);
    image.Row<float>(1)[0] = -3.5f;
    Tensor t = Tensor::FromImage(image);
    EXPECT_FLOAT_EQ(t.data[2], -3.5f);

    EXPECT_THROW(Tensor::FromImage(QImage()), InvalidArgumentException);
}

TEST(TensorTest, FindTensor) {
    std::vector<Tensor> tensors = {Tensor("scores", {1}), Tensor("fourier", {2})};
    const Tensor* found = FindTensor(tensors, "fourier");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->NumElements(), 2u);
    EXPECT_EQ(FindTensor(tensors, "refinement"), nullptr);
}

// =============================================================================
// Model
// =============================================================================

TEST(ModelTest, Unloaded) {
    Model model;
    EXPECT_FALSE(model.IsLoaded());
    EXPECT_THROW(model.Load(""), InvalidArgumentException);

    Model moved(std::move(model));
    EXPECT_FALSE(moved.IsLoaded());
    moved.Reset();
    EXPECT_FALSE(moved.IsLoaded());
}

#ifdef CPNVISION_HAS_ONNXRUNTIME
TEST(ModelTest, RunWithoutModel) {
    Model model;
    EXPECT_THROW(model.Run({Tensor("input", {1, 1, 2, 2})}), InvalidArgumentException);
    EXPECT_FALSE(model.Load("/nonexistent/model.onnx"));
}
#else
TEST(ModelTest, UnsupportedWithoutRuntime) {
    Model model;
    EXPECT_THROW(model.Load("model.onnx"), UnsupportedException);
    EXPECT_THROW(model.Run({Tensor("input", {1, 1, 2, 2})}), UnsupportedException);
    EXPECT_TRUE(model.InputNames().empty());
    EXPECT_TRUE(model.OutputNames().empty());
}
#endif
