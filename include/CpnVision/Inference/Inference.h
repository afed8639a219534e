#pragma once

/**
 * @file Inference.h
 * @brief Dense float tensors and a lightweight ONNX Runtime model wrapper
 *
 * Tensors are row-major float arrays. Dense network outputs use the
 * [C, H, W] or [1, C, H, W] layout.
 *
 * Model::Load and Model::Run require a build with ONNX Runtime
 * (CPNVISION_HAS_ONNXRUNTIME); otherwise they throw UnsupportedException.
 */

#include <CpnVision/Core/Export.h>
#include <CpnVision/Core/Exception.h>
#include <CpnVision/Core/QImage.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace Cpn::Vision::Inference {

struct CPNVISION_API Tensor {
    std::string name;
    std::vector<int64_t> shape;
    std::vector<float> data;

    Tensor() = default;
    Tensor(std::string name_, std::vector<int64_t> shape_);
    Tensor(std::string name_, std::vector<int64_t> shape_, std::vector<float> data_);

    /// Product of dimensions (0 for an empty shape or a non-positive dimension)
    size_t NumElements() const;

    size_t Rank() const { return shape.size(); }
    bool Empty() const { return data.empty(); }

    /// Shape has positive dimensions matching data.size()
    bool IsValid() const;

    /// Shape as "[d0, d1, ...]"
    std::string ShapeString() const;

    /**
     * @brief Image as a [1, C, H, W] tensor
     *
     * UInt8 values are scaled by 1/255 and UInt16 values by 1/65535; Float32
     * is copied. Interleaved RGB becomes planar.
     */
    static Tensor FromImage(const QImage& image, const std::string& name = "input");
};

/**
 * @brief Tensor with the given name, nullptr if absent
 */
CPNVISION_API const Tensor* FindTensor(const std::vector<Tensor>& tensors, const std::string& name);

struct CPNVISION_API SessionOptions {
    int numThreads = 4;
    int gpuIndex = -1;        // -1 = CPU
};

class CPNVISION_API Model {
public:
    Model();
    ~Model();

    Model(const Model&) = delete;
    Model& operator=(const Model&) = delete;
    Model(Model&& other) noexcept;
    Model& operator=(Model&& other) noexcept;

    /**
     * @brief Load an ONNX model
     * @return false if ONNX Runtime rejects the file
     * @throws InvalidArgumentException for an empty path
     * @throws UnsupportedException without ONNX Runtime
     */
    bool Load(const std::string& modelPath, const SessionOptions& opts = {});
    bool IsLoaded() const;
    void Reset();

    /**
     * @brief Run the model; outputs carry the model's output names
     */
    std::vector<Tensor> Run(const std::vector<Tensor>& inputs);
    std::vector<std::string> InputNames() const;
    std::vector<std::string> OutputNames() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace Cpn::Vision::Inference
