#pragma once

#include <CpnVision/Core/Export.h>

/**
 * @file ContourDetector.h
 * @brief Dense output -> final contours: decode, suppress, refine
 *
 * @code
 * Detection::ContourDetector detector(config);
 * auto detections = detector.Detect(output);
 * for (const auto& d : detections) {
 *     // d.contour, d.score, d.classId
 * }
 * @endcode
 */

#include <CpnVision/Core/QContour.h>
#include <CpnVision/Core/QImage.h>
#include <CpnVision/Detection/ContourNMS.h>
#include <CpnVision/Detection/ProposalDecoder.h>
#include <CpnVision/Detection/Refinement.h>
#include <CpnVision/Inference/Inference.h>
#include <CpnVision/Targets/CpnConfig.h>

#include <string>
#include <vector>

namespace Cpn::Vision::Platform {
class StageTimer;
}

namespace Cpn::Vision::Detection {

/**
 * @brief Final detection
 */
struct Detection {
    QContour contour;       ///< Closed refined contour (image pixels)
    double score = 0.0;
    int32_t classId = 0;
    Point2d location;       ///< Cell location the proposal was decoded at
};

/**
 * @brief Post-processing pipeline of a contour proposal network
 */
class CPNVISION_API ContourDetector {
public:
    /**
     * @throws InvalidConfigurationException if config.Validate() fails
     */
    explicit ContourDetector(const CpnConfig& config);

    const CpnConfig& Config() const { return config_; }

    /**
     * @brief NMS settings
     *
     * Threshold, mode and per-class flag come from the configuration. Detect
     * clips the overlap measurement to the output grid (W * stride, H * stride).
     */
    const NmsParams& Nms() const { return nms_; }

    /**
     * @brief Detections of one image in descending score order
     *
     * Refinement uses the output's refinement tensor; it is skipped when the
     * tensor is absent or refinementIterations == 0.
     */
    std::vector<Detection> Detect(const DenseOutput& output) const;

    /**
     * @brief Detections refined with an external field
     */
    std::vector<Detection> Detect(const DenseOutput& output, const RefinementField& field) const;

    /**
     * @brief Detect each image of an [N, C, H, W] output on the thread pool
     */
    std::vector<std::vector<Detection>> DetectBatch(const DenseOutput& output) const;

private:
    std::vector<Proposal> DecodeAndSuppress(const DenseOutput& output,
                                            Platform::StageTimer& timer) const;
    static std::vector<Detection> ToDetections(std::vector<Proposal>& proposals);

    CpnConfig config_;
    ProposalDecoder decoder_;
    NmsParams nms_;
};

/**
 * @brief ONNX model producing dense outputs, coupled with a ContourDetector
 *
 * The model takes one [1, C, H, W] float image and returns tensors named
 * "scores", "fourier" and optionally "refinement". Unnamed outputs are taken
 * in that order.
 */
class CPNVISION_API ContourProposalNetwork {
public:
    explicit ContourProposalNetwork(const CpnConfig& config);

    /**
     * @return false if ONNX Runtime rejects the model
     * @throws UnsupportedException without ONNX Runtime
     */
    bool Load(const std::string& modelPath,
              const Inference::SessionOptions& opts = Inference::SessionOptions());

    bool IsLoaded() const { return model_.IsLoaded(); }

    /**
     * @brief Run the model on an image and post-process its outputs
     * @throws InvalidArgumentException if the model is not loaded or lacks outputs
     */
    std::vector<Detection> Detect(const QImage& image);

    const ContourDetector& Detector() const { return detector_; }

private:
    ContourDetector detector_;
    Inference::Model model_;
};

/**
 * @brief Match model outputs to a DenseOutput by name, then by position
 */
CPNVISION_API DenseOutput MakeDenseOutput(const std::vector<Inference::Tensor>& outputs);

} // namespace Cpn::Vision::Detection
