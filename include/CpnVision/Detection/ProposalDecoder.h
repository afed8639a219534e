#pragma once

#include <CpnVision/Core/Export.h>

/**
 * @file ProposalDecoder.h
 * @brief Dense network output -> scored contour proposals
 *
 * Dense outputs are float tensors in [C, H, W] or [N, C, H, W] layout:
 * - scores:     C >= 1 per-class probabilities
 * - fourier:    4 * order descriptor channels (CpnConfig::fourierLayout)
 * - refinement: optional, 2 * refinementBuckets offset channels
 *
 * Output cell (x, y) corresponds to image location (x * stride, y * stride).
 */

#include <CpnVision/Core/Types.h>
#include <CpnVision/Fourier/FourierDescriptor.h>
#include <CpnVision/Inference/Inference.h>
#include <CpnVision/Targets/CpnConfig.h>

#include <cstdint>
#include <vector>

namespace Cpn::Vision::Detection {

// =============================================================================
// Types
// =============================================================================

/**
 * @brief Raw dense network output of one image (or a batch)
 */
struct CPNVISION_API DenseOutput {
    Inference::Tensor scores;
    Inference::Tensor fourier;
    Inference::Tensor refinement;   ///< Empty when the network has no refinement head

    bool HasRefinement() const { return !refinement.Empty(); }
};

/**
 * @brief Dimensions of a dense tensor
 */
struct DenseDims {
    int64_t batch = 1;
    int64_t channels = 0;
    int64_t height = 0;
    int64_t width = 0;

    int64_t Plane() const { return height * width; }
};

/**
 * @brief Candidate detection decoded from one output cell
 */
struct Proposal {
    double score = 0.0;                     ///< Maximum class probability
    int32_t classId = 0;                    ///< argmax + 1
    Point2d location;                       ///< Cell location in image pixels
    Fourier::FourierDescriptor descriptor;  ///< Predicted shape
    std::vector<Point2d> contour;           ///< samples points
    std::vector<double> sampling;           ///< Parameters of the contour points
    int64_t detectionIndex = 0;             ///< Raster index of the cell
};

/**
 * @brief Parse and check a [C, H, W] or [N, C, H, W] tensor
 * @throws InvalidArgumentException for other ranks or shape/data mismatch
 */
CPNVISION_API DenseDims GetDenseDims(const Inference::Tensor& tensor, const char* what);

/**
 * @brief Number of images in a dense output
 */
CPNVISION_API int64_t BatchSize(const DenseOutput& output);

/**
 * @brief Image n of a batched dense output, as [1, C, H, W] tensors
 */
CPNVISION_API DenseOutput SliceBatch(const DenseOutput& output, int64_t n);

// =============================================================================
// ProposalDecoder
// =============================================================================

class CPNVISION_API ProposalDecoder {
public:
    /**
     * @throws InvalidConfigurationException if config.Validate() fails
     */
    explicit ProposalDecoder(const CpnConfig& config);

    const CpnConfig& Config() const { return config_; }

    /**
     * @brief Proposals of every cell with score > scoreThresh, in raster order
     *
     * @throws ShapeMismatchException if the fourier channel count is not
     *         4 * order or the spatial sizes of scores and fourier differ
     * @throws InvalidArgumentException for malformed tensors or a batch > 1
     */
    std::vector<Proposal> Decode(const DenseOutput& output) const;

    /**
     * @brief Decode each image of an [N, C, H, W] output on the thread pool
     */
    std::vector<std::vector<Proposal>> DecodeBatch(const DenseOutput& output) const;

private:
    CpnConfig config_;
    std::vector<double> sampling_;
};

} // namespace Cpn::Vision::Detection
