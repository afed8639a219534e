#pragma once

#include <CpnVision/Core/Export.h>

/**
 * @file ContourNMS.h
 * @brief Non-maximum suppression of contour proposals
 *
 * Proposals are ranked by score descending (stable; equal scores by
 * detectionIndex). Greedy mode accepts the best remaining proposal and
 * removes every remaining proposal whose contour IoU with it is strictly
 * greater than the threshold. IoU is measured on scanline rasters of the
 * closed contours.
 *
 * Only Fast mode is monotone: raising the threshold never removes a
 * survivor. In Greedy mode a proposal freed by a higher threshold may in
 * turn suppress one that survived before, so the survivor count can drop.
 *
 * Decoded contours are unbounded; set clip to the output grid so overlap is
 * measured (and rasters are allocated) inside the image only.
 */

#include <CpnVision/Detection/ProposalDecoder.h>
#include <CpnVision/Internal/NonMaxSuppression.h>

#include <vector>

namespace Cpn::Vision::Detection {

using NmsMode = Internal::NmsMode;

/**
 * @brief NMS parameters
 */
struct NmsParams {
    double iouThreshold = 0.3;      ///< Suppress when IoU > threshold, in [0, 1]
    NmsMode mode = NmsMode::Greedy; ///< Fast: suppressed proposals also suppress
    bool perClass = true;           ///< Compare proposals of the same class only
    int32_t supersample = 2;        ///< Raster samples per pixel per axis
    Rect2d clip;                    ///< Overlap window in pixels (zero size = unbounded)
};

/**
 * @brief Indices of the proposals kept, in descending score order
 */
CPNVISION_API std::vector<size_t> SuppressProposalIndices(const std::vector<Proposal>& proposals,
                                                          const NmsParams& params = NmsParams());

/**
 * @brief Kept proposals, in descending score order
 */
CPNVISION_API std::vector<Proposal> SuppressProposals(std::vector<Proposal> proposals,
                                                      const NmsParams& params = NmsParams());

/**
 * @brief IoU of two closed contours on a shared raster grid
 * @throws InvalidArgumentException for contours too large to rasterize
 */
CPNVISION_API double ContourIoU(const std::vector<Point2d>& a, const std::vector<Point2d>& b,
                                int32_t supersample = 2);

} // namespace Cpn::Vision::Detection
