#pragma once

/**
 * @file DistanceTransform.h
 * @brief Exact Euclidean distance transform
 *
 * Computes, for each foreground pixel, the Euclidean distance to the nearest
 * background pixel (Meijster et al., "A General Algorithm for Computing
 * Distance Transforms in Linear Time"). Used by the reduced-label generator
 * to derive per-instance normalized interior distances.
 */

#include <CpnVision/Core/QImage.h>
#include <CpnVision/Core/Types.h>

#include <cstdint>
#include <vector>

namespace Cpn::Vision::Internal {

/**
 * @brief Exact L2 distance of each mask pixel to the nearest zero pixel
 *
 * @param mask    Row-major mask, non-zero = foreground
 * @param width   Mask width
 * @param height  Mask height
 * @param stride  Row stride in bytes
 * @return width*height distances (0 for background pixels)
 *
 * Pixels outside the mask are not treated as background. A mask without any
 * zero pixel yields distances larger than width + height.
 */
std::vector<float> ComputeL2Distance(const uint8_t* mask, int32_t width, int32_t height,
                                     int32_t stride);

/**
 * @brief L2 distance where everything outside the mask counts as background
 *
 * @param mask   Row-major mask (non-zero = foreground), stride == width
 * @return width*height distances, 0 for background pixels
 */
std::vector<float> BorderedL2Distance(const uint8_t* mask, int32_t width, int32_t height);

/**
 * @brief Image based L2 distance transform
 *
 * @param binary UInt8 single-channel mask
 * @return Float32 distance image
 */
QImage DistanceTransformL2(const QImage& binary);

} // namespace Cpn::Vision::Internal
