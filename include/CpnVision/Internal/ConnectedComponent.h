#pragma once

/**
 * @file ConnectedComponent.h
 * @brief Connected component labeling on binary masks
 *
 * Two-pass union-find labeling. Labels are numbered 1..N in the raster order
 * of each component's first pixel, so results are deterministic.
 */

#include <CpnVision/Core/Types.h>

#include <cstdint>
#include <vector>

namespace Cpn::Vision::Internal {

/**
 * @brief Statistics of one labeled component
 */
struct ComponentStats {
    int32_t label = 0;      ///< Component label (1-based)
    int64_t area = 0;       ///< Pixel count
    Point2i firstPixel;     ///< First pixel in raster order
    Rect2i bbox;            ///< Bounding box (mask coordinates)
};

/**
 * @brief Label connected foreground pixels of a mask
 *
 * @param mask         Row-major mask (non-zero = foreground), stride == width
 * @param width        Mask width
 * @param height       Mask height
 * @param connectivity Four or Eight
 * @param[out] labels  width*height labels, 0 = background
 * @return Number of components
 */
int32_t LabelComponents(const uint8_t* mask, int32_t width, int32_t height,
                        Connectivity connectivity, std::vector<int32_t>& labels);

/**
 * @brief Per-component statistics, indexed by label - 1
 */
std::vector<ComponentStats> GetComponentStats(const std::vector<int32_t>& labels,
                                              int32_t width, int32_t height,
                                              int32_t numLabels);

/**
 * @brief Index of the largest component (ties: lowest label)
 * @return -1 if stats is empty
 */
int32_t LargestComponent(const std::vector<ComponentStats>& stats);

} // namespace Cpn::Vision::Internal
