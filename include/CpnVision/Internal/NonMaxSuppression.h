#pragma once

/**
 * @file NonMaxSuppression.h
 * @brief Non-maximum suppression of scored closed contours
 *
 * Overlap between two contours is the IoU of their scanline rasters
 * (see ContourConvert.h). Candidates are ranked by score descending; equal
 * scores are ordered by ascending rank key, then by input position.
 */

#include <CpnVision/Core/Types.h>

#include <cstdint>
#include <vector>

namespace Cpn::Vision::Internal {

/**
 * @brief Suppression strategy
 */
enum class NmsMode {
    Greedy,  ///< Only accepted contours suppress lower-ranked ones
    Fast     ///< Every higher-ranked contour suppresses, accepted or not
};

/**
 * @brief One scored contour
 */
struct ScoredContour {
    const std::vector<Point2d>* points = nullptr;  ///< Polygon (not owned)
    double score = 0.0;
    int32_t classId = 0;
    int64_t rankKey = 0;    ///< Tie-break for equal scores (lower first)
};

/**
 * @brief Parameters for contour NMS
 */
struct ContourNmsParams {
    double iouThreshold = 0.3;   ///< Suppress when IoU > threshold
    NmsMode mode = NmsMode::Greedy;
    bool perClass = true;        ///< Only contours of the same class compete
    int32_t supersample = 2;     ///< Raster samples per pixel per axis
    Rect2d clip;                 ///< Overlap is measured inside clip (zero size = unbounded)
};

/**
 * @brief Rank candidates by score (stable, ties by rankKey)
 * @return Candidate indices, highest score first
 */
std::vector<size_t> RankByScore(const std::vector<ScoredContour>& candidates);

/**
 * @brief Apply NMS to scored contours
 *
 * Greedy mode is not monotone in the threshold: raising it can let a
 * contour survive that then suppresses one kept at the lower threshold.
 * Fast mode keeps a superset whenever the threshold is raised.
 *
 * @return Indices of kept candidates in descending score order
 */
std::vector<size_t> ContourNMS(const std::vector<ScoredContour>& candidates,
                               const ContourNmsParams& params);

} // namespace Cpn::Vision::Internal
