#pragma once

#include <CpnVision/Core/Export.h>

/**
 * @file ContourExtractor.h
 * @brief Instance boundaries and reduced labels from instance label maps
 *
 * A label map holds 0 for background and a distinct positive id per
 * instance. Each instance yields one closed outer boundary traced on its
 * largest 8-connected fragment:
 * - Moore-neighbour tracing with Jacob's stopping criterion
 * - Start point = first pixel of the fragment in raster order
 * - Positive signed (shoelace) area in pixel coordinates
 * - Pixel (x, y) maps to the point (x, y)
 *
 * Instances are reported in the raster order of their first pixel.
 */

#include <CpnVision/Core/QContour.h>
#include <CpnVision/Core/QImage.h>
#include <CpnVision/Core/Types.h>

#include <cstdint>
#include <vector>

namespace Cpn::Vision::Contour {

// =============================================================================
// Types
// =============================================================================

/**
 * @brief Extraction parameters
 */
struct ExtractParams {
    int64_t minArea = 3;                             ///< Smaller fragments are dropped
    Connectivity connectivity = Connectivity::Eight; ///< Fragment connectivity
    bool removePartials = false;                     ///< Drop instances touching the border
};

/**
 * @brief Boundary and statistics of one surviving instance
 */
struct InstanceContour {
    int32_t id = 0;              ///< Instance id in the label map
    QContour contour;            ///< Closed outer boundary (>= 3 points)
    int64_t area = 0;            ///< Pixel count of the kept fragment
    Rect2i boundingBox;          ///< Bounding box of the kept fragment
    bool touchesBorder = false;  ///< Kept fragment touches the image border
    bool fragmented = false;     ///< Instance had more than one fragment

    /// Kept fragment pixels, boundingBox-sized, row-major (non-zero = member)
    std::vector<uint8_t> mask;
};

// =============================================================================
// Extraction
// =============================================================================

/**
 * @brief Extract the outer boundary of every instance in a label map
 *
 * Degenerate instances (kept fragment smaller than minArea, traced boundary
 * with fewer than 3 points) and, with removePartials, instances touching the
 * border are dropped and reported through diagnostics.
 *
 * @param labels          Single-channel integer label map
 * @param params          Extraction parameters
 * @param[out] droppedIds Ids of dropped instances, in first-encounter order
 * @return Surviving instances in first-encounter order
 *
 * @throws InvalidArgumentException for empty, multi-channel, Float32 maps or
 *         negative labels
 */
CPNVISION_API std::vector<InstanceContour> ExtractInstances(const QImage& labels,
                                                            const ExtractParams& params,
                                                            std::vector<int32_t>& droppedIds);

/**
 * @brief Extract instances, discarding the dropped-id list
 */
CPNVISION_API std::vector<InstanceContour> ExtractInstances(const QImage& labels,
                                                            const ExtractParams& params = ExtractParams());

// =============================================================================
// Reduced Labels
// =============================================================================

/**
 * @brief Dense per-pixel training labels
 *
 * For each instance pixel, d = (distance to the nearest non-instance pixel,
 * image outside counting as background) / (instance maximum of that distance).
 * - d >= minFgDist: class id of the instance
 * - d <= maxBgDist: 0
 * - otherwise: IGNORE_LABEL (-1)
 *
 * Background stays 0. Pixels of instances not listed in `instances` (dropped
 * instances, discarded fragments) are IGNORE_LABEL.
 *
 * @param labels    Label map the instances were extracted from
 * @param instances Surviving instances
 * @param classOf   Class id per instance (same length as instances, >= 1)
 * @param minFgDist Normalized foreground threshold in [0, 1]
 * @param maxBgDist Normalized background threshold in [0, minFgDist]
 * @return Int32 image of the label map size
 */
CPNVISION_API QImage ReduceLabels(const QImage& labels,
                                  const std::vector<InstanceContour>& instances,
                                  const std::vector<int32_t>& classOf,
                                  double minFgDist, double maxBgDist);

} // namespace Cpn::Vision::Contour
