#pragma once

/**
 * @file ContourConvert.h
 * @brief Scanline rasterization of closed polygons and raster overlap
 *
 * A polygon is rasterized on a grid with `supersample` samples per pixel in
 * each direction: sample (i, j) sits at ((i + 0.5) / s, (j + 0.5) / s).
 * Interior is decided by the even-odd rule with half-open edge crossings, so
 * two polygons sharing an edge never both cover a sample on it.
 */

#include <CpnVision/Core/Types.h>

#include <cstdint>
#include <utility>
#include <vector>

namespace Cpn::Vision::Internal {

/**
 * @brief Run-length raster of one polygon
 *
 * rows[r] holds the sorted, disjoint half-open sample-column intervals
 * covered on sample row firstRow + r.
 */
struct PolygonRaster {
    int32_t supersample = 1;
    int32_t firstRow = 0;
    std::vector<std::vector<std::pair<int32_t, int32_t>>> rows;
    Rect2d bbox;                ///< Clipped polygon bounding box (pixel units)
    int64_t sampleCount = 0;    ///< Covered samples

    /// Covered area in pixels
    double Area() const {
        return static_cast<double>(sampleCount) /
               (static_cast<double>(supersample) * supersample);
    }

    bool Empty() const { return sampleCount == 0; }
};

/**
 * @brief Sorted x positions where the horizontal line at y crosses the polygon
 */
std::vector<double> ScanlineIntersections(const std::vector<Point2d>& polygon, double y);

/// Largest number of sample rows a single raster may allocate
constexpr int64_t MAX_RASTER_ROWS = int64_t(1) << 20;

/**
 * @brief Rasterize a closed polygon
 *
 * With a non-empty clip only the part of the polygon inside the clip
 * rectangle is rasterized, so the raster size is bounded by the clip.
 *
 * @param polygon     Polygon vertices (closing edge implicit)
 * @param supersample Samples per pixel per axis (>= 1)
 * @param clip        Raster window in pixels (zero size = unbounded)
 * @throws InvalidArgumentException if the (clipped) extent does not fit in
 *         int32 sample indices or spans more than MAX_RASTER_ROWS rows
 */
PolygonRaster RasterizePolygon(const std::vector<Point2d>& polygon, int32_t supersample = 2,
                               const Rect2d& clip = Rect2d());

/**
 * @brief Number of samples covered by both rasters
 *
 * Both rasters must share the same supersample factor.
 */
int64_t IntersectionCount(const PolygonRaster& a, const PolygonRaster& b);

/**
 * @brief Intersection over union of two rasters
 *
 * Returns 0 without touching the rows when the bounding boxes are disjoint
 * or either raster is empty.
 */
double RasterIoU(const PolygonRaster& a, const PolygonRaster& b);

/**
 * @brief Intersection over union of two closed polygons, within clip if given
 */
double PolygonIoU(const std::vector<Point2d>& a, const std::vector<Point2d>& b,
                  int32_t supersample = 2, const Rect2d& clip = Rect2d());

} // namespace Cpn::Vision::Internal
