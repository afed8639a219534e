#pragma once

/**
 * @file ContourTrace.h
 * @brief Outer boundary tracing of binary masks
 *
 * Moore-neighbour tracing with Jacob's stopping criterion: tracing stops when
 * the start pixel is re-entered and the next move repeats the very first
 * move. Pixels on one-pixel-wide bridges are therefore visited twice, and the
 * trace never stops early on shapes that pass through the start pixel more
 * than once.
 *
 * Coordinates follow the pixel-center convention: pixel (x, y) maps to the
 * point (x, y).
 */

#include <CpnVision/Core/QContour.h>
#include <CpnVision/Core/Types.h>

#include <cstdint>
#include <vector>

namespace Cpn::Vision::Internal {

/**
 * @brief Trace the outer boundary of the 8-connected component containing start
 *
 * @param mask    Row-major mask (non-zero = foreground), stride == width
 * @param width   Mask width
 * @param height  Mask height
 * @param start   First raster pixel of the component (no foreground pixel
 *                above it or left of it in its row)
 * @return Boundary pixels in tracing order, start first. A single isolated
 *         pixel yields one point.
 */
std::vector<Point2i> TraceBoundary(const uint8_t* mask, int32_t width, int32_t height,
                                   const Point2i& start);

/**
 * @brief Trace a boundary and convert it to a closed contour with positive
 *        signed area
 *
 * @param offset Added to every traced pixel (mask origin in image coordinates)
 *
 * The start pixel stays first. Contours with zero area keep tracing order.
 */
QContour TraceContour(const uint8_t* mask, int32_t width, int32_t height,
                      const Point2i& start, const Point2i& offset = Point2i(0, 0));

} // namespace Cpn::Vision::Internal
