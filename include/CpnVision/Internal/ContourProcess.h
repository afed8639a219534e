#pragma once

/**
 * @file ContourProcess.h
 * @brief Arc-length parameterization and resampling of closed polylines
 *
 * A closed polyline with points p_0..p_{n-1} has perimeter T (including the
 * closing segment p_{n-1} -> p_0). The normalized parameter t in [0, 1)
 * corresponds to arc length t*T measured from p_0.
 */

#include <CpnVision/Core/Types.h>

#include <vector>

namespace Cpn::Vision::Internal {

/**
 * @brief Cumulative arc length of a closed polyline
 *
 * @return n+1 values: cum[0] = 0, cum[i] = length from p_0 to p_i,
 *         cum[n] = perimeter (closing segment included)
 */
std::vector<double> CumulativeLength(const std::vector<Point2d>& points);

/**
 * @brief Point at arc length s along a closed polyline
 *
 * s is wrapped into [0, perimeter).
 *
 * @param cum Output of CumulativeLength(points)
 */
Point2d PointAtLength(const std::vector<Point2d>& points,
                      const std::vector<double>& cum, double s);

/**
 * @brief Evaluate a closed polyline at normalized parameters
 *
 * @param params Parameters in [0, 1) (values outside are wrapped)
 * @return One point per parameter. A zero-perimeter polyline yields copies
 *         of its first point.
 */
std::vector<Point2d> SampleAtParameters(const std::vector<Point2d>& points,
                                        const std::vector<double>& params);

/**
 * @brief Resample a closed polyline to count points equidistant in arc length
 *
 * The first output point equals the first input point.
 */
std::vector<Point2d> ResampleByCount(const std::vector<Point2d>& points, size_t count);

} // namespace Cpn::Vision::Internal
