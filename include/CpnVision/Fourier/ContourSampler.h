#pragma once

#include <CpnVision/Core/Export.h>

/**
 * @file ContourSampler.h
 * @brief Fixed-size point sets along closed contours
 *
 * Points are placed by normalized arc length t in [0, 1) measured from the
 * first contour point. Sampling a raw boundary and a descriptor of the same
 * boundary at the same parameters gives point-to-point correspondence.
 */

#include <CpnVision/Core/QContour.h>
#include <CpnVision/Core/Types.h>
#include <CpnVision/Fourier/FourierDescriptor.h>

#include <cstdint>
#include <vector>

namespace Cpn::Vision::Fourier {

/**
 * @brief Sampling parameters shared by all instances of one label map
 *
 * @param samples Number of parameters (>= 1)
 * @param random  false: t_m = m / samples; true: sorted uniform draws
 * @param seed    Seed for random draws (same seed, same parameters)
 */
CPNVISION_API std::vector<double> MakeSampling(int32_t samples, bool random = false,
                                               uint64_t seed = 0);

/**
 * @brief count points equidistant in arc length, starting at the first point
 *
 * @throws InvalidArgumentException if count < 1
 * @throws InsufficientDataException if the contour is empty
 */
CPNVISION_API std::vector<Point2d> SampleContour(const QContour& contour, int32_t count);

/**
 * @brief Contour points at the given normalized arc-length parameters
 *
 * @throws InsufficientDataException if the contour is empty
 */
CPNVISION_API std::vector<Point2d> SampleContourAt(const QContour& contour,
                                                   const std::vector<double>& params);

/**
 * @brief count points equidistant in arc length along the decoded curve
 *
 * The series is evaluated at max(8 * count, 256) uniform parameters and the
 * resulting polygon is resampled by arc length.
 */
CPNVISION_API std::vector<Point2d> SampleDescriptor(const FourierDescriptor& descriptor,
                                                    const Point2d& location, int32_t count);

} // namespace Cpn::Vision::Fourier
