#include <CpnVision/Fourier/ContourSampler.h>

#include <CpnVision/Core/Exception.h>
#include <CpnVision/Core/Validate.h>
#include <CpnVision/Internal/ContourProcess.h>
#include <CpnVision/Platform/Random.h>

#include <algorithm>

namespace Cpn::Vision::Fourier {

std::vector<double> MakeSampling(int32_t samples, bool random, uint64_t seed) {
    CPNVISION_REQUIRE_POSITIVE(samples);

    if (random) {
        Platform::Random rng(seed);
        return rng.SortedUnitSamples(static_cast<size_t>(samples));
    }

    std::vector<double> params(samples);
    for (int32_t m = 0; m < samples; ++m) {
        params[m] = static_cast<double>(m) / samples;
    }
    return params;
}

std::vector<Point2d> SampleContour(const QContour& contour, int32_t count) {
    CPNVISION_REQUIRE_POSITIVE(count);
    if (contour.Empty()) {
        throw InsufficientDataException("SampleContour: contour is empty");
    }
    return Internal::ResampleByCount(contour.GetPoints(), static_cast<size_t>(count));
}

std::vector<Point2d> SampleContourAt(const QContour& contour, const std::vector<double>& params) {
    if (contour.Empty()) {
        throw InsufficientDataException("SampleContourAt: contour is empty");
    }
    return Internal::SampleAtParameters(contour.GetPoints(), params);
}

std::vector<Point2d> SampleDescriptor(const FourierDescriptor& descriptor,
                                      const Point2d& location, int32_t count) {
    CPNVISION_REQUIRE_POSITIVE(count);
    int32_t dense = std::max(8 * count, 256);
    std::vector<Point2d> curve = DecodeDescriptor(descriptor, location, dense);
    return Internal::ResampleByCount(curve, static_cast<size_t>(count));
}

} // namespace Cpn::Vision::Fourier
