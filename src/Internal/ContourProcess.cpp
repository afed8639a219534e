#include <CpnVision/Internal/ContourProcess.h>

#include <algorithm>
#include <cmath>

namespace Cpn::Vision::Internal {

std::vector<double> CumulativeLength(const std::vector<Point2d>& points) {
    const size_t n = points.size();
    std::vector<double> cum(n + 1, 0.0);
    for (size_t i = 0; i < n; ++i) {
        const Point2d& a = points[i];
        const Point2d& b = points[(i + 1) % n];
        cum[i + 1] = cum[i] + a.DistanceTo(b);
    }
    return cum;
}

Point2d PointAtLength(const std::vector<Point2d>& points,
                      const std::vector<double>& cum, double s) {
    const size_t n = points.size();
    if (n == 0) {
        return Point2d();
    }
    const double perimeter = cum[n];
    if (n == 1 || perimeter <= 0.0) {
        return points[0];
    }

    s = std::fmod(s, perimeter);
    if (s < 0.0) {
        s += perimeter;
    }

    // First segment whose end lies beyond s
    auto it = std::upper_bound(cum.begin() + 1, cum.end(), s);
    size_t seg = (it == cum.end()) ? n - 1 : static_cast<size_t>(it - cum.begin()) - 1;

    const double segLen = cum[seg + 1] - cum[seg];
    const Point2d& a = points[seg];
    const Point2d& b = points[(seg + 1) % n];
    if (segLen <= 0.0) {
        return a;
    }
    double alpha = (s - cum[seg]) / segLen;
    return a + (b - a) * alpha;
}

std::vector<Point2d> SampleAtParameters(const std::vector<Point2d>& points,
                                        const std::vector<double>& params) {
    std::vector<Point2d> result;
    result.reserve(params.size());
    if (points.empty()) {
        result.assign(params.size(), Point2d());
        return result;
    }

    std::vector<double> cum = CumulativeLength(points);
    const double perimeter = cum.back();
    for (double t : params) {
        result.push_back(PointAtLength(points, cum, t * perimeter));
    }
    return result;
}

std::vector<Point2d> ResampleByCount(const std::vector<Point2d>& points, size_t count) {
    std::vector<double> params(count);
    for (size_t m = 0; m < count; ++m) {
        params[m] = static_cast<double>(m) / static_cast<double>(count);
    }
    return SampleAtParameters(points, params);
}

} // namespace Cpn::Vision::Internal
