#include <CpnVision/Internal/ContourConvert.h>
#include <CpnVision/Core/Exception.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace Cpn::Vision::Internal {

std::vector<double> ScanlineIntersections(const std::vector<Point2d>& polygon, double y) {
    std::vector<double> intersections;
    const size_t n = polygon.size();

    for (size_t i = 0; i < n; ++i) {
        const Point2d& p1 = polygon[i];
        const Point2d& p2 = polygon[(i + 1) % n];

        // Half-open interval: include bottom, exclude top
        if ((p1.y <= y && y < p2.y) || (p2.y <= y && y < p1.y)) {
            double t = (y - p1.y) / (p2.y - p1.y);
            intersections.push_back(p1.x + t * (p2.x - p1.x));
        }
    }

    std::sort(intersections.begin(), intersections.end());
    return intersections;
}

namespace {

constexpr double MAX_SAMPLE_INDEX = static_cast<double>(std::numeric_limits<int32_t>::max());

// First sample index at or after coord; sample k sits at (k + 0.5) / s
double SampleIndex(double coord, double s) {
    return std::ceil(coord * s - 0.5);
}

void RequireSampleRange(double lo, double hi, const char* axis) {
    if (lo < -MAX_SAMPLE_INDEX || hi > MAX_SAMPLE_INDEX) {
        throw InvalidArgumentException(std::string("RasterizePolygon: ") + axis +
                                       " extent exceeds the sample index range");
    }
}

} // anonymous namespace

PolygonRaster RasterizePolygon(const std::vector<Point2d>& polygon, int32_t supersample,
                               const Rect2d& clip) {
    if (supersample < 1) {
        throw InvalidArgumentException("RasterizePolygon: supersample must be >= 1, got " +
                                       std::to_string(supersample));
    }

    PolygonRaster raster;
    raster.supersample = supersample;
    if (polygon.size() < 3) {
        return raster;
    }

    double minX = std::numeric_limits<double>::max();
    double minY = std::numeric_limits<double>::max();
    double maxX = std::numeric_limits<double>::lowest();
    double maxY = std::numeric_limits<double>::lowest();
    for (const auto& p : polygon) {
        if (!p.IsValid()) {
            return raster;
        }
        minX = std::min(minX, p.x);
        minY = std::min(minY, p.y);
        maxX = std::max(maxX, p.x);
        maxY = std::max(maxY, p.y);
    }

    if (clip.width > 0.0 && clip.height > 0.0) {
        minX = std::max(minX, clip.x);
        minY = std::max(minY, clip.y);
        maxX = std::min(maxX, clip.Right());
        maxY = std::min(maxY, clip.Bottom());
        if (minX >= maxX || minY >= maxY) {
            return raster;
        }
    }
    raster.bbox = Rect2d(minX, minY, maxX - minX, maxY - minY);

    // Covered rows and columns satisfy min <= (k + 0.5) / s < max
    const double s = static_cast<double>(supersample);
    const double rowLo = SampleIndex(minY, s);
    const double rowHi = SampleIndex(maxY, s);
    const double colLo = SampleIndex(minX, s);
    const double colHi = SampleIndex(maxX, s);
    RequireSampleRange(rowLo, rowHi, "row");
    RequireSampleRange(colLo, colHi, "column");
    if (rowHi - rowLo > static_cast<double>(MAX_RASTER_ROWS)) {
        throw InvalidArgumentException("RasterizePolygon: polygon spans more than " +
                                       std::to_string(MAX_RASTER_ROWS) + " sample rows");
    }

    const int32_t rowBegin = static_cast<int32_t>(rowLo);
    const int32_t rowEnd = static_cast<int32_t>(rowHi);
    raster.firstRow = rowBegin;
    if (rowEnd <= rowBegin) {
        return raster;
    }
    raster.rows.resize(static_cast<size_t>(rowEnd - rowBegin));

    for (int32_t j = rowBegin; j < rowEnd; ++j) {
        double scanY = (j + 0.5) / s;
        std::vector<double> xs = ScanlineIntersections(polygon, scanY);
        auto& spans = raster.rows[j - rowBegin];

        // Fill between pairs (even-odd rule), limited to the raster columns
        for (size_t i = 0; i + 1 < xs.size(); i += 2) {
            double start = std::clamp(SampleIndex(xs[i], s), colLo, colHi);
            double stop = std::clamp(SampleIndex(xs[i + 1], s), colLo, colHi);
            if (start < stop) {
                spans.emplace_back(static_cast<int32_t>(start), static_cast<int32_t>(stop));
                raster.sampleCount += static_cast<int64_t>(stop - start);
            }
        }
    }
    return raster;
}

int64_t IntersectionCount(const PolygonRaster& a, const PolygonRaster& b) {
    if (a.supersample != b.supersample) {
        throw InvalidArgumentException("IntersectionCount: rasters use different supersample factors");
    }

    const int32_t aEnd = a.firstRow + static_cast<int32_t>(a.rows.size());
    const int32_t bEnd = b.firstRow + static_cast<int32_t>(b.rows.size());
    const int32_t rowBegin = std::max(a.firstRow, b.firstRow);
    const int32_t rowEnd = std::min(aEnd, bEnd);

    int64_t count = 0;
    for (int32_t j = rowBegin; j < rowEnd; ++j) {
        const auto& sa = a.rows[j - a.firstRow];
        const auto& sb = b.rows[j - b.firstRow];
        size_t ia = 0;
        size_t ib = 0;
        while (ia < sa.size() && ib < sb.size()) {
            int32_t lo = std::max(sa[ia].first, sb[ib].first);
            int32_t hi = std::min(sa[ia].second, sb[ib].second);
            if (lo < hi) {
                count += static_cast<int64_t>(hi) - lo;
            }
            if (sa[ia].second < sb[ib].second) {
                ++ia;
            } else {
                ++ib;
            }
        }
    }
    return count;
}

double RasterIoU(const PolygonRaster& a, const PolygonRaster& b) {
    if (a.Empty() || b.Empty()) {
        return 0.0;
    }
    // Bounding-box rejection (touching boxes cannot share a sample)
    if (!a.bbox.Overlaps(b.bbox)) {
        return 0.0;
    }

    int64_t inter = IntersectionCount(a, b);
    int64_t uni = a.sampleCount + b.sampleCount - inter;
    if (uni <= 0) {
        return 0.0;
    }
    return static_cast<double>(inter) / static_cast<double>(uni);
}

double PolygonIoU(const std::vector<Point2d>& a, const std::vector<Point2d>& b,
                  int32_t supersample, const Rect2d& clip) {
    return RasterIoU(RasterizePolygon(a, supersample, clip),
                     RasterizePolygon(b, supersample, clip));
}

} // namespace Cpn::Vision::Internal
