/**
 * @file Refinement.cpp
 * @brief Bucket-wise iterative contour refinement
 */

#include <CpnVision/Detection/Refinement.h>

#include <CpnVision/Core/Constants.h>
#include <CpnVision/Core/Exception.h>
#include <CpnVision/Core/Validate.h>

#include <algorithm>
#include <cmath>
#include <string>

namespace Cpn::Vision::Detection {

namespace {

// Outward unit normals of a closed polyline (central differences)
std::vector<Point2d> ComputeNormals(const std::vector<Point2d>& pts) {
    const size_t n = pts.size();
    std::vector<Point2d> normals(n, Point2d(0.0, 0.0));
    if (n < 3) {
        return normals;
    }

    double area2 = 0.0;
    for (size_t i = 0; i < n; ++i) {
        area2 += pts[i].Cross(pts[(i + 1) % n]);
    }
    // Positive shoelace area (y down): outward normal is (t.y, -t.x)
    const double sign = (area2 >= 0.0) ? 1.0 : -1.0;

    for (size_t i = 0; i < n; ++i) {
        Point2d tangent = pts[(i + 1) % n] - pts[(i + n - 1) % n];
        double len = tangent.Norm();
        if (len > EPSILON) {
            normals[i] = Point2d(tangent.y, -tangent.x) * (sign / len);
        }
    }
    return normals;
}

void RequireBucket(int32_t bucket, int32_t buckets, const char* func) {
    if (bucket < 0 || bucket >= buckets) {
        throw InvalidArgumentException(std::string(func) + ": bucket " + std::to_string(bucket) +
                                       " outside [0, " + std::to_string(buckets) + ")");
    }
}

Point2d ClampToDomain(const Point2d& p, const Rect2d& domain) {
    return {std::clamp(p.x, domain.x, domain.Right()),
            std::clamp(p.y, domain.y, domain.Bottom())};
}

} // anonymous namespace

// =============================================================================
// DenseRefinementField
// =============================================================================

DenseRefinementField::DenseRefinementField(const Inference::Tensor& refinement, int32_t buckets,
                                           double margin, int32_t stride)
    : tensor_(refinement), buckets_(buckets), margin_(margin), stride_(stride) {
    CPNVISION_REQUIRE_POSITIVE(buckets);
    CPNVISION_REQUIRE_POSITIVE(stride);
    CPNVISION_REQUIRE_NON_NEGATIVE(margin);

    dims_ = GetDenseDims(refinement, "refinement");
    if (dims_.batch != 1) {
        throw InvalidArgumentException("DenseRefinementField: batch size " +
                                       std::to_string(dims_.batch) + ", expected 1");
    }
    if (dims_.channels != 2 * static_cast<int64_t>(buckets)) {
        throw ShapeMismatchException(
            "DenseRefinementField: refinement has " + std::to_string(dims_.channels) +
            " channels, expected " + std::to_string(2 * buckets) +
            " (" + std::to_string(buckets) + " buckets)");
    }
}

Point2d DenseRefinementField::Offset(const Point2d& point, int32_t bucket,
                                     const Point2d& /*normal*/) const {
    RequireBucket(bucket, buckets_, "DenseRefinementField::Offset");
    int64_t cx = static_cast<int64_t>(std::lround(point.x / stride_));
    int64_t cy = static_cast<int64_t>(std::lround(point.y / stride_));
    cx = std::clamp<int64_t>(cx, 0, dims_.width - 1);
    cy = std::clamp<int64_t>(cy, 0, dims_.height - 1);

    const int64_t cell = cy * dims_.width + cx;
    const float* data = tensor_.data.data();
    double vx = data[(2 * bucket) * dims_.Plane() + cell];
    double vy = data[(2 * bucket + 1) * dims_.Plane() + cell];
    return {margin_ * std::tanh(vx), margin_ * std::tanh(vy)};
}

Rect2d DenseRefinementField::Domain() const {
    return Rect2d(0.0, 0.0,
                  static_cast<double>((dims_.width - 1) * stride_),
                  static_cast<double>((dims_.height - 1) * stride_));
}

// =============================================================================
// ScoreMapRefinementField
// =============================================================================

ScoreMapRefinementField::ScoreMapRefinementField(const QImage& scoreMap, int32_t buckets,
                                                 double margin)
    : scoreMap_(scoreMap), buckets_(buckets), margin_(margin) {
    Validate::RequireImageNonEmpty(scoreMap, "ScoreMapRefinementField");
    Validate::RequireImageFloatGray(scoreMap, "ScoreMapRefinementField");
    CPNVISION_REQUIRE_POSITIVE(buckets);
    CPNVISION_REQUIRE_NON_NEGATIVE(margin);
}

// The search sector follows the normal, so every bucket yields the same offset
Point2d ScoreMapRefinementField::Offset(const Point2d& point, int32_t bucket,
                                        const Point2d& normal) const {
    RequireBucket(bucket, buckets_, "ScoreMapRefinementField::Offset");
    const int32_t width = scoreMap_.Width();
    const int32_t height = scoreMap_.Height();
    const int32_t px = std::clamp(static_cast<int32_t>(std::lround(point.x)), 0, width - 1);
    const int32_t py = std::clamp(static_cast<int32_t>(std::lround(point.y)), 0, height - 1);

    double normalLen = normal.Norm();
    if (normalLen <= EPSILON || margin_ <= 0.0) {
        return {0.0, 0.0};
    }
    const Point2d axis = normal * (1.0 / normalLen);

    // Sector half-width pi / B around the normal axis (both directions)
    const double halfWidth = PI / buckets_;
    const double cosLimit = std::cos(halfWidth);
    const int32_t r = static_cast<int32_t>(std::ceil(margin_));

    float best = scoreMap_.Row<float>(py)[px];
    Point2d target = point;

    for (int32_t y = std::max(0, py - r); y <= std::min(height - 1, py + r); ++y) {
        const float* row = scoreMap_.Row<float>(y);
        for (int32_t x = std::max(0, px - r); x <= std::min(width - 1, px + r); ++x) {
            Point2d d(x - point.x, y - point.y);
            double dist = d.Norm();
            if (dist <= EPSILON || dist > margin_) continue;
            if (std::abs(d.Dot(axis)) / dist < cosLimit) continue;

            if (row[x] > best) {
                best = row[x];
                target = Point2d(x, y);
            }
        }
    }
    return target - point;
}

Rect2d ScoreMapRefinementField::Domain() const {
    return Rect2d(0.0, 0.0, scoreMap_.Width() - 1.0, scoreMap_.Height() - 1.0);
}

// =============================================================================
// Refinement
// =============================================================================

BucketWeights AssignBuckets(double t, int32_t buckets) {
    CPNVISION_REQUIRE_POSITIVE(buckets);

    double u = t * buckets - 0.5;
    double base = std::floor(u);
    double frac = u - base;

    int32_t b0 = static_cast<int32_t>(base) % buckets;
    if (b0 < 0) {
        b0 += buckets;
    }

    BucketWeights w;
    w.bucket0 = b0;
    w.bucket1 = (b0 + 1) % buckets;
    w.weight0 = 1.0 - frac;
    w.weight1 = frac;
    return w;
}

int32_t RefineContour(std::vector<Point2d>& contour, const std::vector<double>& sampling,
                      const RefinementField& field, int32_t iterations) {
    CPNVISION_REQUIRE_NON_NEGATIVE(iterations);

    const size_t n = contour.size();
    std::vector<double> params = sampling;
    if (params.size() != n) {
        params.resize(n);
        for (size_t m = 0; m < n; ++m) {
            params[m] = static_cast<double>(m) / static_cast<double>(n);
        }
    }

    std::vector<BucketWeights> weights(n);
    for (size_t m = 0; m < n; ++m) {
        weights[m] = AssignBuckets(params[m], field.Buckets());
    }

    const Rect2d domain = field.Domain();
    std::vector<Point2d> next(n);

    int32_t passes = 0;
    for (; passes < iterations; ++passes) {
        std::vector<Point2d> normals = ComputeNormals(contour);
        for (size_t m = 0; m < n; ++m) {
            const auto& w = weights[m];
            Point2d d0 = field.Offset(contour[m], w.bucket0, normals[m]);
            Point2d d1 = field.Offset(contour[m], w.bucket1, normals[m]);
            next[m] = ClampToDomain(contour[m] + d0 * w.weight0 + d1 * w.weight1, domain);
        }
        contour.swap(next);
    }
    return passes;
}

int32_t RefineProposals(std::vector<Proposal>& proposals, const RefinementField& field,
                        int32_t iterations) {
    CPNVISION_REQUIRE_NON_NEGATIVE(iterations);
    for (auto& p : proposals) {
        RefineContour(p.contour, p.sampling, field, iterations);
    }
    return iterations;
}

} // namespace Cpn::Vision::Detection
