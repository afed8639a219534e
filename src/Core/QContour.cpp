/**
 * @file QContour.cpp
 * @brief Closed and open point contours
 */

#include <CpnVision/Core/QContour.h>
#include <CpnVision/Core/Constants.h>
#include <CpnVision/Core/Exception.h>

#include <algorithm>
#include <cmath>

namespace Cpn::Vision {

// =============================================================================
// Constructors
// =============================================================================

QContour::QContour() = default;

QContour::QContour(const std::vector<Point2d>& points, bool closed)
    : points_(points), closed_(closed) {}

const Point2d& QContour::At(size_t index) const {
    if (index >= points_.size()) {
        throw OutOfRangeException("QContour::At: index " + std::to_string(index) +
                                  " >= size " + std::to_string(points_.size()));
    }
    return points_[index];
}

// =============================================================================
// Geometric Properties
// =============================================================================

double QContour::Length() const {
    const size_t n = points_.size();
    double length = 0.0;
    for (size_t i = 1; i < n; ++i) {
        length += points_[i - 1].DistanceTo(points_[i]);
    }
    if (closed_ && n > 1) {
        length += points_[n - 1].DistanceTo(points_[0]);
    }
    return length;
}

// Shoelace; positive for counter-clockwise in a y-up frame
double QContour::SignedArea() const {
    const size_t n = points_.size();
    if (n < 3) {
        return 0.0;
    }
    double twice = points_[n - 1].Cross(points_[0]);
    for (size_t i = 0; i + 1 < n; ++i) {
        twice += points_[i].Cross(points_[i + 1]);
    }
    return 0.5 * twice;
}

double QContour::Area() const {
    return std::abs(SignedArea());
}

Point2d QContour::Centroid() const {
    const size_t n = points_.size();
    if (n == 0) {
        return {0.0, 0.0};
    }

    Point2d mean(0.0, 0.0);
    for (const auto& p : points_) {
        mean += p;
    }
    mean = mean * (1.0 / static_cast<double>(n));

    const double area = SignedArea();
    if (!closed_ || std::abs(area) < EPSILON) {
        return mean;
    }

    // Area-weighted triangle centroids
    Point2d sum(0.0, 0.0);
    for (size_t i = 0; i < n; ++i) {
        const Point2d& p = points_[i];
        const Point2d& q = points_[(i + 1) % n];
        sum += (p + q) * p.Cross(q);
    }
    return sum * (1.0 / (6.0 * area));
}

Rect2d QContour::BoundingBox() const {
    if (points_.empty()) {
        return Rect2d();
    }
    auto [minX, maxX] = std::minmax_element(points_.begin(), points_.end(),
        [](const Point2d& a, const Point2d& b) { return a.x < b.x; });
    auto [minY, maxY] = std::minmax_element(points_.begin(), points_.end(),
        [](const Point2d& a, const Point2d& b) { return a.y < b.y; });
    return Rect2d(minX->x, minY->y, maxX->x - minX->x, maxY->y - minY->y);
}

void QContour::Reverse() {
    std::reverse(points_.begin(), points_.end());
}

bool QContour::Contains(const Point2d& p) const {
    if (points_.size() < 3) {
        return false;
    }

    size_t n = points_.size();
    int crossings = 0;

    for (size_t i = 0; i < n; ++i) {
        const Point2d& a = points_[i];
        const Point2d& b = points_[(i + 1) % n];

        // Ray to the right, half-open edge interval
        if ((a.y <= p.y && b.y > p.y) || (b.y <= p.y && a.y > p.y)) {
            double t = (p.y - a.y) / (b.y - a.y);
            if (p.x < a.x + t * (b.x - a.x)) {
                ++crossings;
            }
        }
    }

    return (crossings % 2) == 1;
}

// =============================================================================
// Transformations
// =============================================================================

QContour QContour::Translate(const Point2d& offset) const {
    QContour result(*this);
    for (auto& p : result.points_) {
        p += offset;
    }
    return result;
}

QContour QContour::RotateStart(size_t start) const {
    if (points_.empty()) {
        return *this;
    }
    QContour result(*this);
    std::rotate(result.points_.begin(),
                result.points_.begin() + static_cast<std::ptrdiff_t>(start % points_.size()),
                result.points_.end());
    return result;
}

// =============================================================================
// Static Factory Methods
// =============================================================================

QContour QContour::FromCircle(const Point2d& center, double radius, size_t numPoints) {
    QContour contour;
    contour.Reserve(numPoints);
    for (size_t i = 0; i < numPoints; ++i) {
        double angle = TWO_PI * static_cast<double>(i) / static_cast<double>(numPoints);
        contour.AddPoint(center.x + radius * std::cos(angle),
                         center.y + radius * std::sin(angle));
    }
    contour.SetClosed(true);
    return contour;
}

QContour QContour::FromRectangle(const Rect2d& rect) {
    return QContour({{rect.x, rect.y},
                     {rect.Right(), rect.y},
                     {rect.Right(), rect.Bottom()},
                     {rect.x, rect.Bottom()}}, true);
}

} // namespace Cpn::Vision
