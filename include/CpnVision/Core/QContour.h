#pragma once

/**
 * @file QContour.h
 * @brief Sub-pixel point sequence describing an instance boundary
 *
 * Contours are ordered point sequences in pixel coordinates (pixel (x, y)
 * has its center at (x, y)). Boundaries traced from label maps are closed:
 * the last point connects back to the first.
 */

#include <CpnVision/Core/Types.h>

#include <vector>

namespace Cpn::Vision {

/**
 * @brief Ordered 2D point sequence, open or closed
 */
class CPNVISION_API QContour {
public:
    // =========================================================================
    // Constructors
    // =========================================================================

    /// Default constructor (empty contour)
    QContour();

    /// Construct from points
    explicit QContour(const std::vector<Point2d>& points, bool closed = true);

    // =========================================================================
    // Point Access
    // =========================================================================

    /// Number of points in the contour
    size_t Size() const { return points_.size(); }

    /// Check if contour is empty
    bool Empty() const { return points_.empty(); }

    /// Access point by index (bounds checked)
    const Point2d& At(size_t index) const;

    const Point2d& operator[](size_t index) const { return points_[index]; }
    Point2d& operator[](size_t index) { return points_[index]; }

    /// Get all points
    const std::vector<Point2d>& GetPoints() const { return points_; }

    // =========================================================================
    // Point Modification
    // =========================================================================

    void AddPoint(const Point2d& p) { points_.push_back(p); }
    void AddPoint(double x, double y) { points_.emplace_back(x, y); }

    void Clear() { points_.clear(); }
    void Reserve(size_t capacity) { points_.reserve(capacity); }
    void SetPoints(const std::vector<Point2d>& points) { points_ = points; }

    /// Is the contour closed?
    bool IsClosed() const { return closed_; }

    /// Set closed state
    void SetClosed(bool closed) { closed_ = closed; }

    // =========================================================================
    // Geometric Properties
    // =========================================================================

    /// Total contour length (includes closing segment for closed contours)
    double Length() const;

    /// Area (shoelace formula, closed interpretation)
    double Area() const;

    /// Signed area (positive = counter-clockwise in a y-up frame)
    double SignedArea() const;

    /// Area centroid for closed contours, mean point otherwise
    Point2d Centroid() const;

    /// Bounding box
    Rect2d BoundingBox() const;

    /// Check if contour has positive signed area
    bool IsCounterClockwise() const { return SignedArea() > 0; }

    /// Reverse the point order in place
    void Reverse();

    /// Check if a point is inside the contour (even-odd rule)
    bool Contains(const Point2d& p) const;

    // =========================================================================
    // Transformations
    // =========================================================================

    /// Translate the contour
    QContour Translate(const Point2d& offset) const;

    /// Rotate the start index so that point `start` becomes point 0
    QContour RotateStart(size_t start) const;

    // =========================================================================
    // Static Factory Methods
    // =========================================================================

    /// Create contour from circle (counter-clockwise, starting at angle 0)
    static QContour FromCircle(const Point2d& center, double radius, size_t numPoints = 64);

    /// Create closed contour from rectangle corners
    static QContour FromRectangle(const Rect2d& rect);

private:
    std::vector<Point2d> points_;
    bool closed_ = true;
};

} // namespace Cpn::Vision
