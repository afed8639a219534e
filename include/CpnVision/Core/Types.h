#pragma once

/**
 * @file Types.h
 * @brief Core type definitions for CpnVision
 */

#include <cstdint>
#include <CpnVision/Core/Export.h>
#include <cmath>
#include <vector>

namespace Cpn::Vision {

// =============================================================================
// Pixel Types
// =============================================================================

/**
 * @brief Supported pixel data types
 */
enum class PixelType {
    UInt8,      ///< 8-bit unsigned [0, 255]
    UInt16,     ///< 16-bit unsigned [0, 65535]
    Int32,      ///< 32-bit signed (label maps, reduced labels)
    Float32     ///< 32-bit float (score maps)
};

/**
 * @brief Image channel types
 */
enum class ChannelType {
    Gray,       ///< Single channel
    RGB         ///< 3 channels RGB
};

// =============================================================================
// 2D Point Types
// =============================================================================

/**
 * @brief 2D point with integer coordinates
 */
struct CPNVISION_API Point2i {
    int32_t x = 0;
    int32_t y = 0;

    Point2i() = default;
    Point2i(int32_t x_, int32_t y_) : x(x_), y(y_) {}

    bool operator==(const Point2i& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Point2i& other) const { return !(*this == other); }
};

/**
 * @brief 2D point with sub-pixel precision
 */
struct CPNVISION_API Point2d {
    double x = 0.0;
    double y = 0.0;

    Point2d() = default;
    Point2d(double x_, double y_) : x(x_), y(y_) {}

    bool IsValid() const { return std::isfinite(x) && std::isfinite(y); }

    /// Vector addition
    Point2d operator+(const Point2d& other) const {
        return {x + other.x, y + other.y};
    }

    /// Vector subtraction
    Point2d operator-(const Point2d& other) const {
        return {x - other.x, y - other.y};
    }

    /// Scalar multiplication
    Point2d operator*(double s) const {
        return {x * s, y * s};
    }

    Point2d& operator+=(const Point2d& other) {
        x += other.x;
        y += other.y;
        return *this;
    }

    bool operator==(const Point2d& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Point2d& other) const { return !(*this == other); }

    /// Euclidean norm
    double Norm() const {
        return std::sqrt(x * x + y * y);
    }

    /// Dot product
    double Dot(const Point2d& other) const {
        return x * other.x + y * other.y;
    }

    /// Cross product (2D: returns scalar)
    double Cross(const Point2d& other) const {
        return x * other.y - y * other.x;
    }

    /// Distance to another point
    double DistanceTo(const Point2d& other) const {
        return (*this - other).Norm();
    }
};

// =============================================================================
// Size Type
// =============================================================================

/**
 * @brief 2D size with integer dimensions
 */
struct CPNVISION_API Size2i {
    int32_t width = 0;
    int32_t height = 0;

    Size2i() = default;
    Size2i(int32_t w, int32_t h) : width(w), height(h) {}

    int64_t Area() const { return static_cast<int64_t>(width) * height; }
    bool IsValid() const { return width >= 0 && height >= 0; }
    bool IsZero() const { return width == 0 && height == 0; }

    bool operator==(const Size2i& other) const {
        return width == other.width && height == other.height;
    }
    bool operator!=(const Size2i& other) const { return !(*this == other); }
};

// =============================================================================
// Rectangle Types
// =============================================================================

/**
 * @brief Axis-aligned rectangle with integer coordinates
 */
struct CPNVISION_API Rect2i {
    int32_t x = 0;      ///< Left
    int32_t y = 0;      ///< Top
    int32_t width = 0;
    int32_t height = 0;

    Rect2i() = default;
    Rect2i(int32_t x_, int32_t y_, int32_t w, int32_t h)
        : x(x_), y(y_), width(w), height(h) {}

    int32_t Right() const { return x + width; }
    int32_t Bottom() const { return y + height; }
    int64_t Area() const { return static_cast<int64_t>(width) * height; }
    bool IsValid() const { return width >= 0 && height >= 0; }

    bool Contains(int32_t px, int32_t py) const {
        return px >= x && px < Right() && py >= y && py < Bottom();
    }

    bool Contains(const Point2i& p) const {
        return Contains(p.x, p.y);
    }
};

/**
 * @brief Axis-aligned rectangle with double precision
 */
struct CPNVISION_API Rect2d {
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;

    Rect2d() = default;
    Rect2d(double x_, double y_, double w, double h)
        : x(x_), y(y_), width(w), height(h) {}

    double Right() const { return x + width; }
    double Bottom() const { return y + height; }
    double Area() const { return width * height; }
    Point2d Center() const { return {x + width / 2.0, y + height / 2.0}; }

    /// True if the two rectangles share a region of positive area
    bool Overlaps(const Rect2d& other) const {
        return x < other.Right() && other.x < Right() &&
               y < other.Bottom() && other.y < Bottom();
    }

    bool IsValid() const {
        return std::isfinite(x) && std::isfinite(y) &&
               std::isfinite(width) && std::isfinite(height) &&
               width >= 0.0 && height >= 0.0;
    }
};

// =============================================================================
// Enumerations
// =============================================================================

/**
 * @brief Connectivity for pixel neighbourhood operations
 */
enum class Connectivity {
    Four,           ///< 4-connected neighbors
    Eight           ///< 8-connected neighbors
};

} // namespace Cpn::Vision
