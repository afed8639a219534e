#pragma once

#include <CpnVision/Core/Export.h>

/**
 * @file FourierDescriptor.h
 * @brief Truncated Fourier series of closed contours
 *
 * A closed curve z(t) = x(t) + i y(t), t in [0, 1) the normalized arc length
 * measured from the first contour point, is approximated by
 *
 *   z(t) = c_0 + sum_{k=1..N} ( c_k e^{2 pi i k t} + c_-k e^{-2 pi i k t} )
 *
 * The descriptor stores the N harmonic pairs (c_k, c_-k). The DC term c_0 is
 * the contour location and is kept outside the descriptor.
 *
 * Each harmonic is equivalently described by elliptic coefficients
 * (a, b, c, d) with x = a cos(2 pi k t) + b sin(2 pi k t) and
 * y = c cos(2 pi k t) + d sin(2 pi k t).
 */

#include <CpnVision/Core/QContour.h>
#include <CpnVision/Core/Types.h>

#include <array>
#include <complex>
#include <cstdint>
#include <vector>

namespace Cpn::Vision::Fourier {

// =============================================================================
// Types
// =============================================================================

/**
 * @brief Flat channel layout of a descriptor (4 channels per harmonic)
 */
enum class FourierLayout {
    Complex,    ///< Re c_k, Im c_k, Re c_-k, Im c_-k
    Elliptic    ///< a_k, b_k, c_k, d_k
};

/**
 * @brief N harmonics of a closed curve, shape only
 */
class CPNVISION_API FourierDescriptor {
public:
    using Complex = std::complex<double>;

    /// Empty descriptor (order 0)
    FourierDescriptor() = default;

    /// Zero descriptor of the given order
    explicit FourierDescriptor(int32_t order);

    /**
     * @brief Build from harmonic pairs
     * @param positive c_1..c_N
     * @param negative c_-1..c_-N (same length)
     */
    FourierDescriptor(std::vector<Complex> positive, std::vector<Complex> negative);

    /**
     * @brief Build from a flat channel vector of 4 * order values
     */
    static FourierDescriptor FromChannels(const std::vector<double>& channels,
                                          FourierLayout layout);

    /**
     * @brief Build from 4 * order strided float values (dense tensor column)
     *
     * @param data   Pointer to channel 0
     * @param order  Number of harmonics
     * @param step   Distance between consecutive channels, in elements
     */
    static FourierDescriptor FromChannels(const float* data, int32_t order, size_t step,
                                          FourierLayout layout);

    int32_t Order() const { return static_cast<int32_t>(positive_.size()); }
    bool Empty() const { return positive_.empty(); }

    /// c_k, k in [1, Order()]
    const Complex& Positive(int32_t k) const { return positive_[k - 1]; }
    Complex& Positive(int32_t k) { return positive_[k - 1]; }

    /// c_-k, k in [1, Order()]
    const Complex& Negative(int32_t k) const { return negative_[k - 1]; }
    Complex& Negative(int32_t k) { return negative_[k - 1]; }

    /// Elliptic coefficients (a, b, c, d) of harmonic k
    std::array<double, 4> Elliptic(int32_t k) const;

    /// Flat channel vector (4 * Order() values)
    std::vector<double> ToChannels(FourierLayout layout) const;

    /**
     * @brief Shape offset at parameter t (location not included)
     */
    Point2d Evaluate(double t) const;

    bool operator==(const FourierDescriptor& other) const {
        return positive_ == other.positive_ && negative_ == other.negative_;
    }
    bool operator!=(const FourierDescriptor& other) const { return !(*this == other); }

private:
    std::vector<Complex> positive_;
    std::vector<Complex> negative_;
};

// =============================================================================
// Encoding
// =============================================================================

/**
 * @brief Fourier coefficients of a closed polygon under arc-length parameterization
 *
 * Exact for the piecewise-linear curve:
 *   c_k = T / (2 pi k)^2 * sum_j s_j (e^{-2 pi i k t_j / T} - e^{-2 pi i k t_{j-1} / T})
 * with s_j the slope dz/dt of segment j and T the perimeter.
 *
 * @param points         Closed polygon (closing segment implicit)
 * @param order          Number of harmonics (>= 1)
 * @param[out] location  Curve centroid c_0
 *
 * @throws InvalidArgumentException if order < 1
 * @throws InsufficientDataException for fewer than 3 points or zero perimeter
 */
CPNVISION_API FourierDescriptor EncodeContour(const std::vector<Point2d>& points, int32_t order,
                                              Point2d& location);

/**
 * @brief Encode a QContour (treated as closed)
 */
CPNVISION_API FourierDescriptor EncodeContour(const QContour& contour, int32_t order,
                                              Point2d& location);

// =============================================================================
// Decoding
// =============================================================================

/**
 * @brief Evaluate location + descriptor at the given parameters
 */
CPNVISION_API std::vector<Point2d> EvaluateDescriptor(const FourierDescriptor& descriptor,
                                                      const Point2d& location,
                                                      const std::vector<double>& params);

/**
 * @brief Evaluate at count parameters t = m / count
 */
CPNVISION_API std::vector<Point2d> DecodeDescriptor(const FourierDescriptor& descriptor,
                                                    const Point2d& location, int32_t count);

/**
 * @brief Decode a descriptor that must have the configured order
 * @throws ShapeMismatchException if descriptor.Order() != expectedOrder
 */
CPNVISION_API std::vector<Point2d> DecodeDescriptor(const FourierDescriptor& descriptor,
                                                    const Point2d& location, int32_t count,
                                                    int32_t expectedOrder);

// =============================================================================
// Normalization
// =============================================================================

/**
 * @brief Shift the parameter origin to the major axis of the first harmonic
 *
 * After normalization arg(c_1) == arg(c_-1), i.e. t = 0 lies on an endpoint
 * of the major axis of the first-harmonic ellipse; of the two endpoints the
 * one with larger x is chosen. The normalized descriptor evaluated at t
 * equals the input evaluated at t + shift.
 *
 * @param[out] shift Parameter shift in [0, 1)
 */
CPNVISION_API FourierDescriptor NormalizePhase(const FourierDescriptor& descriptor, double& shift);

CPNVISION_API FourierDescriptor NormalizePhase(const FourierDescriptor& descriptor);

/**
 * @brief Shift the parameter origin by `shift` (fraction of the period)
 */
CPNVISION_API FourierDescriptor ShiftPhase(const FourierDescriptor& descriptor, double shift);

} // namespace Cpn::Vision::Fourier
