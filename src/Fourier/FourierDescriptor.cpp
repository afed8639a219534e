/**
 * @file FourierDescriptor.cpp
 * @brief Closed-form Fourier encoding of polygons and series evaluation
 */

#include <CpnVision/Fourier/FourierDescriptor.h>

#include <CpnVision/Core/Constants.h>
#include <CpnVision/Core/Exception.h>
#include <CpnVision/Core/Validate.h>

#include <cmath>
#include <string>

namespace Cpn::Vision::Fourier {

using Complex = FourierDescriptor::Complex;

// =============================================================================
// FourierDescriptor
// =============================================================================

FourierDescriptor::FourierDescriptor(int32_t order) {
    Validate::RequireNonNegative(order, "order", "FourierDescriptor");
    positive_.assign(order, Complex(0.0, 0.0));
    negative_.assign(order, Complex(0.0, 0.0));
}

FourierDescriptor::FourierDescriptor(std::vector<Complex> positive, std::vector<Complex> negative)
    : positive_(std::move(positive)), negative_(std::move(negative)) {
    if (positive_.size() != negative_.size()) {
        throw InvalidArgumentException(
            "FourierDescriptor: " + std::to_string(positive_.size()) + " positive and " +
            std::to_string(negative_.size()) + " negative harmonics");
    }
}

FourierDescriptor FourierDescriptor::FromChannels(const std::vector<double>& channels,
                                                  FourierLayout layout) {
    if (channels.size() % 4 != 0) {
        throw ShapeMismatchException(
            "FourierDescriptor::FromChannels: channel count " + std::to_string(channels.size()) +
            " is not a multiple of 4");
    }

    const int32_t order = static_cast<int32_t>(channels.size() / 4);
    FourierDescriptor desc(order);
    for (int32_t k = 1; k <= order; ++k) {
        const double* v = channels.data() + 4 * (k - 1);
        if (layout == FourierLayout::Complex) {
            desc.Positive(k) = Complex(v[0], v[1]);
            desc.Negative(k) = Complex(v[2], v[3]);
        } else {
            // v = (a, b, c, d)
            desc.Positive(k) = Complex((v[0] + v[3]) * 0.5, (v[2] - v[1]) * 0.5);
            desc.Negative(k) = Complex((v[0] - v[3]) * 0.5, (v[1] + v[2]) * 0.5);
        }
    }
    return desc;
}

FourierDescriptor FourierDescriptor::FromChannels(const float* data, int32_t order, size_t step,
                                                  FourierLayout layout) {
    Validate::RequireNonNegative(order, "order", "FourierDescriptor::FromChannels");
    std::vector<double> channels(static_cast<size_t>(order) * 4);
    for (size_t c = 0; c < channels.size(); ++c) {
        channels[c] = static_cast<double>(data[c * step]);
    }
    return FromChannels(channels, layout);
}

std::array<double, 4> FourierDescriptor::Elliptic(int32_t k) const {
    const Complex& p = Positive(k);
    const Complex& n = Negative(k);
    return {p.real() + n.real(),     // a
            n.imag() - p.imag(),     // b
            p.imag() + n.imag(),     // c
            p.real() - n.real()};    // d
}

std::vector<double> FourierDescriptor::ToChannels(FourierLayout layout) const {
    std::vector<double> channels;
    channels.reserve(positive_.size() * 4);
    for (int32_t k = 1; k <= Order(); ++k) {
        if (layout == FourierLayout::Complex) {
            channels.push_back(Positive(k).real());
            channels.push_back(Positive(k).imag());
            channels.push_back(Negative(k).real());
            channels.push_back(Negative(k).imag());
        } else {
            auto e = Elliptic(k);
            channels.insert(channels.end(), e.begin(), e.end());
        }
    }
    return channels;
}

Point2d FourierDescriptor::Evaluate(double t) const {
    Complex z(0.0, 0.0);
    for (int32_t k = 1; k <= Order(); ++k) {
        double theta = TWO_PI * k * t;
        Complex e(std::cos(theta), std::sin(theta));
        z += Positive(k) * e + Negative(k) * std::conj(e);
    }
    return {z.real(), z.imag()};
}

// =============================================================================
// Encoding
// =============================================================================

FourierDescriptor EncodeContour(const std::vector<Point2d>& points, int32_t order,
                                Point2d& location) {
    if (order < 1) {
        throw InvalidArgumentException("EncodeContour: order must be >= 1, got " +
                                       std::to_string(order));
    }
    const size_t n = points.size();
    if (n < 3) {
        throw InsufficientDataException("EncodeContour: need at least 3 points, got " +
                                        std::to_string(n));
    }

    // Segment j runs from points[j-1] to points[j]; segment n closes the curve
    std::vector<double> t(n + 1, 0.0);
    for (size_t j = 1; j <= n; ++j) {
        t[j] = t[j - 1] + points[j - 1].DistanceTo(points[j % n]);
    }
    const double perimeter = t[n];
    if (perimeter <= EPSILON) {
        throw InsufficientDataException("EncodeContour: contour has zero perimeter");
    }

    // Curve centroid: mean of z over arc length
    Complex c0(0.0, 0.0);
    for (size_t j = 1; j <= n; ++j) {
        const Point2d& a = points[j - 1];
        const Point2d& b = points[j % n];
        double dt = t[j] - t[j - 1];
        c0 += Complex((a.x + b.x) * 0.5, (a.y + b.y) * 0.5) * dt;
    }
    c0 /= perimeter;
    location = Point2d(c0.real(), c0.imag());

    FourierDescriptor desc(order);
    for (int32_t k = 1; k <= order; ++k) {
        const double omega = TWO_PI * k / perimeter;
        Complex sumPos(0.0, 0.0);
        Complex sumNeg(0.0, 0.0);

        for (size_t j = 1; j <= n; ++j) {
            double dt = t[j] - t[j - 1];
            if (dt <= 0.0) continue;

            const Point2d& a = points[j - 1];
            const Point2d& b = points[j % n];
            Complex slope((b.x - a.x) / dt, (b.y - a.y) / dt);

            Complex e1 = std::polar(1.0, -omega * t[j]);
            Complex e0 = std::polar(1.0, -omega * t[j - 1]);
            sumPos += slope * (e1 - e0);
            sumNeg += slope * (std::conj(e1) - std::conj(e0));
        }

        double scale = perimeter / ((TWO_PI * k) * (TWO_PI * k));
        desc.Positive(k) = sumPos * scale;
        desc.Negative(k) = sumNeg * scale;
    }
    return desc;
}

FourierDescriptor EncodeContour(const QContour& contour, int32_t order, Point2d& location) {
    return EncodeContour(contour.GetPoints(), order, location);
}

// =============================================================================
// Decoding
// =============================================================================

std::vector<Point2d> EvaluateDescriptor(const FourierDescriptor& descriptor,
                                        const Point2d& location,
                                        const std::vector<double>& params) {
    std::vector<Point2d> points;
    points.reserve(params.size());
    for (double t : params) {
        points.push_back(location + descriptor.Evaluate(t));
    }
    return points;
}

std::vector<Point2d> DecodeDescriptor(const FourierDescriptor& descriptor,
                                      const Point2d& location, int32_t count) {
    Validate::RequireNonNegative(count, "count", "DecodeDescriptor");
    std::vector<double> params(count);
    for (int32_t m = 0; m < count; ++m) {
        params[m] = static_cast<double>(m) / count;
    }
    return EvaluateDescriptor(descriptor, location, params);
}

std::vector<Point2d> DecodeDescriptor(const FourierDescriptor& descriptor,
                                      const Point2d& location, int32_t count,
                                      int32_t expectedOrder) {
    if (descriptor.Order() != expectedOrder) {
        throw ShapeMismatchException(
            "DecodeDescriptor: descriptor has order " + std::to_string(descriptor.Order()) +
            ", expected " + std::to_string(expectedOrder));
    }
    return DecodeDescriptor(descriptor, location, count);
}

// =============================================================================
// Normalization
// =============================================================================

FourierDescriptor ShiftPhase(const FourierDescriptor& descriptor, double shift) {
    FourierDescriptor result = descriptor;
    for (int32_t k = 1; k <= descriptor.Order(); ++k) {
        Complex e = std::polar(1.0, TWO_PI * k * shift);
        result.Positive(k) *= e;
        result.Negative(k) *= std::conj(e);
    }
    return result;
}

FourierDescriptor NormalizePhase(const FourierDescriptor& descriptor, double& shift) {
    shift = 0.0;
    if (descriptor.Empty()) {
        return descriptor;
    }

    const Complex& c1 = descriptor.Positive(1);
    const Complex& cm1 = descriptor.Negative(1);
    const bool hasPos = std::abs(c1) > EPSILON;
    const bool hasNeg = std::abs(cm1) > EPSILON;

    // Rotation angle phi = 2 pi shift of the first harmonic
    double phi = 0.0;
    if (hasPos && hasNeg) {
        phi = 0.5 * (std::arg(cm1) - std::arg(c1));
        Complex start = c1 * std::polar(1.0, phi) + cm1 * std::polar(1.0, -phi);
        if (start.real() < 0.0) {
            phi += PI;
        }
    } else if (hasPos) {
        phi = -std::arg(c1);
    } else if (hasNeg) {
        phi = std::arg(cm1);
    } else {
        return descriptor;
    }

    shift = std::fmod(phi / TWO_PI, 1.0);
    if (shift < 0.0) {
        shift += 1.0;
    }
    return ShiftPhase(descriptor, shift);
}

FourierDescriptor NormalizePhase(const FourierDescriptor& descriptor) {
    double shift = 0.0;
    return NormalizePhase(descriptor, shift);
}

} // namespace Cpn::Vision::Fourier
