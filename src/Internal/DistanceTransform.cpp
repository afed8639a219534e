#include <CpnVision/Internal/DistanceTransform.h>
#include <CpnVision/Core/Validate.h>

#include <algorithm>
#include <cmath>

namespace Cpn::Vision::Internal {

namespace {

// Squared distance of column x to the parabola rooted at column i
inline int64_t ParabolaValue(int64_t x, int64_t i, int64_t gi) {
    return (x - i) * (x - i) + gi * gi;
}

// First column where the parabola at u lies below the one at i (i < u)
inline int64_t ParabolaSep(int64_t i, int64_t u, int64_t gi, int64_t gu) {
    int64_t num = u * u - i * i + gu * gu - gi * gi;
    int64_t den = 2 * (u - i);
    // Floor division (num may be negative)
    int64_t q = num / den;
    if ((num % den != 0) && ((num < 0) != (den < 0))) {
        --q;
    }
    return q;
}

} // anonymous namespace

std::vector<float> ComputeL2Distance(const uint8_t* mask, int32_t width, int32_t height,
                                     int32_t stride) {
    std::vector<float> dist(static_cast<size_t>(width) * height, 0.0f);
    if (width <= 0 || height <= 0) {
        return dist;
    }

    const int64_t inf = static_cast<int64_t>(width) + height;

    // Phase 1: vertical distance per column
    std::vector<int64_t> g(static_cast<size_t>(width) * height);
    for (int32_t c = 0; c < width; ++c) {
        g[c] = (mask[c] == 0) ? 0 : inf;
        for (int32_t r = 1; r < height; ++r) {
            size_t idx = static_cast<size_t>(r) * width + c;
            g[idx] = (mask[r * stride + c] == 0) ? 0 : std::min(inf, g[idx - width] + 1);
        }
        for (int32_t r = height - 2; r >= 0; --r) {
            size_t idx = static_cast<size_t>(r) * width + c;
            if (g[idx + width] < g[idx]) {
                g[idx] = g[idx + width] + 1;
            }
        }
    }

    // Phase 2: lower envelope of parabolas per row
    std::vector<int64_t> s(width);
    std::vector<int64_t> t(width);
    for (int32_t r = 0; r < height; ++r) {
        const int64_t* gr = g.data() + static_cast<size_t>(r) * width;
        int32_t q = 0;
        s[0] = 0;
        t[0] = 0;

        for (int32_t u = 1; u < width; ++u) {
            while (q >= 0 && ParabolaValue(t[q], s[q], gr[s[q]]) > ParabolaValue(t[q], u, gr[u])) {
                --q;
            }
            if (q < 0) {
                q = 0;
                s[0] = u;
            } else {
                int64_t w = 1 + ParabolaSep(s[q], u, gr[s[q]], gr[u]);
                if (w < width) {
                    ++q;
                    s[q] = u;
                    t[q] = std::max<int64_t>(w, 0);
                }
            }
        }

        float* dr = dist.data() + static_cast<size_t>(r) * width;
        for (int32_t u = width - 1; u >= 0; --u) {
            dr[u] = static_cast<float>(std::sqrt(static_cast<double>(
                ParabolaValue(u, s[q], gr[s[q]]))));
            if (u == t[q] && q > 0) {
                --q;
            }
        }
    }

    return dist;
}

std::vector<float> BorderedL2Distance(const uint8_t* mask, int32_t width, int32_t height) {
    if (width <= 0 || height <= 0) {
        return {};
    }

    // One pixel of zero padding around the mask
    const int32_t pw = width + 2;
    const int32_t ph = height + 2;
    std::vector<uint8_t> padded(static_cast<size_t>(pw) * ph, 0);
    for (int32_t y = 0; y < height; ++y) {
        const uint8_t* src = mask + static_cast<size_t>(y) * width;
        std::copy(src, src + width, padded.begin() + static_cast<size_t>(y + 1) * pw + 1);
    }

    std::vector<float> dist = ComputeL2Distance(padded.data(), pw, ph, pw);

    std::vector<float> result(static_cast<size_t>(width) * height);
    for (int32_t y = 0; y < height; ++y) {
        const float* src = dist.data() + static_cast<size_t>(y + 1) * pw + 1;
        std::copy(src, src + width, result.begin() + static_cast<size_t>(y) * width);
    }
    return result;
}

QImage DistanceTransformL2(const QImage& binary) {
    CPNVISION_REQUIRE_IMAGE(binary);
    Validate::RequireImageType(binary, PixelType::UInt8, "DistanceTransformL2");

    const int32_t width = binary.Width();
    const int32_t height = binary.Height();
    std::vector<float> dist = ComputeL2Distance(
        static_cast<const uint8_t*>(binary.Data()), width, height,
        static_cast<int32_t>(binary.Stride()));

    return QImage::FromData(dist.data(), width, height, PixelType::Float32);
}

} // namespace Cpn::Vision::Internal
