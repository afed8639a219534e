#pragma once

/**
 * @file test_helpers.h
 * @brief Synthetic label maps and dense outputs shared by unit tests
 */

#include <CpnVision/Core/QImage.h>
#include <CpnVision/Detection/ProposalDecoder.h>

#include <cstdint>

namespace TestHelpers {

using Cpn::Vision::QImage;
using Cpn::Vision::PixelType;

inline QImage MakeLabelMap(int32_t width, int32_t height) {
    return QImage(width, height, PixelType::Int32);
}

/// Label every pixel within radius r of (cx, cy)
inline void FillDisk(QImage& labels, double cx, double cy, double r, int32_t id) {
    for (int32_t y = 0; y < labels.Height(); ++y) {
        int32_t* row = labels.Row<int32_t>(y);
        for (int32_t x = 0; x < labels.Width(); ++x) {
            double dx = x - cx;
            double dy = y - cy;
            if (dx * dx + dy * dy <= r * r) {
                row[x] = id;
            }
        }
    }
}

inline void FillRect(QImage& labels, int32_t x0, int32_t y0, int32_t w, int32_t h, int32_t id) {
    for (int32_t y = y0; y < y0 + h; ++y) {
        int32_t* row = labels.Row<int32_t>(y);
        for (int32_t x = x0; x < x0 + w; ++x) {
            row[x] = id;
        }
    }
}

/// Zero dense output: scores [1, C, H, W], fourier [1, 4 * order, H, W]
inline Cpn::Vision::Detection::DenseOutput MakeZeroOutput(int64_t classes, int32_t order,
                                                          int64_t height, int64_t width) {
    Cpn::Vision::Detection::DenseOutput out;
    out.scores = Cpn::Vision::Inference::Tensor("scores", {1, classes, height, width});
    out.fourier = Cpn::Vision::Inference::Tensor("fourier", {1, 4 * order, height, width});
    return out;
}

/// Circle of the given radius (Complex layout: Re c_1 = radius) at cell (x, y)
inline void SetCircleProposal(Cpn::Vision::Detection::DenseOutput& out, int64_t x, int64_t y,
                              float score, float radius, int64_t classIndex = 0) {
    const int64_t height = out.scores.shape[2];
    const int64_t width = out.scores.shape[3];
    const int64_t plane = height * width;
    const int64_t cell = y * width + x;
    out.scores.data[classIndex * plane + cell] = score;
    out.fourier.data[cell] = radius;
}

} // namespace TestHelpers
