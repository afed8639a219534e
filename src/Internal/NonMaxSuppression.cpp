/**
 * @file NonMaxSuppression.cpp
 * @brief Implementation of contour non-maximum suppression
 */

#include <CpnVision/Internal/NonMaxSuppression.h>
#include <CpnVision/Internal/ContourConvert.h>
#include <CpnVision/Core/Validate.h>

#include <algorithm>
#include <numeric>

namespace Cpn::Vision::Internal {

std::vector<size_t> RankByScore(const std::vector<ScoredContour>& candidates) {
    std::vector<size_t> order(candidates.size());
    std::iota(order.begin(), order.end(), size_t(0));
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        const auto& ca = candidates[a];
        const auto& cb = candidates[b];
        if (ca.score != cb.score) {
            return ca.score > cb.score;
        }
        return ca.rankKey < cb.rankKey;
    });
    return order;
}

std::vector<size_t> ContourNMS(const std::vector<ScoredContour>& candidates,
                               const ContourNmsParams& params) {
    Validate::RequireRange(params.iouThreshold, 0.0, 1.0, "iouThreshold", "ContourNMS");
    Validate::RequireMin(params.supersample, 1, "supersample", "ContourNMS");

    std::vector<size_t> order = RankByScore(candidates);
    if (order.empty()) {
        return order;
    }

    // Rasterize once, in rank order
    std::vector<PolygonRaster> rasters(order.size());
    for (size_t r = 0; r < order.size(); ++r) {
        const auto* pts = candidates[order[r]].points;
        if (pts != nullptr) {
            rasters[r] = RasterizePolygon(*pts, params.supersample, params.clip);
        } else {
            rasters[r].supersample = params.supersample;
        }
    }

    auto competes = [&](size_t hi, size_t lo) {
        return !params.perClass ||
               candidates[order[hi]].classId == candidates[order[lo]].classId;
    };

    std::vector<bool> suppressed(order.size(), false);
    std::vector<size_t> kept;

    for (size_t i = 0; i < order.size(); ++i) {
        if (params.mode == NmsMode::Greedy) {
            if (suppressed[i]) continue;
            kept.push_back(order[i]);
            for (size_t j = i + 1; j < order.size(); ++j) {
                if (suppressed[j] || !competes(i, j)) continue;
                if (RasterIoU(rasters[i], rasters[j]) > params.iouThreshold) {
                    suppressed[j] = true;
                }
            }
        } else {
            bool drop = false;
            for (size_t h = 0; h < i && !drop; ++h) {
                if (!competes(h, i)) continue;
                drop = RasterIoU(rasters[h], rasters[i]) > params.iouThreshold;
            }
            if (!drop) {
                kept.push_back(order[i]);
            }
        }
    }
    return kept;
}

} // namespace Cpn::Vision::Internal
