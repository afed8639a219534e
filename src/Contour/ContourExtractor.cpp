/**
 * @file ContourExtractor.cpp
 * @brief Instance contour extraction and reduced label generation
 */

#include <CpnVision/Contour/ContourExtractor.h>

#include <CpnVision/Core/Constants.h>
#include <CpnVision/Core/Exception.h>
#include <CpnVision/Core/Validate.h>
#include <CpnVision/Internal/ConnectedComponent.h>
#include <CpnVision/Internal/ContourTrace.h>
#include <CpnVision/Internal/DistanceTransform.h>
#include <CpnVision/Platform/Diagnostics.h>

#include <algorithm>
#include <unordered_map>

namespace Cpn::Vision::Contour {

namespace {

// Per-id bounds gathered in a single raster scan
struct IdBounds {
    int32_t id = 0;
    int32_t minX = 0;
    int32_t minY = 0;
    int32_t maxX = 0;
    int32_t maxY = 0;
};

std::vector<IdBounds> ScanInstanceIds(const QImage& labels) {
    std::vector<IdBounds> bounds;
    std::unordered_map<int32_t, size_t> index;

    const int32_t width = labels.Width();
    const int32_t height = labels.Height();
    for (int32_t y = 0; y < height; ++y) {
        for (int32_t x = 0; x < width; ++x) {
            int32_t id = labels.LabelAt(x, y);
            if (id == 0) continue;
            if (id < 0) {
                throw InvalidArgumentException(
                    "ExtractInstances: negative label " + std::to_string(id) +
                    " at (" + std::to_string(x) + ", " + std::to_string(y) + ")");
            }

            auto it = index.find(id);
            if (it == index.end()) {
                index.emplace(id, bounds.size());
                bounds.push_back({id, x, y, x, y});
            } else {
                auto& b = bounds[it->second];
                b.minX = std::min(b.minX, x);
                b.maxX = std::max(b.maxX, x);
                b.maxY = std::max(b.maxY, y);
            }
        }
    }
    return bounds;
}

bool TouchesBorder(const Rect2i& bbox, int32_t width, int32_t height) {
    return bbox.x == 0 || bbox.y == 0 || bbox.Right() == width || bbox.Bottom() == height;
}

} // anonymous namespace

// =============================================================================
// Extraction
// =============================================================================

std::vector<InstanceContour> ExtractInstances(const QImage& labels,
                                              const ExtractParams& params,
                                              std::vector<int32_t>& droppedIds) {
    Validate::RequireLabelImage(labels, "ExtractInstances");
    Validate::RequireNonNegative(params.minArea, "minArea", "ExtractInstances");

    droppedIds.clear();
    std::vector<InstanceContour> instances;

    const int32_t width = labels.Width();
    const int32_t height = labels.Height();

    for (const auto& b : ScanInstanceIds(labels)) {
        const int32_t bw = b.maxX - b.minX + 1;
        const int32_t bh = b.maxY - b.minY + 1;

        std::vector<uint8_t> mask(static_cast<size_t>(bw) * bh, 0);
        for (int32_t y = 0; y < bh; ++y) {
            for (int32_t x = 0; x < bw; ++x) {
                if (labels.LabelAt(b.minX + x, b.minY + y) == b.id) {
                    mask[static_cast<size_t>(y) * bw + x] = 1;
                }
            }
        }

        std::vector<int32_t> fragmentLabels;
        int32_t numFragments = Internal::LabelComponents(mask.data(), bw, bh,
                                                         params.connectivity, fragmentLabels);
        auto stats = Internal::GetComponentStats(fragmentLabels, bw, bh, numFragments);
        const auto& kept = stats[Internal::LargestComponent(stats)];

        InstanceContour inst;
        inst.id = b.id;
        inst.area = kept.area;
        inst.fragmented = numFragments > 1;
        inst.boundingBox = Rect2i(b.minX + kept.bbox.x, b.minY + kept.bbox.y,
                                  kept.bbox.width, kept.bbox.height);
        inst.touchesBorder = TouchesBorder(inst.boundingBox, width, height);

        if (inst.area < params.minArea) {
            CPNVISION_DIAG("Contour", "dropped instance %d: area %lld < %lld",
                           b.id, static_cast<long long>(inst.area),
                           static_cast<long long>(params.minArea));
            droppedIds.push_back(b.id);
            continue;
        }
        if (params.removePartials && inst.touchesBorder) {
            CPNVISION_DIAG("Contour", "dropped instance %d: touches image border", b.id);
            droppedIds.push_back(b.id);
            continue;
        }

        // Crop the kept fragment
        const Rect2i& fb = kept.bbox;
        inst.mask.assign(static_cast<size_t>(fb.width) * fb.height, 0);
        for (int32_t y = 0; y < fb.height; ++y) {
            for (int32_t x = 0; x < fb.width; ++x) {
                size_t src = static_cast<size_t>(fb.y + y) * bw + (fb.x + x);
                if (fragmentLabels[src] == kept.label) {
                    inst.mask[static_cast<size_t>(y) * fb.width + x] = 1;
                }
            }
        }

        Point2i start(kept.firstPixel.x - fb.x, kept.firstPixel.y - fb.y);
        inst.contour = Internal::TraceContour(inst.mask.data(), fb.width, fb.height, start,
                                              Point2i(inst.boundingBox.x, inst.boundingBox.y));

        if (inst.contour.Size() < 3) {
            CPNVISION_DIAG("Contour", "dropped instance %d: boundary has %zu points",
                           b.id, inst.contour.Size());
            droppedIds.push_back(b.id);
            continue;
        }

        instances.push_back(std::move(inst));
    }

    return instances;
}

std::vector<InstanceContour> ExtractInstances(const QImage& labels, const ExtractParams& params) {
    std::vector<int32_t> dropped;
    return ExtractInstances(labels, params, dropped);
}

// =============================================================================
// Reduced Labels
// =============================================================================

QImage ReduceLabels(const QImage& labels,
                    const std::vector<InstanceContour>& instances,
                    const std::vector<int32_t>& classOf,
                    double minFgDist, double maxBgDist) {
    Validate::RequireLabelImage(labels, "ReduceLabels");
    Validate::RequireRange(minFgDist, 0.0, 1.0, "minFgDist", "ReduceLabels");
    Validate::RequireRange(maxBgDist, 0.0, minFgDist, "maxBgDist", "ReduceLabels");
    if (classOf.size() != instances.size()) {
        throw InvalidArgumentException(
            "ReduceLabels: classOf has " + std::to_string(classOf.size()) +
            " entries for " + std::to_string(instances.size()) + " instances");
    }

    const int32_t width = labels.Width();
    const int32_t height = labels.Height();

    // Background 0, every instance pixel ignore until assigned
    QImage reduced(width, height, PixelType::Int32);
    for (int32_t y = 0; y < height; ++y) {
        int32_t* dst = reduced.Row<int32_t>(y);
        for (int32_t x = 0; x < width; ++x) {
            dst[x] = (labels.LabelAt(x, y) == 0) ? 0 : IGNORE_LABEL;
        }
    }

    for (size_t i = 0; i < instances.size(); ++i) {
        const auto& inst = instances[i];
        if (classOf[i] < 1) {
            throw InvalidArgumentException(
                "ReduceLabels: class id must be >= 1, got " + std::to_string(classOf[i]) +
                " for instance " + std::to_string(inst.id));
        }

        const Rect2i& bb = inst.boundingBox;
        if (inst.mask.size() != static_cast<size_t>(bb.Area())) {
            throw InvalidArgumentException(
                "ReduceLabels: instance " + std::to_string(inst.id) + " has no fragment mask");
        }

        std::vector<float> dist = Internal::BorderedL2Distance(inst.mask.data(), bb.width, bb.height);
        float maxDist = 0.0f;
        for (float d : dist) {
            maxDist = std::max(maxDist, d);
        }
        if (maxDist <= 0.0f) continue;

        for (int32_t y = 0; y < bb.height; ++y) {
            int32_t* dst = reduced.Row<int32_t>(bb.y + y);
            for (int32_t x = 0; x < bb.width; ++x) {
                size_t idx = static_cast<size_t>(y) * bb.width + x;
                if (inst.mask[idx] == 0) continue;

                double d = static_cast<double>(dist[idx]) / maxDist;
                int32_t& out = dst[bb.x + x];
                if (d >= minFgDist) {
                    out = classOf[i];
                } else if (d <= maxBgDist) {
                    out = 0;
                } else {
                    out = IGNORE_LABEL;
                }
            }
        }
    }

    return reduced;
}

} // namespace Cpn::Vision::Contour
