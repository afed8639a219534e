#include <CpnVision/Internal/ConnectedComponent.h>

#include <algorithm>
#include <limits>

namespace Cpn::Vision::Internal {

// =============================================================================
// Union-Find Data Structure
// =============================================================================

namespace {

class UnionFind {
public:
    int32_t Add() {
        int32_t id = static_cast<int32_t>(parent_.size());
        parent_.push_back(id);
        rank_.push_back(0);
        return id;
    }

    int32_t Find(int32_t x) {
        while (parent_[x] != x) {
            parent_[x] = parent_[parent_[x]];  // Path halving
            x = parent_[x];
        }
        return x;
    }

    void Union(int32_t x, int32_t y) {
        int32_t px = Find(x);
        int32_t py = Find(y);
        if (px == py) return;

        if (rank_[px] < rank_[py]) {
            parent_[px] = py;
        } else if (rank_[px] > rank_[py]) {
            parent_[py] = px;
        } else {
            parent_[py] = px;
            rank_[px]++;
        }
    }

    size_t Size() const { return parent_.size(); }

private:
    std::vector<int32_t> parent_;
    std::vector<int32_t> rank_;
};

} // anonymous namespace

// =============================================================================
// Labeling
// =============================================================================

int32_t LabelComponents(const uint8_t* mask, int32_t width, int32_t height,
                        Connectivity connectivity, std::vector<int32_t>& labels) {
    labels.assign(static_cast<size_t>(std::max(width, 0)) * std::max(height, 0), -1);
    if (width <= 0 || height <= 0) {
        return 0;
    }

    const bool eight = (connectivity == Connectivity::Eight);
    UnionFind uf;

    // First pass: provisional labels (0-based, -1 = background)
    for (int32_t r = 0; r < height; ++r) {
        for (int32_t c = 0; c < width; ++c) {
            size_t idx = static_cast<size_t>(r) * width + c;
            if (mask[idx] == 0) continue;

            int32_t neighbors[4];
            int count = 0;
            if (c > 0 && labels[idx - 1] >= 0) neighbors[count++] = labels[idx - 1];
            if (r > 0) {
                size_t up = idx - width;
                if (labels[up] >= 0) neighbors[count++] = labels[up];
                if (eight) {
                    if (c > 0 && labels[up - 1] >= 0) neighbors[count++] = labels[up - 1];
                    if (c + 1 < width && labels[up + 1] >= 0) neighbors[count++] = labels[up + 1];
                }
            }

            if (count == 0) {
                labels[idx] = uf.Add();
            } else {
                int32_t minLabel = neighbors[0];
                for (int i = 1; i < count; ++i) {
                    minLabel = std::min(minLabel, neighbors[i]);
                }
                labels[idx] = minLabel;
                for (int i = 0; i < count; ++i) {
                    uf.Union(minLabel, neighbors[i]);
                }
            }
        }
    }

    // Second pass: resolve roots and renumber by first raster encounter
    std::vector<int32_t> remap(uf.Size(), 0);
    int32_t numLabels = 0;
    for (auto& label : labels) {
        if (label < 0) {
            label = 0;
            continue;
        }
        int32_t root = uf.Find(label);
        if (remap[root] == 0) {
            remap[root] = ++numLabels;
        }
        label = remap[root];
    }
    return numLabels;
}

std::vector<ComponentStats> GetComponentStats(const std::vector<int32_t>& labels,
                                              int32_t width, int32_t height,
                                              int32_t numLabels) {
    std::vector<ComponentStats> stats(std::max(numLabels, 0));
    std::vector<int32_t> maxX(stats.size(), std::numeric_limits<int32_t>::min());
    std::vector<int32_t> maxY(stats.size(), std::numeric_limits<int32_t>::min());

    for (int32_t r = 0; r < height; ++r) {
        for (int32_t c = 0; c < width; ++c) {
            int32_t label = labels[static_cast<size_t>(r) * width + c];
            if (label <= 0) continue;

            auto& s = stats[label - 1];
            if (s.area == 0) {
                s.label = label;
                s.firstPixel = {c, r};
                s.bbox = Rect2i(c, r, 0, 0);
            }
            s.area++;
            s.bbox.x = std::min(s.bbox.x, c);
            maxX[label - 1] = std::max(maxX[label - 1], c);
            maxY[label - 1] = std::max(maxY[label - 1], r);
        }
    }

    for (size_t i = 0; i < stats.size(); ++i) {
        if (stats[i].area == 0) continue;
        stats[i].bbox.width = maxX[i] - stats[i].bbox.x + 1;
        stats[i].bbox.height = maxY[i] - stats[i].bbox.y + 1;
    }
    return stats;
}

int32_t LargestComponent(const std::vector<ComponentStats>& stats) {
    int32_t best = -1;
    for (size_t i = 0; i < stats.size(); ++i) {
        if (best < 0 || stats[i].area > stats[best].area) {
            best = static_cast<int32_t>(i);
        }
    }
    return best;
}

} // namespace Cpn::Vision::Internal
