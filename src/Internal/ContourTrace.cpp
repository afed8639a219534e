#include <CpnVision/Internal/ContourTrace.h>

namespace Cpn::Vision::Internal {

namespace {

// 8-neighborhood: E, NE, N, NW, W, SW, S, SE (image y axis points down)
const int32_t dx8[8] = {1, 1, 0, -1, -1, -1, 0, 1};
const int32_t dy8[8] = {0, -1, -1, -1, 0, 1, 1, 1};

inline bool IsSet(const uint8_t* mask, int32_t width, int32_t height, int32_t x, int32_t y) {
    return x >= 0 && y >= 0 && x < width && y < height &&
           mask[static_cast<size_t>(y) * width + x] != 0;
}

} // anonymous namespace

std::vector<Point2i> TraceBoundary(const uint8_t* mask, int32_t width, int32_t height,
                                   const Point2i& start) {
    std::vector<Point2i> boundary;
    if (!IsSet(mask, width, height, start.x, start.y)) {
        return boundary;
    }
    boundary.push_back(start);

    int32_t x = start.x;
    int32_t y = start.y;
    int dir = 0;  // Entered from the west
    int firstDir = -1;
    bool atStart = true;

    // Each boundary pixel is entered at most 4 times
    const size_t maxSteps = 4 * static_cast<size_t>(width) * height + 8;

    for (size_t step = 0; step < maxSteps; ++step) {
        int searchStart = (dir + 5) % 8;  // Backtrack neighbor + 1
        int nextDir = -1;
        for (int i = 0; i < 8; ++i) {
            int checkDir = (searchStart + i) % 8;
            if (IsSet(mask, width, height, x + dx8[checkDir], y + dy8[checkDir])) {
                nextDir = checkDir;
                break;
            }
        }

        if (nextDir < 0) {
            break;  // Isolated pixel
        }

        if (firstDir < 0) {
            firstDir = nextDir;
        } else if (atStart) {
            if (nextDir == firstDir) {
                break;  // Jacob's stopping criterion
            }
            boundary.push_back(start);
        }

        x += dx8[nextDir];
        y += dy8[nextDir];
        dir = nextDir;

        atStart = (x == start.x && y == start.y);
        if (!atStart) {
            boundary.emplace_back(x, y);
        }
    }

    return boundary;
}

QContour TraceContour(const uint8_t* mask, int32_t width, int32_t height,
                      const Point2i& start, const Point2i& offset) {
    std::vector<Point2i> boundary = TraceBoundary(mask, width, height, start);

    std::vector<Point2d> points;
    points.reserve(boundary.size());
    for (const auto& p : boundary) {
        points.emplace_back(static_cast<double>(p.x + offset.x),
                            static_cast<double>(p.y + offset.y));
    }

    QContour contour(points, true);
    if (contour.SignedArea() < 0.0) {
        // Reverse direction, keep the start pixel first
        std::vector<Point2d> reversed;
        reversed.reserve(points.size());
        reversed.push_back(points[0]);
        for (size_t i = points.size() - 1; i > 0; --i) {
            reversed.push_back(points[i]);
        }
        contour.SetPoints(reversed);
    }
    return contour;
}

} // namespace Cpn::Vision::Internal
