/**
 * @file cpn_detect.cpp
 * @brief Example: contour detection from dense network outputs
 *
 * Usage:
 *   cpn_detect                      synthetic outputs built from label targets
 *   cpn_detect model.onnx image.png run an ONNX contour proposal network
 *
 * The synthetic mode writes each target descriptor into the output cell at
 * its location and into the four neighbouring cells with a lower score, so
 * NMS has duplicates to remove.
 */

#include <CpnVision/CpnVision.h>

#include <cmath>
#include <cstdio>

using namespace Cpn::Vision;

static QImage CreateSyntheticLabels() {
    QImage labels(96, 96, PixelType::Int32);
    const Point2d centers[3] = {{25, 25}, {65, 30}, {45, 70}};
    const double radii[3] = {14, 10, 18};
    for (int32_t y = 0; y < labels.Height(); ++y) {
        int32_t* row = labels.Row<int32_t>(y);
        for (int32_t x = 0; x < labels.Width(); ++x) {
            for (int i = 0; i < 3; ++i) {
                if (Point2d(x, y).DistanceTo(centers[i]) <= radii[i]) {
                    row[x] = i + 1;
                }
            }
        }
    }
    return labels;
}

static Detection::DenseOutput CreateDenseOutput(const Targets::TargetBundle& bundle,
                                                const CpnConfig& config, int64_t width,
                                                int64_t height) {
    Detection::DenseOutput out;
    out.scores = Inference::Tensor("scores", {1, 1, height, width});
    out.fourier = Inference::Tensor("fourier", {1, config.FourierChannels(), height, width});
    const int64_t plane = width * height;

    const int dx[5] = {0, 1, -1, 0, 0};
    const int dy[5] = {0, 0, 0, 1, -1};
    for (const auto& target : bundle.instances) {
        auto channels = target.descriptor.ToChannels(config.fourierLayout);
        int64_t cx = std::lround(target.location.x);
        int64_t cy = std::lround(target.location.y);
        for (int n = 0; n < 5; ++n) {
            int64_t x = cx + dx[n];
            int64_t y = cy + dy[n];
            if (x < 0 || y < 0 || x >= width || y >= height) continue;
            const int64_t cell = y * width + x;
            out.scores.data[cell] = (n == 0) ? 0.99f : 0.95f;
            for (size_t c = 0; c < channels.size(); ++c) {
                out.fourier.data[c * plane + cell] = static_cast<float>(channels[c]);
            }
        }
    }
    return out;
}

static void PrintDetections(const std::vector<Detection::Detection>& detections) {
    std::printf("%zu detections\n", detections.size());
    for (const auto& d : detections) {
        std::printf("  class %d  score %.3f  location (%.1f, %.1f)  area %.1f\n", d.classId,
                    d.score, d.location.x, d.location.y, d.contour.Area());
    }
}

int main(int argc, char* argv[]) {
    CpnConfig config;
    config.order = 6;
    config.samples = 48;

    try {
        if (argc > 2) {
#ifdef CPNVISION_HAS_STB
            QImage image = IO::ReadImage(argv[2]);
            Detection::ContourProposalNetwork network(config);
            if (!network.Load(argv[1])) {
                std::fprintf(stderr, "Failed to load model %s\n", argv[1]);
                return 1;
            }
            PrintDetections(network.Detect(image));
            return 0;
#else
            std::fprintf(stderr, "Built without stb: cannot read %s\n", argv[2]);
            return 1;
#endif
        }

        QImage labels = CreateSyntheticLabels();
        Targets::TargetGenerator generator(config);
        Targets::TargetBundle bundle = generator.Generate(labels);
        std::printf("%zu targets\n", bundle.Size());

        Detection::DenseOutput output =
            CreateDenseOutput(bundle, config, labels.Width(), labels.Height());

        Detection::ContourDetector detector(config);
        Platform::StageTimer timer;
        auto detections = detector.Detect(output);
        std::printf("Detect: %.2f ms\n", timer.Mark("detect"));
        PrintDetections(detections);
    } catch (const Exception& e) {
        std::fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }
    return 0;
}
