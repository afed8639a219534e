/**
 * @file cpn_targets.cpp
 * @brief Example: training targets of an instance label map
 *
 * Usage: cpn_targets [labels.png] [order] [samples]
 *
 * Without a file a synthetic label map with a disk, a rectangle and a
 * partial instance at the border is used.
 */

#include <CpnVision/CpnVision.h>

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <string>

using namespace Cpn::Vision;

static QImage CreateSyntheticLabels() {
    QImage labels(128, 96, PixelType::Int32);
    for (int32_t y = 0; y < labels.Height(); ++y) {
        int32_t* row = labels.Row<int32_t>(y);
        for (int32_t x = 0; x < labels.Width(); ++x) {
            double dx = x - 40.0;
            double dy = y - 40.0;
            if (dx * dx + dy * dy <= 20.0 * 20.0) {
                row[x] = 1;
            } else if (x >= 75 && x < 115 && y >= 50 && y < 80) {
                row[x] = 2;
            } else if (x < 10 && y >= 70) {
                row[x] = 3;
            }
        }
    }
    return labels;
}

int main(int argc, char* argv[]) {
    CpnConfig config;
    config.order = (argc > 2) ? std::atoi(argv[2]) : 8;
    config.samples = (argc > 3) ? std::atoi(argv[3]) : 32;
    config.normalizePhase = true;
    config.removePartials = true;

    try {
        QImage labels;
        if (argc > 1) {
#ifdef CPNVISION_HAS_STB
            labels = IO::ReadLabelMap(argv[1]);
#else
            std::fprintf(stderr, "Built without stb: cannot read %s\n", argv[1]);
            return 1;
#endif
        } else {
            labels = CreateSyntheticLabels();
        }

        std::printf("CpnVision %s\n", GetVersion());
        std::printf("Config: %s\n", config.ToString().c_str());
        std::printf("Label map: %dx%d\n\n", labels.Width(), labels.Height());

        Targets::TargetGenerator generator(config);
        Platform::StageTimer timer;
        Targets::TargetBundle bundle = generator.Generate(labels);
        double ms = timer.Mark("generate");

        std::printf("%zu instances, %d dropped (%.2f ms)\n", bundle.Size(),
                    bundle.droppedInstances, ms);
        for (const auto& target : bundle.instances) {
            std::printf("  id %3d  class %d  area %6lld  location (%.2f, %.2f)%s\n",
                        target.instanceId, target.classId,
                        static_cast<long long>(target.area),
                        target.location.x, target.location.y,
                        target.fragmented ? "  fragmented" : "");

            auto e = target.descriptor.Elliptic(1);
            std::printf("         c1: a=%.2f b=%.2f c=%.2f d=%.2f\n", e[0], e[1], e[2], e[3]);

            // Reconstruction error of the descriptor on the sampled contour
            auto decoded = Fourier::EvaluateDescriptor(target.descriptor, target.location,
                                                       bundle.sampling);
            double maxErr = 0.0;
            for (size_t m = 0; m < decoded.size(); ++m) {
                maxErr = std::max(maxErr, decoded[m].DistanceTo(target.sampledContour[m]));
            }
            std::printf("         max sample error %.3f px\n", maxErr);
        }

        int64_t ignored = 0;
        for (int32_t y = 0; y < bundle.reducedLabels.Height(); ++y) {
            const int32_t* row = bundle.reducedLabels.Row<int32_t>(y);
            for (int32_t x = 0; x < bundle.reducedLabels.Width(); ++x) {
                ignored += (row[x] == IGNORE_LABEL) ? 1 : 0;
            }
        }
        std::printf("\nReduced labels: %lld ignored pixels\n", static_cast<long long>(ignored));
    } catch (const Exception& e) {
        std::fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }
    return 0;
}
