#include <CpnVision/Targets/CpnConfig.h>

#include <CpnVision/Core/Validate.h>

#include <cstdio>

namespace Cpn::Vision {

void CpnConfig::Validate() const {
    const char* func = "CpnConfig";

    Validate::RequireConfigPositive(order, "order", func);
    Validate::RequireConfigPositive(samples, "samples", func);
    Validate::RequireConfigRange(minFgDist, 0.0, 1.0, "minFgDist", func);
    Validate::RequireConfigRange(maxBgDist, 0.0, 1.0, "maxBgDist", func);
    if (maxBgDist > minFgDist) {
        throw InvalidConfigurationException(
            std::string(func) + ": maxBgDist (" + Validate::Detail::FormatValue(maxBgDist) +
            ") must be <= minFgDist (" + Validate::Detail::FormatValue(minFgDist) + ")");
    }
    Validate::RequireConfigNonNegative(minInstanceArea, "minInstanceArea", func);
    if (!inputSize.IsValid()) {
        throw InvalidConfigurationException(std::string(func) + ": inputSize must be non-negative");
    }

    Validate::RequireConfigRange(scoreThresh, 0.0, 1.0, "scoreThresh", func);
    Validate::RequireConfigRange(nmsThresh, 0.0, 1.0, "nmsThresh", func);
    Validate::RequireConfigPositive(stride, "stride", func);

    Validate::RequireConfigNonNegative(refinementIterations, "refinementIterations", func);
    Validate::RequireConfigPositive(refinementBuckets, "refinementBuckets", func);
    Validate::RequireConfigNonNegative(refinementMargin, "refinementMargin", func);
}

std::string CpnConfig::ToString() const {
    char buf[256];
    std::snprintf(buf, sizeof(buf),
                  "order=%d samples=%d fg=%.3g bg=%.3g score=%.3g nms=%.3g(%s) "
                  "refine=%dx%d margin=%.3g stride=%d",
                  order, samples, minFgDist, maxBgDist, scoreThresh, nmsThresh,
                  nmsMode == Internal::NmsMode::Fast ? "fast" : "greedy",
                  refinementIterations, refinementBuckets, refinementMargin, stride);
    return buf;
}

} // namespace Cpn::Vision
