#pragma once

#include <CpnVision/Core/Export.h>

/**
 * @file CpnConfig.h
 * @brief Typed configuration shared by target generation and detection
 *
 * @code
 * CpnConfig config = CpnConfig::Default();
 * config.order = 12;
 * config.samples = 64;
 * Targets::TargetGenerator generator(config);   // validates once
 * @endcode
 */

#include <CpnVision/Core/Types.h>
#include <CpnVision/Fourier/FourierDescriptor.h>
#include <CpnVision/Internal/NonMaxSuppression.h>

#include <cstdint>
#include <string>

namespace Cpn::Vision {

/**
 * @brief Contour proposal configuration
 */
struct CPNVISION_API CpnConfig {
    // Shape representation
    int32_t order = 8;                  ///< Fourier harmonics per contour
    int32_t samples = 32;               ///< Points per sampled contour
    Fourier::FourierLayout fourierLayout = Fourier::FourierLayout::Complex;
    bool normalizePhase = false;        ///< Start contours at the major axis
    bool randomSampling = false;        ///< Random instead of uniform parameters
    uint64_t samplingSeed = 0;          ///< Seed for random sampling

    // Targets
    double minFgDist = 0.75;            ///< Normalized distance for foreground
    double maxBgDist = 0.5;             ///< Normalized distance for background
    int64_t minInstanceArea = 3;        ///< Smaller instances are dropped
    bool removePartials = false;        ///< Drop instances touching the border
    Size2i inputSize{0, 0};             ///< Expected label map size ({0, 0} = any)

    // Detection
    double scoreThresh = 0.9;           ///< Cells with score > thresh become proposals
    double nmsThresh = 0.3;             ///< Suppress when IoU > thresh
    bool nmsPerClass = true;            ///< NMS within classes only
    /// Greedy (default) or Fast; only Fast is monotone in nmsThresh
    Internal::NmsMode nmsMode = Internal::NmsMode::Greedy;
    int32_t stride = 1;                 ///< Image pixels per output cell

    // Refinement
    int32_t refinementIterations = 4;   ///< Passes (0 = no refinement)
    int32_t refinementBuckets = 6;      ///< Angular buckets
    double refinementMargin = 3.0;      ///< Maximum displacement per pass (pixels)

    /// Defaults
    static CpnConfig Default() { return CpnConfig(); }

    /**
     * @brief Check every field
     * @throws InvalidConfigurationException naming the first offending field
     */
    void Validate() const;

    /// Number of dense fourier channels (4 * order)
    int32_t FourierChannels() const { return 4 * order; }

    /// One-line summary for diagnostics
    std::string ToString() const;
};

} // namespace Cpn::Vision
