#pragma once

/**
 * @file CpnVision.h
 * @brief Main header file for CpnVision library
 *
 * CpnVision converts instance label maps into Fourier contour targets and
 * decodes dense contour proposal network outputs into refined contours.
 *
 * @version 0.1.0
 */

// Configuration and export macros
#include <CpnVision/CpnVisionConfig.h>

// Core types and utilities
#include <CpnVision/Core/Constants.h>
#include <CpnVision/Core/Exception.h>
#include <CpnVision/Core/Export.h>
#include <CpnVision/Core/Types.h>

// Core data structures
#include <CpnVision/Core/QContour.h>
#include <CpnVision/Core/QImage.h>

// Platform abstraction
#include <CpnVision/Platform/Diagnostics.h>
#include <CpnVision/Platform/Random.h>
#include <CpnVision/Platform/Thread.h>
#include <CpnVision/Platform/Timer.h>

// Feature modules
#include <CpnVision/Contour/ContourExtractor.h>
#include <CpnVision/Detection/ContourDetector.h>
#include <CpnVision/Detection/ContourNMS.h>
#include <CpnVision/Detection/ProposalDecoder.h>
#include <CpnVision/Detection/Refinement.h>
#include <CpnVision/Fourier/ContourSampler.h>
#include <CpnVision/Fourier/FourierDescriptor.h>
#include <CpnVision/Inference/Inference.h>
#include <CpnVision/Targets/CpnConfig.h>
#include <CpnVision/Targets/TargetGenerator.h>

#ifdef CPNVISION_HAS_STB
#include <CpnVision/IO/ImageIO.h>
#endif

namespace Cpn::Vision {

/**
 * @brief Get library version string
 * @return Version string in format "major.minor.patch"
 */
inline const char* GetVersion() {
    return CPNVISION_VERSION_STRING;
}

/**
 * @brief Get library version as integers
 */
inline void GetVersion(int& major, int& minor, int& patch) {
    major = CPNVISION_VERSION_MAJOR;
    minor = CPNVISION_VERSION_MINOR;
    patch = CPNVISION_VERSION_PATCH;
}

} // namespace Cpn::Vision
