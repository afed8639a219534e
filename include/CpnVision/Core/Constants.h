#pragma once

/**
 * @file Constants.h
 * @brief Numeric constants shared across CpnVision
 */

#include <cstdint>

namespace Cpn::Vision {

constexpr double PI = 3.14159265358979323846;
constexpr double TWO_PI = 2.0 * PI;
constexpr double HALF_PI = 0.5 * PI;

/// Tolerance for geometric degeneracy tests (lengths, areas)
constexpr double EPSILON = 1e-9;

/// Label value marking pixels excluded from dense supervision
constexpr int32_t IGNORE_LABEL = -1;

} // namespace Cpn::Vision
