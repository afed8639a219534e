#pragma once

/**
 * @file Random.h
 * @brief Seeded random sampling parameters
 *
 * Random contour sampling draws its parameters from here, so a given seed
 * yields the same sampling on every platform and thread.
 */

#include <CpnVision/Core/Export.h>

#include <cstdint>
#include <cstddef>
#include <random>
#include <vector>

namespace Cpn::Vision::Platform {

/**
 * @brief Deterministic MT19937-64 stream of unit-interval values
 */
class CPNVISION_API Random {
public:
    explicit Random(uint64_t seed);

    uint64_t Seed() const { return seed_; }

    /**
     * @brief Next value in [0, 1)
     *
     * Uses the top 53 bits of the raw engine output, so the value does not
     * depend on the standard library's distribution implementations.
     */
    double Unit();

    /**
     * @brief count values in [0, 1), sorted ascending
     */
    std::vector<double> SortedUnitSamples(size_t count);

private:
    uint64_t seed_;
    std::mt19937_64 engine_;
};

} // namespace Cpn::Vision::Platform
