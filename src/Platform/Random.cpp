/**
 * @file Random.cpp
 * @brief Seeded sampling stream
 */

#include <CpnVision/Platform/Random.h>

#include <algorithm>

namespace Cpn::Vision::Platform {

Random::Random(uint64_t seed) : seed_(seed), engine_(seed) {}

double Random::Unit() {
    constexpr double kInv53 = 1.0 / 9007199254740992.0;  // 2^-53
    return static_cast<double>(engine_() >> 11) * kInv53;
}

std::vector<double> Random::SortedUnitSamples(size_t count) {
    std::vector<double> values;
    values.reserve(count);
    while (values.size() < count) {
        values.push_back(Unit());
    }
    std::sort(values.begin(), values.end());
    return values;
}

} // namespace Cpn::Vision::Platform
