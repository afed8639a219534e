#pragma once

/**
 * @file Timer.h
 * @brief Per-stage wall clock timings for diagnostics output
 *
 * Usage:
 * @code
 * StageTimer timer;
 * auto proposals = decoder.Decode(output);
 * timer.Mark("decode");
 * proposals = SuppressProposals(std::move(proposals), params);
 * timer.Mark("nms");
 * CPNVISION_DIAG("Detector", "%s", timer.Summary().c_str());
 * @endcode
 */

#include <chrono>
#include <string>
#include <utility>
#include <vector>

#include <CpnVision/Core/Export.h>

namespace Cpn::Vision::Platform {

class CPNVISION_API StageTimer {
public:
    using Clock = std::chrono::steady_clock;
    using Stage = std::pair<std::string, double>;

    StageTimer();

    /**
     * @brief Close the current stage under @p name
     * @return Milliseconds since construction, Restart() or the previous Mark()
     */
    double Mark(const std::string& name);

    /// Drop recorded stages and start timing from now
    void Restart();

    /// Milliseconds since the last Mark() (or start)
    double SinceMarkMs() const;

    /// Sum of recorded stages
    double TotalMs() const;

    const std::vector<Stage>& Stages() const { return stages_; }

    /// "decode 0.12 ms, nms 0.40 ms (total 0.52 ms)"
    std::string Summary() const;

private:
    Clock::time_point mark_;
    std::vector<Stage> stages_;
};

} // namespace Cpn::Vision::Platform
