/**
 * @file Timer.cpp
 * @brief Stage timer implementation
 */

#include <CpnVision/Platform/Timer.h>

#include <cstdio>

namespace Cpn::Vision::Platform {

namespace {

double MillisBetween(StageTimer::Clock::time_point from, StageTimer::Clock::time_point to) {
    return std::chrono::duration<double, std::milli>(to - from).count();
}

} // anonymous namespace

StageTimer::StageTimer() : mark_(Clock::now()) {}

double StageTimer::Mark(const std::string& name) {
    const Clock::time_point now = Clock::now();
    const double ms = MillisBetween(mark_, now);
    stages_.emplace_back(name, ms);
    mark_ = now;
    return ms;
}

void StageTimer::Restart() {
    stages_.clear();
    mark_ = Clock::now();
}

double StageTimer::SinceMarkMs() const {
    return MillisBetween(mark_, Clock::now());
}

double StageTimer::TotalMs() const {
    double total = 0.0;
    for (const Stage& s : stages_) {
        total += s.second;
    }
    return total;
}

std::string StageTimer::Summary() const {
    std::string text;
    char buf[64];
    for (const Stage& s : stages_) {
        if (!text.empty()) {
            text += ", ";
        }
        std::snprintf(buf, sizeof(buf), " %.2f ms", s.second);
        text += s.first + buf;
    }
    std::snprintf(buf, sizeof(buf), "(total %.2f ms)", TotalMs());
    if (!text.empty()) {
        text += ' ';
    }
    return text + buf;
}

} // namespace Cpn::Vision::Platform
