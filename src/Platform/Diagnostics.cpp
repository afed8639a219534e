/**
 * @file Diagnostics.cpp
 * @brief Environment-gated stderr diagnostics
 */

#include <CpnVision/Platform/Diagnostics.h>

#include <atomic>
#include <cstdarg>
#include <cstdlib>
#include <mutex>

namespace Cpn::Vision::Platform {

namespace {

// -1 = not read yet, 0 = off, 1 = on
std::atomic<int> g_diagnosticsState{-1};
std::mutex g_printMutex;

int ReadEnvironmentSwitch() {
    const char* env = std::getenv("CPNVISION_DIAGNOSTICS");
    if (env == nullptr || env[0] == '\0' || env[0] == '0') {
        return 0;
    }
    return 1;
}

} // namespace

bool IsDiagnosticsEnabled() {
    int state = g_diagnosticsState.load(std::memory_order_relaxed);
    if (state < 0) {
        state = ReadEnvironmentSwitch();
        g_diagnosticsState.store(state, std::memory_order_relaxed);
    }
    return state != 0;
}

void SetDiagnosticsEnabled(bool enabled) {
    g_diagnosticsState.store(enabled ? 1 : 0, std::memory_order_relaxed);
}

void PrintDiagnostic(const char* module, const char* format, ...) {
    std::lock_guard<std::mutex> lock(g_printMutex);
    std::fprintf(stderr, "[%s] ", module);

    va_list args;
    va_start(args, format);
    std::vfprintf(stderr, format, args);
    va_end(args);

    std::fputc('\n', stderr);
}

} // namespace Cpn::Vision::Platform
