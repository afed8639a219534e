#pragma once

/**
 * @file Diagnostics.h
 * @brief Opt-in diagnostic lines on stderr
 *
 * Output is enabled by setting the environment variable
 * CPNVISION_DIAGNOSTICS to a value other than "" or "0". The variable is
 * read once per process. Lines have the form "[Module] message".
 *
 * @code
 * CPNVISION_DIAG("TargetGenerator", "dropped instance %d (area=%lld)", id, area);
 * @endcode
 */

#include <CpnVision/Core/Export.h>

#include <cstdio>

namespace Cpn::Vision::Platform {

/**
 * @brief True when CPNVISION_DIAGNOSTICS is set and not "0"
 */
CPNVISION_API bool IsDiagnosticsEnabled();

/**
 * @brief Override the environment switch (tests, embedding applications)
 */
CPNVISION_API void SetDiagnosticsEnabled(bool enabled);

/**
 * @brief printf-style line "[module] ..." on stderr, unconditionally
 */
CPNVISION_API void PrintDiagnostic(const char* module, const char* format, ...)
#if defined(__GNUC__) || defined(__clang__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;

} // namespace Cpn::Vision::Platform

#define CPNVISION_DIAG(module, ...)                                         \
    do {                                                                    \
        if (::Cpn::Vision::Platform::IsDiagnosticsEnabled()) {              \
            ::Cpn::Vision::Platform::PrintDiagnostic(module, __VA_ARGS__);  \
        }                                                                   \
    } while (0)
