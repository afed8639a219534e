#pragma once

/**
 * @file Validate.h
 * @brief Argument, image and configuration checks
 *
 * Messages read "<func>: <param> must be ..., got ...". RequireImageValid
 * treats an empty image as "nothing to do" and returns false.
 */

#include <CpnVision/Core/Export.h>
#include <CpnVision/Core/Exception.h>
#include <CpnVision/Core/QImage.h>

#include <cstdio>
#include <string>

namespace Cpn::Vision::Validate {

// =============================================================================
// Internal Formatting
// =============================================================================

namespace Detail {

// Format double with limited precision (avoid long tails)
inline std::string FormatValue(double val) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.4g", val);
    return buf;
}

inline std::string FormatValue(float val) {
    return FormatValue(static_cast<double>(val));
}

inline std::string FormatValue(int val) {
    return std::to_string(val);
}

inline std::string FormatValue(int64_t val) {
    return std::to_string(val);
}

inline std::string FormatValue(size_t val) {
    return std::to_string(val);
}

inline const char* PixelTypeName(PixelType type) {
    switch (type) {
        case PixelType::UInt8:   return "UInt8";
        case PixelType::UInt16:  return "UInt16";
        case PixelType::Int32:   return "Int32";
        case PixelType::Float32: return "Float32";
        default:                 return "Unknown";
    }
}

template<typename T>
std::string RangeMessage(const char* funcName, const char* paramName,
                         T value, T minVal, T maxVal) {
    return std::string(funcName) + ": " + paramName + " must be in [" +
           FormatValue(minVal) + ", " + FormatValue(maxVal) +
           "], got " + FormatValue(value);
}

template<typename T>
std::string PositiveMessage(const char* funcName, const char* paramName, T value) {
    return std::string(funcName) + ": " + paramName + " must be > 0, got " +
           FormatValue(value);
}

} // namespace Detail

// =============================================================================
// Image Validation
// =============================================================================

/**
 * @brief Check image is allocated and valid (no type restriction)
 *
 * @return false if empty (caller should return empty result)
 * @throws InvalidArgumentException if image is invalid (corrupted)
 */
inline bool RequireImageValid(const QImage& image, const char* funcName) {
    if (image.Empty()) {
        return false;
    }
    if (!image.IsValid()) {
        throw InvalidArgumentException(std::string(funcName) + ": image is invalid");
    }
    return true;
}

/**
 * @brief Check image is non-empty and valid (throws on empty)
 */
inline void RequireImageNonEmpty(const QImage& image, const char* funcName) {
    if (image.Empty()) {
        throw InvalidArgumentException(std::string(funcName) + ": image is empty");
    }
    if (!image.IsValid()) {
        throw InvalidArgumentException(std::string(funcName) + ": image is invalid");
    }
}

/**
 * @brief Check image has specific pixel type
 * @throws UnsupportedException if type mismatch
 */
inline void RequireImageType(const QImage& image, PixelType expected, const char* funcName) {
    if (image.Type() != expected) {
        throw UnsupportedException(
            std::string(funcName) + ": expected " + Detail::PixelTypeName(expected) +
            " image, got " + Detail::PixelTypeName(image.Type()));
    }
}

/**
 * @brief Check image is a non-empty single-channel integer label image
 *
 * Accepts UInt8, UInt16 and Int32 pixel types.
 *
 * @throws InvalidArgumentException if empty, multi-channel or Float32
 */
inline void RequireLabelImage(const QImage& image, const char* funcName) {
    RequireImageNonEmpty(image, funcName);
    if (image.Channels() != 1) {
        throw InvalidArgumentException(
            std::string(funcName) + ": label map must have 1 channel, got " +
            std::to_string(image.Channels()));
    }
    if (image.Type() == PixelType::Float32) {
        throw InvalidArgumentException(
            std::string(funcName) + ": label map must have an integer pixel type, got Float32");
    }
}

/**
 * @brief Check a single-channel Float32 image (score maps)
 * @return false if empty
 */
inline bool RequireImageFloatGray(const QImage& image, const char* funcName) {
    if (!RequireImageValid(image, funcName)) return false;
    RequireImageType(image, PixelType::Float32, funcName);
    if (image.Channels() != 1) {
        throw UnsupportedException(
            std::string(funcName) + ": expected 1 channel, got " +
            std::to_string(image.Channels()));
    }
    return true;
}

// =============================================================================
// Value Validation
// =============================================================================
//
// Argument checks throw InvalidArgumentException; the RequireConfig* forms
// throw InvalidConfigurationException with the same message.

template<typename Error = InvalidArgumentException, typename T>
inline void RequireRange(T value, T minVal, T maxVal,
                         const char* paramName, const char* funcName) {
    if (!(value >= minVal && value <= maxVal)) {
        throw Error(Detail::RangeMessage(funcName, paramName, value, minVal, maxVal));
    }
}

template<typename Error = InvalidArgumentException, typename T>
inline void RequirePositive(T value, const char* paramName, const char* funcName) {
    if (!(value > T(0))) {
        throw Error(Detail::PositiveMessage(funcName, paramName, value));
    }
}

template<typename Error = InvalidArgumentException, typename T>
inline void RequireMin(T value, T minVal, const char* paramName, const char* funcName) {
    if (!(value >= minVal)) {
        throw Error(std::string(funcName) + ": " + paramName + " must be >= " +
                    Detail::FormatValue(minVal) + ", got " + Detail::FormatValue(value));
    }
}

template<typename Error = InvalidArgumentException, typename T>
inline void RequireNonNegative(T value, const char* paramName, const char* funcName) {
    RequireMin<Error>(value, T(0), paramName, funcName);
}

template<typename T>
inline void RequireConfigRange(T value, T minVal, T maxVal,
                               const char* paramName, const char* funcName) {
    RequireRange<InvalidConfigurationException>(value, minVal, maxVal, paramName, funcName);
}

template<typename T>
inline void RequireConfigPositive(T value, const char* paramName, const char* funcName) {
    RequirePositive<InvalidConfigurationException>(value, paramName, funcName);
}

template<typename T>
inline void RequireConfigNonNegative(T value, const char* paramName, const char* funcName) {
    RequireNonNegative<InvalidConfigurationException>(value, paramName, funcName);
}

// =============================================================================
// Convenience Macros
// =============================================================================

/// Early `return {}` for an empty image
#define CPNVISION_REQUIRE_IMAGE(img) \
    if (!::Cpn::Vision::Validate::RequireImageValid(img, __func__)) return {}

#define CPNVISION_REQUIRE_POSITIVE(val) \
    ::Cpn::Vision::Validate::RequirePositive(val, #val, __func__)

#define CPNVISION_REQUIRE_NON_NEGATIVE(val) \
    ::Cpn::Vision::Validate::RequireNonNegative(val, #val, __func__)

} // namespace Cpn::Vision::Validate
