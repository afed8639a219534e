#pragma once

#include <CpnVision/Core/Export.h>

/**
 * @file Exception.h
 * @brief Exception classes for CpnVision
 *
 * Configuration and shape-contract violations abort the operation that
 * detects them. Per-instance degeneracies inside the target generator are
 * absorbed and never surface as exceptions.
 */

#include <stdexcept>
#include <string>

namespace Cpn::Vision {

/**
 * @brief Base exception class for CpnVision
 */
class CPNVISION_API Exception : public std::runtime_error {
public:
    explicit Exception(const std::string& message)
        : std::runtime_error(message) {}

    explicit Exception(const char* message)
        : std::runtime_error(message) {}
};

/**
 * @brief Invalid argument exception
 */
class CPNVISION_API InvalidArgumentException : public Exception {
public:
    explicit InvalidArgumentException(const std::string& message)
        : Exception("Invalid argument: " + message) {}
};

/**
 * @brief Configuration record failed validation
 *
 * Raised once, when a generator/decoder/detector is constructed.
 */
class CPNVISION_API InvalidConfigurationException : public Exception {
public:
    explicit InvalidConfigurationException(const std::string& message)
        : Exception("Invalid configuration: " + message) {}
};

/**
 * @brief Tensor/image/descriptor dimensions disagree with the configuration
 */
class CPNVISION_API ShapeMismatchException : public Exception {
public:
    explicit ShapeMismatchException(const std::string& message)
        : Exception("Shape mismatch: " + message) {}
};

/**
 * @brief Out of range exception
 */
class CPNVISION_API OutOfRangeException : public Exception {
public:
    explicit OutOfRangeException(const std::string& message)
        : Exception("Out of range: " + message) {}
};

/**
 * @brief Insufficient data for algorithm (e.g., fewer than 3 contour points)
 */
class CPNVISION_API InsufficientDataException : public Exception {
public:
    explicit InsufficientDataException(const std::string& message)
        : Exception("Insufficient data: " + message) {}
};

/**
 * @brief File I/O exception
 */
class CPNVISION_API IOException : public Exception {
public:
    explicit IOException(const std::string& message)
        : Exception("I/O error: " + message) {}
};

/**
 * @brief Unsupported operation or format
 */
class CPNVISION_API UnsupportedException : public Exception {
public:
    explicit UnsupportedException(const std::string& message)
        : Exception("Unsupported: " + message) {}
};

} // namespace Cpn::Vision
