#pragma once

#include <CpnVision/Core/Export.h>

/**
 * @file ImageIO.h
 * @brief Label map and image file I/O (PNG via stb_image)
 *
 * Label maps are stored as:
 * - 8-bit gray PNG when every id is <= 255
 * - RGB PNG with id = R + 256 * G + 65536 * B otherwise (ids < 2^24)
 *
 * 16-bit gray PNGs are read as UInt16 label maps.
 */

#include <CpnVision/Core/QImage.h>

#include <string>

namespace Cpn::Vision::IO {

/**
 * @brief Read a label map
 *
 * @return UInt8 (8-bit gray), UInt16 (16-bit gray) or Int32 (RGB-encoded) image
 * @throws IOException if the file cannot be read
 */
CPNVISION_API QImage ReadLabelMap(const std::string& path);

/**
 * @brief Write a label map as PNG
 *
 * @throws InvalidArgumentException for negative ids or ids >= 2^24
 * @throws IOException if the file cannot be written
 */
CPNVISION_API void WriteLabelMap(const std::string& path, const QImage& labels);

/**
 * @brief Read an 8-bit image (gray or RGB; alpha is dropped)
 * @throws IOException if the file cannot be read
 */
CPNVISION_API QImage ReadImage(const std::string& path);

} // namespace Cpn::Vision::IO
