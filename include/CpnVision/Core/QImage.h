#pragma once

/**
 * @file QImage.h
 * @brief Image container for label maps, reduced labels and score maps
 *
 * Rows are contiguous (Stride() == Width() * BytesPerPixel()). Copies share
 * pixel storage; Clone() duplicates it.
 *
 * @code
 * QImage labels(640, 480, PixelType::Int32);     // zero = background
 * labels.Row<int32_t>(y)[x] = 7;                 // instance 7
 * int32_t id = labels.LabelAt(x, y);
 * @endcode
 */

#include <CpnVision/Core/Types.h>

#include <memory>

namespace Cpn::Vision {

class CPNVISION_API QImage {
public:
    /// Empty image
    QImage();

    /**
     * @brief Zero-filled image
     * @throws InvalidArgumentException if width or height is not positive
     */
    QImage(int32_t width, int32_t height,
           PixelType type = PixelType::UInt8,
           ChannelType channels = ChannelType::Gray);

    QImage(const QImage& other);
    QImage(QImage&& other) noexcept;
    ~QImage();
    QImage& operator=(const QImage& other);
    QImage& operator=(QImage&& other) noexcept;

    /**
     * @brief Copy of tightly packed row-major pixels
     * @throws InvalidArgumentException if data is null
     */
    static QImage FromData(const void* data, int32_t width, int32_t height,
                           PixelType type = PixelType::UInt8,
                           ChannelType channels = ChannelType::Gray);

    int32_t Width() const;
    int32_t Height() const;
    Size2i Size() const { return {Width(), Height()}; }
    int Channels() const;
    PixelType Type() const;

    size_t BytesPerPixel() const;
    size_t Stride() const;

    bool Empty() const;
    /// Allocated and non-empty
    bool IsValid() const;

    const void* Data() const;

    /// Typed row access, no type check
    template<typename T>
    T* Row(int32_t y) { return reinterpret_cast<T*>(RowBytes(y)); }

    template<typename T>
    const T* Row(int32_t y) const { return reinterpret_cast<const T*>(RowBytes(y)); }

    /// UInt8 gray only (UnsupportedException otherwise)
    uint8_t At(int32_t x, int32_t y) const;
    void SetAt(int32_t x, int32_t y, uint8_t value);

    /**
     * @brief Instance id at (x, y) of a UInt8, UInt16 or Int32 gray image
     * @throws UnsupportedException for Float32 or RGB images
     */
    int32_t LabelAt(int32_t x, int32_t y) const;

    /// Value at (x, y) of any gray image
    double ValueAt(int32_t x, int32_t y) const;

    QImage Clone() const;

    /// Label image widened to Int32 (deep copy)
    QImage ToInt32() const;

private:
    uint8_t* RowBytes(int32_t y) const;

    class Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace Cpn::Vision
