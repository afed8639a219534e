/**
 * @file QImage.cpp
 * @brief Shared-storage image container
 */

#include <CpnVision/Core/QImage.h>
#include <CpnVision/Core/Exception.h>

#include <cstring>
#include <string>
#include <vector>

namespace Cpn::Vision {

namespace {

size_t ChannelBytes(PixelType type) {
    switch (type) {
        case PixelType::UInt8:   return 1;
        case PixelType::UInt16:  return 2;
        case PixelType::Int32:   return 4;
        case PixelType::Float32: return 4;
    }
    return 1;
}

} // anonymous namespace

class QImage::Impl {
public:
    int32_t width = 0;
    int32_t height = 0;
    PixelType type = PixelType::UInt8;
    ChannelType channels = ChannelType::Gray;
    std::vector<uint8_t> pixels;

    int NumChannels() const { return channels == ChannelType::RGB ? 3 : 1; }
    size_t PixelBytes() const { return ChannelBytes(type) * NumChannels(); }
    size_t RowBytes() const { return static_cast<size_t>(width) * PixelBytes(); }

    bool IsUInt8Gray() const {
        return type == PixelType::UInt8 && channels == ChannelType::Gray;
    }
};

// =============================================================================
// Construction
// =============================================================================

QImage::QImage() : impl_(std::make_shared<Impl>()) {}

QImage::QImage(int32_t width, int32_t height, PixelType type, ChannelType channels)
    : impl_(std::make_shared<Impl>())
{
    if (width <= 0 || height <= 0) {
        throw InvalidArgumentException("QImage: size " + std::to_string(width) + "x" +
                                       std::to_string(height) + " is not positive");
    }
    impl_->width = width;
    impl_->height = height;
    impl_->type = type;
    impl_->channels = channels;
    impl_->pixels.assign(impl_->RowBytes() * static_cast<size_t>(height), 0);
}

QImage::QImage(const QImage& other) = default;
QImage::QImage(QImage&& other) noexcept = default;
QImage::~QImage() = default;
QImage& QImage::operator=(const QImage& other) = default;
QImage& QImage::operator=(QImage&& other) noexcept = default;

QImage QImage::FromData(const void* data, int32_t width, int32_t height,
                        PixelType type, ChannelType channels) {
    if (data == nullptr) {
        throw InvalidArgumentException("QImage::FromData: data is null");
    }
    QImage img(width, height, type, channels);
    std::memcpy(img.impl_->pixels.data(), data, img.impl_->pixels.size());
    return img;
}

// =============================================================================
// Properties
// =============================================================================

int32_t QImage::Width() const { return impl_->width; }
int32_t QImage::Height() const { return impl_->height; }
int QImage::Channels() const { return impl_->NumChannels(); }
PixelType QImage::Type() const { return impl_->type; }
size_t QImage::BytesPerPixel() const { return impl_->PixelBytes(); }
size_t QImage::Stride() const { return impl_->RowBytes(); }
bool QImage::Empty() const { return impl_->width == 0 || impl_->height == 0; }
bool QImage::IsValid() const { return !Empty() && !impl_->pixels.empty(); }

const void* QImage::Data() const { return impl_->pixels.data(); }

uint8_t* QImage::RowBytes(int32_t y) const {
    return impl_->pixels.data() + static_cast<size_t>(y) * impl_->RowBytes();
}

// =============================================================================
// Pixel access
// =============================================================================

uint8_t QImage::At(int32_t x, int32_t y) const {
    if (!impl_->IsUInt8Gray()) {
        throw UnsupportedException("QImage::At: UInt8 gray images only");
    }
    return Row<uint8_t>(y)[x];
}

void QImage::SetAt(int32_t x, int32_t y, uint8_t value) {
    if (!impl_->IsUInt8Gray()) {
        throw UnsupportedException("QImage::SetAt: UInt8 gray images only");
    }
    Row<uint8_t>(y)[x] = value;
}

int32_t QImage::LabelAt(int32_t x, int32_t y) const {
    if (impl_->channels != ChannelType::Gray) {
        throw UnsupportedException("QImage::LabelAt: single-channel images only");
    }
    switch (impl_->type) {
        case PixelType::UInt8:   return Row<uint8_t>(y)[x];
        case PixelType::UInt16:  return Row<uint16_t>(y)[x];
        case PixelType::Int32:   return Row<int32_t>(y)[x];
        case PixelType::Float32: break;
    }
    throw UnsupportedException("QImage::LabelAt: Float32 images hold no labels");
}

double QImage::ValueAt(int32_t x, int32_t y) const {
    if (impl_->type == PixelType::Float32 && impl_->channels == ChannelType::Gray) {
        return Row<float>(y)[x];
    }
    return LabelAt(x, y);
}

// =============================================================================
// Copies
// =============================================================================

QImage QImage::Clone() const {
    QImage copy;
    *copy.impl_ = *impl_;
    return copy;
}

QImage QImage::ToInt32() const {
    if (Empty() || impl_->type == PixelType::Int32) {
        return Clone();
    }
    QImage result(impl_->width, impl_->height, PixelType::Int32);
    for (int32_t y = 0; y < impl_->height; ++y) {
        int32_t* dst = result.Row<int32_t>(y);
        for (int32_t x = 0; x < impl_->width; ++x) {
            dst[x] = LabelAt(x, y);
        }
    }
    return result;
}

} // namespace Cpn::Vision
