/**
 * @file ImageIO.cpp
 * @brief PNG label map I/O
 */

#include <CpnVision/IO/ImageIO.h>

#include <CpnVision/Core/Exception.h>
#include <CpnVision/Core/Validate.h>

#include <algorithm>
#include <cstring>
#include <vector>

#define STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb/stb_image.h>
#include <stb/stb_image_write.h>

namespace Cpn::Vision::IO {

namespace {

constexpr int32_t MAX_RGB_LABEL = (1 << 24) - 1;

} // anonymous namespace

QImage ReadLabelMap(const std::string& path) {
    int w = 0;
    int h = 0;
    int channels = 0;

    if (stbi_is_16_bit(path.c_str())) {
        stbi_us* data = stbi_load_16(path.c_str(), &w, &h, &channels, 1);
        if (!data) {
            throw IOException("Failed to load label map: " + path);
        }
        QImage labels = QImage::FromData(data, w, h, PixelType::UInt16);
        stbi_image_free(data);
        return labels;
    }

    stbi_uc* data = stbi_load(path.c_str(), &w, &h, &channels, 0);
    if (!data) {
        throw IOException("Failed to load label map: " + path);
    }

    QImage labels;
    if (channels == 1 || channels == 2) {
        // Gray (+ alpha): first channel is the id
        labels = QImage(w, h, PixelType::UInt8);
        for (int32_t y = 0; y < h; ++y) {
            uint8_t* dst = labels.Row<uint8_t>(y);
            const stbi_uc* src = data + static_cast<size_t>(y) * w * channels;
            for (int32_t x = 0; x < w; ++x) {
                dst[x] = src[x * channels];
            }
        }
    } else {
        labels = QImage(w, h, PixelType::Int32);
        for (int32_t y = 0; y < h; ++y) {
            int32_t* dst = labels.Row<int32_t>(y);
            const stbi_uc* src = data + static_cast<size_t>(y) * w * channels;
            for (int32_t x = 0; x < w; ++x) {
                const stbi_uc* px = src + x * channels;
                dst[x] = px[0] + 256 * px[1] + 65536 * px[2];
            }
        }
    }

    stbi_image_free(data);
    return labels;
}

void WriteLabelMap(const std::string& path, const QImage& labels) {
    Validate::RequireLabelImage(labels, "WriteLabelMap");

    const int32_t w = labels.Width();
    const int32_t h = labels.Height();

    int32_t maxId = 0;
    for (int32_t y = 0; y < h; ++y) {
        for (int32_t x = 0; x < w; ++x) {
            int32_t id = labels.LabelAt(x, y);
            if (id < 0 || id > MAX_RGB_LABEL) {
                throw InvalidArgumentException("WriteLabelMap: id " + std::to_string(id) +
                                               " outside [0, " + std::to_string(MAX_RGB_LABEL) + "]");
            }
            maxId = std::max(maxId, id);
        }
    }

    const int channels = (maxId <= 255) ? 1 : 3;
    std::vector<uint8_t> buffer(static_cast<size_t>(w) * h * channels);
    for (int32_t y = 0; y < h; ++y) {
        for (int32_t x = 0; x < w; ++x) {
            int32_t id = labels.LabelAt(x, y);
            uint8_t* px = buffer.data() + (static_cast<size_t>(y) * w + x) * channels;
            px[0] = static_cast<uint8_t>(id & 0xFF);
            if (channels == 3) {
                px[1] = static_cast<uint8_t>((id >> 8) & 0xFF);
                px[2] = static_cast<uint8_t>((id >> 16) & 0xFF);
            }
        }
    }

    if (!stbi_write_png(path.c_str(), w, h, channels, buffer.data(), w * channels)) {
        throw IOException("Failed to write label map: " + path);
    }
}

QImage ReadImage(const std::string& path) {
    int w = 0;
    int h = 0;
    int channels = 0;
    stbi_uc* data = stbi_load(path.c_str(), &w, &h, &channels, 0);
    if (!data) {
        throw IOException("Failed to load image: " + path);
    }

    const int outChannels = (channels >= 3) ? 3 : 1;
    std::vector<uint8_t> pixels(static_cast<size_t>(w) * h * outChannels);
    for (size_t i = 0; i < static_cast<size_t>(w) * h; ++i) {
        std::memcpy(pixels.data() + i * outChannels, data + i * channels, outChannels);
    }
    stbi_image_free(data);

    return QImage::FromData(pixels.data(), w, h, PixelType::UInt8,
                            outChannels == 3 ? ChannelType::RGB : ChannelType::Gray);
}

} // namespace Cpn::Vision::IO
