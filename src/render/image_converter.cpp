/**
 * @file image_converter.cpp
 * @brief AsciiImageConverter 实现
 */

#include "render/image_converter.hpp"
#include <algorithm>
#include <cstring>
#include <memory>

#define STB_IMAGE_IMPLEMENTATION
#define STBI_NO_STDIO
#include <stb_image.h>

namespace paneltalk {

AsciiImageConverter::GrayImage AsciiImageConverter::decode(const std::vector<uint8_t>& bytes) {
    if (bytes.empty()) {
        throw UnsupportedFormat();
    }

    int width = 0;
    int height = 0;
    int channels = 0;
    // 第 5 个参数为 1：由 stb 转为单通道灰度
    std::unique_ptr<stbi_uc, decltype(&stbi_image_free)> data(
        stbi_load_from_memory(bytes.data(), static_cast<int>(bytes.size()),
                              &width, &height, &channels, 1),
        &stbi_image_free);
    if (!data) {
        const char* reason = stbi_failure_reason();
        if (reason && std::strcmp(reason, "unknown image type") == 0) {
            throw UnsupportedFormat();
        }
        throw std::runtime_error(reason ? reason : "decode failed");
    }
    if (width <= 0 || height <= 0) {
        throw std::runtime_error("invalid dimensions");
    }

    GrayImage image;
    image.width = width;
    image.height = height;
    image.pixels.assign(data.get(), data.get() + static_cast<size_t>(width) * height);
    return image;
}

int AsciiImageConverter::outputHeight(int w, int h, int width) {
    const int outWidth = std::max(width, 1);
    const double aspect = static_cast<double>(h) / w;
    return std::max(1, static_cast<int>(outWidth * aspect * 0.5));
}

size_t AsciiImageConverter::measure(const std::vector<uint8_t>& bytes, int width) const {
    int w = 0;
    int h = 0;
    int channels = 0;
    if (bytes.empty() ||
        !stbi_info_from_memory(bytes.data(), static_cast<int>(bytes.size()), &w, &h, &channels) ||
        w <= 0 || h <= 0) {
        return 1;
    }
    return static_cast<size_t>(outputHeight(w, h, width));
}

ImageGrid AsciiImageConverter::convert(const std::vector<uint8_t>& bytes, int width) const {
    GrayImage image;
    try {
        image = decode(bytes);
    } catch (const UnsupportedFormat&) {
        return {UNSUPPORTED};
    } catch (const std::runtime_error& e) {
        return {std::string("[Error converting image: ") + e.what() + "]"};
    }

    const int outWidth = std::max(width, 1);
    const int outHeight = outputHeight(image.width, image.height, width);
    const size_t levels = std::strlen(RAMP);

    ImageGrid grid;
    grid.reserve(static_cast<size_t>(outHeight));
    for (int y = 0; y < outHeight; ++y) {
        const int y0 = y * image.height / outHeight;
        const int y1 = std::max(y0 + 1, (y + 1) * image.height / outHeight);
        std::string line;
        line.reserve(static_cast<size_t>(outWidth));
        for (int x = 0; x < outWidth; ++x) {
            const int x0 = x * image.width / outWidth;
            const int x1 = std::max(x0 + 1, (x + 1) * image.width / outWidth);
            // 按块取平均
            long sum = 0;
            int n = 0;
            for (int sy = y0; sy < y1 && sy < image.height; ++sy) {
                for (int sx = x0; sx < x1 && sx < image.width; ++sx) {
                    sum += image.pixels[static_cast<size_t>(sy) * image.width + sx];
                    ++n;
                }
            }
            const long gray = n > 0 ? sum / n : 0;
            line.push_back(RAMP[static_cast<size_t>(gray) * (levels - 1) / 255]);
        }
        grid.push_back(std::move(line));
    }
    return grid;
}

} // namespace paneltalk
