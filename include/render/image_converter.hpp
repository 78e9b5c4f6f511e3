/**
 * @file image_converter.hpp
 * @brief 图片转字符画
 */

#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <stdexcept>

namespace paneltalk {

/// 字符画：每个元素是一行
using ImageGrid = std::vector<std::string>;

/**
 * @class ImageConverter
 * @brief 图片转换接口
 *
 * 实现必须可在后台线程调用（不访问共享可变状态）。
 * 失败以文本行的形式返回，而不是抛出异常。
 */
class ImageConverter {
public:
    virtual ~ImageConverter() = default;

    /**
     * @brief 把图片字节转换为字符画
     * @param bytes 原始图片数据
     * @param width 输出列数
     */
    virtual ImageGrid convert(const std::vector<uint8_t>& bytes, int width) const = 0;

    /**
     * @brief 不解码像素，估算 convert 输出的行数（用于排版）
     */
    virtual size_t measure(const std::vector<uint8_t>& bytes, int width) const {
        (void)bytes;
        (void)width;
        return 1;
    }
};

/**
 * @class AsciiImageConverter
 * @brief 灰度字符画转换
 *
 * 由 stb_image 解码（PNG/JPEG/BMP/GIF/PNM 等），转为 8 位灰度后按块取平均。
 * 输出高度 = width * (h / w) * 0.5（终端字符约为 1:2）。
 * 灰度按 "@%#*+=-:. " 由暗到亮映射。
 */
class AsciiImageConverter : public ImageConverter {
public:
    static constexpr const char* RAMP = "@%#*+=-:. ";
    static constexpr const char* UNSUPPORTED = "[Image format not supported]";

    /// 无法识别的图片格式
    class UnsupportedFormat : public std::runtime_error {
    public:
        UnsupportedFormat() : std::runtime_error("unknown image type") {}
    };

    ImageGrid convert(const std::vector<uint8_t>& bytes, int width) const override;

    /// 只读图片头得到尺寸，无法识别时为 1
    size_t measure(const std::vector<uint8_t>& bytes, int width) const override;

    /// 源图 w x h 在 width 列下的输出行数
    static int outputHeight(int w, int h, int width);

    /// 解码后的 8 位灰度图
    struct GrayImage {
        int width = 0;
        int height = 0;
        std::vector<uint8_t> pixels;
    };

    /**
     * @brief 解码为灰度图
     * @throws UnsupportedFormat 格式无法识别
     * @throws std::runtime_error 数据损坏（消息为解码器给出的原因）
     */
    static GrayImage decode(const std::vector<uint8_t>& bytes);
};

} // namespace paneltalk
