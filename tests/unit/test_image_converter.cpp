#include <catch2/catch.hpp>
#include "render/image_converter.hpp"
#include <string>
#include <stdexcept>

using namespace paneltalk;

namespace {

std::vector<uint8_t> bytesOf(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

// 二进制灰度图，所有像素取同一灰度
std::vector<uint8_t> makePgm(int w, int h, uint8_t gray) {
    auto bytes = bytesOf("P5\n" + std::to_string(w) + " " + std::to_string(h) + "\n255\n");
    bytes.insert(bytes.end(), static_cast<size_t>(w * h), gray);
    return bytes;
}

} // anonymous namespace

TEST_CASE("Black and white map to ramp ends", "[image]") {
    AsciiImageConverter converter;
    auto bytes = bytesOf("P5\n2 1\n255\n");
    bytes.push_back(0);
    bytes.push_back(255);

    auto grid = converter.convert(bytes, 2);
    REQUIRE(grid.size() == 1);
    REQUIRE(grid[0] == "@ ");
}

TEST_CASE("Header comments are skipped", "[image]") {
    AsciiImageConverter converter;
    auto bytes = bytesOf("P5\n# made by hand\n1 1\n# max\n255\n");
    bytes.push_back(0);

    REQUIRE(converter.convert(bytes, 1) == ImageGrid{"@"});
}

TEST_CASE("Output height follows aspect ratio at half scale", "[image]") {
    AsciiImageConverter converter;

    REQUIRE(converter.convert(makePgm(40, 40, 128), 40).size() == 20);
    REQUIRE(converter.convert(makePgm(64, 32, 128), 40).size() == 10);

    auto grid = converter.convert(makePgm(64, 32, 128), 40);
    for (const auto& line : grid) {
        REQUIRE(line.size() == 40);
    }
}

TEST_CASE("Very wide image still yields one line", "[image]") {
    AsciiImageConverter converter;
    REQUIRE(converter.convert(makePgm(100, 1, 0), 10) == ImageGrid{"@@@@@@@@@@"});
}

TEST_CASE("Color image uses luminance", "[image]") {
    AsciiImageConverter converter;
    // 纯红 -> 亮度 76
    auto red = bytesOf("P6\n1 1\n255\n");
    red.push_back(255);
    red.push_back(0);
    red.push_back(0);
    REQUIRE(converter.convert(red, 1) == ImageGrid{"#"});

    auto white = bytesOf("P6\n1 1\n255\n");
    white.insert(white.end(), 3, 255);
    REQUIRE(converter.convert(white, 1) == ImageGrid{" "});
}

TEST_CASE("Unknown formats are reported as unsupported", "[image]") {
    AsciiImageConverter converter;

    REQUIRE(converter.convert(bytesOf("hello world"), 40) == ImageGrid{AsciiImageConverter::UNSUPPORTED});
    REQUIRE(converter.convert({}, 40) == ImageGrid{AsciiImageConverter::UNSUPPORTED});
}

TEST_CASE("Corrupt images become an error line", "[image]") {
    AsciiImageConverter converter;
    // 只有 PNG 签名，没有任何数据块
    const std::vector<uint8_t> png = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1a, '\n'};

    auto grid = converter.convert(png, 40);
    REQUIRE(grid.size() == 1);
    REQUIRE(grid[0].rfind("[Error converting image: ", 0) == 0);
    REQUIRE(grid[0].back() == ']');
}

TEST_CASE("decode throws on bad input", "[image]") {
    REQUIRE_THROWS_AS(AsciiImageConverter::decode(bytesOf("hello world")),
                      AsciiImageConverter::UnsupportedFormat);
    REQUIRE_THROWS_AS(AsciiImageConverter::decode(bytesOf("GIF89a")), std::runtime_error);

    auto image = AsciiImageConverter::decode(makePgm(3, 2, 255));
    REQUIRE(image.width == 3);
    REQUIRE(image.height == 2);
    REQUIRE(image.pixels == std::vector<uint8_t>(6, 255));
}
