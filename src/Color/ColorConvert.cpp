/**
 * @file ColorConvert.cpp
 * @brief Channel layout conversion implementation
 */

#include <FaceGate/Color/ColorConvert.h>
#include <FaceGate/Core/Exception.h>

#include <cmath>

namespace FaceGate::Color {

namespace {

constexpr double R_WEIGHT = 0.299;
constexpr double G_WEIGHT = 0.587;
constexpr double B_WEIGHT = 0.114;

inline uint8_t Luminosity(int r, int g, int b) {
    double value = R_WEIGHT * r + G_WEIGHT * g + B_WEIGHT * b;
    return static_cast<uint8_t>(std::lround(value > 255.0 ? 255.0 : value));
}

} // anonymous namespace

void ToGray(const Image& image, Image& gray) {
    if (image.Empty()) {
        throw InvalidArgumentException("ToGray: input image is empty");
    }

    if (image.GetChannelType() == ChannelType::Gray) {
        gray = image;
        return;
    }

    Image result(image.Width(), image.Height(), ChannelType::Gray);
    const int32_t channels = image.Channels();
    const bool isColor = channels >= 3;

    for (int32_t y = 0; y < image.Height(); ++y) {
        const uint8_t* src = image.RowPtr(y);
        uint8_t* dst = result.RowPtr(y);

        for (int32_t x = 0; x < image.Width(); ++x) {
            const uint8_t* px = src + static_cast<size_t>(x) * channels;
            dst[x] = isColor ? Luminosity(px[0], px[1], px[2]) : px[0];
        }
    }

    gray = std::move(result);
}

void ToRgb(const Image& image, Image& rgb) {
    if (image.Empty()) {
        throw InvalidArgumentException("ToRgb: input image is empty");
    }

    if (image.GetChannelType() == ChannelType::RGB) {
        rgb = image;
        return;
    }

    Image result(image.Width(), image.Height(), ChannelType::RGB);
    const int32_t channels = image.Channels();
    const bool isColor = channels >= 3;

    for (int32_t y = 0; y < image.Height(); ++y) {
        const uint8_t* src = image.RowPtr(y);
        uint8_t* dst = result.RowPtr(y);

        for (int32_t x = 0; x < image.Width(); ++x) {
            const uint8_t* px = src + static_cast<size_t>(x) * channels;
            uint8_t* out = dst + static_cast<size_t>(x) * 3;
            if (isColor) {
                out[0] = px[0];
                out[1] = px[1];
                out[2] = px[2];
            } else {
                out[0] = out[1] = out[2] = px[0];
            }
        }
    }

    rgb = std::move(result);
}

} // namespace FaceGate::Color
