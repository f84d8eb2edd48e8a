/**
 * @file Resize.cpp
 * @brief Image resampling implementation
 */

#include <FaceGate/Transform/Resize.h>
#include <FaceGate/Color/ColorConvert.h>
#include <FaceGate/Core/Exception.h>
#include <FaceGate/IO/ImageIO.h>

#include <algorithm>
#include <cmath>
#include <vector>

namespace FaceGate::Transform {

namespace {

enum class InterpolationMethod {
    Nearest,
    Bilinear,
    Area
};

InterpolationMethod ToInterpolation(const std::string& name) {
    if (name == "nearest") return InterpolationMethod::Nearest;
    if (name == "bilinear") return InterpolationMethod::Bilinear;
    if (name == "area") return InterpolationMethod::Area;
    throw InvalidArgumentException("Unknown interpolation: " + name);
}

/// One source sample contributing to an output index along one axis
struct Tap {
    int32_t index;
    double weight;
};

/**
 * Per-axis tap table: output index i samples the source span
 * [origin + i*step, origin + (i+1)*step).
 */
std::vector<std::vector<Tap>> BuildTaps(InterpolationMethod method,
                                        double origin, double span,
                                        int32_t srcSize, int32_t dstSize) {
    std::vector<std::vector<Tap>> taps(dstSize);
    double step = span / dstSize;

    for (int32_t i = 0; i < dstSize; ++i) {
        std::vector<Tap>& t = taps[i];

        if (method == InterpolationMethod::Nearest) {
            int32_t s = static_cast<int32_t>(std::floor(origin + (i + 0.5) * step));
            t.push_back({std::clamp(s, 0, srcSize - 1), 1.0});
        } else if (method == InterpolationMethod::Bilinear || step <= 1.0) {
            // Upscaling with "area" degenerates to bilinear
            double pos = origin + (i + 0.5) * step - 0.5;
            pos = std::clamp(pos, 0.0, static_cast<double>(srcSize - 1));
            int32_t s0 = static_cast<int32_t>(std::floor(pos));
            int32_t s1 = std::min(s0 + 1, srcSize - 1);
            double frac = pos - s0;
            t.push_back({s0, 1.0 - frac});
            if (s1 != s0 && frac > 0.0) {
                t.push_back({s1, frac});
            }
        } else {
            double start = origin + i * step;
            double end = start + step;
            int32_t first = std::max(0, static_cast<int32_t>(std::floor(start)));
            int32_t last = std::min(srcSize - 1, static_cast<int32_t>(std::ceil(end)) - 1);
            double total = 0.0;
            for (int32_t s = first; s <= last; ++s) {
                double cover = std::min(end, s + 1.0) - std::max(start, static_cast<double>(s));
                if (cover > 0.0) {
                    t.push_back({s, cover});
                    total += cover;
                }
            }
            if (total <= 0.0) {
                t.assign(1, {std::clamp(first, 0, srcSize - 1), 1.0});
            } else {
                for (Tap& tap : t) tap.weight /= total;
            }
        }
    }
    return taps;
}

void Resample(const Image& src, Image& dst,
              double x0, double y0, double spanX, double spanY,
              int32_t dstWidth, int32_t dstHeight,
              InterpolationMethod method) {
    if (src.Empty()) {
        throw InvalidArgumentException("Resample: input image is empty");
    }
    if (dstWidth <= 0 || dstHeight <= 0) {
        throw InvalidArgumentException("Resample: invalid target size " +
                                       std::to_string(dstWidth) + "x" + std::to_string(dstHeight));
    }

    auto tapsX = BuildTaps(method, x0, spanX, src.Width(), dstWidth);
    auto tapsY = BuildTaps(method, y0, spanY, src.Height(), dstHeight);

    const int32_t channels = src.Channels();
    Image result(dstWidth, dstHeight, src.GetChannelType());

    for (int32_t dy = 0; dy < dstHeight; ++dy) {
        uint8_t* out = result.RowPtr(dy);
        for (int32_t dx = 0; dx < dstWidth; ++dx) {
            for (int32_t c = 0; c < channels; ++c) {
                double sum = 0.0;
                for (const Tap& ty : tapsY[dy]) {
                    const uint8_t* row = src.RowPtr(ty.index);
                    double rowSum = 0.0;
                    for (const Tap& tx : tapsX[dx]) {
                        rowSum += tx.weight * row[static_cast<size_t>(tx.index) * channels + c];
                    }
                    sum += ty.weight * rowSum;
                }
                out[static_cast<size_t>(dx) * channels + c] =
                    static_cast<uint8_t>(std::clamp(std::lround(sum), 0L, 255L));
            }
        }
    }

    dst = std::move(result);
}

} // anonymous namespace

// =============================================================================
// Image Resampling
// =============================================================================

void ZoomImageSize(
    const Image& src,
    Image& dst,
    int32_t dstWidth,
    int32_t dstHeight,
    const std::string& interpolation)
{
    Resample(src, dst, 0.0, 0.0, src.Width(), src.Height(),
             dstWidth, dstHeight, ToInterpolation(interpolation));
}

CoverWindow ComputeCoverWindow(int32_t srcWidth, int32_t srcHeight,
                               int32_t dstWidth, int32_t dstHeight) {
    if (srcWidth <= 0 || srcHeight <= 0 || dstWidth <= 0 || dstHeight <= 0) {
        throw InvalidArgumentException("ComputeCoverWindow: sizes must be positive");
    }

    double scale = std::max(static_cast<double>(dstWidth) / srcWidth,
                            static_cast<double>(dstHeight) / srcHeight);

    CoverWindow window;
    window.width = std::min(static_cast<double>(srcWidth), dstWidth / scale);
    window.height = std::min(static_cast<double>(srcHeight), dstHeight / scale);
    window.x = (srcWidth - window.width) / 2.0;
    window.y = (srcHeight - window.height) / 2.0;
    return window;
}

void ZoomImageCover(
    const Image& src,
    Image& dst,
    int32_t dstWidth,
    int32_t dstHeight,
    const std::string& interpolation)
{
    if (src.Empty()) {
        throw InvalidArgumentException("ZoomImageCover: input image is empty");
    }
    CoverWindow window = ComputeCoverWindow(src.Width(), src.Height(), dstWidth, dstHeight);
    Resample(src, dst, window.x, window.y, window.width, window.height,
             dstWidth, dstHeight, ToInterpolation(interpolation));
}

void ZoomGrayCover(
    const Image& src,
    Image& dst,
    int32_t dstWidth,
    int32_t dstHeight)
{
    Image gray;
    Color::ToGray(src, gray);
    if (gray.Width() == dstWidth && gray.Height() == dstHeight) {
        dst = std::move(gray);
        return;
    }
    ZoomImageCover(gray, dst, dstWidth, dstHeight);
}

// =============================================================================
// Encoded Input Helpers
// =============================================================================

Image ResizeGray(const ByteBuffer& bytes, int32_t width, int32_t height) {
    Image result;
    ZoomGrayCover(IO::DecodeImage(bytes), result, width, height);
    return result;
}

Image ResizeCoverRgb(const ByteBuffer& bytes, int32_t width, int32_t height) {
    Image decoded = IO::DecodeImage(bytes);
    Image rgb;
    Color::ToRgb(decoded, rgb);

    Image result;
    ZoomImageCover(rgb, result, width, height);
    return result;
}

} // namespace FaceGate::Transform
