/**
 * @file Filter.cpp
 * @brief Image filtering implementation
 */

#include <FaceGate/Filter/Filter.h>
#include <FaceGate/Core/Exception.h>

#include <string>
#include <utility>
#include <vector>

namespace FaceGate::Filter {

// =============================================================================
// Helper Functions
// =============================================================================

namespace {

void RequireGray(const Image& image, const char* op) {
    if (image.Empty()) {
        throw InvalidArgumentException(std::string(op) + ": input image is empty");
    }
    if (image.Channels() != 1) {
        throw UnsupportedException(std::string(op) + " requires single-channel image");
    }
}

} // anonymous namespace

// =============================================================================
// Convolution
// =============================================================================

void ConvolImage3x3(const Image& image, Image& output,
                    const Internal::Kernel3x3& kernel,
                    uint8_t borderValue) {
    RequireGray(image, "ConvolImage3x3");

    int32_t w = image.Width();
    int32_t h = image.Height();
    std::vector<double> response(static_cast<size_t>(w) * h);

    Internal::Convolve3x3<uint8_t, double>(image.Data(), response.data(), w, h,
                                           kernel, borderValue);

    Image result(w, h, ChannelType::Gray);
    uint8_t* dst = result.Data();
    for (size_t i = 0; i < response.size(); ++i) {
        dst[i] = Internal::SaturateU8(response[i]);
    }
    output = std::move(result);
}

// =============================================================================
// Edge / Sharpness
// =============================================================================

void EdgeMap(const Image& gray, Image& edges) {
    ConvolImage3x3(gray, edges, Internal::HIGHPASS_KERNEL);
}

double LaplacianVariance(const Image& gray) {
    RequireGray(gray, "LaplacianVariance");

    int32_t w = gray.Width();
    int32_t h = gray.Height();
    if (w < 3 || h < 3) {
        return 0.0;
    }

    // Stencil inlined: one pass, three row pointers per row
    double sumSq = 0.0;
    for (int32_t y = 1; y < h - 1; ++y) {
        const uint8_t* above = gray.RowPtr(y - 1);
        const uint8_t* row = gray.RowPtr(y);
        const uint8_t* below = gray.RowPtr(y + 1);

        for (int32_t x = 1; x < w - 1; ++x) {
            int32_t r = 4 * row[x] - row[x - 1] - row[x + 1] - above[x] - below[x];
            sumSq += static_cast<double>(r) * r;
        }
    }

    double count = static_cast<double>(w - 2) * (h - 2);
    return sumSq / count;
}

} // namespace FaceGate::Filter
