#pragma once

/**
 * @file Convolution.h
 * @brief 3x3 convolution on raw single-channel buffers
 *
 * Provides:
 * - 3x3 stencil convolution over the interior, border filled
 * - Saturating cast to 8-bit
 *
 * Used by:
 * - Edge map (Filter)
 */

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>

namespace FaceGate::Internal {

// ============================================================================
// Kernels
// ============================================================================

/// Row-major 3x3 kernel
using Kernel3x3 = std::array<double, 9>;

/// High-pass edge kernel (8-neighbour), weights sum to 0
constexpr Kernel3x3 HIGHPASS_KERNEL = {
    -1, -1, -1,
    -1,  8, -1,
    -1, -1, -1
};

/**
 * @brief Round and clamp to [0, 255]
 */
inline uint8_t SaturateU8(double value) {
    if (value <= 0.0) return 0;
    if (value >= 255.0) return 255;
    return static_cast<uint8_t>(std::lround(value));
}

// ============================================================================
// 3x3 Convolution
// ============================================================================

/**
 * @brief Apply a 3x3 kernel to a single-channel buffer
 * @param src Source buffer (width * height)
 * @param dst Destination buffer (must be pre-allocated, may not alias src)
 * @param width Buffer width
 * @param height Buffer height
 * @param kernel Row-major 3x3 kernel
 * @param borderValue Written to the one-pixel border, which is not convolved
 */
template<typename SrcT, typename DstT = double>
void Convolve3x3(const SrcT* src, DstT* dst,
                 int32_t width, int32_t height,
                 const Kernel3x3& kernel,
                 double borderValue = 0.0);

// ============================================================================
// Template Implementations
// ============================================================================

template<typename SrcT, typename DstT>
void Convolve3x3(const SrcT* src, DstT* dst,
                 int32_t width, int32_t height,
                 const Kernel3x3& kernel, double borderValue) {
    const DstT fill = static_cast<DstT>(borderValue);

    for (int32_t y = 0; y < height; ++y) {
        DstT* out = dst + static_cast<size_t>(y) * width;
        if (y == 0 || y == height - 1) {
            std::fill(out, out + width, fill);
            continue;
        }

        const SrcT* above = src + static_cast<size_t>(y - 1) * width;
        const SrcT* row = src + static_cast<size_t>(y) * width;
        const SrcT* below = src + static_cast<size_t>(y + 1) * width;

        out[0] = fill;
        for (int32_t x = 1; x < width - 1; ++x) {
            double sum =
                kernel[0] * above[x - 1] + kernel[1] * above[x] + kernel[2] * above[x + 1] +
                kernel[3] * row[x - 1]   + kernel[4] * row[x]   + kernel[5] * row[x + 1] +
                kernel[6] * below[x - 1] + kernel[7] * below[x] + kernel[8] * below[x + 1];
            out[x] = static_cast<DstT>(sum);
        }
        if (width > 1) {
            out[width - 1] = fill;
        }
    }
}

} // namespace FaceGate::Internal
