#pragma once

/**
 * @file PixelStats.h
 * @brief First and second moments of 8-bit sample buffers
 */

#include <FaceGate/Core/Image.h>

#include <cstddef>
#include <cstdint>

namespace FaceGate::Internal {

/**
 * @brief Intensity statistics
 *
 * variance = sum(p^2)/N - mean^2 (population variance), clamped at 0
 */
struct PixelStats {
    double mean = 0.0;
    double variance = 0.0;
    double stdDev = 0.0;
    size_t count = 0;
};

/**
 * @brief Compute statistics over a raw sample buffer
 * @return Zeroed stats when size is 0
 */
PixelStats ComputePixelStats(const uint8_t* data, size_t size);

/**
 * @brief Compute statistics over all samples of an image
 *
 * Every channel sample is counted, so pass a single-channel image for
 * intensity statistics.
 */
PixelStats ComputePixelStats(const Image& image);

} // namespace FaceGate::Internal
