/**
 * @file PixelStats.cpp
 * @brief Intensity statistics implementation
 */

#include <FaceGate/Internal/PixelStats.h>

#include <cmath>

namespace FaceGate::Internal {

PixelStats ComputePixelStats(const uint8_t* data, size_t size) {
    PixelStats stats;
    if (data == nullptr || size == 0) {
        return stats;
    }

    // Integer accumulation is exact up to ~7e13 samples
    uint64_t sum = 0;
    uint64_t sumSq = 0;
    for (size_t i = 0; i < size; ++i) {
        uint64_t v = data[i];
        sum += v;
        sumSq += v * v;
    }

    double n = static_cast<double>(size);
    stats.count = size;
    stats.mean = static_cast<double>(sum) / n;
    stats.variance = static_cast<double>(sumSq) / n - stats.mean * stats.mean;
    if (stats.variance < 0.0) {
        stats.variance = 0.0;
    }
    stats.stdDev = std::sqrt(stats.variance);
    return stats;
}

PixelStats ComputePixelStats(const Image& image) {
    return ComputePixelStats(image.Data(), image.ByteSize());
}

} // namespace FaceGate::Internal
