/**
 * @file Lighting.cpp
 * @brief Brightness / contrast validation
 */

#include <FaceGate/Quality/Quality.h>
#include <FaceGate/Core/Exception.h>
#include <FaceGate/Core/Log.h>
#include <FaceGate/Transform/Resize.h>

#include <cstdio>

namespace FaceGate::Quality {

namespace {

std::string Fixed2(double value) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.2f", value);
    return buf;
}

} // anonymous namespace

void LightingParams::Validate() const {
    if (minBrightness < 0.0 || maxBrightness > 255.0 || maxBrightness < minBrightness) {
        throw InvalidArgumentException("LightingParams: brightness range must lie in [0, 255]");
    }
    if (minContrast < 0.0) {
        throw InvalidArgumentException("LightingParams: minContrast must be non-negative");
    }
    if (sampleSize <= 0) {
        throw InvalidArgumentException("LightingParams: sampleSize must be positive");
    }
}

Internal::PixelStats MeasureLighting(const Image& image, const LightingParams& params) {
    Image sample;
    Transform::ZoomGrayCover(image, sample, params.sampleSize, params.sampleSize);
    return Internal::ComputePixelStats(sample);
}

void ValidateLighting(const Internal::PixelStats& stats, const LightingParams& params) {
    Log::Get()->debug("Lighting: brightness {:.2f}, contrast {:.2f}", stats.mean, stats.stdDev);

    if (stats.mean < params.minBrightness) {
        throw LightingError(LightingError::Condition::TooDark, stats.mean, stats.stdDev,
                            "Image too dark: mean brightness " + Fixed2(stats.mean) +
                            " is below " + Fixed2(params.minBrightness) +
                            ". Please ensure adequate lighting");
    }

    if (stats.mean > params.maxBrightness) {
        throw LightingError(LightingError::Condition::TooBright, stats.mean, stats.stdDev,
                            "Image too bright: mean brightness " + Fixed2(stats.mean) +
                            " is above " + Fixed2(params.maxBrightness) +
                            ". Please reduce lighting or avoid direct flash");
    }

    if (stats.stdDev < params.minContrast) {
        throw LightingError(LightingError::Condition::LowContrast, stats.mean, stats.stdDev,
                            "Low contrast image: intensity std " + Fixed2(stats.stdDev) +
                            " is below " + Fixed2(params.minContrast) +
                            ". Face features may not be clear");
    }
}

Internal::PixelStats ValidateLighting(const Image& image, const LightingParams& params) {
    Internal::PixelStats stats = MeasureLighting(image, params);
    ValidateLighting(stats, params);
    return stats;
}

} // namespace FaceGate::Quality
