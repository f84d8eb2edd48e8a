#pragma once

/**
 * @file Quality.h
 * @brief Image admission checks run before face detection
 *
 * - CheckImageQuality: format, resolution, aspect ratio, file size
 * - ValidateLighting: brightness / contrast of a greyscale sample
 * - ValidateSharpness: Laplacian variance of a greyscale sample
 *
 * Each check throws on the first violated rule (ValidationError,
 * LightingError, BlurError) with the measured value(s) in the message.
 */

#include <FaceGate/Core/Image.h>
#include <FaceGate/Core/Types.h>
#include <FaceGate/IO/ImageIO.h>
#include <FaceGate/Internal/PixelStats.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace FaceGate::Quality {

// =============================================================================
// Parameters
// =============================================================================

/**
 * @brief Admission limits for encoded images
 */
struct QualityParams {
    std::vector<IO::ImageFormat> allowedFormats = {
        IO::ImageFormat::JPEG, IO::ImageFormat::PNG, IO::ImageFormat::WebP
    };

    int32_t minShortSide = 150;         ///< min(width, height) lower bound
    int32_t minLongSide = 200;          ///< max(width, height) lower bound
    int32_t maxWidth = 4000;
    int32_t maxHeight = 4000;

    double minAspectRatio = 0.5;        ///< width / height, inclusive
    double maxAspectRatio = 2.0;

    size_t minFileBytes = 2048;
    size_t maxFileBytes = 10 * 1024 * 1024;

    static QualityParams Default() {
        return QualityParams();
    }

    /// Replace allowed formats by name ("jpeg", "JPG", "png", "webp", ...)
    QualityParams& SetAllowedFormats(const std::vector<std::string>& names);

    QualityParams& SetMinResolution(int32_t shortSide, int32_t longSide) {
        minShortSide = shortSide;
        minLongSide = longSide;
        return *this;
    }
    QualityParams& SetMaxResolution(int32_t width, int32_t height) {
        maxWidth = width;
        maxHeight = height;
        return *this;
    }
    QualityParams& SetAspectRange(double minRatio, double maxRatio) {
        minAspectRatio = minRatio;
        maxAspectRatio = maxRatio;
        return *this;
    }
    QualityParams& SetFileSizeRange(size_t minBytes, size_t maxBytes) {
        minFileBytes = minBytes;
        maxFileBytes = maxBytes;
        return *this;
    }

    bool IsAllowed(IO::ImageFormat format) const;

    /// @throws InvalidArgumentException on inconsistent limits
    void Validate() const;
};

/**
 * @brief Brightness and contrast limits
 */
struct LightingParams {
    double minBrightness = 30.0;        ///< Mean intensity lower bound (else too dark)
    double maxBrightness = 200.0;       ///< Mean intensity upper bound (else too bright)
    double minContrast = 15.0;          ///< Intensity std lower bound
    int32_t sampleSize = 224;           ///< Side of the square analysis sample

    static LightingParams Default() {
        return LightingParams();
    }

    LightingParams& SetBrightnessRange(double minValue, double maxValue) {
        minBrightness = minValue;
        maxBrightness = maxValue;
        return *this;
    }
    LightingParams& SetMinContrast(double v) { minContrast = v; return *this; }
    LightingParams& SetSampleSize(int32_t v) { sampleSize = v; return *this; }

    void Validate() const;
};

/**
 * @brief Sharpness limit
 */
struct BlurParams {
    double minVariance = 100.0;         ///< Laplacian variance lower bound
    int32_t sampleSize = 300;           ///< Side of the square analysis sample

    static BlurParams Default() {
        return BlurParams();
    }

    BlurParams& SetMinVariance(double v) { minVariance = v; return *this; }
    BlurParams& SetSampleSize(int32_t v) { sampleSize = v; return *this; }

    void Validate() const;
};

// =============================================================================
// Quality Gate
// =============================================================================

/**
 * @brief Check decoded header values against the admission limits
 *
 * Rules, in order: format allowed; short side >= minShortSide and long
 * side >= minLongSide; width <= maxWidth and height <= maxHeight; aspect
 * ratio in [minAspectRatio, maxAspectRatio]; byte length in
 * [minFileBytes, maxFileBytes]; width > 0 and height > 0.
 *
 * @param meta Header values
 * @param byteLength Encoded size in bytes
 * @param params Limits
 * @throws ValidationError on the first violated rule
 */
void CheckImageQuality(const IO::ImageMetadata& meta, size_t byteLength,
                       const QualityParams& params = QualityParams());

/**
 * @brief Read the header of an encoded image and check it
 *
 * No pixels are decoded.
 *
 * @return Header values of the accepted image
 * @throws ValidationError if the header is unreadable or a rule is violated
 */
IO::ImageMetadata CheckImageQuality(const ByteBuffer& bytes,
                                    const QualityParams& params = QualityParams());

// =============================================================================
// Lighting
// =============================================================================

/**
 * @brief Intensity statistics of the square analysis sample
 *
 * The image is converted to greyscale if needed and cover-resized to
 * sampleSize x sampleSize unless it already has that size.
 */
Internal::PixelStats MeasureLighting(const Image& image,
                                     const LightingParams& params = LightingParams());

/**
 * @brief Check precomputed statistics
 * @throws LightingError (TooDark, TooBright, LowContrast)
 */
void ValidateLighting(const Internal::PixelStats& stats,
                      const LightingParams& params = LightingParams());

/**
 * @brief Measure and check lighting
 * @return Measured statistics
 * @throws LightingError
 */
Internal::PixelStats ValidateLighting(const Image& image,
                                      const LightingParams& params = LightingParams());

// =============================================================================
// Sharpness
// =============================================================================

/**
 * @brief Laplacian variance of the square analysis sample
 */
double MeasureSharpness(const Image& image, const BlurParams& params = BlurParams());

/**
 * @brief Measure and check sharpness
 * @return Measured variance
 * @throws BlurError if variance < minVariance
 */
double ValidateSharpness(const Image& image, const BlurParams& params = BlurParams());

} // namespace FaceGate::Quality
