/**
 * @file Sharpness.cpp
 * @brief Blur validation by Laplacian variance
 */

#include <FaceGate/Quality/Quality.h>
#include <FaceGate/Core/Exception.h>
#include <FaceGate/Core/Log.h>
#include <FaceGate/Filter/Filter.h>
#include <FaceGate/Transform/Resize.h>

#include <cstdio>

namespace FaceGate::Quality {

void BlurParams::Validate() const {
    if (minVariance < 0.0) {
        throw InvalidArgumentException("BlurParams: minVariance must be non-negative");
    }
    if (sampleSize < 3) {
        throw InvalidArgumentException("BlurParams: sampleSize must be at least 3");
    }
}

double MeasureSharpness(const Image& image, const BlurParams& params) {
    Image sample;
    Transform::ZoomGrayCover(image, sample, params.sampleSize, params.sampleSize);
    return Filter::LaplacianVariance(sample);
}

double ValidateSharpness(const Image& image, const BlurParams& params) {
    double variance = MeasureSharpness(image, params);
    Log::Get()->debug("Blur variance: {:.2f}", variance);

    if (variance < params.minVariance) {
        char buf[160];
        std::snprintf(buf, sizeof(buf),
                      "Image appears blurry or out of focus: Laplacian variance %.2f is below %.2f",
                      variance, params.minVariance);
        throw BlurError(variance, params.minVariance, buf);
    }
    return variance;
}

} // namespace FaceGate::Quality
