/**
 * @file DetectTypes.cpp
 * @brief Detection parameter validation
 */

#include <FaceGate/Detect/DetectTypes.h>
#include <FaceGate/Core/Exception.h>

#include <string>

namespace FaceGate::Detect {

namespace {

void RequireUnit(double value, const char* name) {
    if (!(value >= 0.0 && value <= 1.0)) {
        throw InvalidArgumentException(std::string(name) + " must lie in [0, 1], got " +
                                       std::to_string(value));
    }
}

void RequireIntensity(int32_t value, const char* name) {
    if (value < 0 || value > 255) {
        throw InvalidArgumentException(std::string(name) + " must lie in [0, 255], got " +
                                       std::to_string(value));
    }
}

} // anonymous namespace

void ScoreParams::Validate() const {
    RequireUnit(symmetryWeight, "symmetryWeight");
    RequireUnit(eyeWeight, "eyeWeight");
    RequireUnit(mouthWeight, "mouthWeight");
    RequireUnit(edgeDistributionWeight, "edgeDistributionWeight");
    RequireUnit(positionWeight, "positionWeight");

    if (symmetryRowStep <= 0 || eyeRowStep <= 0) {
        throw InvalidArgumentException("ScoreParams: row steps must be positive");
    }
    if (symmetryMaxOffset <= 0 || symmetryTolerance <= 0.0) {
        throw InvalidArgumentException("ScoreParams: symmetry offset and tolerance must be positive");
    }

    RequireUnit(eyeBandHeight, "eyeBandHeight");
    RequireUnit(mouthBandStart, "mouthBandStart");
    if (eyeTrim < 0.0 || eyeTrim >= 0.5 || mouthTrim < 0.0 || mouthTrim >= 0.5) {
        throw InvalidArgumentException("ScoreParams: horizontal trims must lie in [0, 0.5)");
    }
    if (eyeExpectedWidth <= 0.0 || mouthExpectedWidth <= 0.0) {
        throw InvalidArgumentException("ScoreParams: expected feature widths must be positive");
    }

    RequireIntensity(eyeThreshold, "eyeThreshold");
    RequireIntensity(mouthThreshold, "mouthThreshold");
    RequireIntensity(edgePixelThreshold, "edgePixelThreshold");

    if (minConcentration <= 0.0 || centerRadiusFactor < 0.0) {
        throw InvalidArgumentException("ScoreParams: invalid concentration settings");
    }
}

void DetectParams::Validate() const {
    if (analysisSize < 3) {
        throw InvalidArgumentException("DetectParams: analysisSize must be at least 3");
    }
    if (!(minFaceSize > 0.0 && minFaceSize < 0.5)) {
        throw InvalidArgumentException("DetectParams: minFaceSize must lie in (0, 0.5)");
    }
    if (seedStride <= 0) {
        throw InvalidArgumentException("DetectParams: seedStride must be positive");
    }
    if (minComponentFactor < 0.0) {
        throw InvalidArgumentException("DetectParams: minComponentFactor must be non-negative");
    }
    if (minAspectRatio <= 0.0 || maxAspectRatio <= minAspectRatio) {
        throw InvalidArgumentException("DetectParams: invalid aspect ratio range");
    }
    RequireUnit(minSizeRatio, "minSizeRatio");
    if (minDensity < 0.0 || maxDensity > 1.0 || maxDensity <= minDensity) {
        throw InvalidArgumentException("DetectParams: invalid density range");
    }
    RequireUnit(minFaceScore, "minFaceScore");
    RequireUnit(maxOverlap, "maxOverlap");
    if (maxFaces < 1) {
        throw InvalidArgumentException("DetectParams: maxFaces must be at least 1");
    }
    if (passes.empty()) {
        throw InvalidArgumentException("DetectParams: at least one detection pass is required");
    }
    for (const DetectionPass& pass : passes) {
        RequireIntensity(pass.edgeThreshold, "edgeThreshold");
        RequireIntensity(pass.regionThreshold, "regionThreshold");
    }
    score.Validate();
}

} // namespace FaceGate::Detect
