#pragma once

/**
 * @file PipelineTypes.h
 * @brief Face pipeline parameters and results
 */

#include <FaceGate/Core/Constants.h>
#include <FaceGate/Core/Image.h>
#include <FaceGate/Detect/DetectTypes.h>
#include <FaceGate/Embed/EmbeddingStore.h>
#include <FaceGate/IO/ImageIO.h>
#include <FaceGate/Internal/PixelStats.h>
#include <FaceGate/Match/MatchTypes.h>
#include <FaceGate/Quality/Quality.h>

#include <cstdint>
#include <string>
#include <vector>

namespace FaceGate::Pipeline {

// =============================================================================
// Parameters
// =============================================================================

/**
 * @brief Model input preparation
 */
struct PreprocessParams {
    int32_t targetSize = FACE_INPUT_SIZE;   ///< Side of the square RGB output
    int32_t minSide = 50;                   ///< Decoded width and height lower bound

    static PreprocessParams Default() {
        return PreprocessParams();
    }

    PreprocessParams& SetTargetSize(int32_t v) { targetSize = v; return *this; }
    PreprocessParams& SetMinSide(int32_t v) { minSide = v; return *this; }

    void Validate() const;
};

/**
 * @brief All stage parameters of the face pipeline
 */
struct PipelineParams {
    Quality::QualityParams quality;
    Quality::LightingParams lighting;
    Quality::BlurParams blur;
    Detect::DetectParams detect;
    PreprocessParams preprocess;
    Match::MatchParams match;

    static PipelineParams Default() {
        return PipelineParams();
    }

    /// Default stages with the match threshold taken from SIMILARITY_THRESHOLD
    static PipelineParams FromEnvironment();

    /// @throws InvalidArgumentException naming the first invalid stage
    void Validate() const;
};

// =============================================================================
// Results
// =============================================================================

/**
 * @brief Output of the full validation and preprocessing pipeline
 */
struct PreprocessResult {
    Image face;                             ///< targetSize x targetSize RGB
    IO::ImageMetadata metadata;
    Internal::PixelStats lighting;          ///< Measured on the lighting sample
    double sharpness = 0.0;                 ///< Laplacian variance of the blur sample
    Detect::LocateResult location;
};

/**
 * @brief Stored registration
 */
struct RegistrationResult {
    std::string userId;
    Match::Embedding embedding;
    Embed::StoreReceipt receipt;
};

/**
 * @brief Verification of a probe image against a stored user
 */
struct VerificationResult {
    std::string userId;
    Match::MatchResult match;
};

/**
 * @brief Model section of the service description
 */
struct ModelInfo {
    std::string name;
    size_t embeddingDimension = EMBEDDING_DIMENSION;
    int32_t inputSize = FACE_INPUT_SIZE;
    bool loaded = false;
};

/**
 * @brief Static description of the service limits and checks
 */
struct ServiceInfo {
    std::string service;
    std::string version;
    ModelInfo model;

    double similarityThreshold = Match::DEFAULT_SIMILARITY_THRESHOLD;
    std::string metric;
    std::vector<std::string> supportedFormats;
    std::string minResolution;
    std::string maxResolution;
    std::string maxFileSize;
    std::string minFaceSize;
    int32_t maxFaces = 1;
    double blurThreshold = 0.0;
    std::vector<std::string> qualityChecks;
    std::vector<std::string> faceFeatures;
};

} // namespace FaceGate::Pipeline
