/**
 * @file FacePipeline.cpp
 * @brief Face pipeline implementation
 */

#include <FaceGate/Pipeline/FacePipeline.h>
#include <FaceGate/Color/ColorConvert.h>
#include <FaceGate/Core/Exception.h>
#include <FaceGate/Core/Log.h>
#include <FaceGate/Detect/FaceLocator.h>
#include <FaceGate/IO/ImageIO.h>
#include <FaceGate/Quality/Quality.h>
#include <FaceGate/Transform/Resize.h>

#include <optional>
#include <utility>

namespace FaceGate::Pipeline {

namespace {

Image PreprocessImage(const Image& image, const PreprocessParams& params) {
    if (image.Width() < params.minSide || image.Height() < params.minSide) {
        throw ValidationError("Image too small: Minimum size is " + std::to_string(params.minSide) +
                              "x" + std::to_string(params.minSide) + " pixels, got " +
                              std::to_string(image.Width()) + "x" +
                              std::to_string(image.Height()));
    }

    Image rgb;
    Color::ToRgb(image, rgb);

    Image face;
    Transform::ZoomImageCover(rgb, face, params.targetSize, params.targetSize);
    return face;
}

void LogRejection(const Exception& e) {
    Log::Get()->warn("Face image rejected ({}): {}", e.KindName(), e.what());
}

Match::Embedding EmbedFace(const Image& face, Embed::EmbeddingModel& model) {
    Embed::InputTensor tensor = Embed::BuildInputTensor(face);
    Match::Embedding embedding = Embed::FinalizeEmbedding(model.Infer(tensor));
    Log::Get()->debug("Generated {}D embedding with {}", embedding.size(), model.Name());
    return embedding;
}

void RequireLoaded(const Embed::EmbeddingModel& model) {
    if (!model.IsLoaded()) {
        throw ModelException("AI model not loaded. Please wait for initialization.");
    }
}

} // anonymous namespace

// =============================================================================
// Parameters
// =============================================================================

void PreprocessParams::Validate() const {
    if (targetSize <= 0) {
        throw InvalidArgumentException("PreprocessParams: targetSize must be positive");
    }
    if (minSide <= 0) {
        throw InvalidArgumentException("PreprocessParams: minSide must be positive");
    }
}

PipelineParams PipelineParams::FromEnvironment() {
    PipelineParams params;
    params.match = Match::MatchParams::FromEnvironment();
    return params;
}

void PipelineParams::Validate() const {
    quality.Validate();
    lighting.Validate();
    blur.Validate();
    detect.Validate();
    preprocess.Validate();
    match.Validate();
}

// =============================================================================
// Image Stages
// =============================================================================

Image Preprocess(const ByteBuffer& bytes, const PreprocessParams& params) {
    params.Validate();
    return PreprocessImage(IO::DecodeImage(bytes), params);
}

Detect::LocateResult LocateFace(const ByteBuffer& bytes, const PipelineParams& params) {
    return Detect::LocateFace(bytes, params.detect);
}

PreprocessResult ProcessFaceImage(const ByteBuffer& bytes, const PipelineParams& params) {
    params.Validate();

    PreprocessResult result;
    try {
        // Step 1: header only
        result.metadata = Quality::CheckImageQuality(bytes, params.quality);

        Image image = IO::DecodeImage(bytes);

        // Step 2-3: photometric checks
        result.lighting = Quality::ValidateLighting(image, params.lighting);
        result.sharpness = Quality::ValidateSharpness(image, params.blur);

        // Step 4: exactly one face
        result.location = Detect::LocateFaceInImage(image, params.detect);

        // Step 5: model input
        result.face = PreprocessImage(image, params.preprocess);
    } catch (const Exception& e) {
        LogRejection(e);
        throw;
    }

    Log::Get()->info("Face image accepted: {}x{} {}, face {}x{} score {:.3f}",
                     result.metadata.width, result.metadata.height,
                     IO::FormatName(result.metadata.format),
                     result.location.sourceRegion.width, result.location.sourceRegion.height,
                     result.location.region.faceScore);
    return result;
}

// =============================================================================
// Embedding Operations
// =============================================================================

Match::Embedding CreateEmbedding(const ByteBuffer& bytes, Embed::EmbeddingModel& model,
                                 const PipelineParams& params) {
    RequireLoaded(model);

    PreprocessResult processed = ProcessFaceImage(bytes, params);
    return EmbedFace(processed.face, model);
}

RegistrationResult RegisterUser(const std::string& userId, const ByteBuffer& bytes,
                                Embed::EmbeddingModel& model, Embed::EmbeddingStore& store,
                                const PipelineParams& params) {
    if (userId.empty()) {
        throw InvalidArgumentException("User id must not be empty");
    }

    RegistrationResult result;
    result.userId = userId;
    result.embedding = CreateEmbedding(bytes, model, params);
    result.receipt = store.Put(userId, result.embedding);

    Log::Get()->info("User {} registered (revision {})", userId, result.receipt.revision);
    return result;
}

VerificationResult VerifyUser(const std::string& userId, const ByteBuffer& bytes,
                              Embed::EmbeddingModel& model, const Embed::EmbeddingStore& store,
                              const PipelineParams& params) {
    std::optional<Match::Embedding> stored = store.Get(userId);
    if (!stored) {
        throw NotFoundException("User " + userId + " not found in database");
    }
    Match::ValidateStoredEmbedding(*stored);

    Match::Embedding probe = CreateEmbedding(bytes, model, params);

    VerificationResult result;
    result.userId = userId;
    result.match = Match::Compare(*stored, probe, params.match);

    Log::Get()->info("User {} verification: similarity {:.4f}, threshold {:.2f}, match {}",
                     userId, result.match.similarity, result.match.threshold,
                     result.match.isMatch);
    return result;
}

Match::MatchResult CompareWithStored(const ByteBuffer& bytes,
                                     const Match::StoredEmbeddingInput& stored,
                                     Embed::EmbeddingModel& model,
                                     const PipelineParams& params) {
    Match::Embedding reference = Match::ParseStoredEmbedding(stored);

    Match::Embedding probe = CreateEmbedding(bytes, model, params);
    if (probe.size() != reference.size()) {
        throw DimensionMismatchError(probe.size(), reference.size());
    }

    Match::MatchResult result = Match::Compare(reference, probe, params.match);
    Log::Get()->info("Stored embedding comparison: similarity {:.4f}, threshold {:.2f}, match {}",
                     result.similarity, result.threshold, result.isMatch);
    return result;
}

} // namespace FaceGate::Pipeline
