#pragma once

/**
 * @file FacePipeline.h
 * @brief Exposed face operations: preprocess, locate, embed, register, verify
 *
 * Stage order of ProcessFaceImage:
 * 1. Quality gate on the encoded bytes (no pixel decode)
 * 2. Lighting on a 224x224 greyscale cover sample
 * 3. Sharpness on a 300x300 greyscale cover sample
 * 4. Face location on a 400x400 edge map (exactly one face)
 * 5. 112x112 RGB cover resize for the embedding model
 *
 * The first failing stage throws and nothing after it runs.
 *
 * Model and store are borrowed; the caller keeps them alive for the call.
 */

#include <FaceGate/Core/Types.h>
#include <FaceGate/Embed/EmbeddingModel.h>
#include <FaceGate/Embed/EmbeddingStore.h>
#include <FaceGate/Match/EmbeddingMatcher.h>
#include <FaceGate/Pipeline/PipelineTypes.h>

#include <string>

namespace FaceGate::Pipeline {

// =============================================================================
// Image Stages
// =============================================================================

/**
 * @brief Decode and cover-resize to the model input size
 *
 * Alpha is dropped and greyscale is expanded, so the result is always
 * targetSize x targetSize x 3.
 *
 * @throws ValidationError if the image is smaller than minSide in either axis
 * @throws IOException, UnsupportedException from decoding
 */
Image Preprocess(const ByteBuffer& bytes, const PreprocessParams& params = PreprocessParams());

/**
 * @brief Locate the single face of an image
 * @throws NoFaceError, MultipleFaceError
 */
Detect::LocateResult LocateFace(const ByteBuffer& bytes,
                                const PipelineParams& params = PipelineParams());

/**
 * @brief Run every validation stage and preprocess
 *
 * @throws ValidationError, LightingError, BlurError, NoFaceError,
 *         MultipleFaceError
 */
PreprocessResult ProcessFaceImage(const ByteBuffer& bytes,
                                  const PipelineParams& params = PipelineParams());

// =============================================================================
// Embedding Operations
// =============================================================================

/**
 * @brief Validated, L2-normalized embedding of the face in an image
 *
 * @throws ModelException if the model is not loaded or its output is invalid
 * @throws any ProcessFaceImage rejection
 */
Match::Embedding CreateEmbedding(const ByteBuffer& bytes, Embed::EmbeddingModel& model,
                                 const PipelineParams& params = PipelineParams());

/**
 * @brief Create an embedding and store it for userId (insert or replace)
 */
RegistrationResult RegisterUser(const std::string& userId, const ByteBuffer& bytes,
                                Embed::EmbeddingModel& model, Embed::EmbeddingStore& store,
                                const PipelineParams& params = PipelineParams());

/**
 * @brief Compare a probe image with the stored embedding of userId
 *
 * The store is consulted and the stored vector validated before any image
 * processing.
 *
 * @throws NotFoundException if userId has no stored embedding
 * @throws EmbeddingFormatError if the stored vector has a non-finite element
 *         or an unusual length
 */
VerificationResult VerifyUser(const std::string& userId, const ByteBuffer& bytes,
                              Embed::EmbeddingModel& model, const Embed::EmbeddingStore& store,
                              const PipelineParams& params = PipelineParams());

/**
 * @brief Compare a probe image with a caller-supplied stored embedding
 *
 * The stored value is parsed and validated before any image processing.
 *
 * @throws EmbeddingFormatError for a malformed stored embedding
 * @throws DimensionMismatchError if lengths differ from the model output
 */
Match::MatchResult CompareWithStored(const ByteBuffer& bytes,
                                     const Match::StoredEmbeddingInput& stored,
                                     Embed::EmbeddingModel& model,
                                     const PipelineParams& params = PipelineParams());

// =============================================================================
// Service Description
// =============================================================================

/**
 * @brief Describe limits and checks in effect
 * @param model Optional model; nullptr reports it as not loaded
 */
ServiceInfo GetServiceInfo(const PipelineParams& params = PipelineParams(),
                           const Embed::EmbeddingModel* model = nullptr);

/**
 * @brief Service description as a JSON document
 */
std::string ServiceInfoToJson(const ServiceInfo& info);

} // namespace FaceGate::Pipeline
