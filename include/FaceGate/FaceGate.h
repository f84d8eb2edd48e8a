#pragma once

/**
 * @file FaceGate.h
 * @brief Main header file for the FaceGate library
 *
 * FaceGate admits face photos through heuristic quality, lighting, sharpness
 * and face-presence checks, prepares the model input and matches face
 * embeddings against stored ones.
 *
 * @version 1.0.0
 */

// Core types and utilities
#include <FaceGate/Core/Types.h>
#include <FaceGate/Core/Constants.h>
#include <FaceGate/Core/Exception.h>
#include <FaceGate/Core/Image.h>
#include <FaceGate/Core/Log.h>

// Image layers
#include <FaceGate/IO/ImageIO.h>
#include <FaceGate/Color/ColorConvert.h>
#include <FaceGate/Transform/Resize.h>
#include <FaceGate/Filter/Filter.h>
#include <FaceGate/Blob/Blob.h>

// Feature modules
#include <FaceGate/Quality/Quality.h>
#include <FaceGate/Detect/DetectTypes.h>
#include <FaceGate/Detect/FaceScore.h>
#include <FaceGate/Detect/FaceLocator.h>
#include <FaceGate/Match/MatchTypes.h>
#include <FaceGate/Match/VectorMath.h>
#include <FaceGate/Match/EmbeddingMatcher.h>
#include <FaceGate/Embed/EmbeddingModel.h>
#include <FaceGate/Embed/EmbeddingStore.h>
#include <FaceGate/Pipeline/PipelineTypes.h>
#include <FaceGate/Pipeline/FacePipeline.h>

namespace FaceGate {

/**
 * @brief Get library version string
 * @return Version string in format "major.minor.patch"
 */
inline const char* GetVersion() {
    return "1.0.0";
}

/**
 * @brief Get library version as integers
 */
inline void GetVersion(int& major, int& minor, int& patch) {
    major = 1;
    minor = 0;
    patch = 0;
}

} // namespace FaceGate
