#pragma once

/**
 * @file Constants.h
 * @brief Numeric constants and small helpers shared by FaceGate modules
 */

#include <cmath>
#include <cstddef>
#include <cstdint>

namespace FaceGate {

// =============================================================================
// Precision Constants
// =============================================================================

/// Tolerance used when checking that a vector has unit length
constexpr double UNIT_NORM_EPSILON = 1e-5;

// =============================================================================
// Model Boundary
// =============================================================================

/// Side length of the square RGB crop handed to the embedding model
constexpr int32_t FACE_INPUT_SIZE = 112;

/// Channels of the embedding model input (interleaved RGB)
constexpr int32_t FACE_INPUT_CHANNELS = 3;

/// Output length of the embedding model in use
constexpr size_t EMBEDDING_DIMENSION = 512;

/// Accepted length range for embeddings read back from a store
constexpr size_t MIN_STORED_DIMENSION = 64;
constexpr size_t MAX_STORED_DIMENSION = 2048;

// =============================================================================
// Algorithm Limits
// =============================================================================

/// Largest image side the decoder will allocate for
constexpr int32_t MAX_IMAGE_DIMENSION = 16384;

// =============================================================================
// Utility Functions
// =============================================================================

/**
 * @brief Clamp value to range
 */
template<typename T>
inline T Clamp(T value, T minVal, T maxVal) {
    return value < minVal ? minVal : (value > maxVal ? maxVal : value);
}

/**
 * @brief Square of a value
 */
template<typename T>
inline T Square(T x) {
    return x * x;
}

} // namespace FaceGate
