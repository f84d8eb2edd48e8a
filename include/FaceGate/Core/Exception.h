#pragma once

/**
 * @file Exception.h
 * @brief Exception hierarchy for FaceGate
 *
 * Every failure aborts the current call and is reported by throwing one of
 * the classes below. Each carries a stable ErrorKind so that callers can map
 * failures to transport-level responses without parsing messages.
 *
 * Library-level:
 * - InvalidArgumentException, UnsupportedException, IOException
 * - NotFoundException, ModelException
 *
 * Pipeline rejections:
 * - ValidationError, LightingError, BlurError, NoFaceError, MultipleFaceError
 *
 * Vector comparison:
 * - DimensionMismatchError, EmptyVectorError, ZeroVectorError,
 *   EmbeddingFormatError
 */

#include <cstddef>
#include <stdexcept>
#include <string>

namespace FaceGate {

/**
 * @brief Stable failure category
 */
enum class ErrorKind {
    Generic,
    InvalidArgument,
    Unsupported,
    IO,
    NotFound,
    Model,
    Validation,
    Lighting,
    Blur,
    NoFace,
    MultipleFace,
    DimensionMismatch,
    EmptyVector,
    ZeroVector,
    EmbeddingFormat
};

/**
 * @brief Stable identifier for an error kind (e.g. "validation_error")
 */
inline const char* KindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Generic: return "error";
        case ErrorKind::InvalidArgument: return "invalid_argument";
        case ErrorKind::Unsupported: return "unsupported";
        case ErrorKind::IO: return "io_error";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::Model: return "model_error";
        case ErrorKind::Validation: return "validation_error";
        case ErrorKind::Lighting: return "lighting_error";
        case ErrorKind::Blur: return "blur_error";
        case ErrorKind::NoFace: return "no_face_error";
        case ErrorKind::MultipleFace: return "multiple_face_error";
        case ErrorKind::DimensionMismatch: return "dimension_mismatch_error";
        case ErrorKind::EmptyVector: return "empty_vector_error";
        case ErrorKind::ZeroVector: return "zero_vector_error";
        case ErrorKind::EmbeddingFormat: return "embedding_format_error";
    }
    return "error";
}

// =============================================================================
// Base
// =============================================================================

class Exception : public std::runtime_error {
public:
    explicit Exception(const std::string& message, ErrorKind kind = ErrorKind::Generic)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind Kind() const noexcept { return kind_; }
    const char* KindName() const noexcept { return FaceGate::KindName(kind_); }

private:
    ErrorKind kind_;
};

// =============================================================================
// Library-level
// =============================================================================

class InvalidArgumentException : public Exception {
public:
    explicit InvalidArgumentException(const std::string& message)
        : Exception(message, ErrorKind::InvalidArgument) {}
};

class UnsupportedException : public Exception {
public:
    explicit UnsupportedException(const std::string& message)
        : Exception(message, ErrorKind::Unsupported) {}
};

class IOException : public Exception {
public:
    explicit IOException(const std::string& message)
        : Exception(message, ErrorKind::IO) {}
};

/// Requested key is absent from an embedding store
class NotFoundException : public Exception {
public:
    explicit NotFoundException(const std::string& message)
        : Exception(message, ErrorKind::NotFound) {}
};

/// Embedding model produced unusable output
class ModelException : public Exception {
public:
    explicit ModelException(const std::string& message)
        : Exception(message, ErrorKind::Model) {}
};

// =============================================================================
// Pipeline Rejections
// =============================================================================

/// Format / resolution / aspect ratio / file size rejection
class ValidationError : public Exception {
public:
    explicit ValidationError(const std::string& message)
        : Exception(message, ErrorKind::Validation) {}
};

class LightingError : public Exception {
public:
    enum class Condition {
        TooDark,
        TooBright,
        LowContrast
    };

    LightingError(Condition condition, double mean, double stdDev, const std::string& message)
        : Exception(message, ErrorKind::Lighting),
          condition_(condition), mean_(mean), stdDev_(stdDev) {}

    Condition GetCondition() const noexcept { return condition_; }
    double Mean() const noexcept { return mean_; }
    double StdDev() const noexcept { return stdDev_; }

private:
    Condition condition_;
    double mean_;
    double stdDev_;
};

class BlurError : public Exception {
public:
    BlurError(double variance, double threshold, const std::string& message)
        : Exception(message, ErrorKind::Blur), variance_(variance), threshold_(threshold) {}

    double Variance() const noexcept { return variance_; }
    double Threshold() const noexcept { return threshold_; }

private:
    double variance_;
    double threshold_;
};

class NoFaceError : public Exception {
public:
    explicit NoFaceError(const std::string& message)
        : Exception(message, ErrorKind::NoFace) {}
};

class MultipleFaceError : public Exception {
public:
    MultipleFaceError(size_t count, const std::string& message)
        : Exception(message, ErrorKind::MultipleFace), count_(count) {}

    size_t Count() const noexcept { return count_; }

private:
    size_t count_;
};

// =============================================================================
// Vector Comparison
// =============================================================================

class DimensionMismatchError : public Exception {
public:
    DimensionMismatchError(size_t lengthA, size_t lengthB)
        : Exception("Vector dimensions must match. A: " + std::to_string(lengthA) +
                    ", B: " + std::to_string(lengthB),
                    ErrorKind::DimensionMismatch),
          lengthA_(lengthA), lengthB_(lengthB) {}

    size_t LengthA() const noexcept { return lengthA_; }
    size_t LengthB() const noexcept { return lengthB_; }

private:
    size_t lengthA_;
    size_t lengthB_;
};

class EmptyVectorError : public Exception {
public:
    explicit EmptyVectorError(const std::string& message = "Vectors cannot be empty")
        : Exception(message, ErrorKind::EmptyVector) {}
};

class ZeroVectorError : public Exception {
public:
    explicit ZeroVectorError(const std::string& message = "Vector has zero magnitude")
        : Exception(message, ErrorKind::ZeroVector) {}
};

class EmbeddingFormatError : public Exception {
public:
    explicit EmbeddingFormatError(const std::string& message)
        : Exception("Invalid embedding format: " + message, ErrorKind::EmbeddingFormat) {}
};

} // namespace FaceGate
