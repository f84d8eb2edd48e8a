#pragma once

/**
 * @file MatchTypes.h
 * @brief Embedding comparison types and parameters
 */

#include <FaceGate/Core/Constants.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace FaceGate::Match {

/// Face embedding vector
using Embedding = std::vector<float>;

// =============================================================================
// Enumerations
// =============================================================================

/**
 * @brief Similarity metric used for match decisions
 *
 * Distance metrics are mapped to [0, 1] similarities assuming unit-length
 * inputs: 1 - d / maxD with maxD = sqrt(2 * len) (Euclidean) or 2 * len
 * (Manhattan), floored at 0.
 */
enum class SimilarityMetric {
    Cosine,         ///< Normalized dot product, [-1, 1]
    Euclidean,      ///< Bounded Euclidean similarity, [0, 1]
    Manhattan       ///< Bounded Manhattan similarity, [0, 1]
};

/**
 * @brief Lower-case metric name ("cosine", "euclidean", "manhattan")
 */
std::string MetricName(SimilarityMetric metric);

/**
 * @brief Parse a metric name, case-insensitive
 * @throws InvalidArgumentException for unknown names
 */
SimilarityMetric ParseMetric(const std::string& name);

// =============================================================================
// Parameters
// =============================================================================

/// Default similarity threshold for a match
constexpr double DEFAULT_SIMILARITY_THRESHOLD = 0.6;

/**
 * @brief Match decision parameters
 */
struct MatchParams {
    double threshold = DEFAULT_SIMILARITY_THRESHOLD;   ///< isMatch = similarity >= threshold, [0, 1]
    SimilarityMetric metric = SimilarityMetric::Cosine;

    static MatchParams Default() {
        return MatchParams();
    }

    /**
     * @brief Read SIMILARITY_THRESHOLD from the environment
     *
     * Unset or unparsable values keep the default threshold.
     *
     * @throws InvalidArgumentException if the value lies outside [0, 1]
     */
    static MatchParams FromEnvironment();

    MatchParams& SetThreshold(double v) { threshold = v; return *this; }
    MatchParams& SetMetric(SimilarityMetric v) { metric = v; return *this; }

    /// @throws InvalidArgumentException if threshold is not within [0, 1]
    void Validate() const;
};

/**
 * @brief Accepted length range of embeddings read back from storage
 */
struct EmbeddingLimits {
    size_t minDimension = MIN_STORED_DIMENSION;
    size_t maxDimension = MAX_STORED_DIMENSION;
};

// =============================================================================
// Results
// =============================================================================

/**
 * @brief Match decision
 */
struct MatchResult {
    double similarity = 0.0;
    bool isMatch = false;
    double threshold = DEFAULT_SIMILARITY_THRESHOLD;
    SimilarityMetric metric = SimilarityMetric::Cosine;
};

/**
 * @brief Distance with its bounded similarity
 */
struct DistanceSimilarity {
    double distance = 0.0;
    double similarity = 0.0;
};

/**
 * @brief All metrics for one vector pair
 */
struct SimilarityReport {
    double cosine = 0.0;
    DistanceSimilarity euclidean;
    DistanceSimilarity manhattan;
};

} // namespace FaceGate::Match
