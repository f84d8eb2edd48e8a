#pragma once

/**
 * @file EmbeddingMatcher.h
 * @brief Threshold match decision and stored embedding parsing
 *
 * Stored embeddings arrive either already decoded (a numeric sequence) or as
 * JSON array text. Both forms go through the same element and length rules:
 *
 * @code
 * auto stored = ParseStoredEmbedding(std::string(row.embeddingJson));
 * auto result = Compare(probe, stored, MatchParams::FromEnvironment());
 * if (result.isMatch) { ... }
 * @endcode
 */

#include <FaceGate/Match/MatchTypes.h>

#include <string>
#include <variant>
#include <vector>

namespace FaceGate::Match {

// =============================================================================
// Similarity
// =============================================================================

/**
 * @brief max(0, 1 - d / sqrt(2 * len))
 * @throws DimensionMismatchError
 */
double EuclideanSimilarity(const Embedding& a, const Embedding& b);

/**
 * @brief max(0, 1 - d / (2 * len))
 * @throws DimensionMismatchError
 */
double ManhattanSimilarity(const Embedding& a, const Embedding& b);

/**
 * @brief Similarity of a and b under the given metric
 *
 * @throws DimensionMismatchError, EmptyVectorError, ZeroVectorError
 */
double Similarity(const Embedding& a, const Embedding& b,
                  SimilarityMetric metric = SimilarityMetric::Cosine);

/**
 * @brief Match decision: isMatch = similarity >= params.threshold
 *
 * @throws InvalidArgumentException if params.threshold is outside [0, 1]
 * @throws DimensionMismatchError, EmptyVectorError, ZeroVectorError
 */
MatchResult Compare(const Embedding& a, const Embedding& b,
                    const MatchParams& params = MatchParams());

/**
 * @brief Match decision with the default metric and a given threshold
 */
MatchResult Compare(const Embedding& a, const Embedding& b, double threshold);

/**
 * @brief Cosine, Euclidean and Manhattan values for one pair
 */
SimilarityReport AllSimilarities(const Embedding& a, const Embedding& b);

// =============================================================================
// Stored Embeddings
// =============================================================================

/// Stored embedding as held by a store: JSON text or decoded numbers
using StoredEmbeddingInput = std::variant<std::string, std::vector<double>>;

/**
 * @brief Decode JSON array text into an embedding
 *
 * Only format rules apply: the text must be a JSON array whose elements are
 * all finite numbers. No length check.
 *
 * @throws EmbeddingFormatError
 */
Embedding DecodeEmbeddingText(const std::string& text);

/**
 * @brief Encode an embedding as compact JSON array text
 */
std::string EncodeEmbeddingText(const Embedding& embedding);

/**
 * @brief Parse and validate a stored embedding
 *
 * Applies the format rules of DecodeEmbeddingText to either variant
 * alternative, then requires limits.minDimension <= length <=
 * limits.maxDimension.
 *
 * @throws EmbeddingFormatError
 */
Embedding ParseStoredEmbedding(const StoredEmbeddingInput& input,
                               const EmbeddingLimits& limits = EmbeddingLimits());

/**
 * @brief Apply the stored embedding rules to an already decoded embedding
 *
 * Used on vectors read back from an EmbeddingStore, which may hold entries
 * written by other processes.
 *
 * @throws EmbeddingFormatError
 */
void ValidateStoredEmbedding(const Embedding& embedding,
                             const EmbeddingLimits& limits = EmbeddingLimits());

} // namespace FaceGate::Match
