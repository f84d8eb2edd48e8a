#pragma once

/**
 * @file VectorMath.h
 * @brief Dense vector operations on embeddings
 *
 * Accumulation is done in double precision. Pairwise operations require
 * equal lengths (DimensionMismatchError).
 */

#include <FaceGate/Match/MatchTypes.h>

namespace FaceGate::Match {

/**
 * @brief Sum of a[i] * b[i]
 * @throws DimensionMismatchError
 */
double Dot(const Embedding& a, const Embedding& b);

/**
 * @brief Euclidean norm
 */
double Magnitude(const Embedding& v);

/**
 * @brief Cosine similarity clamped to [-1, 1]
 *
 * @throws DimensionMismatchError if lengths differ
 * @throws EmptyVectorError if the vectors are empty
 * @throws ZeroVectorError if either vector has zero magnitude
 */
double CosineSimilarity(const Embedding& a, const Embedding& b);

/**
 * @brief sqrt(sum((a[i] - b[i])^2))
 * @throws DimensionMismatchError
 */
double EuclideanDistance(const Embedding& a, const Embedding& b);

/**
 * @brief sum(|a[i] - b[i]|)
 * @throws DimensionMismatchError
 */
double ManhattanDistance(const Embedding& a, const Embedding& b);

/**
 * @brief Scale to unit Euclidean norm
 *
 * Normalizing an already normalized vector returns it unchanged within
 * floating point tolerance.
 *
 * @throws EmptyVectorError, ZeroVectorError
 * @throws EmbeddingFormatError if an element is not finite
 */
Embedding Normalize(const Embedding& v);

/**
 * @brief |norm - 1| <= tolerance
 */
bool IsUnitLength(const Embedding& v, double tolerance = UNIT_NORM_EPSILON);

} // namespace FaceGate::Match
