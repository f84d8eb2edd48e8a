/**
 * @file VectorMath.cpp
 * @brief Dense vector operations implementation
 */

#include <FaceGate/Match/VectorMath.h>
#include <FaceGate/Core/Exception.h>

#include <algorithm>
#include <cmath>

namespace FaceGate::Match {

namespace {

inline void RequireSameLength(const Embedding& a, const Embedding& b) {
    if (a.size() != b.size()) {
        throw DimensionMismatchError(a.size(), b.size());
    }
}

} // anonymous namespace

double Dot(const Embedding& a, const Embedding& b) {
    RequireSameLength(a, b);

    double sum = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        sum += static_cast<double>(a[i]) * b[i];
    }
    return sum;
}

double Magnitude(const Embedding& v) {
    double sumSq = 0.0;
    for (float value : v) {
        sumSq += static_cast<double>(value) * value;
    }
    return std::sqrt(sumSq);
}

double CosineSimilarity(const Embedding& a, const Embedding& b) {
    RequireSameLength(a, b);
    if (a.empty()) {
        throw EmptyVectorError();
    }

    double dot = 0.0;
    double magA = 0.0;
    double magB = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        double va = a[i];
        double vb = b[i];
        dot += va * vb;
        magA += va * va;
        magB += vb * vb;
    }

    magA = std::sqrt(magA);
    magB = std::sqrt(magB);
    if (magA == 0.0 || magB == 0.0) {
        throw ZeroVectorError("Cannot calculate similarity for zero vectors");
    }

    // Clamp to [-1, 1] against rounding
    return std::clamp(dot / (magA * magB), -1.0, 1.0);
}

double EuclideanDistance(const Embedding& a, const Embedding& b) {
    RequireSameLength(a, b);

    double sumSq = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        double diff = static_cast<double>(a[i]) - b[i];
        sumSq += diff * diff;
    }
    return std::sqrt(sumSq);
}

double ManhattanDistance(const Embedding& a, const Embedding& b) {
    RequireSameLength(a, b);

    double sum = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        sum += std::abs(static_cast<double>(a[i]) - b[i]);
    }
    return sum;
}

Embedding Normalize(const Embedding& v) {
    if (v.empty()) {
        throw EmptyVectorError("Vector cannot be empty");
    }

    double sumSq = 0.0;
    for (size_t i = 0; i < v.size(); ++i) {
        if (!std::isfinite(v[i])) {
            throw EmbeddingFormatError("non-finite element at index " + std::to_string(i));
        }
        sumSq += static_cast<double>(v[i]) * v[i];
    }

    double magnitude = std::sqrt(sumSq);
    if (magnitude == 0.0) {
        throw ZeroVectorError("Cannot normalize zero vector");
    }

    Embedding result(v.size());
    for (size_t i = 0; i < v.size(); ++i) {
        result[i] = static_cast<float>(v[i] / magnitude);
    }
    return result;
}

bool IsUnitLength(const Embedding& v, double tolerance) {
    return !v.empty() && std::abs(Magnitude(v) - 1.0) <= tolerance;
}

} // namespace FaceGate::Match
