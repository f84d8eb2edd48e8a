/**
 * @file EmbeddingMatcher.cpp
 * @brief Match decision and stored embedding parsing implementation
 */

#include <FaceGate/Match/EmbeddingMatcher.h>
#include <FaceGate/Core/Exception.h>
#include <FaceGate/Core/Log.h>
#include <FaceGate/Match/VectorMath.h>

#include <json/json.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <memory>

namespace FaceGate::Match {

// =============================================================================
// Parameters
// =============================================================================

std::string MetricName(SimilarityMetric metric) {
    switch (metric) {
        case SimilarityMetric::Cosine: return "cosine";
        case SimilarityMetric::Euclidean: return "euclidean";
        case SimilarityMetric::Manhattan: return "manhattan";
    }
    return "cosine";
}

SimilarityMetric ParseMetric(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "cosine") return SimilarityMetric::Cosine;
    if (lower == "euclidean") return SimilarityMetric::Euclidean;
    if (lower == "manhattan") return SimilarityMetric::Manhattan;
    throw InvalidArgumentException("Unknown similarity metric: " + name +
                                   ". Expected cosine, euclidean or manhattan");
}

void MatchParams::Validate() const {
    if (!(threshold >= 0.0 && threshold <= 1.0)) {
        throw InvalidArgumentException("Similarity threshold must be between 0 and 1, got " +
                                       std::to_string(threshold));
    }
}

MatchParams MatchParams::FromEnvironment() {
    MatchParams params;

    const char* env = std::getenv("SIMILARITY_THRESHOLD");
    if (env == nullptr || *env == '\0') {
        return params;
    }

    char* end = nullptr;
    double value = std::strtod(env, &end);
    if (end == env || !std::isfinite(value)) {
        Log::Get()->warn("Ignoring unparsable SIMILARITY_THRESHOLD '{}', using {}",
                         env, params.threshold);
        return params;
    }

    params.threshold = value;
    params.Validate();
    return params;
}

// =============================================================================
// Similarity
// =============================================================================

double EuclideanSimilarity(const Embedding& a, const Embedding& b) {
    double distance = EuclideanDistance(a, b);
    if (a.empty()) return 0.0;
    double maxDistance = std::sqrt(2.0 * static_cast<double>(a.size()));
    return std::max(0.0, 1.0 - distance / maxDistance);
}

double ManhattanSimilarity(const Embedding& a, const Embedding& b) {
    double distance = ManhattanDistance(a, b);
    if (a.empty()) return 0.0;
    double maxDistance = 2.0 * static_cast<double>(a.size());
    return std::max(0.0, 1.0 - distance / maxDistance);
}

double Similarity(const Embedding& a, const Embedding& b, SimilarityMetric metric) {
    switch (metric) {
        case SimilarityMetric::Euclidean:
            return EuclideanSimilarity(a, b);
        case SimilarityMetric::Manhattan:
            return ManhattanSimilarity(a, b);
        case SimilarityMetric::Cosine:
            break;
    }
    return CosineSimilarity(a, b);
}

MatchResult Compare(const Embedding& a, const Embedding& b, const MatchParams& params) {
    params.Validate();

    MatchResult result;
    result.similarity = Similarity(a, b, params.metric);
    result.threshold = params.threshold;
    result.metric = params.metric;
    result.isMatch = result.similarity >= params.threshold;

    Log::Get()->debug("Compare ({}): similarity {:.4f}, threshold {:.2f} -> {}",
                      MetricName(params.metric), result.similarity, params.threshold,
                      result.isMatch ? "match" : "no match");
    return result;
}

MatchResult Compare(const Embedding& a, const Embedding& b, double threshold) {
    return Compare(a, b, MatchParams().SetThreshold(threshold));
}

SimilarityReport AllSimilarities(const Embedding& a, const Embedding& b) {
    SimilarityReport report;
    report.cosine = CosineSimilarity(a, b);
    report.euclidean.distance = EuclideanDistance(a, b);
    report.euclidean.similarity = EuclideanSimilarity(a, b);
    report.manhattan.distance = ManhattanDistance(a, b);
    report.manhattan.similarity = ManhattanSimilarity(a, b);
    return report;
}

// =============================================================================
// Stored Embeddings
// =============================================================================

namespace {

Embedding FromNumbers(const std::vector<double>& values) {
    Embedding embedding;
    embedding.reserve(values.size());
    for (double value : values) {
        float element = static_cast<float>(value);
        if (!std::isfinite(value) || !std::isfinite(element)) {
            throw EmbeddingFormatError("Embedding contains non-numeric values");
        }
        embedding.push_back(element);
    }
    return embedding;
}

void CheckDimension(size_t length, const EmbeddingLimits& limits) {
    if (length < limits.minDimension || length > limits.maxDimension) {
        throw EmbeddingFormatError("Unusual embedding size: " + std::to_string(length) +
                                   ". Expected between " + std::to_string(limits.minDimension) +
                                   "-" + std::to_string(limits.maxDimension) + " dimensions.");
    }
}

} // anonymous namespace

Embedding DecodeEmbeddingText(const std::string& text) {
    Json::CharReaderBuilder builder;
    Json::CharReaderBuilder::strictMode(&builder.settings_);
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    const char* begin = text.data();
    const char* end = begin + text.size();
    if (!reader->parse(begin, end, &root, &errors)) {
        throw EmbeddingFormatError("Embedding text is not valid JSON");
    }
    if (!root.isArray()) {
        throw EmbeddingFormatError("Embedding must be an array");
    }

    std::vector<double> values;
    values.reserve(root.size());
    for (Json::ArrayIndex i = 0; i < root.size(); ++i) {
        const Json::Value& element = root[i];
        if (!element.isNumeric()) {
            throw EmbeddingFormatError("Embedding contains non-numeric values");
        }
        values.push_back(element.asDouble());
    }
    return FromNumbers(values);
}

std::string EncodeEmbeddingText(const Embedding& embedding) {
    Json::Value array(Json::arrayValue);
    for (float value : embedding) {
        array.append(static_cast<double>(value));
    }

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, array);
}

Embedding ParseStoredEmbedding(const StoredEmbeddingInput& input, const EmbeddingLimits& limits) {
    Embedding embedding;
    if (const auto* text = std::get_if<std::string>(&input)) {
        embedding = DecodeEmbeddingText(*text);
    } else {
        embedding = FromNumbers(std::get<std::vector<double>>(input));
    }

    CheckDimension(embedding.size(), limits);
    return embedding;
}

void ValidateStoredEmbedding(const Embedding& embedding, const EmbeddingLimits& limits) {
    for (float value : embedding) {
        if (!std::isfinite(value)) {
            throw EmbeddingFormatError("Embedding contains non-numeric values");
        }
    }
    CheckDimension(embedding.size(), limits);
}

} // namespace FaceGate::Match
