/**
 * @file test_embedding_matcher.cpp
 * @brief Unit tests for match decisions and stored embedding parsing
 */

#include <FaceGate/Match/EmbeddingMatcher.h>
#include <FaceGate/Match/VectorMath.h>
#include <FaceGate/Core/Exception.h>

#include <gtest/gtest.h>

#include <cmath>
#include <cstdlib>
#include <limits>
#include <string>

using namespace FaceGate;
using namespace FaceGate::Match;

namespace {

std::vector<double> Ramp(size_t n) {
    std::vector<double> values(n);
    for (size_t i = 0; i < n; ++i) {
        values[i] = 0.01 * static_cast<double>(i + 1);
    }
    return values;
}

class SimilarityThresholdEnvTest : public ::testing::Test {
protected:
    void TearDown() override {
        unsetenv("SIMILARITY_THRESHOLD");
    }
};

} // anonymous namespace

// =============================================================================
// Match Decision
// =============================================================================

TEST(CompareTest, IdenticalVectorsMatch) {
    Embedding a = Normalize({0.2f, -0.5f, 0.7f, 0.1f});
    MatchResult result = Compare(a, a, 0.6);
    EXPECT_NEAR(result.similarity, 1.0, 1e-6);
    EXPECT_TRUE(result.isMatch);
    EXPECT_DOUBLE_EQ(result.threshold, 0.6);
    EXPECT_EQ(result.metric, SimilarityMetric::Cosine);
}

TEST(CompareTest, ThresholdIsInclusive) {
    // cos = 0.6 exactly for (1, 0) vs (0.6, 0.8)
    MatchResult result = Compare({1.0f, 0.0f}, {0.6f, 0.8f}, 0.6);
    EXPECT_NEAR(result.similarity, 0.6, 1e-6);

    EXPECT_TRUE(Compare({1.0f, 0.0f}, {1.0f, 0.0f}, 1.0).isMatch);
    EXPECT_TRUE(Compare({1.0f, 0.0f}, {0.0f, 1.0f}, 0.0).isMatch);
    EXPECT_FALSE(Compare({1.0f, 0.0f}, {0.0f, 1.0f}, 0.01).isMatch);
}

TEST(CompareTest, OppositeVectorsDoNotMatch) {
    MatchResult result = Compare({1.0f, 2.0f}, {-1.0f, -2.0f});
    EXPECT_NEAR(result.similarity, -1.0, 1e-9);
    EXPECT_FALSE(result.isMatch);
}

TEST(CompareTest, Errors) {
    EXPECT_THROW(Compare({1, 2, 3}, {1, 2}, 0.6), DimensionMismatchError);
    EXPECT_THROW(Compare({1, 2}, {1, 2}, 1.5), InvalidArgumentException);
    EXPECT_THROW(Compare({1, 2}, {1, 2}, -0.1), InvalidArgumentException);
    EXPECT_THROW(Compare({0, 0}, {1, 2}, 0.6), ZeroVectorError);
}

TEST(CompareTest, DistanceMetrics) {
    Embedding a = {1.0f, 0.0f};
    Embedding b = {0.0f, 1.0f};

    // sqrt(2) / sqrt(4)
    EXPECT_NEAR(EuclideanSimilarity(a, b), 1.0 - std::sqrt(2.0) / 2.0, 1e-9);
    // 2 / 4
    EXPECT_NEAR(ManhattanSimilarity(a, b), 0.5, 1e-9);
    // Floored at zero beyond the unit-vector range
    EXPECT_DOUBLE_EQ(EuclideanSimilarity({5.0f, 0.0f}, {-5.0f, 0.0f}), 0.0);

    MatchResult result = Compare(a, b, MatchParams().SetMetric(SimilarityMetric::Manhattan)
                                                    .SetThreshold(0.5));
    EXPECT_TRUE(result.isMatch);
    EXPECT_EQ(result.metric, SimilarityMetric::Manhattan);
}

TEST(CompareTest, AllSimilarities) {
    SimilarityReport report = AllSimilarities({1.0f, 0.0f}, {0.0f, 1.0f});
    EXPECT_NEAR(report.cosine, 0.0, 1e-12);
    EXPECT_NEAR(report.euclidean.distance, std::sqrt(2.0), 1e-9);
    EXPECT_NEAR(report.manhattan.distance, 2.0, 1e-9);
    EXPECT_NEAR(report.manhattan.similarity, 0.5, 1e-9);
}

TEST(MetricTest, NamesRoundTrip) {
    EXPECT_EQ(ParseMetric("Euclidean"), SimilarityMetric::Euclidean);
    EXPECT_EQ(MetricName(ParseMetric("MANHATTAN")), "manhattan");
    EXPECT_THROW(ParseMetric("hamming"), InvalidArgumentException);
}

// =============================================================================
// Environment
// =============================================================================

TEST_F(SimilarityThresholdEnvTest, DefaultWhenUnset) {
    unsetenv("SIMILARITY_THRESHOLD");
    EXPECT_DOUBLE_EQ(MatchParams::FromEnvironment().threshold, 0.6);
}

TEST_F(SimilarityThresholdEnvTest, ReadsValue) {
    setenv("SIMILARITY_THRESHOLD", "0.75", 1);
    EXPECT_DOUBLE_EQ(MatchParams::FromEnvironment().threshold, 0.75);
}

TEST_F(SimilarityThresholdEnvTest, UnparsableKeepsDefault) {
    setenv("SIMILARITY_THRESHOLD", "strict", 1);
    EXPECT_DOUBLE_EQ(MatchParams::FromEnvironment().threshold, 0.6);
}

TEST_F(SimilarityThresholdEnvTest, OutOfRangeThrows) {
    setenv("SIMILARITY_THRESHOLD", "1.2", 1);
    EXPECT_THROW(MatchParams::FromEnvironment(), InvalidArgumentException);
}

// =============================================================================
// Stored Embeddings
// =============================================================================

TEST(DecodeEmbeddingTextTest, NumericArray) {
    Embedding v = DecodeEmbeddingText("[1, 2.5, -3]");
    ASSERT_EQ(v.size(), 3u);
    EXPECT_FLOAT_EQ(v[0], 1.0f);
    EXPECT_FLOAT_EQ(v[1], 2.5f);
    EXPECT_FLOAT_EQ(v[2], -3.0f);

    Embedding back = DecodeEmbeddingText(EncodeEmbeddingText(v));
    EXPECT_EQ(back, v);
}

TEST(DecodeEmbeddingTextTest, Malformed) {
    EXPECT_THROW(DecodeEmbeddingText("[1, \"x\", 3]"), EmbeddingFormatError);
    EXPECT_THROW(DecodeEmbeddingText("[1, null]"), EmbeddingFormatError);
    EXPECT_THROW(DecodeEmbeddingText("{\"v\": [1]}"), EmbeddingFormatError);
    EXPECT_THROW(DecodeEmbeddingText("[1, 2"), EmbeddingFormatError);
    EXPECT_THROW(DecodeEmbeddingText("[1e400]"), EmbeddingFormatError);
}

TEST(DecodeEmbeddingTextTest, RejectsTrailingContent) {
    EXPECT_THROW(DecodeEmbeddingText("[1,2,3] trailing"), EmbeddingFormatError);
    EXPECT_THROW(DecodeEmbeddingText("[1,2,3][4]"), EmbeddingFormatError);
    EXPECT_THROW(DecodeEmbeddingText("[1, 2] // note"), EmbeddingFormatError);
    EXPECT_THROW(DecodeEmbeddingText("[1, /* x */ 2]"), EmbeddingFormatError);

    EXPECT_EQ(DecodeEmbeddingText("  [1, 2, 3]\n").size(), 3u);
}

TEST(ParseStoredEmbeddingTest, AcceptsTextAndNumbers) {
    std::vector<double> values = Ramp(128);
    Embedding fromNumbers = ParseStoredEmbedding(values);
    ASSERT_EQ(fromNumbers.size(), 128u);
    EXPECT_FLOAT_EQ(fromNumbers[127], 1.28f);

    Embedding fromText = ParseStoredEmbedding(EncodeEmbeddingText(fromNumbers));
    EXPECT_EQ(fromText, fromNumbers);
}

TEST(ParseStoredEmbeddingTest, DimensionLimits) {
    try {
        ParseStoredEmbedding(std::string("[1, 2, 3]"));
        FAIL() << "expected EmbeddingFormatError";
    } catch (const EmbeddingFormatError& e) {
        EXPECT_NE(std::string(e.what()).find("Unusual embedding size: 3"), std::string::npos);
    }

    EXPECT_THROW(ParseStoredEmbedding(Ramp(63)), EmbeddingFormatError);
    EXPECT_NO_THROW(ParseStoredEmbedding(Ramp(64)));
    EXPECT_NO_THROW(ParseStoredEmbedding(Ramp(2048)));
    EXPECT_THROW(ParseStoredEmbedding(Ramp(2049)), EmbeddingFormatError);

    EmbeddingLimits loose;
    loose.minDimension = 1;
    EXPECT_EQ(ParseStoredEmbedding(std::string("[1, 2, 3]"), loose).size(), 3u);
}

TEST(ValidateStoredEmbeddingTest, AppliesElementAndLengthRules) {
    Embedding stored(512, 0.04f);
    EXPECT_NO_THROW(ValidateStoredEmbedding(stored));

    stored[3] = std::nanf("");
    EXPECT_THROW(ValidateStoredEmbedding(stored), EmbeddingFormatError);
    stored[3] = std::numeric_limits<float>::infinity();
    EXPECT_THROW(ValidateStoredEmbedding(stored), EmbeddingFormatError);

    EXPECT_THROW(ValidateStoredEmbedding(Embedding(32, 0.1f)), EmbeddingFormatError);
    EXPECT_THROW(ValidateStoredEmbedding(Embedding(2049, 0.1f)), EmbeddingFormatError);
}
