/**
 * @file test_pixel_stats.cpp
 * @brief Unit tests for intensity statistics
 */

#include <FaceGate/Internal/PixelStats.h>

#include <gtest/gtest.h>

#include <vector>

using namespace FaceGate;
using namespace FaceGate::Internal;

TEST(PixelStatsTest, EmptyBufferIsZero) {
    PixelStats stats = ComputePixelStats(nullptr, 0);
    EXPECT_EQ(stats.count, 0u);
    EXPECT_DOUBLE_EQ(stats.mean, 0.0);
    EXPECT_DOUBLE_EQ(stats.stdDev, 0.0);
}

TEST(PixelStatsTest, UniformHasZeroVariance) {
    std::vector<uint8_t> data(1000, 173);
    PixelStats stats = ComputePixelStats(data.data(), data.size());
    EXPECT_EQ(stats.count, 1000u);
    EXPECT_DOUBLE_EQ(stats.mean, 173.0);
    EXPECT_DOUBLE_EQ(stats.variance, 0.0);
    EXPECT_DOUBLE_EQ(stats.stdDev, 0.0);
}

TEST(PixelStatsTest, PopulationVariance) {
    // 0 and 200 in equal parts: mean 100, variance 10000
    std::vector<uint8_t> data = {0, 200, 0, 200};
    PixelStats stats = ComputePixelStats(data.data(), data.size());
    EXPECT_DOUBLE_EQ(stats.mean, 100.0);
    EXPECT_DOUBLE_EQ(stats.variance, 10000.0);
    EXPECT_DOUBLE_EQ(stats.stdDev, 100.0);
}

TEST(PixelStatsTest, ImageOverload) {
    Image image(10, 10);
    image.Fill(20);
    for (int32_t x = 0; x < 10; ++x) {
        image.Set(x, 0, 120);
    }
    PixelStats stats = ComputePixelStats(image);
    EXPECT_EQ(stats.count, 100u);
    EXPECT_DOUBLE_EQ(stats.mean, 30.0);
    EXPECT_NEAR(stats.stdDev, 30.0, 1e-9);
}
