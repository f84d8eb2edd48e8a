/**
 * @file test_sharpness.cpp
 * @brief Unit tests for blur validation
 */

#include <FaceGate/Quality/Quality.h>
#include <FaceGate/Core/Exception.h>

#include <gtest/gtest.h>

#include <cmath>

using namespace FaceGate;
using namespace FaceGate::Quality;

namespace {

Image MakeCheckerboard(int32_t size, int32_t cell) {
    Image image(size, size);
    for (int32_t y = 0; y < size; ++y) {
        for (int32_t x = 0; x < size; ++x) {
            image.Set(x, y, ((x / cell + y / cell) % 2 == 0) ? 30 : 220);
        }
    }
    return image;
}

Image MakeVerticalRamp(int32_t size) {
    Image image(size, size);
    for (int32_t y = 0; y < size; ++y) {
        uint8_t v = static_cast<uint8_t>(std::lround(y * 255.0 / (size - 1)));
        for (int32_t x = 0; x < size; ++x) {
            image.Set(x, y, v);
        }
    }
    return image;
}

} // anonymous namespace

TEST(SharpnessTest, UniformIsBlurry) {
    Image flat(300, 300);
    flat.Fill(128);
    try {
        ValidateSharpness(flat);
        FAIL() << "expected BlurError";
    } catch (const BlurError& e) {
        EXPECT_DOUBLE_EQ(e.Variance(), 0.0);
        EXPECT_DOUBLE_EQ(e.Threshold(), 100.0);
        EXPECT_EQ(e.Kind(), ErrorKind::Blur);
    }
}

TEST(SharpnessTest, SmoothRampIsBlurry) {
    EXPECT_LT(MeasureSharpness(MakeVerticalRamp(300)), 100.0);
    EXPECT_THROW(ValidateSharpness(MakeVerticalRamp(300)), BlurError);
}

TEST(SharpnessTest, FineTextureIsSharp) {
    double variance = ValidateSharpness(MakeCheckerboard(300, 4));
    EXPECT_GT(variance, 100.0);
}

TEST(SharpnessTest, ThresholdIsConfigurable) {
    BlurParams params;
    params.SetMinVariance(0.0);
    EXPECT_NO_THROW(ValidateSharpness(MakeVerticalRamp(300), params));
}

TEST(BlurParamsTest, Validate) {
    EXPECT_NO_THROW(BlurParams().Validate());
    EXPECT_THROW(BlurParams().SetMinVariance(-1.0).Validate(), InvalidArgumentException);
    EXPECT_THROW(BlurParams().SetSampleSize(2).Validate(), InvalidArgumentException);
}
