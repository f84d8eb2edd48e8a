/**
 * @file test_exception.cpp
 * @brief Unit tests for the exception hierarchy
 */

#include <FaceGate/Core/Exception.h>

#include <gtest/gtest.h>

#include <string>

using namespace FaceGate;

TEST(ExceptionTest, KindNamesAreStable) {
    EXPECT_STREQ(KindName(ErrorKind::Validation), "validation_error");
    EXPECT_STREQ(KindName(ErrorKind::Lighting), "lighting_error");
    EXPECT_STREQ(KindName(ErrorKind::Blur), "blur_error");
    EXPECT_STREQ(KindName(ErrorKind::NoFace), "no_face_error");
    EXPECT_STREQ(KindName(ErrorKind::MultipleFace), "multiple_face_error");
    EXPECT_STREQ(KindName(ErrorKind::DimensionMismatch), "dimension_mismatch_error");
    EXPECT_STREQ(KindName(ErrorKind::EmbeddingFormat), "embedding_format_error");
    EXPECT_STREQ(KindName(ErrorKind::NotFound), "not_found");
}

TEST(ExceptionTest, CaughtThroughBase) {
    try {
        throw MultipleFaceError(3, "Multiple faces detected (3)");
    } catch (const Exception& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::MultipleFace);
        EXPECT_STREQ(e.KindName(), "multiple_face_error");
        EXPECT_STREQ(e.what(), "Multiple faces detected (3)");
    }
}

TEST(ExceptionTest, CaughtAsRuntimeError) {
    EXPECT_THROW(throw ValidationError("bad"), std::runtime_error);
}

TEST(ExceptionTest, DimensionMismatchCarriesLengths) {
    DimensionMismatchError e(512, 128);
    EXPECT_EQ(e.LengthA(), 512u);
    EXPECT_EQ(e.LengthB(), 128u);
    EXPECT_NE(std::string(e.what()).find("512"), std::string::npos);
    EXPECT_NE(std::string(e.what()).find("128"), std::string::npos);
}

TEST(ExceptionTest, LightingErrorCarriesMeasurements) {
    LightingError e(LightingError::Condition::TooDark, 12.5, 3.0, "Image too dark");
    EXPECT_EQ(e.GetCondition(), LightingError::Condition::TooDark);
    EXPECT_DOUBLE_EQ(e.Mean(), 12.5);
    EXPECT_DOUBLE_EQ(e.StdDev(), 3.0);
    EXPECT_EQ(e.Kind(), ErrorKind::Lighting);
}

TEST(ExceptionTest, EmbeddingFormatMessagePrefix) {
    EmbeddingFormatError e("Embedding contains non-numeric values");
    EXPECT_EQ(std::string(e.what()),
              "Invalid embedding format: Embedding contains non-numeric values");
}
