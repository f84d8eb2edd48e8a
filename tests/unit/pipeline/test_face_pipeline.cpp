/**
 * @file test_face_pipeline.cpp
 * @brief End-to-end tests for face admission, registration and verification
 */

#include <FaceGate/Pipeline/FacePipeline.h>
#include <FaceGate/Core/Exception.h>
#include <FaceGate/IO/ImageIO.h>
#include <FaceGate/Match/VectorMath.h>

#include <gtest/gtest.h>

#include <cmath>
#include <string>

using namespace FaceGate;
using namespace FaceGate::Pipeline;

namespace {

// =============================================================================
// Test Images
// =============================================================================

// Vertical gradient 40 .. 215
Image MakeBackground(int32_t size = 400) {
    Image image(size, size);
    for (int32_t y = 0; y < size; ++y) {
        uint8_t v = static_cast<uint8_t>(std::lround(40.0 + y * 175.0 / (size - 1)));
        for (int32_t x = 0; x < size; ++x) {
            image.Set(x, y, v);
        }
    }
    return image;
}

// Square outline of fine checker texture, interior untouched
void DrawFaceOutline(Image& image, int32_t x0, int32_t y0, int32_t size = 100,
                     int32_t thickness = 10) {
    for (int32_t y = y0; y < y0 + size; ++y) {
        for (int32_t x = x0; x < x0 + size; ++x) {
            bool inner = x >= x0 + thickness && x < x0 + size - thickness &&
                         y >= y0 + thickness && y < y0 + size - thickness;
            if (!inner) {
                image.Set(x, y, ((x + y) % 2 == 0) ? 255 : 0);
            }
        }
    }
}

void DrawCheckerPatch(Image& image, int32_t x0, int32_t y0, int32_t size = 30) {
    for (int32_t y = y0; y < y0 + size; ++y) {
        for (int32_t x = x0; x < x0 + size; ++x) {
            image.Set(x, y, ((x + y) % 2 == 0) ? 255 : 0);
        }
    }
}

ByteBuffer SingleFacePng() {
    Image image = MakeBackground();
    DrawFaceOutline(image, 150, 150);
    return IO::EncodePng(image);
}

ByteBuffer SingleFaceWebP() {
    Image image = MakeBackground();
    DrawFaceOutline(image, 150, 150);
    return IO::EncodeWebPLossless(image);
}

ByteBuffer TwoFacesPng() {
    Image image = MakeBackground();
    DrawFaceOutline(image, 40, 150);
    DrawFaceOutline(image, 260, 150);
    return IO::EncodePng(image);
}

ByteBuffer NoFacePng() {
    Image image = MakeBackground();
    DrawCheckerPatch(image, 20, 20);
    DrawCheckerPatch(image, 350, 20);
    return IO::EncodePng(image);
}

ByteBuffer UniformPng(int32_t size, uint8_t value) {
    Image image(size, size);
    image.Fill(value);
    return IO::EncodePng(image);
}

ByteBuffer RampPng(int32_t size) {
    Image image(size, size);
    for (int32_t y = 0; y < size; ++y) {
        uint8_t v = static_cast<uint8_t>(std::lround(y * 255.0 / (size - 1)));
        for (int32_t x = 0; x < size; ++x) {
            image.Set(x, y, v);
        }
    }
    return IO::EncodePng(image);
}

// Synthetic PNGs compress well below the default 2KB floor
PipelineParams TestParams() {
    PipelineParams params;
    params.quality.SetFileSizeRange(1, 10 * 1024 * 1024);
    return params;
}

// =============================================================================
// Test Model
// =============================================================================

/**
 * Deterministic stand-in for a network: folds the tensor into 512 bins.
 * `sign` flips the output to simulate a different identity.
 */
class FoldingModel : public Embed::EmbeddingModel {
public:
    std::string Name() const override { return "folding-test-model"; }
    bool IsLoaded() const override { return loaded; }

    Match::Embedding Infer(const Embed::InputTensor& tensor) override {
        ++inferCount;
        Match::Embedding out(Dimension(), 0.0f);
        if (zeroOutput) return out;

        for (size_t i = 0; i < tensor.data.size(); ++i) {
            out[i % out.size()] += tensor.data[i];
        }
        for (size_t i = 0; i < out.size(); ++i) {
            out[i] = sign * (out[i] + 0.1f * static_cast<float>(i % 7 + 1));
        }
        return out;
    }

    bool loaded = true;
    bool zeroOutput = false;
    float sign = 1.0f;
    int inferCount = 0;
};

template <typename E, typename Check>
void ExpectRejected(const ByteBuffer& bytes, const PipelineParams& params, Check check) {
    try {
        ProcessFaceImage(bytes, params);
        ADD_FAILURE() << "image was accepted";
    } catch (const E& e) {
        check(e);
    }
}

} // anonymous namespace

// =============================================================================
// Processing
// =============================================================================

TEST(ProcessFaceImageTest, AcceptsSingleFace) {
    PreprocessResult result = ProcessFaceImage(SingleFacePng(), TestParams());

    EXPECT_EQ(result.metadata.format, IO::ImageFormat::PNG);
    EXPECT_EQ(result.metadata.width, 400);
    EXPECT_NEAR(result.lighting.mean, 127.5, 0.5);
    EXPECT_NEAR(result.lighting.stdDev, 50.46, 0.5);
    EXPECT_GT(result.sharpness, 100.0);

    EXPECT_EQ(result.location.passIndex, 0);
    EXPECT_EQ(result.location.sourceRegion, (Rect2i{149, 149, 102, 102}));
    EXPECT_NEAR(result.location.region.faceScore, 0.7022, 1e-3);

    EXPECT_EQ(result.face.Width(), 112);
    EXPECT_EQ(result.face.Height(), 112);
    EXPECT_EQ(result.face.Channels(), 3);
}

TEST(ProcessFaceImageTest, AcceptsWebP) {
    if (!IO::WebPCodecAvailable()) {
        GTEST_SKIP() << "built without libwebp";
    }

    PreprocessResult result = ProcessFaceImage(SingleFaceWebP(), TestParams());

    EXPECT_EQ(result.metadata.format, IO::ImageFormat::WebP);
    EXPECT_EQ(result.metadata.width, 400);
    EXPECT_EQ(result.metadata.height, 400);
    EXPECT_NEAR(result.lighting.mean, 127.5, 0.5);
    EXPECT_EQ(result.location.passIndex, 0);
    EXPECT_EQ(result.location.sourceRegion, (Rect2i{149, 149, 102, 102}));
    EXPECT_NEAR(result.location.region.faceScore, 0.7022, 1e-3);
    EXPECT_EQ(result.face.Channels(), 3);
}

TEST(RegisterVerifyTest, WebPProbeMatchesPngRegistration) {
    if (!IO::WebPCodecAvailable()) {
        GTEST_SKIP() << "built without libwebp";
    }

    FoldingModel model;
    Embed::MemoryEmbeddingStore store;
    RegisterUser("alice", SingleFacePng(), model, store, TestParams());

    VerificationResult verified = VerifyUser("alice", SingleFaceWebP(), model, store,
                                             TestParams());
    EXPECT_TRUE(verified.match.isMatch);
    EXPECT_NEAR(verified.match.similarity, 1.0, 1e-5);
}

TEST(ProcessFaceImageTest, RejectsMultipleFaces) {
    ExpectRejected<MultipleFaceError>(TwoFacesPng(), TestParams(),
        [](const MultipleFaceError& e) { EXPECT_EQ(e.Count(), 2u); });
}

TEST(ProcessFaceImageTest, RejectsMissingFace) {
    ExpectRejected<NoFaceError>(NoFacePng(), TestParams(),
        [](const NoFaceError& e) { EXPECT_EQ(e.Kind(), ErrorKind::NoFace); });
}

TEST(ProcessFaceImageTest, RejectsDarkImage) {
    ExpectRejected<LightingError>(UniformPng(300, 0), TestParams(),
        [](const LightingError& e) {
            EXPECT_EQ(e.GetCondition(), LightingError::Condition::TooDark);
        });
}

TEST(ProcessFaceImageTest, RejectsFlatImage) {
    ExpectRejected<LightingError>(UniformPng(300, 128), TestParams(),
        [](const LightingError& e) {
            EXPECT_EQ(e.GetCondition(), LightingError::Condition::LowContrast);
        });
}

TEST(ProcessFaceImageTest, RejectsBlurryImage) {
    ExpectRejected<BlurError>(RampPng(300), TestParams(),
        [](const BlurError& e) { EXPECT_LT(e.Variance(), 100.0); });
}

TEST(ProcessFaceImageTest, RejectsSmallImageFirst) {
    ExpectRejected<ValidationError>(UniformPng(100, 0), TestParams(),
        [](const ValidationError& e) {
            EXPECT_NE(std::string(e.what()).find("resolution too low"), std::string::npos);
        });
}

TEST(ProcessFaceImageTest, InvalidParamsRejectedUpFront) {
    PipelineParams params = TestParams();
    params.match.threshold = 2.0;
    EXPECT_THROW(ProcessFaceImage(SingleFacePng(), params), InvalidArgumentException);
}

TEST(LocateFaceTest, MatchesFullProcessing) {
    Detect::LocateResult located = LocateFace(SingleFacePng());
    EXPECT_EQ(located.sourceRegion, (Rect2i{149, 149, 102, 102}));
    EXPECT_EQ(located.mapSize, 400);
}

// =============================================================================
// Preprocess
// =============================================================================

TEST(PreprocessTest, CoverResizeToModelInput) {
    Image face = Preprocess(IO::EncodePng(MakeBackground(300)));
    EXPECT_EQ(face.Width(), 112);
    EXPECT_EQ(face.Height(), 112);
    EXPECT_EQ(face.Channels(), 3);
    // Grey expanded to identical channels
    EXPECT_EQ(face.At(50, 50, 0), face.At(50, 50, 1));
    EXPECT_EQ(face.At(50, 50, 1), face.At(50, 50, 2));
}

TEST(PreprocessTest, RejectsTinyImage) {
    try {
        Preprocess(UniformPng(40, 100));
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_NE(std::string(e.what()).find("Minimum size is 50x50 pixels, got 40x40"),
                  std::string::npos);
    }
}

// =============================================================================
// Embedding Operations
// =============================================================================

TEST(CreateEmbeddingTest, UnitLengthAndDeterministic) {
    FoldingModel model;
    Match::Embedding a = CreateEmbedding(SingleFacePng(), model, TestParams());
    Match::Embedding b = CreateEmbedding(SingleFacePng(), model, TestParams());

    EXPECT_EQ(a.size(), 512u);
    EXPECT_TRUE(Match::IsUnitLength(a));
    EXPECT_EQ(a, b);
}

TEST(CreateEmbeddingTest, ModelNotLoaded) {
    FoldingModel model;
    model.loaded = false;
    try {
        CreateEmbedding(ByteBuffer{1, 2, 3}, model, TestParams());
        FAIL() << "expected ModelException";
    } catch (const ModelException& e) {
        EXPECT_NE(std::string(e.what()).find("not loaded"), std::string::npos);
    }
    EXPECT_EQ(model.inferCount, 0);
}

TEST(CreateEmbeddingTest, InvalidModelOutput) {
    FoldingModel model;
    model.zeroOutput = true;
    EXPECT_THROW(CreateEmbedding(SingleFacePng(), model, TestParams()), ModelException);
}

TEST(CreateEmbeddingTest, RejectionSkipsInference) {
    FoldingModel model;
    EXPECT_THROW(CreateEmbedding(TwoFacesPng(), model, TestParams()), MultipleFaceError);
    EXPECT_EQ(model.inferCount, 0);
}

TEST(RegisterVerifyTest, SamePersonMatches) {
    FoldingModel model;
    Embed::MemoryEmbeddingStore store;

    RegistrationResult registered = RegisterUser("alice", SingleFacePng(), model, store,
                                                 TestParams());
    EXPECT_EQ(registered.userId, "alice");
    EXPECT_EQ(registered.receipt.revision, 1u);
    EXPECT_EQ(store.Size(), 1u);

    VerificationResult verified = VerifyUser("alice", SingleFacePng(), model, store,
                                             TestParams());
    EXPECT_TRUE(verified.match.isMatch);
    EXPECT_NEAR(verified.match.similarity, 1.0, 1e-5);
    EXPECT_DOUBLE_EQ(verified.match.threshold, 0.6);
}

TEST(RegisterVerifyTest, DifferentPersonDoesNotMatch) {
    FoldingModel model;
    Embed::MemoryEmbeddingStore store;
    RegisterUser("alice", SingleFacePng(), model, store, TestParams());

    model.sign = -1.0f;
    VerificationResult verified = VerifyUser("alice", SingleFacePng(), model, store,
                                             TestParams());
    EXPECT_FALSE(verified.match.isMatch);
    EXPECT_NEAR(verified.match.similarity, -1.0, 1e-5);
}

TEST(RegisterVerifyTest, UnknownUserCheckedBeforeProcessing) {
    FoldingModel model;
    Embed::MemoryEmbeddingStore store;
    try {
        VerifyUser("nobody", ByteBuffer{0, 1, 2}, model, store, TestParams());
        FAIL() << "expected NotFoundException";
    } catch (const NotFoundException& e) {
        EXPECT_STREQ(e.what(), "User nobody not found in database");
    }
    EXPECT_EQ(model.inferCount, 0);
}

TEST(RegisterVerifyTest, CorruptStoredEntryRejected) {
    FoldingModel model;
    Embed::MemoryEmbeddingStore store;
    Match::Embedding corrupt(512, 0.04f);
    corrupt[3] = std::nanf("");
    store.Put("alice", corrupt);

    try {
        VerifyUser("alice", SingleFacePng(), model, store, TestParams());
        FAIL() << "expected EmbeddingFormatError";
    } catch (const EmbeddingFormatError& e) {
        EXPECT_NE(std::string(e.what()).find("non-numeric"), std::string::npos);
    }
    EXPECT_EQ(model.inferCount, 0);
}

TEST(RegisterVerifyTest, ShortStoredEntryRejected) {
    FoldingModel model;
    Embed::MemoryEmbeddingStore store;
    store.Put("alice", Match::Embedding(32, 0.1f));

    try {
        VerifyUser("alice", SingleFacePng(), model, store, TestParams());
        FAIL() << "expected EmbeddingFormatError";
    } catch (const EmbeddingFormatError& e) {
        EXPECT_NE(std::string(e.what()).find("Unusual embedding size: 32"), std::string::npos);
    }
    EXPECT_EQ(model.inferCount, 0);
}

TEST(RegisterVerifyTest, ReRegistrationReplaces) {
    FoldingModel model;
    Embed::MemoryEmbeddingStore store;
    RegisterUser("alice", SingleFacePng(), model, store, TestParams());
    RegistrationResult second = RegisterUser("alice", SingleFacePng(), model, store,
                                             TestParams());
    EXPECT_EQ(second.receipt.revision, 2u);
    EXPECT_EQ(store.Size(), 1u);
}

TEST(RegisterVerifyTest, RejectedImageIsNotStored) {
    FoldingModel model;
    Embed::MemoryEmbeddingStore store;
    EXPECT_THROW(RegisterUser("alice", NoFacePng(), model, store, TestParams()), NoFaceError);
    EXPECT_EQ(store.Size(), 0u);
    EXPECT_THROW(RegisterUser("", SingleFacePng(), model, store, TestParams()),
                 InvalidArgumentException);
}

TEST(CompareWithStoredTest, TextAndNumbers) {
    FoldingModel model;
    Match::Embedding reference = CreateEmbedding(SingleFacePng(), model, TestParams());

    Match::MatchResult fromText = CompareWithStored(
        SingleFacePng(), Match::EncodeEmbeddingText(reference), model, TestParams());
    EXPECT_TRUE(fromText.isMatch);
    EXPECT_NEAR(fromText.similarity, 1.0, 1e-5);

    std::vector<double> numbers(reference.begin(), reference.end());
    Match::MatchResult fromNumbers = CompareWithStored(SingleFacePng(), numbers, model,
                                                       TestParams());
    EXPECT_NEAR(fromNumbers.similarity, 1.0, 1e-5);
}

TEST(CompareWithStoredTest, MalformedStoredSkipsInference) {
    FoldingModel model;
    EXPECT_THROW(CompareWithStored(SingleFacePng(), std::string("[1, \"a\"]"), model,
                                   TestParams()),
                 EmbeddingFormatError);
    EXPECT_EQ(model.inferCount, 0);
}

TEST(CompareWithStoredTest, LengthMismatch) {
    FoldingModel model;
    std::vector<double> stored(128, 0.5);
    try {
        CompareWithStored(SingleFacePng(), stored, model, TestParams());
        FAIL() << "expected DimensionMismatchError";
    } catch (const DimensionMismatchError& e) {
        EXPECT_EQ(e.LengthA(), 512u);
        EXPECT_EQ(e.LengthB(), 128u);
    }
}

// =============================================================================
// Service Description
// =============================================================================

TEST(ServiceInfoTest, ReportsLimits) {
    FoldingModel model;
    ServiceInfo info = GetServiceInfo(PipelineParams(), &model);

    EXPECT_EQ(info.version, "1.0.0");
    EXPECT_EQ(info.model.name, "folding-test-model");
    EXPECT_TRUE(info.model.loaded);
    EXPECT_EQ(info.model.embeddingDimension, 512u);
    EXPECT_EQ(info.model.inputSize, 112);
    EXPECT_DOUBLE_EQ(info.similarityThreshold, 0.6);
    EXPECT_EQ(info.metric, "cosine");
    EXPECT_EQ(info.supportedFormats, (std::vector<std::string>{"JPEG", "PNG", "WEBP"}));
    EXPECT_EQ(info.maxResolution, "4000x4000");
    EXPECT_EQ(info.maxFileSize, "10MB");
    EXPECT_EQ(info.minFaceSize, "10.0% of image");
    EXPECT_EQ(info.maxFaces, 1);
    EXPECT_DOUBLE_EQ(info.blurThreshold, 100.0);
}

TEST(ServiceInfoTest, WithoutModel) {
    ServiceInfo info = GetServiceInfo();
    EXPECT_FALSE(info.model.loaded);

    std::string json = ServiceInfoToJson(info);
    EXPECT_NE(json.find("\"similarityThreshold\""), std::string::npos);
    EXPECT_NE(json.find("\"modelLoaded\" : false"), std::string::npos);
    EXPECT_NE(json.find("\"112x112\""), std::string::npos);
}
