/**
 * @file EmbeddingModel.cpp
 * @brief Model input tensor and output normalization
 */

#include <FaceGate/Embed/EmbeddingModel.h>
#include <FaceGate/Core/Exception.h>
#include <FaceGate/Match/VectorMath.h>

#include <cmath>

namespace FaceGate::Embed {

InputTensor BuildInputTensor(const Image& rgb) {
    if (rgb.Empty() || rgb.Channels() != FACE_INPUT_CHANNELS ||
        rgb.Width() != FACE_INPUT_SIZE || rgb.Height() != FACE_INPUT_SIZE) {
        throw InvalidArgumentException(
            "Model input must be a " + std::to_string(FACE_INPUT_SIZE) + "x" +
            std::to_string(FACE_INPUT_SIZE) + " RGB image, got " +
            std::to_string(rgb.Width()) + "x" + std::to_string(rgb.Height()) +
            " with " + std::to_string(rgb.Channels()) + " channels");
    }

    InputTensor tensor;
    tensor.data.resize(rgb.ByteSize());

    // Image layout is already HWC, so the tensor is a straight rescale
    const uint8_t* src = rgb.Data();
    for (size_t i = 0; i < tensor.data.size(); ++i) {
        tensor.data[i] = static_cast<float>(src[i] / 127.5 - 1.0);
    }
    return tensor;
}

Match::Embedding FinalizeEmbedding(const Match::Embedding& raw) {
    if (raw.empty()) {
        throw ModelException("Failed to generate valid embedding: model returned no values");
    }
    for (size_t i = 0; i < raw.size(); ++i) {
        if (!std::isfinite(raw[i])) {
            throw ModelException("Failed to generate valid embedding: non-finite value at index " +
                                 std::to_string(i));
        }
    }
    if (Match::Magnitude(raw) == 0.0) {
        throw ModelException("Failed to generate valid embedding: zero vector");
    }
    return Match::Normalize(raw);
}

} // namespace FaceGate::Embed
