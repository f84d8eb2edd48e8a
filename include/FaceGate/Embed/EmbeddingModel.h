#pragma once

/**
 * @file EmbeddingModel.h
 * @brief Embedding model boundary: input tensor layout and output checks
 *
 * The model itself is external. FaceGate hands it a 1x112x112x3 float tensor
 * (NHWC, values p / 127.5 - 1) and L2-normalizes whatever vector it returns.
 */

#include <FaceGate/Core/Constants.h>
#include <FaceGate/Core/Image.h>
#include <FaceGate/Match/MatchTypes.h>

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace FaceGate::Embed {

// =============================================================================
// Input Tensor
// =============================================================================

/**
 * @brief Dense float tensor in NHWC order
 */
struct InputTensor {
    std::vector<float> data;
    std::array<int64_t, 4> shape = {1, FACE_INPUT_SIZE, FACE_INPUT_SIZE, FACE_INPUT_CHANNELS};

    /// Product of shape
    int64_t ElementCount() const {
        return shape[0] * shape[1] * shape[2] * shape[3];
    }
};

/**
 * @brief Convert an interleaved RGB image to the model input tensor
 *
 * Each sample p becomes p / 127.5 - 1, so values lie in [-1, 1].
 *
 * @param rgb 3-channel image of FACE_INPUT_SIZE x FACE_INPUT_SIZE
 * @throws InvalidArgumentException on other sizes or channel layouts
 */
InputTensor BuildInputTensor(const Image& rgb);

// =============================================================================
// Model Interface
// =============================================================================

/**
 * @brief Face embedding model
 *
 * Implementations wrap an inference runtime. Infer may return any non-zero
 * finite vector; callers normalize it through FinalizeEmbedding.
 */
class EmbeddingModel {
public:
    virtual ~EmbeddingModel() = default;

    /// Model name reported by service info
    virtual std::string Name() const = 0;

    /// False until weights are ready; embedding creation is refused meanwhile
    virtual bool IsLoaded() const = 0;

    /// Length of the vectors Infer produces
    virtual size_t Dimension() const { return EMBEDDING_DIMENSION; }

    /**
     * @brief Run inference on one face
     * @throws ModelException on runtime failure
     */
    virtual Match::Embedding Infer(const InputTensor& tensor) = 0;
};

/**
 * @brief Validate raw model output and L2-normalize it
 *
 * @throws ModelException if the output is empty, contains non-finite values
 *         or has zero magnitude
 */
Match::Embedding FinalizeEmbedding(const Match::Embedding& raw);

} // namespace FaceGate::Embed
