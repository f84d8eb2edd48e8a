#pragma once

/**
 * @file Resize.h
 * @brief Image resampling (Halcon-style API)
 *
 * API Style: void Func(const Image& in, Image& out, params...)
 *
 * Interpolation names:
 * - "nearest":  nearest neighbour
 * - "bilinear": bilinear with pixel-centre alignment
 * - "area":     box average weighted by source pixel coverage
 */

#include <FaceGate/Core/Image.h>
#include <FaceGate/Core/Types.h>

#include <cstdint>
#include <string>

namespace FaceGate::Transform {

// =============================================================================
// Image Resampling
// =============================================================================

/**
 * @brief Scale image to specified size (aspect ratio not preserved)
 *
 * @param src Source image (any channel layout)
 * @param dst Output image with the same channel layout
 * @param dstWidth Target width
 * @param dstHeight Target height
 * @param interpolation "nearest", "bilinear" (default) or "area"
 *
 * @throws InvalidArgumentException on empty input, non-positive size or
 *         unknown interpolation name
 */
void ZoomImageSize(
    const Image& src,
    Image& dst,
    int32_t dstWidth,
    int32_t dstHeight,
    const std::string& interpolation = "bilinear"
);

/**
 * @brief Scale to cover the target size, then centre-crop the overflow
 *
 * Scale factor is max(dstWidth/width, dstHeight/height), so the whole target
 * is filled and only one axis is cropped.
 *
 * @param src Source image (any channel layout)
 * @param dst Output image, exactly dstWidth x dstHeight
 * @param dstWidth Target width
 * @param dstHeight Target height
 * @param interpolation "nearest", "bilinear" or "area" (default)
 */
void ZoomImageCover(
    const Image& src,
    Image& dst,
    int32_t dstWidth,
    int32_t dstHeight,
    const std::string& interpolation = "area"
);

/**
 * @brief Greyscale analysis sample: convert to gray, then cover-resize
 *
 * A greyscale input that already has the target size is copied unchanged.
 *
 * @param src Source image (any channel layout)
 * @param dst Single-channel output, exactly dstWidth x dstHeight
 * @param dstWidth Target width
 * @param dstHeight Target height
 */
void ZoomGrayCover(
    const Image& src,
    Image& dst,
    int32_t dstWidth,
    int32_t dstHeight
);

/**
 * @brief Source rectangle used by ZoomImageCover, in source pixel units
 */
struct CoverWindow {
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;
};

/**
 * @brief Compute the centred source window that ZoomImageCover samples
 */
CoverWindow ComputeCoverWindow(int32_t srcWidth, int32_t srcHeight,
                               int32_t dstWidth, int32_t dstHeight);

// =============================================================================
// Encoded Input Helpers
// =============================================================================

/**
 * @brief Decode, convert to greyscale and cover-resize
 * @throws IOException / UnsupportedException from decoding
 */
Image ResizeGray(const ByteBuffer& bytes, int32_t width, int32_t height);

/**
 * @brief Decode, convert to RGB and cover-resize
 *
 * The result buffer has exactly width * height * 3 bytes.
 */
Image ResizeCoverRgb(const ByteBuffer& bytes, int32_t width, int32_t height);

} // namespace FaceGate::Transform
