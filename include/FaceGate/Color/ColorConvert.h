#pragma once

/**
 * @file ColorConvert.h
 * @brief Channel layout conversion for 8-bit images
 *
 * API Style: void Func(const Image& in, Image& out)
 *
 * Alpha channels are dropped, never composited.
 */

#include <FaceGate/Core/Image.h>

namespace FaceGate::Color {

/**
 * @brief Convert any layout to single-channel intensity
 *
 * Colour input uses BT.601 luminosity weights (0.299, 0.587, 0.114).
 * Gray input is copied unchanged.
 *
 * @param image Input image (Gray, GrayAlpha, RGB or RGBA)
 * @param[out] gray Single-channel output
 */
void ToGray(const Image& image, Image& gray);

/**
 * @brief Convert any layout to interleaved RGB
 *
 * Gray input is replicated into the three channels.
 *
 * @param image Input image
 * @param[out] rgb Three-channel output
 */
void ToRgb(const Image& image, Image& rgb);

} // namespace FaceGate::Color
