#pragma once

/**
 * @file Filter.h
 * @brief Image filtering operations (Halcon-style API)
 *
 * API Style: void Func(const Image& in, Image& out, params...)
 *
 * Operators:
 * - ConvolImage3x3: generic 3x3 convolution, saturated to 8-bit
 * - EdgeMap: 8-neighbour high-pass edge intensity
 * - LaplacianVariance: blur metric from the 4-neighbour Laplacian
 *
 * All operators require single-channel images.
 */

#include <FaceGate/Core/Image.h>
#include <FaceGate/Internal/Convolution.h>

#include <cstdint>

namespace FaceGate::Filter {

// =============================================================================
// Convolution
// =============================================================================

/**
 * @brief Convolve with an arbitrary 3x3 kernel
 *
 * Responses are rounded and clamped to [0, 255].
 *
 * @param image Input single-channel image
 * @param output Output image, same size
 * @param kernel Row-major 3x3 kernel
 * @param borderValue Value of the one-pixel border, which is not convolved
 *
 * @code
 * Image edges;
 * ConvolImage3x3(gray, edges, Internal::HIGHPASS_KERNEL);
 * @endcode
 */
void ConvolImage3x3(const Image& image, Image& output,
                    const Internal::Kernel3x3& kernel,
                    uint8_t borderValue = 0);

// =============================================================================
// Edge / Sharpness
// =============================================================================

/**
 * @brief Edge intensity map
 *
 * Convolves with [-1,-1,-1,-1,8,-1,-1,-1,-1]. Negative responses clamp to 0,
 * the one-pixel border is zero-filled.
 *
 * @param gray Input single-channel image
 * @param edges Output edge intensity, same size
 */
void EdgeMap(const Image& gray, Image& edges);

/**
 * @brief Mean squared Laplacian response over the interior
 *
 * Applies [[0,-1,0],[-1,4,-1],[0,-1,0]] to every pixel not on the border and
 * returns sum(response^2) / interiorCount. Sharp images score high, blurred
 * or flat images score low; a uniform image scores exactly 0.
 *
 * @param gray Input single-channel image
 * @return Variance metric (0 for images smaller than 3x3)
 */
double LaplacianVariance(const Image& gray);

} // namespace FaceGate::Filter
