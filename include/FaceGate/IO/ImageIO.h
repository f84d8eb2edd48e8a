#pragma once

/**
 * @file ImageIO.h
 * @brief Encoded image handling: format sniffing, metadata, decode, encode
 *
 * Decoding: JPEG, PNG, BMP, GIF (first frame) through stb_image, WebP
 * through libwebp when the build found it.
 * Metadata: all of the above, WebP read from the RIFF chunk header.
 * Encoding: PNG through stb_image_write, lossless WebP through libwebp.
 */

#include <FaceGate/Core/Image.h>
#include <FaceGate/Core/Types.h>

#include <cstddef>
#include <cstdint>
#include <string>

namespace FaceGate::IO {

// =============================================================================
// Image Format Enumeration
// =============================================================================

/**
 * @brief Container format recognised from the leading bytes
 */
enum class ImageFormat {
    Unknown,
    JPEG,
    PNG,
    WebP,
    BMP,
    GIF
};

/**
 * @brief Header information of an encoded image
 */
struct ImageMetadata {
    int32_t width = 0;
    int32_t height = 0;
    int32_t channels = 0;           ///< Channels stored in the file (0 = unknown)
    ImageFormat format = ImageFormat::Unknown;
};

// =============================================================================
// Format Utility Functions
// =============================================================================

/**
 * @brief Lower-case format name: "jpeg", "png", "webp", "bmp", "gif", "unknown"
 */
std::string FormatName(ImageFormat format);

/**
 * @brief Parse a format name, case-insensitive ("jpg" is accepted for JPEG)
 * @return ImageFormat::Unknown for unrecognised names
 */
ImageFormat ParseImageFormat(const std::string& name);

/**
 * @brief Identify the container format from magic bytes
 */
ImageFormat DetectFormat(const uint8_t* data, size_t size);

inline ImageFormat DetectFormat(const ByteBuffer& bytes) {
    return DetectFormat(bytes.data(), bytes.size());
}

// =============================================================================
// Decoding
// =============================================================================

/**
 * @brief Read dimensions and format without decoding pixels
 * @throws IOException if the header cannot be parsed
 */
ImageMetadata DecodeMetadata(const ByteBuffer& bytes);

/**
 * @brief Decode pixels in the file's native channel layout
 *
 * WebP decodes to RGB, or RGBA when the bitstream carries alpha.
 *
 * @throws UnsupportedException for WebP when built without libwebp
 * @throws IOException if decoding fails
 */
Image DecodeImage(const ByteBuffer& bytes);

// =============================================================================
// Encoding / Files
// =============================================================================

/**
 * @brief Encode an image as PNG
 * @throws IOException if encoding fails
 */
ByteBuffer EncodePng(const Image& image);

/**
 * @brief Whether this build links libwebp
 */
bool WebPCodecAvailable();

/**
 * @brief Encode an image as lossless WebP
 *
 * Gray input is expanded to RGB (GrayAlpha to RGBA).
 *
 * @throws UnsupportedException when built without libwebp
 * @throws IOException if encoding fails
 */
ByteBuffer EncodeWebPLossless(const Image& image);

/**
 * @brief Read a whole file into memory
 * @throws IOException if the file cannot be opened or read
 */
ByteBuffer ReadFileBytes(const std::string& path);

} // namespace FaceGate::IO
