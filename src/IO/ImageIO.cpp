/**
 * @file ImageIO.cpp
 * @brief Encoded image handling implementation
 */

#include <FaceGate/IO/ImageIO.h>
#include <FaceGate/Core/Constants.h>
#include <FaceGate/Core/Exception.h>

#include <algorithm>
#include <cctype>
#include <climits>
#include <cstring>
#include <fstream>
#include <iterator>

#define STB_IMAGE_IMPLEMENTATION
#include <stb/stb_image.h>
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb/stb_image_write.h>

#ifdef FACEGATE_HAS_WEBP
#include <webp/decode.h>
#include <webp/encode.h>
#endif

namespace FaceGate::IO {

// =============================================================================
// Helper Functions
// =============================================================================

namespace {

std::string ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

inline uint32_t ReadLE16(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8);
}

inline uint32_t ReadLE24(const uint8_t* p) {
    return ReadLE16(p) | (static_cast<uint32_t>(p[2]) << 16);
}

ChannelType ChannelTypeFromCount(int32_t channels) {
    switch (channels) {
        case 1: return ChannelType::Gray;
        case 2: return ChannelType::GrayAlpha;
        case 3: return ChannelType::RGB;
        case 4: return ChannelType::RGBA;
        default:
            throw IOException("Unsupported channel count: " + std::to_string(channels));
    }
}

int ToStbLength(size_t size) {
    if (size > static_cast<size_t>(INT_MAX)) {
        throw IOException("Encoded image too large: " + std::to_string(size) + " bytes");
    }
    return static_cast<int>(size);
}

/**
 * WebP layout: "RIFF" <size:4> "WEBP" <chunk fourcc:4> <chunk size:4> <payload>
 *
 * VP8  (lossy):    payload[3..5] = 9d 01 2a, then 14-bit width/height (LE16)
 * VP8L (lossless): payload[0] = 0x2f, then 14-bit (width-1), 14-bit (height-1)
 * VP8X (extended): payload[4..6] = canvas width-1, payload[7..9] = height-1 (LE24)
 */
ImageMetadata ParseWebPHeader(const uint8_t* data, size_t size) {
    constexpr size_t CHUNK_OFFSET = 12;
    constexpr size_t PAYLOAD_OFFSET = 20;

    if (size < 30) {
        throw IOException("WebP header truncated: " + std::to_string(size) + " bytes");
    }

    ImageMetadata meta;
    meta.format = ImageFormat::WebP;
    const uint8_t* fourcc = data + CHUNK_OFFSET;
    const uint8_t* payload = data + PAYLOAD_OFFSET;

    if (std::memcmp(fourcc, "VP8 ", 4) == 0) {
        if (payload[3] != 0x9d || payload[4] != 0x01 || payload[5] != 0x2a) {
            throw IOException("WebP VP8 frame start code missing");
        }
        meta.width = static_cast<int32_t>(ReadLE16(payload + 6) & 0x3fff);
        meta.height = static_cast<int32_t>(ReadLE16(payload + 8) & 0x3fff);
        meta.channels = 3;
    } else if (std::memcmp(fourcc, "VP8L", 4) == 0) {
        if (payload[0] != 0x2f) {
            throw IOException("WebP VP8L signature missing");
        }
        uint32_t b0 = payload[1];
        uint32_t b1 = payload[2];
        uint32_t b2 = payload[3];
        uint32_t b3 = payload[4];
        meta.width = static_cast<int32_t>(1 + (b0 | ((b1 & 0x3f) << 8)));
        meta.height = static_cast<int32_t>(1 + ((b1 >> 6) | (b2 << 2) | ((b3 & 0x0f) << 10)));
        meta.channels = 4;
    } else if (std::memcmp(fourcc, "VP8X", 4) == 0) {
        bool hasAlpha = (payload[0] & 0x10) != 0;
        meta.width = static_cast<int32_t>(1 + ReadLE24(payload + 4));
        meta.height = static_cast<int32_t>(1 + ReadLE24(payload + 7));
        meta.channels = hasAlpha ? 4 : 3;
    } else {
        throw IOException("Unknown WebP chunk type");
    }
    return meta;
}

bool DecodedSizeInRange(int width, int height, int channels) {
    return width >= 1 && height >= 1 && width <= MAX_IMAGE_DIMENSION &&
           height <= MAX_IMAGE_DIMENSION && channels >= 1 && channels <= 4;
}

IOException DecodedSizeError(int width, int height, int channels) {
    return IOException("Decoded image out of range: " + std::to_string(width) + "x" +
                       std::to_string(height) + "x" + std::to_string(channels));
}

#ifdef FACEGATE_HAS_WEBP

Image DecodeWebP(const ByteBuffer& bytes) {
    WebPBitstreamFeatures features;
    VP8StatusCode status = WebPGetFeatures(bytes.data(), bytes.size(), &features);
    if (status != VP8_STATUS_OK) {
        throw IOException("Failed to read webp header (status " +
                          std::to_string(static_cast<int>(status)) + ")");
    }

    int channels = features.has_alpha ? 4 : 3;
    if (!DecodedSizeInRange(features.width, features.height, channels)) {
        throw DecodedSizeError(features.width, features.height, channels);
    }

    Image image(features.width, features.height,
                features.has_alpha ? ChannelType::RGBA : ChannelType::RGB);
    size_t outputSize = static_cast<size_t>(image.Stride()) * image.Height();
    uint8_t* decoded = features.has_alpha
        ? WebPDecodeRGBAInto(bytes.data(), bytes.size(), image.Data(), outputSize, image.Stride())
        : WebPDecodeRGBInto(bytes.data(), bytes.size(), image.Data(), outputSize, image.Stride());
    if (decoded == nullptr) {
        throw IOException("Failed to decode webp image");
    }
    return image;
}

#endif

std::string FailureReason() {
    const char* reason = stbi_failure_reason();
    return reason != nullptr ? reason : "unknown error";
}

void AppendToBuffer(void* context, void* data, int size) {
    auto* buffer = static_cast<ByteBuffer*>(context);
    const auto* bytes = static_cast<const uint8_t*>(data);
    buffer->insert(buffer->end(), bytes, bytes + size);
}

} // anonymous namespace

// =============================================================================
// Format Utility Functions
// =============================================================================

std::string FormatName(ImageFormat format) {
    switch (format) {
        case ImageFormat::JPEG: return "jpeg";
        case ImageFormat::PNG: return "png";
        case ImageFormat::WebP: return "webp";
        case ImageFormat::BMP: return "bmp";
        case ImageFormat::GIF: return "gif";
        case ImageFormat::Unknown: return "unknown";
    }
    return "unknown";
}

ImageFormat ParseImageFormat(const std::string& name) {
    std::string lower = ToLower(name);
    if (lower == "jpeg" || lower == "jpg") return ImageFormat::JPEG;
    if (lower == "png") return ImageFormat::PNG;
    if (lower == "webp") return ImageFormat::WebP;
    if (lower == "bmp") return ImageFormat::BMP;
    if (lower == "gif") return ImageFormat::GIF;
    return ImageFormat::Unknown;
}

ImageFormat DetectFormat(const uint8_t* data, size_t size) {
    static const uint8_t PNG_SIGNATURE[8] = {0x89, 'P', 'N', 'G', 0x0d, 0x0a, 0x1a, 0x0a};

    if (data == nullptr) return ImageFormat::Unknown;

    if (size >= 3 && data[0] == 0xff && data[1] == 0xd8 && data[2] == 0xff) {
        return ImageFormat::JPEG;
    }
    if (size >= 8 && std::memcmp(data, PNG_SIGNATURE, 8) == 0) {
        return ImageFormat::PNG;
    }
    if (size >= 12 && std::memcmp(data, "RIFF", 4) == 0 && std::memcmp(data + 8, "WEBP", 4) == 0) {
        return ImageFormat::WebP;
    }
    if (size >= 6 && (std::memcmp(data, "GIF87a", 6) == 0 || std::memcmp(data, "GIF89a", 6) == 0)) {
        return ImageFormat::GIF;
    }
    if (size >= 2 && data[0] == 'B' && data[1] == 'M') {
        return ImageFormat::BMP;
    }
    return ImageFormat::Unknown;
}

// =============================================================================
// Decoding
// =============================================================================

ImageMetadata DecodeMetadata(const ByteBuffer& bytes) {
    ImageFormat format = DetectFormat(bytes);
    if (format == ImageFormat::Unknown) {
        throw IOException("Unrecognised image format (" + std::to_string(bytes.size()) + " bytes)");
    }

    if (format == ImageFormat::WebP) {
        return ParseWebPHeader(bytes.data(), bytes.size());
    }

    int width = 0;
    int height = 0;
    int channels = 0;
    if (!stbi_info_from_memory(bytes.data(), ToStbLength(bytes.size()), &width, &height, &channels)) {
        throw IOException("Failed to read " + FormatName(format) + " header: " +
                          FailureReason());
    }

    ImageMetadata meta;
    meta.width = width;
    meta.height = height;
    meta.channels = channels;
    meta.format = format;
    return meta;
}

Image DecodeImage(const ByteBuffer& bytes) {
    ImageFormat format = DetectFormat(bytes);
    if (format == ImageFormat::Unknown) {
        throw IOException("Unrecognised image format (" + std::to_string(bytes.size()) + " bytes)");
    }
    if (format == ImageFormat::WebP) {
#ifdef FACEGATE_HAS_WEBP
        return DecodeWebP(bytes);
#else
        throw UnsupportedException("WebP decoding requires libwebp, which this build lacks");
#endif
    }

    int width = 0;
    int height = 0;
    int channels = 0;
    stbi_uc* pixels = stbi_load_from_memory(bytes.data(), ToStbLength(bytes.size()),
                                            &width, &height, &channels, 0);
    if (pixels == nullptr) {
        throw IOException("Failed to decode " + FormatName(format) + " image: " +
                          FailureReason());
    }

    if (!DecodedSizeInRange(width, height, channels)) {
        stbi_image_free(pixels);
        throw DecodedSizeError(width, height, channels);
    }

    size_t size = static_cast<size_t>(width) * height * channels;
    std::vector<uint8_t> data(pixels, pixels + size);
    stbi_image_free(pixels);

    return Image(width, height, ChannelTypeFromCount(channels), std::move(data));
}

// =============================================================================
// Encoding / Files
// =============================================================================

ByteBuffer EncodePng(const Image& image) {
    if (image.Empty()) {
        throw IOException("Cannot encode an empty image");
    }

    ByteBuffer buffer;
    int ok = stbi_write_png_to_func(AppendToBuffer, &buffer,
                                    image.Width(), image.Height(), image.Channels(),
                                    image.Data(), image.Stride());
    if (!ok || buffer.empty()) {
        throw IOException("PNG encoding failed for " + std::to_string(image.Width()) + "x" +
                          std::to_string(image.Height()) + " image");
    }
    return buffer;
}

bool WebPCodecAvailable() {
#ifdef FACEGATE_HAS_WEBP
    return true;
#else
    return false;
#endif
}

ByteBuffer EncodeWebPLossless(const Image& image) {
    if (image.Empty()) {
        throw IOException("Cannot encode an empty image");
    }
#ifdef FACEGATE_HAS_WEBP
    // libwebp takes RGB or RGBA only
    Image source = image;
    const ChannelType type = image.GetChannelType();
    if (type == ChannelType::Gray || type == ChannelType::GrayAlpha) {
        bool alpha = type == ChannelType::GrayAlpha;
        source = Image(image.Width(), image.Height(), alpha ? ChannelType::RGBA : ChannelType::RGB);
        for (int32_t y = 0; y < image.Height(); ++y) {
            for (int32_t x = 0; x < image.Width(); ++x) {
                uint8_t v = image.At(x, y, 0);
                source.Set(x, y, v, 0);
                source.Set(x, y, v, 1);
                source.Set(x, y, v, 2);
                if (alpha) source.Set(x, y, image.At(x, y, 1), 3);
            }
        }
    }

    uint8_t* output = nullptr;
    size_t size = source.Channels() == 4
        ? WebPEncodeLosslessRGBA(source.Data(), source.Width(), source.Height(),
                                 source.Stride(), &output)
        : WebPEncodeLosslessRGB(source.Data(), source.Width(), source.Height(),
                                source.Stride(), &output);
    if (size == 0 || output == nullptr) {
        WebPFree(output);
        throw IOException("WebP encoding failed for " + std::to_string(image.Width()) + "x" +
                          std::to_string(image.Height()) + " image");
    }

    ByteBuffer buffer(output, output + size);
    WebPFree(output);
    return buffer;
#else
    throw UnsupportedException("WebP encoding requires libwebp, which this build lacks");
#endif
}

ByteBuffer ReadFileBytes(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw IOException("Cannot open file: " + path);
    }

    ByteBuffer bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw IOException("Failed to read file: " + path);
    }
    return bytes;
}

} // namespace FaceGate::IO
