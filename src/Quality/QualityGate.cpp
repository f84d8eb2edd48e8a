/**
 * @file QualityGate.cpp
 * @brief Format / resolution / aspect ratio / file size checks
 */

#include <FaceGate/Quality/Quality.h>
#include <FaceGate/Core/Exception.h>
#include <FaceGate/Core/Log.h>

#include <algorithm>
#include <cstdio>
#include <string>
#include <utility>

namespace FaceGate::Quality {

namespace {

std::string FormatDouble(double value, int precision) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", precision, value);
    return buf;
}

std::string SizeString(const IO::ImageMetadata& meta) {
    return std::to_string(meta.width) + "x" + std::to_string(meta.height);
}

std::string AllowedList(const QualityParams& params) {
    std::string list;
    for (IO::ImageFormat format : params.allowedFormats) {
        if (!list.empty()) list += ", ";
        list += IO::FormatName(format);
    }
    return list;
}

} // anonymous namespace

// =============================================================================
// QualityParams
// =============================================================================

QualityParams& QualityParams::SetAllowedFormats(const std::vector<std::string>& names) {
    std::vector<IO::ImageFormat> formats;
    for (const std::string& name : names) {
        IO::ImageFormat format = IO::ParseImageFormat(name);
        if (format == IO::ImageFormat::Unknown) {
            throw InvalidArgumentException("Unknown image format name: " + name);
        }
        if (std::find(formats.begin(), formats.end(), format) == formats.end()) {
            formats.push_back(format);
        }
    }
    allowedFormats = std::move(formats);
    return *this;
}

bool QualityParams::IsAllowed(IO::ImageFormat format) const {
    return std::find(allowedFormats.begin(), allowedFormats.end(), format) != allowedFormats.end();
}

void QualityParams::Validate() const {
    if (allowedFormats.empty()) {
        throw InvalidArgumentException("QualityParams: no allowed formats");
    }
    if (minShortSide <= 0 || minLongSide < minShortSide) {
        throw InvalidArgumentException("QualityParams: invalid minimum resolution");
    }
    if (maxWidth < minShortSide || maxHeight < minShortSide) {
        throw InvalidArgumentException("QualityParams: maximum resolution below minimum");
    }
    if (minAspectRatio <= 0.0 || maxAspectRatio < minAspectRatio) {
        throw InvalidArgumentException("QualityParams: invalid aspect ratio range");
    }
    if (maxFileBytes < minFileBytes) {
        throw InvalidArgumentException("QualityParams: invalid file size range");
    }
}

// =============================================================================
// Quality Gate
// =============================================================================

void CheckImageQuality(const IO::ImageMetadata& meta, size_t byteLength,
                       const QualityParams& params) {
    if (!params.IsAllowed(meta.format)) {
        throw ValidationError("Unsupported image format: " + IO::FormatName(meta.format) +
                              ". Supported formats: " + AllowedList(params));
    }

    int32_t shortSide = std::min(meta.width, meta.height);
    int32_t longSide = std::max(meta.width, meta.height);
    if (shortSide < params.minShortSide || longSide < params.minLongSide) {
        throw ValidationError("Image resolution too low: " + SizeString(meta) +
                              ". Minimum required: smaller dimension >= " +
                              std::to_string(params.minShortSide) +
                              "px and larger dimension >= " +
                              std::to_string(params.minLongSide) + "px");
    }

    if (meta.width > params.maxWidth || meta.height > params.maxHeight) {
        throw ValidationError("Image resolution too high: " + SizeString(meta) +
                              ". Maximum: " + std::to_string(params.maxWidth) + "x" +
                              std::to_string(params.maxHeight));
    }

    double aspectRatio = static_cast<double>(meta.width) / meta.height;
    if (aspectRatio < params.minAspectRatio || aspectRatio > params.maxAspectRatio) {
        throw ValidationError("Unusual image aspect ratio: " + FormatDouble(aspectRatio, 2) +
                              ". Allowed range: " + FormatDouble(params.minAspectRatio, 2) +
                              " to " + FormatDouble(params.maxAspectRatio, 2));
    }

    if (byteLength > params.maxFileBytes) {
        throw ValidationError("Image file too large: " +
                              FormatDouble(byteLength / (1024.0 * 1024.0), 1) +
                              "MB. Maximum size: " +
                              FormatDouble(params.maxFileBytes / (1024.0 * 1024.0), 1) + "MB");
    }
    if (byteLength < params.minFileBytes) {
        throw ValidationError("Image file too small: " + std::to_string(byteLength) +
                              " bytes. Minimum size: " + std::to_string(params.minFileBytes) +
                              " bytes");
    }

    if (meta.width <= 0 || meta.height <= 0) {
        throw ValidationError("Image appears to be corrupted: dimensions " + SizeString(meta));
    }

    Log::Get()->debug("Quality check passed: {} {} bytes {}",
                      SizeString(meta), byteLength, IO::FormatName(meta.format));
}

IO::ImageMetadata CheckImageQuality(const ByteBuffer& bytes, const QualityParams& params) {
    IO::ImageMetadata meta;
    try {
        meta = IO::DecodeMetadata(bytes);
    } catch (const IOException& e) {
        throw ValidationError(std::string("Unable to read image header: ") + e.what());
    }

    CheckImageQuality(meta, bytes.size(), params);
    return meta;
}

} // namespace FaceGate::Quality
