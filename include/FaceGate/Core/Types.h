#pragma once

/**
 * @file Types.h
 * @brief Basic value types used across FaceGate
 */

#include <algorithm>
#include <cstdint>
#include <vector>

namespace FaceGate {

/// Raw encoded image or file contents
using ByteBuffer = std::vector<uint8_t>;

// =============================================================================
// Enumerations
// =============================================================================

/**
 * @brief Channel layout of an 8-bit image
 */
enum class ChannelType {
    Gray,       ///< Single channel intensity
    GrayAlpha,  ///< Intensity + alpha
    RGB,        ///< Interleaved R, G, B
    RGBA        ///< Interleaved R, G, B, A
};

/**
 * @brief Number of interleaved samples per pixel
 */
inline int32_t ChannelCount(ChannelType type) {
    switch (type) {
        case ChannelType::Gray: return 1;
        case ChannelType::GrayAlpha: return 2;
        case ChannelType::RGB: return 3;
        case ChannelType::RGBA: return 4;
    }
    return 1;
}

// =============================================================================
// Geometry
// =============================================================================

struct Point2i {
    int32_t x = 0;
    int32_t y = 0;
};

/**
 * @brief Axis-aligned integer rectangle, covering [x, x+width) x [y, y+height)
 */
struct Rect2i {
    int32_t x = 0;
    int32_t y = 0;
    int32_t width = 0;
    int32_t height = 0;

    int64_t Area() const { return static_cast<int64_t>(width) * height; }
    bool Empty() const { return width <= 0 || height <= 0; }
    int32_t Right() const { return x + width; }
    int32_t Bottom() const { return y + height; }

    /// Intersection with another rectangle (empty rect if disjoint)
    Rect2i Intersect(const Rect2i& other) const {
        int32_t left = std::max(x, other.x);
        int32_t top = std::max(y, other.y);
        int32_t right = std::min(Right(), other.Right());
        int32_t bottom = std::min(Bottom(), other.Bottom());
        if (left >= right || top >= bottom) {
            return Rect2i{};
        }
        return Rect2i{left, top, right - left, bottom - top};
    }

    bool operator==(const Rect2i& other) const {
        return x == other.x && y == other.y &&
               width == other.width && height == other.height;
    }
};

// =============================================================================
// Face Region
// =============================================================================

/**
 * @brief Candidate face bounding box found on an edge map
 *
 * width/height are inclusive pixel extents of the grown component, so
 * density = size / (width * height) stays within [0, 1].
 */
struct FaceRegion {
    int32_t x = 0;              ///< Left column
    int32_t y = 0;              ///< Top row
    int32_t width = 0;          ///< Inclusive width in pixels
    int32_t height = 0;         ///< Inclusive height in pixels
    int64_t size = 0;           ///< Number of admitted pixels
    double density = 0.0;       ///< size / (width * height), [0, 1]
    double faceScore = 0.0;     ///< Face confidence, [0, 1]

    int64_t Area() const { return static_cast<int64_t>(width) * height; }

    /// Center column, (minX + maxX) / 2
    double CenterX() const { return x + (width - 1) / 2.0; }

    /// Center row, (minY + maxY) / 2
    double CenterY() const { return y + (height - 1) / 2.0; }

    Rect2i Bounds() const { return Rect2i{x, y, width, height}; }
};

} // namespace FaceGate
