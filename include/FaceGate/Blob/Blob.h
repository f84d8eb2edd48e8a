#pragma once

/**
 * @file Blob.h
 * @brief Connected component growing on intensity maps
 *
 * Components are 8-connected sets of pixels whose intensity is at least an
 * admission threshold. Growing uses an explicit work list, so stack depth does
 * not depend on component size.
 */

#include <FaceGate/Core/Image.h>
#include <FaceGate/Core/Types.h>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace FaceGate::Blob {

// =============================================================================
// Types
// =============================================================================

/**
 * @brief Flat visited flags indexed by y * width + x
 *
 * Shared by all growths of one detection pass so that no pixel is admitted
 * twice. Reset() clears it for the next pass without reallocating.
 */
class VisitedMask {
public:
    VisitedMask() = default;
    VisitedMask(int32_t width, int32_t height);

    int32_t Width() const { return width_; }
    int32_t Height() const { return height_; }

    bool Test(int32_t x, int32_t y) const {
        return flags_[static_cast<size_t>(y) * width_ + x] != 0;
    }

    void Set(int32_t x, int32_t y) {
        flags_[static_cast<size_t>(y) * width_ + x] = 1;
    }

    void Reset();

    /// Number of pixels currently marked
    size_t CountSet() const;

private:
    int32_t width_ = 0;
    int32_t height_ = 0;
    std::vector<uint8_t> flags_;
};

/**
 * @brief Extent and pixel count of a grown component
 */
struct GrowResult {
    int32_t minX = 0;
    int32_t maxX = 0;
    int32_t minY = 0;
    int32_t maxY = 0;
    int64_t size = 0;           ///< Admitted pixels (0 if the seed was rejected)

    /// Inclusive bounding box: width = maxX - minX + 1
    Rect2i Bounds() const {
        return Rect2i{minX, minY, maxX - minX + 1, maxY - minY + 1};
    }
};

// =============================================================================
// Region Growing
// =============================================================================

/**
 * @brief Grow an 8-connected component from a seed
 *
 * Pops a coordinate, skips it if out of bounds, already visited or below
 * threshold, otherwise marks it visited, extends the running bounds and
 * pushes all 8 neighbours. Checks happen on pop, not on push.
 *
 * @param intensity Single-channel intensity map
 * @param seedX Seed column
 * @param seedY Seed row
 * @param threshold Admission threshold (pixel >= threshold is admitted)
 * @param visited Visited mask of the same size, updated in place
 * @return Component bounds and size (size 0 if the seed is not admitted)
 *
 * @throws InvalidArgumentException if the mask size does not match
 */
GrowResult GrowRegion(const Image& intensity,
                      int32_t seedX, int32_t seedY,
                      int32_t threshold,
                      VisitedMask& visited);

} // namespace FaceGate::Blob
