/**
 * @file Blob.cpp
 * @brief Connected component growing implementation
 */

#include <FaceGate/Blob/Blob.h>
#include <FaceGate/Core/Exception.h>

#include <algorithm>

namespace FaceGate::Blob {

// =============================================================================
// VisitedMask
// =============================================================================

VisitedMask::VisitedMask(int32_t width, int32_t height)
    : width_(width), height_(height) {
    if (width <= 0 || height <= 0) {
        throw InvalidArgumentException("VisitedMask: invalid size " +
                                       std::to_string(width) + "x" + std::to_string(height));
    }
    flags_.assign(static_cast<size_t>(width) * height, 0);
}

void VisitedMask::Reset() {
    std::fill(flags_.begin(), flags_.end(), 0);
}

size_t VisitedMask::CountSet() const {
    return static_cast<size_t>(std::count(flags_.begin(), flags_.end(), uint8_t{1}));
}

// =============================================================================
// Region Growing
// =============================================================================

GrowResult GrowRegion(const Image& intensity,
                      int32_t seedX, int32_t seedY,
                      int32_t threshold,
                      VisitedMask& visited) {
    if (intensity.Channels() != 1) {
        throw UnsupportedException("GrowRegion requires single-channel image");
    }

    const int32_t width = intensity.Width();
    const int32_t height = intensity.Height();
    if (visited.Width() != width || visited.Height() != height) {
        throw InvalidArgumentException("GrowRegion: visited mask size does not match image");
    }

    GrowResult result;
    result.minX = result.maxX = seedX;
    result.minY = result.maxY = seedY;

    std::vector<Point2i> stack;
    stack.push_back({seedX, seedY});

    while (!stack.empty()) {
        Point2i p = stack.back();
        stack.pop_back();

        if (p.x < 0 || p.x >= width || p.y < 0 || p.y >= height) continue;
        if (visited.Test(p.x, p.y)) continue;
        if (intensity.At(p.x, p.y) < threshold) continue;

        visited.Set(p.x, p.y);
        ++result.size;
        result.minX = std::min(result.minX, p.x);
        result.maxX = std::max(result.maxX, p.x);
        result.minY = std::min(result.minY, p.y);
        result.maxY = std::max(result.maxY, p.y);

        for (int32_t dy = -1; dy <= 1; ++dy) {
            for (int32_t dx = -1; dx <= 1; ++dx) {
                if (dx == 0 && dy == 0) continue;
                stack.push_back({p.x + dx, p.y + dy});
            }
        }
    }

    return result;
}

} // namespace FaceGate::Blob
