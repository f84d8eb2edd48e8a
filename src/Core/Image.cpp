/**
 * @file Image.cpp
 * @brief Image buffer implementation
 */

#include <FaceGate/Core/Image.h>
#include <FaceGate/Core/Exception.h>

#include <algorithm>
#include <cstring>
#include <string>

namespace FaceGate {

Image::Image(int32_t width, int32_t height, ChannelType channelType)
    : width_(width), height_(height), channelType_(channelType) {
    if (width <= 0 || height <= 0) {
        throw InvalidArgumentException("Image dimensions must be positive, got " +
                                       std::to_string(width) + "x" + std::to_string(height));
    }
    data_.assign(static_cast<size_t>(width) * height * ChannelCount(channelType), 0);
}

Image::Image(int32_t width, int32_t height, ChannelType channelType, std::vector<uint8_t> data)
    : width_(width), height_(height), channelType_(channelType), data_(std::move(data)) {
    if (width <= 0 || height <= 0) {
        throw InvalidArgumentException("Image dimensions must be positive, got " +
                                       std::to_string(width) + "x" + std::to_string(height));
    }
    size_t expected = static_cast<size_t>(width) * height * ChannelCount(channelType);
    if (data_.size() != expected) {
        throw InvalidArgumentException("Image data size mismatch. Expected " +
                                       std::to_string(expected) + ", got " +
                                       std::to_string(data_.size()));
    }
}

void Image::Fill(uint8_t value) {
    std::fill(data_.begin(), data_.end(), value);
}

Image Image::SubImage(const Rect2i& rect) const {
    if (Empty()) return Image();

    Rect2i clipped = rect.Intersect(Rect2i{0, 0, width_, height_});
    if (clipped.Empty()) return Image();

    Image result(clipped.width, clipped.height, channelType_);
    size_t rowBytes = static_cast<size_t>(clipped.width) * Channels();
    for (int32_t y = 0; y < clipped.height; ++y) {
        const uint8_t* src = RowPtr(clipped.y + y) + static_cast<size_t>(clipped.x) * Channels();
        std::memcpy(result.RowPtr(y), src, rowBytes);
    }
    return result;
}

} // namespace FaceGate
