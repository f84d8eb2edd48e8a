#pragma once

/**
 * @file Image.h
 * @brief 8-bit interleaved image buffer
 *
 * Row-major, tightly packed (stride = width * channels). Used for decoded
 * pixels, greyscale samples and edge maps alike.
 */

#include <FaceGate/Core/Types.h>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace FaceGate {

class Image {
public:
    Image() = default;

    /**
     * @brief Allocate a zero-filled image
     * @throws InvalidArgumentException if width or height is not positive
     */
    Image(int32_t width, int32_t height, ChannelType channelType = ChannelType::Gray);

    /**
     * @brief Wrap a copy of existing pixel data
     * @throws InvalidArgumentException if data size does not match dimensions
     */
    Image(int32_t width, int32_t height, ChannelType channelType, std::vector<uint8_t> data);

    int32_t Width() const { return width_; }
    int32_t Height() const { return height_; }
    int32_t Channels() const { return ChannelCount(channelType_); }
    ChannelType GetChannelType() const { return channelType_; }
    int32_t Stride() const { return width_ * Channels(); }

    bool Empty() const { return data_.empty(); }

    /// width * height
    size_t PixelCount() const { return static_cast<size_t>(width_) * height_; }

    /// width * height * channels
    size_t ByteSize() const { return data_.size(); }

    uint8_t* Data() { return data_.data(); }
    const uint8_t* Data() const { return data_.data(); }

    uint8_t* RowPtr(int32_t y) { return data_.data() + static_cast<size_t>(y) * Stride(); }
    const uint8_t* RowPtr(int32_t y) const { return data_.data() + static_cast<size_t>(y) * Stride(); }

    /// Sample at (x, y, channel), no bounds check
    uint8_t At(int32_t x, int32_t y, int32_t channel = 0) const {
        return data_[static_cast<size_t>(y) * Stride() + static_cast<size_t>(x) * Channels() + channel];
    }

    void Set(int32_t x, int32_t y, uint8_t value, int32_t channel = 0) {
        data_[static_cast<size_t>(y) * Stride() + static_cast<size_t>(x) * Channels() + channel] = value;
    }

    void Fill(uint8_t value);

    /// Copy of the rectangle clipped to the image (empty if no overlap)
    Image SubImage(const Rect2i& rect) const;

    const std::vector<uint8_t>& Buffer() const { return data_; }

private:
    int32_t width_ = 0;
    int32_t height_ = 0;
    ChannelType channelType_ = ChannelType::Gray;
    std::vector<uint8_t> data_;
};

} // namespace FaceGate
