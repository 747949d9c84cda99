#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace media
{

// 8-bit row-major pixels; channels is 1 (gray) or 3 (BGR)
struct Image
{
    int                       width    = 0;
    int                       height   = 0;
    int                       channels = 0;
    std::vector<std::uint8_t> pixels;

    Image() = default;
    Image(int w, int h, int ch, std::uint8_t fill = 0)
        : width(w), height(h), channels(ch),
          pixels(static_cast<std::size_t>(w) * h * ch, fill)
    {
    }

    bool        empty() const { return width <= 0 || height <= 0 || pixels.empty(); }
    std::size_t row_bytes() const { return static_cast<std::size_t>(width) * channels; }

    std::uint8_t *at(int x, int y) { return pixels.data() + y * row_bytes() + x * channels; }
    const std::uint8_t *at(int x, int y) const
    {
        return pixels.data() + y * row_bytes() + x * channels;
    }

    bool operator==(const Image &o) const
    {
        return width == o.width && height == o.height && channels == o.channels &&
               pixels == o.pixels;
    }
    bool operator!=(const Image &o) const { return !(*this == o); }
};

// Gray -> BGR by replication; BGR is returned as is.
Image to_bgr(const Image &src);

// Copy src onto the centre of dst (converting src to dst's channel count).
// Returns false if src does not fit inside dst or a channel count is unsupported.
bool paste_centered(Image &dst, const Image &src);

}  // namespace media
