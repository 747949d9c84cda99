#include <cstring>
#include <utility>

#include "media/memory_media.hpp"

namespace media
{

MemoryCodeEncoder::MemoryCodeEncoder(std::size_t capacity, int width)
    : capacity_(capacity), width_(width > 8 ? width : 8)
{
    const std::size_t total = PREFIX_LEN + capacity_;
    height_ = static_cast<int>((total + width_ - 1) / width_);
}

bool MemoryCodeEncoder::render(const Bytes &bytes, Image &out)
{
    if (bytes.size() > capacity_)
        return false;

    out = Image(width_, height_, 1, 0);
    std::memcpy(out.pixels.data(), MAGIC, sizeof MAGIC);
    const std::uint32_t n = static_cast<std::uint32_t>(bytes.size());
    out.pixels[4]         = static_cast<std::uint8_t>(n >> 24);
    out.pixels[5]         = static_cast<std::uint8_t>(n >> 16);
    out.pixels[6]         = static_cast<std::uint8_t>(n >> 8);
    out.pixels[7]         = static_cast<std::uint8_t>(n);
    if (!bytes.empty())
        std::memcpy(out.pixels.data() + PREFIX_LEN, bytes.data(), bytes.size());
    renders_++;
    return true;
}

std::optional<Bytes> MemoryCodeScanner::scan(const Image &frame)
{
    if (frame.empty() || (frame.channels != 1 && frame.channels != 3))
        return std::nullopt;
    if (frame.width < code_width_)
        return std::nullopt;

    // first channel is enough: codes are gray and pasted by replication
    auto px = [&](int x, int y) -> std::uint8_t { return frame.at(x, y)[0]; };

    for (int y = 0; y < frame.height; ++y)
    {
        for (int x = 0; x + code_width_ <= frame.width; ++x)
        {
            if (px(x, y) != MemoryCodeEncoder::MAGIC[0] ||
                px(x + 1, y) != MemoryCodeEncoder::MAGIC[1] ||
                px(x + 2, y) != MemoryCodeEncoder::MAGIC[2] ||
                px(x + 3, y) != MemoryCodeEncoder::MAGIC[3])
                continue;

            // read the block row by row from (x, y)
            auto byte_at = [&](std::size_t i) -> int {
                const int row = y + static_cast<int>(i / code_width_);
                if (row >= frame.height)
                    return -1;
                return px(x + static_cast<int>(i % code_width_), row);
            };

            std::uint32_t n = 0;
            for (std::size_t i = 4; i < MemoryCodeEncoder::PREFIX_LEN; ++i)
            {
                const int b = byte_at(i);
                if (b < 0)
                    return std::nullopt;
                n = (n << 8) | static_cast<std::uint32_t>(b);
            }

            Bytes out;
            out.reserve(n);
            for (std::size_t i = 0; i < n; ++i)
            {
                const int b = byte_at(MemoryCodeEncoder::PREFIX_LEN + i);
                if (b < 0)
                    return std::nullopt;  // truncated code
                out.push_back(static_cast<std::uint8_t>(b));
            }
            return out;
        }
    }
    return std::nullopt;
}

bool MemoryVideoWriter::open(const std::string &path, const VideoInfo &info)
{
    if (path.empty())
        return false;
    path_           = path;
    staging_        = Clip{};
    staging_.info   = info;
    opened_         = true;
    return true;
}

bool MemoryVideoWriter::append(const Image &frame)
{
    if (!opened_)
        return false;
    if (fail_after_ >= 0 && static_cast<long>(staging_.frames.size()) >= fail_after_)
        return false;
    if (frame.width != staging_.info.width || frame.height != staging_.info.height)
        return false;
    staging_.frames.push_back(frame);
    return true;
}

bool MemoryVideoWriter::commit()
{
    if (!opened_)
        return false;
    staging_.info.frame_count = static_cast<long>(staging_.frames.size());
    store_.clips[path_]       = std::move(staging_);
    staging_                  = Clip{};
    opened_                   = false;
    return true;
}

void MemoryVideoWriter::discard()
{
    staging_ = Clip{};
    opened_  = false;
}

bool MemoryVideoReader::open(const std::string &path)
{
    close();
    auto it = store_.clips.find(path);
    if (it == store_.clips.end())
        return false;
    clip_ = &it->second;
    return true;
}

VideoInfo MemoryVideoReader::info() const
{
    if (!clip_)
        return VideoInfo{};
    VideoInfo i = clip_->info;
    i.frame_count =
        reported_count_ == -2 ? static_cast<long>(clip_->frames.size()) : reported_count_;
    return i;
}

bool MemoryVideoReader::next(Image &frame)
{
    if (!clip_ || pos_ >= clip_->frames.size())
        return false;
    frame = clip_->frames[pos_++];
    return true;
}

void MemoryVideoReader::close()
{
    clip_ = nullptr;
    pos_  = 0;
}

}  // namespace media
