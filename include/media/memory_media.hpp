#pragma once
#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "media/icodec.hpp"
#include "media/ivideo.hpp"

// In-memory stand-ins for the QR and video backends. They let the framing
// protocol run end to end without OpenCV or any file on disk.
namespace media
{

// Code image layout: a gray block `width` pixels wide holding
// "QSFK" | u32 length (big-endian) | bytes | zero fill
class MemoryCodeEncoder final : public ICodeEncoder
{
  public:
    static constexpr std::uint8_t MAGIC[4]   = {'Q', 'S', 'F', 'K'};
    static constexpr std::size_t  PREFIX_LEN = 8;

    explicit MemoryCodeEncoder(std::size_t capacity, int width = 64);

    std::size_t capacity() const override { return capacity_; }
    bool        render(const Bytes &bytes, Image &out) override;
    std::string name() const override { return "memory"; }

    int width() const { return width_; }
    int height() const { return height_; }

    std::size_t renders() const { return renders_; }

  private:
    std::size_t capacity_;
    int         width_;
    int         height_;
    std::size_t renders_ = 0;
};

// Finds a MemoryCodeEncoder block anywhere in a frame (gray or BGR)
class MemoryCodeScanner final : public ICodeScanner
{
  public:
    explicit MemoryCodeScanner(int code_width = 64) : code_width_(code_width) {}

    std::optional<Bytes> scan(const Image &frame) override;
    std::string          name() const override { return "memory"; }

  private:
    int code_width_;
};

struct Clip
{
    VideoInfo          info;
    std::vector<Image> frames;
};

// A map of path -> committed clip, standing in for the filesystem
struct MemoryFrameStore
{
    std::map<std::string, Clip> clips;

    bool        contains(const std::string &path) const { return clips.count(path) != 0; }
    Clip       &at(const std::string &path) { return clips.at(path); }
    const Clip &at(const std::string &path) const { return clips.at(path); }
};

class MemoryVideoWriter final : public IVideoWriter
{
  public:
    explicit MemoryVideoWriter(MemoryFrameStore &store) : store_(store) {}
    ~MemoryVideoWriter() override { discard(); }

    bool open(const std::string &path, const VideoInfo &info) override;
    bool append(const Image &frame) override;
    bool commit() override;
    void discard() override;

    // append() fails once this many frames have been written (-1: never)
    void fail_after(long n) { fail_after_ = n; }

  private:
    MemoryFrameStore &store_;
    std::string       path_;
    Clip              staging_;
    bool              opened_     = false;
    long              fail_after_ = -1;
};

class MemoryVideoReader final : public IVideoReader
{
  public:
    explicit MemoryVideoReader(const MemoryFrameStore &store) : store_(store) {}

    bool      open(const std::string &path) override;
    VideoInfo info() const override;
    bool      next(Image &frame) override;
    void      close() override;

    // Override the reported frame count (e.g. a container that does not know it)
    void report_frame_count(long n) { reported_count_ = n; }

  private:
    const MemoryFrameStore &store_;
    const Clip             *clip_ = nullptr;
    std::size_t             pos_  = 0;
    long                    reported_count_ = -2;  // -2: use the clip's real count
};

}  // namespace media
