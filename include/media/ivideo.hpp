#pragma once
#include <string>

#include "media/image.hpp"

namespace media
{

struct VideoInfo
{
    int    width       = 0;
    int    height      = 0;
    double fps         = 0.0;
    long   frame_count = -1;  // -1 if the container does not say
};

// Frames are written in call order. Nothing is visible at the destination
// until commit(); destroying an uncommitted writer discards its output.
struct IVideoWriter
{
    virtual bool open(const std::string &path, const VideoInfo &info) = 0;
    virtual bool append(const Image &frame)                           = 0;
    virtual bool commit()                                             = 0;
    virtual void discard()                                            = 0;
    virtual ~IVideoWriter() = default;
};

// Forward-only frame source; reopen to restart
struct IVideoReader
{
    virtual bool      open(const std::string &path) = 0;
    virtual VideoInfo info() const                  = 0;
    virtual bool      next(Image &frame)            = 0;  // false at end of stream
    virtual void      close()                       = 0;
    virtual ~IVideoReader() = default;
};

}  // namespace media
