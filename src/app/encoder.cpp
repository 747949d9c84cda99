#include <string>
#include <utility>

#include "app/encoder.hpp"
#include "proto/chunk.hpp"

namespace app
{

using qrstego::Errc;
using qrstego::Status;

namespace
{

// Drops the writer's output on every early return
struct DiscardGuard
{
    media::IVideoWriter &w;
    bool                 armed = true;
    ~DiscardGuard()
    {
        if (armed)
            w.discard();
    }
};

}  // namespace

FrameEncoder::FrameEncoder(media::ICodeEncoder   &enc,
                           media::IVideoWriter   &writer,
                           const qrstego::Config &cfg,
                           const qrstego::Logger &log)
    : enc_(enc), writer_(writer), cfg_(cfg), log_(log)
{
}

std::size_t FrameEncoder::chunk_size() const
{
    const std::size_t cap = enc_.capacity();
    return cap > framing::HDR_SIZE ? cap - framing::HDR_SIZE : 0;
}

Status FrameEncoder::encode(const std::vector<std::uint8_t> &payload,
                            const std::string               &out_path,
                            media::IVideoReader             *cover)
{
    chunks_written_ = 0;
    frames_written_ = 0;

    const std::size_t max_chunk = chunk_size();
    if (max_chunk == 0)
    {
        LOG_ERROR(log_, "code capacity %zu leaves no room after the %zu-byte header",
                  enc_.capacity(), framing::HDR_SIZE);
        return Status::error(Errc::BadConfig, "code capacity too small for the chunk header");
    }

    // 1) Chunk; every size check happens before the first render
    std::vector<framing::FramedChunk> chunks;
    Status st = framing::make_chunks(payload, max_chunk, cfg_.max_chunks, chunks);
    if (!st.ok())
    {
        LOG_ERROR(log_, "%s: %s", qrstego::errc_name(st.code), st.message.c_str());
        return st;
    }

    media::VideoInfo cover_info;
    if (cover)
    {
        cover_info = cover->info();
        if (cover_info.frame_count >= 0 &&
            static_cast<unsigned long>(cover_info.frame_count) < chunks.size())
        {
            LOG_ERROR(log_, "cover has %ld frames, payload needs %zu", cover_info.frame_count,
                      chunks.size());
            return Status::error(Errc::CoverTooShort,
                                 "cover video has " + std::to_string(cover_info.frame_count) +
                                     " frames, payload needs " + std::to_string(chunks.size()));
        }
    }
    LOG_INFO(log_, "payload %zu bytes -> %zu chunks of %zu bytes", payload.size(), chunks.size(),
             max_chunk);

    // 2) Render + append, in index order
    DiscardGuard  guard{writer_};
    bool          opened = false;
    media::Image  frame;
    for (const auto &c : chunks)
    {
        media::Image code;
        if (!enc_.render(framing::serialize(c), code))
        {
            LOG_ERROR(log_, "code encoder rejected chunk %u", c.hdr.seq);
            return Status::error(Errc::EncodeFailure,
                                 "code encoder rejected chunk " + std::to_string(c.hdr.seq));
        }

        if (cover)
        {
            if (!cover->next(frame))
            {
                LOG_ERROR(log_, "cover ended after %zu frames, payload needs %zu",
                          frames_written_, chunks.size());
                return Status::error(Errc::CoverTooShort,
                                     "cover video ended after " + std::to_string(frames_written_) +
                                         " frames, payload needs " +
                                         std::to_string(chunks.size()));
            }
            if (!media::paste_centered(frame, code))
            {
                LOG_ERROR(log_, "%dx%d code does not fit in %dx%d cover frame", code.width,
                          code.height, frame.width, frame.height);
                return Status::error(Errc::BadConfig,
                                     "code image larger than the cover frames; lower the QR "
                                     "version or scale");
            }
        }
        else
        {
            frame = std::move(code);
        }

        if (!opened)
        {
            media::VideoInfo vi;
            vi.width  = frame.width;
            vi.height = frame.height;
            vi.fps    = (cover && cover_info.fps > 0.0) ? cover_info.fps : cfg_.fps;
            if (!writer_.open(out_path, vi))
                return Status::error(Errc::IoError, "cannot open output video " + out_path);
            opened = true;
        }

        if (!writer_.append(frame))
        {
            LOG_ERROR(log_, "writing frame %zu failed", frames_written_);
            return Status::error(Errc::IoError,
                                 "writing frame " + std::to_string(frames_written_) + " failed");
        }
        chunks_written_++;
        frames_written_++;
        LOG_DEBUG(log_, "frame %zu/%zu written", frames_written_, chunks.size());
    }

    // 3) Rest of the cover, unchanged
    if (cover)
    {
        while (cover->next(frame))
        {
            if (!writer_.append(frame))
            {
                LOG_ERROR(log_, "writing cover frame %zu failed", frames_written_);
                return Status::error(Errc::IoError, "writing cover frame " +
                                                        std::to_string(frames_written_) +
                                                        " failed");
            }
            frames_written_++;
        }
    }

    if (!writer_.commit())
        return Status::error(Errc::IoError, "cannot finalize output video " + out_path);
    guard.armed = false;

    LOG_INFO(log_, "encoded %zu chunks into %zu frames", chunks_written_, frames_written_);
    return Status::success();
}

}  // namespace app
