#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "media/icodec.hpp"
#include "media/ivideo.hpp"
#include "util/config.hpp"
#include "util/log.hpp"
#include "util/status.hpp"

namespace app
{

// One encode session: payload -> framed chunks -> one code per frame.
class FrameEncoder
{
  public:
    FrameEncoder(media::ICodeEncoder     &enc,
                 media::IVideoWriter     &writer,
                 const qrstego::Config   &cfg,
                 const qrstego::Logger   &log);

    // Frame i of out_path carries sequence_index i. With a cover, code i is
    // pasted onto cover frame i and leftover cover frames are copied through.
    // Nothing is left at out_path unless the whole video was written.
    qrstego::Status encode(const std::vector<std::uint8_t> &payload,
                           const std::string               &out_path,
                           media::IVideoReader             *cover = nullptr);

    std::size_t chunk_size() const;
    std::size_t chunks_written() const { return chunks_written_; }
    std::size_t frames_written() const { return frames_written_; }

  private:
    media::ICodeEncoder   &enc_;
    media::IVideoWriter   &writer_;
    const qrstego::Config &cfg_;
    const qrstego::Logger &log_;
    std::size_t            chunks_written_ = 0;
    std::size_t            frames_written_ = 0;
};

}  // namespace app
