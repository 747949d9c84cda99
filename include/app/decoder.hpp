#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

#include "media/icodec.hpp"
#include "media/ivideo.hpp"
#include "proto/chunk.hpp"
#include "proto/reassembler.hpp"
#include "util/log.hpp"
#include "util/status.hpp"

namespace app
{

// Lazy sequence of candidate chunks from an opened video, one forward pass.
// Frames without a code and codes that do not parse are skipped, never fatal.
class FrameDecoder
{
  public:
    FrameDecoder(media::IVideoReader &reader, media::ICodeScanner &scanner,
                 const qrstego::Logger &log);

    bool next(framing::FramedChunk &out);  // false at end of stream

    struct Stats
    {
        std::size_t frames    = 0;
        std::size_t codes     = 0;  // frames where the scanner found something
        std::size_t malformed = 0;  // codes that did not parse as a framed chunk
    };
    const Stats &stats() const { return stats_; }

  private:
    media::IVideoReader   &reader_;
    media::ICodeScanner   &scanner_;
    const qrstego::Logger &log_;
    Stats                  stats_;
};

// One decode session: scan every frame, then reassemble. out is written only
// on success.
qrstego::Status decode_payload(media::IVideoReader       &reader,
                               media::ICodeScanner       &scanner,
                               const qrstego::Logger     &log,
                               std::vector<std::uint8_t> &out);

}  // namespace app
