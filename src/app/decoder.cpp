#include <utility>

#include "app/decoder.hpp"

namespace app
{

FrameDecoder::FrameDecoder(media::IVideoReader &reader, media::ICodeScanner &scanner,
                           const qrstego::Logger &log)
    : reader_(reader), scanner_(scanner), log_(log)
{
}

bool FrameDecoder::next(framing::FramedChunk &out)
{
    media::Image frame;
    while (reader_.next(frame))
    {
        const std::size_t idx = stats_.frames++;

        auto bytes = scanner_.scan(frame);
        if (!bytes)
            continue;  // blank, cover-only or unreadable frame
        stats_.codes++;

        auto c = framing::parse(*bytes);
        if (!c)
        {
            stats_.malformed++;
            LOG_DEBUG(log_, "frame %zu: code of %zu bytes is not a framed chunk", idx,
                      bytes->size());
            continue;
        }
        out = std::move(*c);
        return true;
    }
    return false;
}

qrstego::Status decode_payload(media::IVideoReader       &reader,
                               media::ICodeScanner       &scanner,
                               const qrstego::Logger     &log,
                               std::vector<std::uint8_t> &out)
{
    FrameDecoder          dec(reader, scanner, log);
    framing::Reassembler  rx(log);
    framing::FramedChunk  c;

    // always scan to the end: total_chunks is only a claim made by the chunks
    // themselves, and a later frame may still fill a gap
    while (dec.next(c))
        rx.feed(c);

    const auto &fs = dec.stats();
    const auto &rs = rx.stats();
    LOG_INFO(log,
             "scanned %zu frames: %zu codes, %zu malformed, %zu accepted, %zu corrupt, "
             "%zu duplicate, %zu inconsistent",
             fs.frames, fs.codes, fs.malformed, rs.accepted, rs.corrupt, rs.duplicate,
             rs.inconsistent);

    qrstego::Status st = rx.finish(out);
    if (!st.ok())
    {
        LOG_ERROR(log, "%s: %s", qrstego::errc_name(st.code), st.message.c_str());
        return st;
    }
    LOG_INFO(log, "recovered %zu bytes from %u chunks", out.size(), rx.total());
    return st;
}

}  // namespace app
