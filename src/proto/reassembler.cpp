#include <string>

#include "proto/reassembler.hpp"

namespace framing
{

bool Reassembler::fits_session(const FramedChunk &c) const
{
    if (c.hdr.total != total_)
        return false;
    if (c.data.size() != chunk_size_)
        return false;
    if (c.hdr.seq >= c.hdr.total || c.hdr.len > chunk_size_)
        return false;
    // only the last chunk may be short
    if (c.hdr.seq + 1 < c.hdr.total && c.hdr.len != chunk_size_)
        return false;
    return true;
}

Verdict Reassembler::feed(const FramedChunk &c)
{
    if (!checksum_ok(c))
    {
        stats_.corrupt++;
        LOG_WARN(log_, "checksum mismatch, dropping candidate (seq=%u, total=%u)", c.hdr.seq,
                 c.hdr.total);
        return Verdict::Corrupt;
    }

    if (total_ == 0)
    {
        // first valid candidate opens the session
        total_      = c.hdr.total;
        chunk_size_ = c.data.size();
        parts_.assign(total_, {});
        have_.assign(total_, false);
        LOG_DEBUG(log_, "session: total_chunks=%u, chunk_size=%zu", total_, chunk_size_);
    }

    if (!fits_session(c))
    {
        stats_.inconsistent++;
        LOG_WARN(log_,
                 "inconsistent candidate (seq=%u, total=%u, len=%u, size=%zu) for session "
                 "(total=%u, chunk_size=%zu)",
                 c.hdr.seq, c.hdr.total, c.hdr.len, c.data.size(), total_, chunk_size_);
        return Verdict::Inconsistent;
    }

    const std::uint32_t seq = c.hdr.seq;
    if (have_[seq])
    {
        stats_.duplicate++;
        LOG_DEBUG(log_, "duplicate chunk (seq=%u)", seq);
        return Verdict::Duplicate;
    }

    parts_[seq].assign(c.data.begin(), c.data.begin() + c.hdr.len);  // strip padding
    have_[seq] = true;
    received_++;
    stats_.accepted++;
    return Verdict::Accepted;
}

std::vector<std::uint32_t> Reassembler::missing() const
{
    std::vector<std::uint32_t> out;
    for (std::uint32_t i = 0; i < total_; i++)
    {
        if (!have_[i])
            out.push_back(i);
    }
    return out;
}

qrstego::Status Reassembler::finish(std::vector<std::uint8_t> &out) const
{
    using qrstego::Errc;
    using qrstego::Status;

    if (total_ == 0)
    {
        Status s = Status::error(Errc::IncompleteRecovery, "no valid chunk recovered");
        s.total_known = false;
        return s;
    }

    if (received_ < total_)
    {
        Status s      = Status::error(Errc::IncompleteRecovery, "");
        s.total_known = true;
        s.missing     = missing();
        s.message     = std::to_string(s.missing.size()) + " of " + std::to_string(total_) +
                    " chunks missing: " + qrstego::format_indices(s.missing);
        return s;
    }

    std::size_t bytes = 0;
    for (const auto &part : parts_)
        bytes += part.size();

    std::vector<std::uint8_t> buf;
    buf.reserve(bytes);
    for (const auto &part : parts_)
        buf.insert(buf.end(), part.begin(), part.end());
    out.swap(buf);
    return Status::success();
}

}  // namespace framing
