#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

#include "proto/chunk.hpp"
#include "util/log.hpp"
#include "util/status.hpp"

namespace framing
{

// What happened to one candidate fed to the Reassembler
enum class Verdict
{
    Accepted,
    Corrupt,       // checksum mismatch
    Duplicate,     // index already held; first one wins
    Inconsistent   // valid checksum but disagrees with the session (total, size, bounds)
};

// Collects candidates for one decode session. The first valid candidate fixes
// total_chunks and the chunk size; nothing is decided about completeness
// until finish() is called after the whole video has been scanned.
class Reassembler
{
  public:
    explicit Reassembler(const qrstego::Logger &log) : log_(log) {}

    Verdict feed(const FramedChunk &c);

    // Concatenate the held chunks into out. On any gap returns IncompleteRecovery
    // with the missing indices and leaves out untouched.
    qrstego::Status finish(std::vector<std::uint8_t> &out) const;

    std::vector<std::uint32_t> missing() const;

    bool          has_session() const { return total_ != 0; }
    std::uint32_t total() const { return total_; }
    std::size_t   chunk_size() const { return chunk_size_; }
    std::size_t   received() const { return received_; }

    struct Stats
    {
        std::size_t accepted     = 0;
        std::size_t corrupt      = 0;
        std::size_t duplicate    = 0;
        std::size_t inconsistent = 0;
    };
    const Stats &stats() const { return stats_; }

  private:
    bool fits_session(const FramedChunk &c) const;

    const qrstego::Logger                 &log_;
    std::uint32_t                          total_      = 0;
    std::size_t                            chunk_size_ = 0;
    std::size_t                            received_   = 0;
    std::vector<std::vector<std::uint8_t>> parts_;  // size == total, data truncated to len
    std::vector<bool>                      have_;   // size == total
    Stats                                  stats_;
};

}  // namespace framing
