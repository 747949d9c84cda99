#pragma once
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <vector>

#include "crypto/digest.hpp"
#include "util/status.hpp"

/*
ENCODE:
payload
  -> make_chunks(payload, max_chunk_size)   // pad last chunk, checksum each
     -> for each FramedChunk:
          serialize(c)                      // [28B header][max_chunk_size data]
            -> code encoder -> video writer (frame i == sequence_index i)

DECODE:
video reader -> code scanner
  -> parse(bytes)                           // fixed header layout, drop if malformed
     -> Reassembler.feed(c)                 // checksum, dedup, consistency
        -> Reassembler.finish(out)          // gap check, strip padding
*/

namespace framing
{

// --- Protocol constants ---
inline constexpr std::size_t   CHECKSUM_SIZE = digest::CHECKSUM_SIZE;
inline constexpr std::size_t   HDR_FIELDS    = 12;  // seq + total + len
inline constexpr std::size_t   HDR_SIZE      = HDR_FIELDS + CHECKSUM_SIZE;
inline constexpr std::uint32_t MAX_CHUNKS    = std::numeric_limits<std::uint32_t>::max();

// On-wire chunk header, integers big-endian
struct Header
{
    std::uint32_t      seq{0};    // 4B sequence_index
    std::uint32_t      total{0};  // 4B total_chunks
    std::uint32_t      len{0};    // 4B payload_length (bytes before padding)
    digest::Checksum   checksum{};  // 16B
};

struct FramedChunk
{
    Header                    hdr;
    std::vector<std::uint8_t> data;  // padded to the session's chunk size
};

// ceil(payload_len / max_chunk_size), at least 1. nullopt if it does not fit in
// the 32-bit index or max_chunk_size is 0.
std::optional<std::uint32_t> count_chunks(std::size_t payload_len, std::size_t max_chunk_size);

// TX
qrstego::Status make_chunks(const std::vector<std::uint8_t> &payload,
                            std::size_t                      max_chunk_size,
                            std::uint32_t                    index_limit,
                            std::vector<FramedChunk>        &out);
std::vector<std::uint8_t> serialize(const FramedChunk &c);
void                      pack_header(const Header &in, std::uint8_t out[HDR_SIZE]);

// RX
std::optional<FramedChunk> parse(const std::vector<std::uint8_t> &frame);
bool                       unpack_header(const std::uint8_t in[HDR_SIZE], Header &out);

// Digest over the packed seq/total/len fields followed by the data
digest::Checksum compute_checksum(const Header &h, const std::vector<std::uint8_t> &data);
bool             checksum_ok(const FramedChunk &c);

}  // namespace framing
