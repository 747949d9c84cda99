#include <arpa/inet.h>  // htonl, ntohl
#include <algorithm>
#include <cstdint>
#include <cstring>
#include <string>

#include "proto/chunk.hpp"

namespace framing
{

static void put_u32(std::uint8_t *out, std::uint32_t v)
{
    std::uint32_t be = htonl(v);
    std::memcpy(out, &be, sizeof be);
}

static std::uint32_t get_u32(const std::uint8_t *in)
{
    std::uint32_t be;
    std::memcpy(&be, in, sizeof be);
    return ntohl(be);
}

std::optional<std::uint32_t> count_chunks(std::size_t payload_len, std::size_t max_chunk_size)
{
    if (max_chunk_size == 0)
        return std::nullopt;
    if (payload_len == 0)
        return 1;
    // no overflow: payload_len / max_chunk_size first
    const std::size_t n = payload_len / max_chunk_size + (payload_len % max_chunk_size ? 1 : 0);
    if (n > MAX_CHUNKS)
        return std::nullopt;
    return static_cast<std::uint32_t>(n);
}

qrstego::Status make_chunks(const std::vector<std::uint8_t> &payload,
                            std::size_t                      max_chunk_size,
                            std::uint32_t                    index_limit,
                            std::vector<FramedChunk>        &out)
{
    using qrstego::Errc;
    using qrstego::Status;

    out.clear();
    if (max_chunk_size == 0 || max_chunk_size > MAX_CHUNKS)
    {
        return Status::error(Errc::BadConfig,
                             "invalid chunk size " + std::to_string(max_chunk_size));
    }

    const auto num_chunks = count_chunks(payload.size(), max_chunk_size);
    if (!num_chunks || *num_chunks > index_limit)
    {
        return Status::error(Errc::OversizeInput,
                             "payload of " + std::to_string(payload.size()) + " bytes needs more than " +
                                 std::to_string(index_limit) + " chunks of " +
                                 std::to_string(max_chunk_size) + " bytes");
    }

    out.reserve(*num_chunks);
    for (std::uint32_t i = 0; i < *num_chunks; i++)
    {
        const std::size_t start = static_cast<std::size_t>(i) * max_chunk_size;
        const std::size_t take  = std::min(max_chunk_size, payload.size() - start);

        FramedChunk c;
        c.hdr.seq   = i;
        c.hdr.total = *num_chunks;
        c.hdr.len   = static_cast<std::uint32_t>(take);
        c.data.assign(max_chunk_size, 0);  // zero padding for the last chunk
        if (take)
            std::copy_n(payload.begin() + start, take, c.data.begin());
        c.hdr.checksum = compute_checksum(c.hdr, c.data);
        out.push_back(std::move(c));
    }
    return Status::success();
}

std::vector<std::uint8_t> serialize(const FramedChunk &c)
{
    std::vector<std::uint8_t> out(HDR_SIZE + c.data.size());
    pack_header(c.hdr, out.data());
    if (!c.data.empty())
        std::memcpy(out.data() + HDR_SIZE, c.data.data(), c.data.size());
    return out;
}

void pack_header(const Header &in, std::uint8_t out[HDR_SIZE])
{
    put_u32(out + 0, in.seq);
    put_u32(out + 4, in.total);
    put_u32(out + 8, in.len);
    std::memcpy(out + HDR_FIELDS, in.checksum.data(), CHECKSUM_SIZE);
}

bool unpack_header(const std::uint8_t in[HDR_SIZE], Header &out)
{
    out.seq   = get_u32(in + 0);
    out.total = get_u32(in + 4);
    out.len   = get_u32(in + 8);
    std::memcpy(out.checksum.data(), in + HDR_FIELDS, CHECKSUM_SIZE);

    // structural checks only; the checksum is the reassembler's job
    if (out.total == 0)
        return false;
    if (out.seq >= out.total)
        return false;
    return true;
}

std::optional<FramedChunk> parse(const std::vector<std::uint8_t> &frame)
{
    // a frame always carries at least one data byte (even the empty payload is padded)
    if (frame.size() <= HDR_SIZE)
        return std::nullopt;

    FramedChunk c;
    if (!unpack_header(frame.data(), c.hdr))
        return std::nullopt;

    const std::size_t data_len = frame.size() - HDR_SIZE;
    if (c.hdr.len > data_len)
        return std::nullopt;

    c.data.assign(frame.begin() + HDR_SIZE, frame.end());
    return c;
}

digest::Checksum compute_checksum(const Header &h, const std::vector<std::uint8_t> &data)
{
    std::uint8_t fields[HDR_FIELDS];
    put_u32(fields + 0, h.seq);
    put_u32(fields + 4, h.total);
    put_u32(fields + 8, h.len);
    return digest::blake2b_128(fields, sizeof fields, data.data(), data.size());
}

bool checksum_ok(const FramedChunk &c)
{
    return digest::equal(compute_checksum(c.hdr, c.data), c.hdr.checksum);
}

}  // namespace framing
