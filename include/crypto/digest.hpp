#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace digest
{

constexpr std::size_t CHECKSUM_SIZE = 16;  // crypto_generichash_BYTES_MIN

using Checksum = std::array<std::uint8_t, CHECKSUM_SIZE>;

Checksum blake2b_128(const std::uint8_t *data, std::size_t len);
// BLAKE2b-128 over prefix || data without concatenating them
Checksum blake2b_128(const std::uint8_t *prefix,
                     std::size_t         prefix_len,
                     const std::uint8_t *data,
                     std::size_t         len);

// Constant-time comparison
bool equal(const Checksum &a, const Checksum &b);

// Standard base64 alphabet with padding
std::string                              to_base64(const std::uint8_t *data, std::size_t len);
std::optional<std::vector<std::uint8_t>> from_base64(std::string_view text);

// Length of the padded base64 text for n input bytes
constexpr std::size_t base64_len(std::size_t n)
{
    return 4 * ((n + 2) / 3);
}

}  // namespace digest
