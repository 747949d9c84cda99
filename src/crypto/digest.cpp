#include <cstring>
#include <sodium.h>

#include "crypto/digest.hpp"

namespace digest
{

static_assert(CHECKSUM_SIZE >= crypto_generichash_BYTES_MIN, "checksum too short for BLAKE2b");
static_assert(CHECKSUM_SIZE <= crypto_generichash_BYTES_MAX, "checksum too long for BLAKE2b");

static bool ensure_sodium_init()
{
    static int ok = (sodium_init() >= 0);  // -1 means failed
    return ok;
}

Checksum blake2b_128(const std::uint8_t *data, std::size_t len)
{
    ensure_sodium_init();
    Checksum out{};
    crypto_generichash(out.data(), out.size(), len ? data : nullptr, len, nullptr, 0);
    return out;
}

Checksum blake2b_128(const std::uint8_t *prefix,
                     std::size_t         prefix_len,
                     const std::uint8_t *data,
                     std::size_t         len)
{
    ensure_sodium_init();
    crypto_generichash_state st;
    crypto_generichash_init(&st, nullptr, 0, CHECKSUM_SIZE);
    if (prefix_len)
        crypto_generichash_update(&st, prefix, prefix_len);
    if (len)
        crypto_generichash_update(&st, data, len);
    Checksum out{};
    crypto_generichash_final(&st, out.data(), out.size());
    return out;
}

bool equal(const Checksum &a, const Checksum &b)
{
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::string to_base64(const std::uint8_t *data, std::size_t len)
{
    ensure_sodium_init();
    const std::size_t cap = sodium_base64_ENCODED_LEN(len, sodium_base64_VARIANT_ORIGINAL);
    std::string       out(cap, '\0');
    sodium_bin2base64(out.data(), cap, data, len, sodium_base64_VARIANT_ORIGINAL);
    out.resize(std::strlen(out.c_str()));  // drop the terminator
    return out;
}

std::optional<std::vector<std::uint8_t>> from_base64(std::string_view text)
{
    ensure_sodium_init();
    std::vector<std::uint8_t> out(text.size() / 4 * 3 + 3);
    std::size_t               real_len = 0;
    const char               *end      = nullptr;
    if (sodium_base642bin(out.data(), out.size(), text.data(), text.size(), nullptr, &real_len,
                          &end, sodium_base64_VARIANT_ORIGINAL) != 0)
    {
        return std::nullopt;
    }
    // trailing garbage after a valid prefix is a decode failure too
    if (end != text.data() + text.size())
        return std::nullopt;
    out.resize(real_len);
    return out;
}

}  // namespace digest
