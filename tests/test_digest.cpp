// tests/test_digest.cpp
#include <cstdint>
#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "crypto/digest.hpp"

using namespace digest;

static const std::uint8_t *u8(const std::string &s)
{
    return reinterpret_cast<const std::uint8_t *>(s.data());
}

TEST(Digest_Blake2b, Deterministic)
{
    const std::string msg = "chunk payload";
    auto              a   = blake2b_128(u8(msg), msg.size());
    auto              b   = blake2b_128(u8(msg), msg.size());
    EXPECT_EQ(a, b);
    EXPECT_TRUE(equal(a, b));
    EXPECT_EQ(a.size(), 16u);
}

TEST(Digest_Blake2b, SensitiveToEveryByte)
{
    std::string msg  = "0123456789abcdef";
    auto        base = blake2b_128(u8(msg), msg.size());
    for (std::size_t i = 0; i < msg.size(); ++i)
    {
        std::string m = msg;
        m[i] ^= 0x01;
        EXPECT_FALSE(equal(base, blake2b_128(u8(m), m.size()))) << "byte " << i;
    }
}

TEST(Digest_Blake2b, TwoPartEqualsConcatenation)
{
    const std::string head = "header-fields";
    const std::string body = "and the chunk data";
    const std::string all  = head + body;

    auto joined = blake2b_128(u8(all), all.size());
    auto split  = blake2b_128(u8(head), head.size(), u8(body), body.size());
    EXPECT_EQ(joined, split);

    // an empty part is allowed on either side
    EXPECT_EQ(blake2b_128(u8(all), all.size(), nullptr, 0), joined);
    EXPECT_EQ(blake2b_128(nullptr, 0, u8(all), all.size()), joined);
}

TEST(Digest_Blake2b, EmptyInput)
{
    auto a = blake2b_128(nullptr, 0);
    auto b = blake2b_128(nullptr, 0, nullptr, 0);
    EXPECT_EQ(a, b);
    EXPECT_NE(a, Checksum{});
}

TEST(Digest_Base64, Encode)
{
    EXPECT_EQ(to_base64(u8("hello"), 5), "aGVsbG8=");
    EXPECT_EQ(to_base64(u8("hi!"), 3), "aGkh");
    EXPECT_EQ(to_base64(nullptr, 0), "");
    EXPECT_EQ(to_base64(u8("hello"), 5).size(), base64_len(5));
    EXPECT_EQ(base64_len(0), 0u);
    EXPECT_EQ(base64_len(3), 4u);
    EXPECT_EQ(base64_len(4), 8u);
}

TEST(Digest_Base64, DecodeBinary)
{
    std::vector<std::uint8_t> bin(256);
    for (std::size_t i = 0; i < bin.size(); ++i)
        bin[i] = static_cast<std::uint8_t>(i);

    auto dec = from_base64(to_base64(bin.data(), bin.size()));
    ASSERT_TRUE(dec.has_value());
    EXPECT_EQ(*dec, bin);
}

TEST(Digest_Base64, RejectsGarbage)
{
    EXPECT_FALSE(from_base64("not base64!").has_value());
    EXPECT_FALSE(from_base64("aGVsbG8=@@").has_value());
    EXPECT_FALSE(from_base64("https://example.com/").has_value());

    auto empty = from_base64("");
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty->empty());
}
