// tests/test_session.cpp
// Encode and decode sessions end to end over the in-memory code and video backends.
#include <cstdint>
#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "app/decoder.hpp"
#include "app/encoder.hpp"
#include "media/memory_media.hpp"
#include "proto/chunk.hpp"

using namespace media;
using qrstego::Errc;

namespace
{

constexpr std::size_t CHUNK = 16;
constexpr std::size_t CAP   = framing::HDR_SIZE + CHUNK;
constexpr int         CODE_W = 16;

std::vector<std::uint8_t> gen_bytes(std::size_t n, std::uint8_t seed = 3)
{
    std::vector<std::uint8_t> v(n);
    for (std::size_t i = 0; i < n; ++i)
        v[i] = static_cast<std::uint8_t>((i * 31 + seed) & 0xFF);
    return v;
}

qrstego::Logger quiet()
{
    qrstego::Logger lg;
    lg.sink = nullptr;
    return lg;
}

// Fails the n-th render (0-based), delegates otherwise
class FlakyEncoder final : public ICodeEncoder
{
  public:
    FlakyEncoder(ICodeEncoder &inner, std::size_t fail_at) : inner_(inner), fail_at_(fail_at) {}
    std::size_t capacity() const override { return inner_.capacity(); }
    bool        render(const Bytes &b, Image &out) override
    {
        if (calls_++ == fail_at_)
            return false;
        return inner_.render(b, out);
    }

  private:
    ICodeEncoder &inner_;
    std::size_t   fail_at_;
    std::size_t   calls_ = 0;
};

struct Session : ::testing::Test
{
    qrstego::Logger   lg = quiet();
    qrstego::Config   cfg;
    MemoryFrameStore  store;
    MemoryCodeEncoder enc{CAP, CODE_W};
    MemoryCodeScanner scanner{CODE_W};

    qrstego::Status encode(const std::vector<std::uint8_t> &payload,
                           IVideoReader                    *cover = nullptr)
    {
        MemoryVideoWriter  w(store);
        app::FrameEncoder  fe(enc, w, cfg, lg);
        return fe.encode(payload, "out", cover);
    }

    qrstego::Status decode(std::vector<std::uint8_t> &out)
    {
        MemoryVideoReader r(store);
        EXPECT_TRUE(r.open("out"));
        return app::decode_payload(r, scanner, lg, out);
    }

    std::vector<Image> &frames() { return store.at("out").frames; }

    void make_cover(const std::string &name, std::size_t n, int w = 64, int h = 48,
                    double fps = 24.0)
    {
        Clip c;
        c.info.width  = w;
        c.info.height = h;
        c.info.fps    = fps;
        for (std::size_t i = 0; i < n; ++i)
            c.frames.emplace_back(w, h, 3, static_cast<std::uint8_t>(100 + i));
        c.info.frame_count = static_cast<long>(n);
        store.clips[name]  = std::move(c);
    }
};

}  // namespace

TEST_F(Session, ChunkSizeFollowsCapacity)
{
    MemoryVideoWriter w(store);
    app::FrameEncoder fe(enc, w, cfg, lg);
    EXPECT_EQ(fe.chunk_size(), CHUNK);
}

TEST_F(Session, Roundtrip_Empty)
{
    ASSERT_TRUE(encode({}).ok());
    EXPECT_EQ(frames().size(), 1u);

    std::vector<std::uint8_t> out = {9};
    ASSERT_TRUE(decode(out).ok());
    EXPECT_TRUE(out.empty());
}

TEST_F(Session, Roundtrip_ExactlyOneChunk)
{
    auto payload = gen_bytes(CHUNK);
    ASSERT_TRUE(encode(payload).ok());
    EXPECT_EQ(frames().size(), 1u);

    std::vector<std::uint8_t> out;
    ASSERT_TRUE(decode(out).ok());
    EXPECT_EQ(out, payload);
}

TEST_F(Session, Roundtrip_OneByteOverChunk)
{
    auto payload = gen_bytes(CHUNK + 1);
    ASSERT_TRUE(encode(payload).ok());
    EXPECT_EQ(frames().size(), 2u);

    std::vector<std::uint8_t> out;
    ASSERT_TRUE(decode(out).ok());
    EXPECT_EQ(out, payload);
}

TEST_F(Session, Roundtrip_Large)
{
    auto payload = gen_bytes(CHUNK * 200 + 7);
    ASSERT_TRUE(encode(payload).ok());
    EXPECT_EQ(frames().size(), 201u);
    EXPECT_EQ(enc.renders(), 201u);

    std::vector<std::uint8_t> out;
    ASSERT_TRUE(decode(out).ok());
    EXPECT_EQ(out, payload);
}

TEST_F(Session, FrameIndexMatchesSequence)
{
    ASSERT_TRUE(encode(gen_bytes(CHUNK * 5)).ok());
    ASSERT_EQ(frames().size(), 5u);
    for (std::size_t i = 0; i < 5; ++i)
    {
        auto bytes = scanner.scan(frames()[i]);
        ASSERT_TRUE(bytes.has_value());
        auto c = framing::parse(*bytes);
        ASSERT_TRUE(c.has_value());
        EXPECT_EQ(c->hdr.seq, i);
        EXPECT_EQ(c->hdr.total, 5u);
    }
}

TEST_F(Session, DuplicateFrameIsHarmless)
{
    auto payload = gen_bytes(CHUNK * 4);
    ASSERT_TRUE(encode(payload).ok());
    const Image two   = frames()[2];
    const Image three = frames()[3];
    frames().push_back(two);
    frames().insert(frames().begin(), three);

    std::vector<std::uint8_t> out;
    ASSERT_TRUE(decode(out).ok());
    EXPECT_EQ(out, payload);
}

TEST_F(Session, DroppedFrameIsReported)
{
    ASSERT_TRUE(encode(gen_bytes(CHUNK * 6)).ok());
    frames().erase(frames().begin() + 4);

    std::vector<std::uint8_t> out;
    auto                      st = decode(out);
    EXPECT_EQ(st.code, Errc::IncompleteRecovery);
    EXPECT_TRUE(st.total_known);
    EXPECT_EQ(st.missing, std::vector<std::uint32_t>({4}));
    EXPECT_TRUE(out.empty());
}

TEST_F(Session, FlippedDataBitIsCorrupt)
{
    ASSERT_TRUE(encode(gen_bytes(CHUNK * 3)).ok());
    // code pixels: 8-byte block prefix, then the 28-byte header, then data
    frames()[1].pixels[MemoryCodeEncoder::PREFIX_LEN + framing::HDR_SIZE + 5] ^= 0x04;

    std::vector<std::uint8_t> out;
    auto                      st = decode(out);
    EXPECT_EQ(st.code, Errc::IncompleteRecovery);
    EXPECT_EQ(st.missing, std::vector<std::uint32_t>({1}));
}

TEST_F(Session, FlippedBitWithCleanDuplicateRecovers)
{
    auto payload = gen_bytes(CHUNK * 3);
    ASSERT_TRUE(encode(payload).ok());
    Image clean = frames()[1];
    frames()[1].pixels[MemoryCodeEncoder::PREFIX_LEN + framing::HDR_SIZE] ^= 0x80;
    frames().push_back(clean);

    std::vector<std::uint8_t> out;
    ASSERT_TRUE(decode(out).ok());
    EXPECT_EQ(out, payload);
}

TEST_F(Session, BlankAndForeignFramesAreSkipped)
{
    auto payload = gen_bytes(CHUNK * 3 + 2);
    ASSERT_TRUE(encode(payload).ok());

    const int w = frames()[0].width;
    const int h = frames()[0].height;
    Image     foreign;
    ASSERT_TRUE(enc.render(Bytes{'h', 'e', 'l', 'l', 'o'}, foreign));

    frames().insert(frames().begin() + 1, Image(w, h, 1, 0));
    frames().insert(frames().begin(), foreign);
    frames().push_back(Image(w, h, 1, 255));

    MemoryVideoReader r(store);
    ASSERT_TRUE(r.open("out"));
    app::FrameDecoder    dec(r, scanner, lg);
    framing::FramedChunk c;
    std::size_t          chunks = 0;
    while (dec.next(c))
        chunks++;
    EXPECT_EQ(chunks, 4u);
    EXPECT_EQ(dec.stats().frames, 7u);
    EXPECT_EQ(dec.stats().codes, 5u);
    EXPECT_EQ(dec.stats().malformed, 1u);

    std::vector<std::uint8_t> out;
    ASSERT_TRUE(decode(out).ok());
    EXPECT_EQ(out, payload);
}

TEST_F(Session, NoCodesAtAll)
{
    Clip c;
    c.info.width  = 32;
    c.info.height = 32;
    c.frames.assign(5, Image(32, 32, 3, 0));
    store.clips["out"] = c;

    std::vector<std::uint8_t> out;
    auto                      st = decode(out);
    EXPECT_EQ(st.code, Errc::IncompleteRecovery);
    EXPECT_FALSE(st.total_known);
}

TEST_F(Session, OversizeFailsBeforeRendering)
{
    cfg.max_chunks = 2;
    auto st        = encode(gen_bytes(CHUNK * 2 + 1));
    EXPECT_EQ(st.code, Errc::OversizeInput);
    EXPECT_EQ(qrstego::exit_code(st), exitc::oversize_input);
    EXPECT_EQ(enc.renders(), 0u);
    EXPECT_FALSE(store.contains("out"));

    // at the limit is fine
    EXPECT_TRUE(encode(gen_bytes(CHUNK * 2)).ok());
}

TEST_F(Session, CapacityBelowHeaderIsBadConfig)
{
    MemoryCodeEncoder tiny(framing::HDR_SIZE);
    MemoryVideoWriter w(store);
    app::FrameEncoder fe(tiny, w, cfg, lg);
    EXPECT_EQ(fe.chunk_size(), 0u);
    EXPECT_EQ(fe.encode(gen_bytes(4), "out").code, Errc::BadConfig);
    EXPECT_FALSE(store.contains("out"));
}

TEST_F(Session, EncodeFailureLeavesNoOutput)
{
    FlakyEncoder      flaky(enc, 2);
    MemoryVideoWriter w(store);
    app::FrameEncoder fe(flaky, w, cfg, lg);

    auto st = fe.encode(gen_bytes(CHUNK * 4), "out");
    EXPECT_EQ(st.code, Errc::EncodeFailure);
    EXPECT_NE(st.message.find("chunk 2"), std::string::npos);
    EXPECT_EQ(fe.chunks_written(), 2u);
    EXPECT_FALSE(store.contains("out"));
}

TEST_F(Session, AppendFailureLeavesNoOutput)
{
    MemoryVideoWriter w(store);
    w.fail_after(1);
    app::FrameEncoder fe(enc, w, cfg, lg);

    EXPECT_EQ(fe.encode(gen_bytes(CHUNK * 3), "out").code, Errc::IoError);
    EXPECT_FALSE(store.contains("out"));
}

TEST_F(Session, WriterOpenFailureIsIoError)
{
    MemoryVideoWriter w(store);
    app::FrameEncoder fe(enc, w, cfg, lg);
    EXPECT_EQ(fe.encode(gen_bytes(3), "").code, Errc::IoError);
}

TEST_F(Session, FpsWithoutCover)
{
    cfg.fps = 12.5;
    ASSERT_TRUE(encode(gen_bytes(5)).ok());
    EXPECT_DOUBLE_EQ(store.at("out").info.fps, 12.5);
    EXPECT_EQ(store.at("out").info.width, CODE_W);
}

TEST_F(Session, CoverFramesCarryCodesAndPassThrough)
{
    make_cover("cover", 6);
    MemoryVideoReader cover(store);
    ASSERT_TRUE(cover.open("cover"));

    auto payload = gen_bytes(CHUNK * 2 + 3);  // 3 chunks
    ASSERT_TRUE(encode(payload, &cover).ok());

    const Clip &in  = store.at("cover");
    const Clip &out = store.at("out");
    ASSERT_EQ(out.frames.size(), 6u);
    EXPECT_DOUBLE_EQ(out.info.fps, 24.0);
    EXPECT_EQ(out.info.width, 64);
    EXPECT_EQ(out.info.height, 48);
    for (std::size_t i = 0; i < 3; ++i)
    {
        EXPECT_NE(out.frames[i], in.frames[i]) << "frame " << i;
        // corner pixel is outside the pasted code
        EXPECT_EQ(out.frames[i].pixels[0], in.frames[i].pixels[0]);
    }
    for (std::size_t i = 3; i < 6; ++i)
        EXPECT_EQ(out.frames[i], in.frames[i]) << "frame " << i;

    std::vector<std::uint8_t> got;
    ASSERT_TRUE(decode(got).ok());
    EXPECT_EQ(got, payload);
}

TEST_F(Session, CoverTooShortKnownCount)
{
    make_cover("cover", 2);
    MemoryVideoReader cover(store);
    ASSERT_TRUE(cover.open("cover"));

    auto st = encode(gen_bytes(CHUNK * 3), &cover);
    EXPECT_EQ(st.code, Errc::CoverTooShort);
    EXPECT_EQ(qrstego::exit_code(st), exitc::cover_short);
    EXPECT_EQ(enc.renders(), 0u);
    EXPECT_FALSE(store.contains("out"));
}

TEST_F(Session, CoverTooShortUnknownCount)
{
    make_cover("cover", 2);
    MemoryVideoReader cover(store);
    ASSERT_TRUE(cover.open("cover"));
    cover.report_frame_count(-1);

    auto st = encode(gen_bytes(CHUNK * 3), &cover);
    EXPECT_EQ(st.code, Errc::CoverTooShort);
    EXPECT_FALSE(store.contains("out"));
}

TEST_F(Session, CoverFramesTooSmallForCode)
{
    make_cover("cover", 4, 8, 8);
    MemoryVideoReader cover(store);
    ASSERT_TRUE(cover.open("cover"));

    EXPECT_EQ(encode(gen_bytes(CHUNK), &cover).code, Errc::BadConfig);
    EXPECT_FALSE(store.contains("out"));
}
