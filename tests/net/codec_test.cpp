#include "anp/net/codec.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <sstream>

#include "anp/net/errors.hpp"
#include "support/memory_stream.hpp"

namespace anp::net::test {

using anp::test::MemoryStream;

class FrameCodecTest : public ::testing::Test {
   protected:
    // codec whose reads see `input`, one byte per read_some call
    static FrameCodec reader(util::Bytes input,
                             crypto::EncryptionConfig encryption = crypto::EncryptionConfig::none()) {
        return FrameCodec(std::make_shared<MemoryStream>(std::move(input), 1), std::move(encryption));
    }

    // write through `write`, then return a 1-byte-read codec over what was written
    template <typename F>
    static FrameCodec loop(F write, crypto::EncryptionConfig encryption =
                                        crypto::EncryptionConfig::none(),
                           std::size_t chunk_size = DEFAULT_CHUNK_SIZE) {
        auto out = std::make_shared<MemoryStream>(util::Bytes{}, SIZE_MAX, 3);
        FrameCodec writer(out, encryption, chunk_size);
        write(writer);
        return FrameCodec(std::make_shared<MemoryStream>(out->output(), 1), encryption,
                          chunk_size);
    }
};

TEST_F(FrameCodecTest, ReadExactlyAcrossPartialReads) {
    auto stream = std::make_shared<MemoryStream>(util::Bytes{1, 2, 3, 4, 5}, 1);
    FrameCodec codec(stream);

    auto data = codec.read_exactly(5);
    ASSERT_TRUE(data.has_value());
    EXPECT_EQ(*data, (util::Bytes{1, 2, 3, 4, 5}));
    EXPECT_EQ(stream->read_calls(), 5u);
}

TEST_F(FrameCodecTest, ReadExactlyCleanClose) {
    auto codec = reader({});
    EXPECT_FALSE(codec.read_exactly(4).has_value());
}

TEST_F(FrameCodecTest, ReadExactlyTruncated) {
    auto codec = reader({1, 2});
    try {
        (void)codec.read_exactly(5);
        FAIL() << "expected TruncatedStream";
    } catch (const TruncatedStream& e) {
        EXPECT_EQ(e.remaining(), 3u);
    }
}

TEST_F(FrameCodecTest, WriteExactlyAcrossPartialWrites) {
    auto stream = std::make_shared<MemoryStream>(util::Bytes{}, SIZE_MAX, 2);
    FrameCodec codec(stream);

    util::Bytes data{1, 2, 3, 4, 5, 6, 7};
    codec.write_exactly(data);
    EXPECT_EQ(stream->output(), data);
    EXPECT_EQ(stream->write_calls(), 4u);
}

TEST_F(FrameCodecTest, IntegersAreBigEndian) {
    auto stream = std::make_shared<MemoryStream>();
    FrameCodec codec(stream);
    codec.write_uint32(0x01020304);
    codec.write_uint64(5);
    EXPECT_EQ(stream->output(), (util::Bytes{1, 2, 3, 4, 0, 0, 0, 0, 0, 0, 0, 5}));

    auto in = reader(stream->output());
    EXPECT_EQ(in.read_uint32(), 0x01020304u);
    EXPECT_EQ(in.read_uint64(), 5u);
    EXPECT_FALSE(in.read_uint32().has_value());
}

TEST_F(FrameCodecTest, BlockLayout) {
    auto stream = std::make_shared<MemoryStream>();
    FrameCodec codec(stream);
    codec.write_block(util::Bytes{0xAA, 0xBB});
    EXPECT_EQ(stream->output(), (util::Bytes{0, 0, 0, 2, 0xAA, 0xBB}));
}

TEST_F(FrameCodecTest, EmptyBlockIsNotEndOfStream) {
    auto codec = reader({0, 0, 0, 0});
    auto block = codec.read_block();
    ASSERT_TRUE(block.has_value());
    EXPECT_TRUE(block->empty());
    EXPECT_FALSE(codec.read_block().has_value());
}

TEST_F(FrameCodecTest, BlockTruncatedInHeader) {
    auto codec = reader({0, 0});
    EXPECT_THROW((void)codec.read_block(), TruncatedStream);
}

TEST_F(FrameCodecTest, BlockTruncatedAfterHeader) {
    auto codec = reader({0, 0, 0, 4});
    try {
        (void)codec.read_block();
        FAIL() << "expected TruncatedStream";
    } catch (const TruncatedStream& e) {
        EXPECT_EQ(e.remaining(), 4u);
    }
}

TEST_F(FrameCodecTest, BlockTruncatedInPayload) {
    auto codec = reader({0, 0, 0, 4, 1});
    EXPECT_THROW((void)codec.read_block(), TruncatedStream);
}

TEST_F(FrameCodecTest, OversizedBlockRejected) {
    auto codec = reader({0xFF, 0xFF, 0xFF, 0xFF});
    EXPECT_THROW((void)codec.read_block(), DecodeError);
}

TEST_F(FrameCodecTest, StringRoundTrip) {
    auto in = loop([](FrameCodec& c) {
        c.write_string("hello");
        c.write_string("");
        c.write_string("gr\xC3\xBC\xC3\x9F");
    });
    EXPECT_EQ(in.read_string(), "hello");
    EXPECT_EQ(in.read_string(), "");
    EXPECT_EQ(in.read_string(), "gr\xC3\xBC\xC3\x9F");
    EXPECT_FALSE(in.read_string().has_value());
}

TEST_F(FrameCodecTest, StringWireFormat) {
    auto stream = std::make_shared<MemoryStream>();
    FrameCodec codec(stream);
    codec.write_string("ok");
    EXPECT_EQ(stream->output(), (util::Bytes{0, 0, 0, 6, 0xFF, 0xFE, 'o', 0, 'k', 0}));

    stream = std::make_shared<MemoryStream>();
    FrameCodec empty(stream);
    empty.write_string("");
    EXPECT_EQ(stream->output(), (util::Bytes{0, 0, 0, 2, 0xFF, 0xFE}));
}

TEST_F(FrameCodecTest, InvalidStringIsDecodeError) {
    auto codec = reader({0, 0, 0, 3, 0xFF, 0xFE, 'a'});
    EXPECT_THROW((void)codec.read_string(), DecodeError);
}

constexpr std::size_t CHUNK = 16;

class ChunkedStreamTest : public FrameCodecTest,
                          public ::testing::WithParamInterface<std::size_t> {};

TEST_P(ChunkedStreamTest, RoundTrip) {
    std::string payload;
    for (std::size_t i = 0; i < GetParam(); ++i) {
        payload.push_back(static_cast<char>('a' + i % 26));
    }

    uint64_t sent = 0;
    auto in = loop(
        [&](FrameCodec& c) {
            std::istringstream source(payload);
            sent = c.write_chunked_stream(source);
            c.write_uint32(42);
        },
        crypto::EncryptionConfig::none(), CHUNK);

    std::ostringstream sink;
    EXPECT_EQ(in.read_chunked_stream(sink), payload.size());
    EXPECT_EQ(sent, payload.size());
    EXPECT_EQ(sink.str(), payload);
    // the stream ends exactly at the terminator
    EXPECT_EQ(in.read_uint32(), 42u);
}

INSTANTIATE_TEST_SUITE_P(Sizes, ChunkedStreamTest,
                         ::testing::Values(std::size_t{0}, std::size_t{1}, CHUNK - 1, CHUNK,
                                           CHUNK + 1, CHUNK * 3));

TEST_F(FrameCodecTest, ChunkedStreamBlockSizes) {
    auto stream = std::make_shared<MemoryStream>();
    FrameCodec codec(stream, crypto::EncryptionConfig::none(), 4);
    std::istringstream source("abcdefghij");
    EXPECT_EQ(codec.write_chunked_stream(source), 10u);

    // 4 + 4 + 2 then terminator
    EXPECT_EQ(stream->output(),
              (util::Bytes{0, 0, 0, 4, 'a', 'b', 'c', 'd', 0, 0, 0, 4, 'e', 'f', 'g', 'h',
                           0, 0, 0, 2, 'i', 'j', 0, 0, 0, 0}));
}

TEST_F(FrameCodecTest, ChunkedStreamEmptySourceIsJustTerminator) {
    auto stream = std::make_shared<MemoryStream>();
    FrameCodec codec(stream);
    std::istringstream source("");
    EXPECT_EQ(codec.write_chunked_stream(source), 0u);
    EXPECT_EQ(stream->output(), (util::Bytes{0, 0, 0, 0}));
}

TEST_F(FrameCodecTest, ChunkedStreamMissingTerminator) {
    auto codec = reader({0, 0, 0, 1, 'x'});
    std::ostringstream sink;
    EXPECT_THROW((void)codec.read_chunked_stream(sink), TruncatedStream);
}

TEST_F(FrameCodecTest, EncryptedBlockRoundTrip) {
    auto encryption = crypto::EncryptionConfig::from_secret("node-key");
    auto in = loop(
        [](FrameCodec& c) {
            c.write_string("secret text");
            c.write_block(util::Bytes{});
        },
        encryption);

    EXPECT_EQ(in.read_string(), "secret text");
    auto empty = in.read_block();
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty->empty());
}

TEST_F(FrameCodecTest, EncryptedLengthCoversCiphertext) {
    auto stream = std::make_shared<MemoryStream>();
    FrameCodec codec(stream, crypto::EncryptionConfig::from_secret("node-key"));
    codec.write_block(util::Bytes{1, 2, 3});

    const auto& out = stream->output();
    ASSERT_EQ(out.size(), 4 + 3 + crypto::AesGcmCipher::OVERHEAD);
    EXPECT_EQ(util::Bytes(out.begin(), out.begin() + 4),
              (util::Bytes{0, 0, 0, static_cast<uint8_t>(3 + crypto::AesGcmCipher::OVERHEAD)}));
}

TEST_F(FrameCodecTest, EncryptedTerminatorStaysZeroLength) {
    auto stream = std::make_shared<MemoryStream>();
    FrameCodec codec(stream, crypto::EncryptionConfig::from_secret("node-key"));
    std::istringstream source("");
    (void)codec.write_chunked_stream(source);
    EXPECT_EQ(stream->output(), (util::Bytes{0, 0, 0, 0}));
}

TEST_F(FrameCodecTest, EncryptedChunkedStream) {
    auto encryption = crypto::EncryptionConfig::from_secret("node-key");
    std::string payload(100, 'z');
    auto in = loop(
        [&](FrameCodec& c) {
            std::istringstream source(payload);
            (void)c.write_chunked_stream(source, 7);
        },
        encryption);

    std::ostringstream sink;
    EXPECT_EQ(in.read_chunked_stream(sink), 100u);
    EXPECT_EQ(sink.str(), payload);
}

TEST_F(FrameCodecTest, MismatchedSecretIsDecodeError) {
    auto out = std::make_shared<MemoryStream>();
    FrameCodec writer(out, crypto::EncryptionConfig::from_secret("one"));
    writer.write_string("hello");

    auto in = reader(out->output(), crypto::EncryptionConfig::from_secret("two"));
    EXPECT_THROW((void)in.read_string(), DecodeError);
}

TEST_F(FrameCodecTest, PlaintextReaderSeesCiphertext) {
    auto out = std::make_shared<MemoryStream>();
    FrameCodec writer(out, crypto::EncryptionConfig::from_secret("one"));
    writer.write_block(util::Bytes{1, 2, 3});

    auto in = reader(out->output());
    auto block = in.read_block();
    ASSERT_TRUE(block.has_value());
    EXPECT_EQ(block->size(), 3 + crypto::AesGcmCipher::OVERHEAD);
}

TEST_F(FrameCodecTest, RejectsZeroChunkSize) {
    auto stream = std::make_shared<MemoryStream>();
    EXPECT_THROW({ FrameCodec codec(stream, crypto::EncryptionConfig::none(), 0); },
                 std::invalid_argument);
}

TEST_F(FrameCodecTest, RejectsChunkLargerThanABlock) {
    auto stream = std::make_shared<MemoryStream>();
    EXPECT_THROW(
        { FrameCodec codec(stream, crypto::EncryptionConfig::none(), MAX_CHUNK_SIZE + 1); },
        std::invalid_argument);

    FrameCodec codec(stream, crypto::EncryptionConfig::none(), MAX_CHUNK_SIZE);
    EXPECT_EQ(codec.chunk_size(), MAX_CHUNK_SIZE);

    std::istringstream source("x");
    EXPECT_THROW((void)codec.write_chunked_stream(source, MAX_CHUNK_SIZE + 1),
                 std::invalid_argument);
    EXPECT_TRUE(stream->output().empty());
}

}  // namespace anp::net::test
