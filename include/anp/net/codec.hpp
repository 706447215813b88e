#ifndef ANP_NET_CODEC_HPP
#define ANP_NET_CODEC_HPP

#include <cstddef>
#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include "anp/crypto/cipher.hpp"
#include "anp/net/stream.hpp"
#include "anp/util/types.hpp"

namespace anp::net {

constexpr uint16_t DEFAULT_PORT = 41433;

// buffer size used when streaming files
constexpr std::size_t DEFAULT_CHUNK_SIZE = 256 * 1024;

// upper bound on a single block; a corrupt length header must not allocate gigabytes
constexpr uint32_t MAX_BLOCK_SIZE = 64 * 1024 * 1024;

// largest chunk whose block still fits under MAX_BLOCK_SIZE once encrypted
constexpr std::size_t MAX_CHUNK_SIZE = MAX_BLOCK_SIZE - crypto::AesGcmCipher::OVERHEAD;

/*
    wire primitives (all integers big-endian):
    - uint32 / uint64
    - block:          [uint32 length][length bytes]   (bytes encrypted when configured,
                                                      the length header never is)
    - string:         block holding BOM + UTF-16LE text
    - chunked stream: non-empty blocks, then exactly one zero-length block

    every read returns std::nullopt when the peer closed cleanly before the first byte of that
    read, and throws TruncatedStream when it closed part way through.
*/
class FrameCodec {
   public:
    explicit FrameCodec(std::shared_ptr<IStream> stream,
                        crypto::EncryptionConfig encryption = crypto::EncryptionConfig::none(),
                        std::size_t chunk_size = DEFAULT_CHUNK_SIZE);

    FrameCodec(const FrameCodec&) = delete;
    FrameCodec& operator=(const FrameCodec&) = delete;
    FrameCodec(FrameCodec&&) noexcept = default;
    FrameCodec& operator=(FrameCodec&&) noexcept = default;

    [[nodiscard]] std::optional<util::Bytes> read_exactly(std::size_t count);
    void write_exactly(const uint8_t* data, std::size_t len);
    void write_exactly(const util::Bytes& data) {
        write_exactly(data.data(), data.size());
    }

    [[nodiscard]] std::optional<uint32_t> read_uint32();
    [[nodiscard]] std::optional<uint64_t> read_uint64();
    void write_uint32(uint32_t value);
    void write_uint64(uint64_t value);

    // a zero length is a legal empty block, distinct from end of stream
    [[nodiscard]] std::optional<util::Bytes> read_block();
    void write_block(const uint8_t* data, std::size_t len);
    void write_block(const util::Bytes& data) {
        write_block(data.data(), data.size());
    }

    // utf-8 in memory, UTF-16 on the wire
    [[nodiscard]] std::optional<std::string> read_string();
    void write_string(std::string_view value);

    // appends every block up to the zero-length terminator to sink. returns bytes written
    uint64_t read_chunked_stream(std::ostream& sink);
    // streams source in blocks of at most chunk_size, then the terminator. returns bytes sent
    uint64_t write_chunked_stream(std::istream& source);
    uint64_t write_chunked_stream(std::istream& source, std::size_t chunk_size);

    [[nodiscard]] std::size_t chunk_size() const noexcept {
        return chunk_size_;
    }

    [[nodiscard]] const crypto::EncryptionConfig& encryption() const noexcept {
        return encryption_;
    }

    [[nodiscard]] IStream& stream() noexcept {
        return *stream_;
    }

    [[nodiscard]] std::string peer() const {
        return stream_->peer();
    }

    void close() {
        stream_->close();
    }

   private:
    std::shared_ptr<IStream> stream_;
    crypto::EncryptionConfig encryption_;
    std::size_t chunk_size_;
};

}  // namespace anp::net

#endif
