#include "anp/net/codec.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

#include "anp/net/errors.hpp"
#include "anp/util/binary_io.hpp"

namespace anp::net {

FrameCodec::FrameCodec(std::shared_ptr<IStream> stream, crypto::EncryptionConfig encryption,
                       std::size_t chunk_size)
    : stream_(std::move(stream)), encryption_(std::move(encryption)), chunk_size_(chunk_size) {
    if (!stream_) {
        throw std::invalid_argument("FrameCodec needs a stream");
    }
    if (chunk_size_ == 0 || chunk_size_ > MAX_CHUNK_SIZE) {
        throw std::invalid_argument("chunk size must be between 1 and " +
                                    std::to_string(MAX_CHUNK_SIZE));
    }
}

std::optional<util::Bytes> FrameCodec::read_exactly(std::size_t count) {
    util::Bytes buffer(count);
    std::size_t bytes_read = 0;

    // a single read_some may return anything from 1 byte to count
    while (bytes_read < count) {
        std::size_t n = stream_->read_some(buffer.data() + bytes_read, count - bytes_read);
        if (n == 0) {
            if (bytes_read == 0) {
                return std::nullopt;  // socket closed normally
            }
            throw TruncatedStream(count - bytes_read);
        }
        bytes_read += n;
    }
    return buffer;
}

void FrameCodec::write_exactly(const uint8_t* data, std::size_t len) {
    std::size_t written = 0;
    while (written < len) {
        written += stream_->write_some(data + written, len - written);
    }
}

std::optional<uint32_t> FrameCodec::read_uint32() {
    auto data = read_exactly(4);
    if (!data) {
        return std::nullopt;
    }
    return util::read_uint32_be(data->data());
}

std::optional<uint64_t> FrameCodec::read_uint64() {
    auto data = read_exactly(8);
    if (!data) {
        return std::nullopt;
    }
    return util::read_uint64_be(data->data());
}

void FrameCodec::write_uint32(uint32_t value) {
    uint8_t buf[4];
    util::write_uint32_be(buf, value);
    write_exactly(buf, sizeof(buf));
}

void FrameCodec::write_uint64(uint64_t value) {
    uint8_t buf[8];
    util::write_uint64_be(buf, value);
    write_exactly(buf, sizeof(buf));
}

std::optional<util::Bytes> FrameCodec::read_block() {
    auto length = read_uint32();
    if (!length) {
        return std::nullopt;
    }
    // empty blocks are never encrypted
    if (*length == 0) {
        return util::Bytes{};
    }
    if (*length > MAX_BLOCK_SIZE) {
        throw DecodeError("block of " + std::to_string(*length) + " bytes exceeds limit of " +
                          std::to_string(MAX_BLOCK_SIZE));
    }

    auto payload = read_exactly(*length);
    if (!payload) {
        // the length header arrived, the data didn't
        throw TruncatedStream(*length);
    }

    if (!encryption_.enabled()) {
        return payload;
    }
    try {
        return encryption_.cipher()->decrypt(*payload);
    } catch (const crypto::CryptoError& e) {
        throw DecodeError(std::string("unable to decrypt block: ") + e.what());
    }
}

void FrameCodec::write_block(const uint8_t* data, std::size_t len) {
    if (len == 0) {
        write_uint32(0);
        return;
    }

    util::Bytes frame;
    if (encryption_.enabled()) {
        util::Bytes ciphertext = encryption_.cipher()->encrypt(util::Bytes(data, data + len));
        frame.resize(4);
        frame.insert(frame.end(), ciphertext.begin(), ciphertext.end());
    } else {
        frame.resize(4 + len);
        std::copy(data, data + len, frame.begin() + 4);
    }

    // one write for header + payload
    util::write_uint32_be(frame.data(), static_cast<uint32_t>(frame.size() - 4));
    write_exactly(frame);
}

std::optional<std::string> FrameCodec::read_string() {
    auto data = read_block();
    if (!data) {
        return std::nullopt;
    }
    try {
        return util::decode_utf16(*data);
    } catch (const std::invalid_argument& e) {
        throw DecodeError(std::string("invalid string: ") + e.what());
    }
}

void FrameCodec::write_string(std::string_view value) {
    write_block(util::encode_utf16(value));
}

uint64_t FrameCodec::read_chunked_stream(std::ostream& sink) {
    uint64_t total = 0;
    while (true) {
        auto chunk = read_block();
        if (!chunk) {
            // closed between chunks: the terminator's length header is missing
            throw TruncatedStream(4);
        }
        if (chunk->empty()) {
            break;  // last chunk
        }

        sink.write(reinterpret_cast<const char*>(chunk->data()),
                   static_cast<std::streamsize>(chunk->size()));
        if (!sink) {
            throw std::runtime_error("failed to write " + std::to_string(chunk->size()) +
                                     " bytes to chunk sink");
        }
        total += chunk->size();
    }
    return total;
}

uint64_t FrameCodec::write_chunked_stream(std::istream& source) {
    return write_chunked_stream(source, chunk_size_);
}

uint64_t FrameCodec::write_chunked_stream(std::istream& source, std::size_t chunk_size) {
    if (chunk_size == 0 || chunk_size > MAX_CHUNK_SIZE) {
        throw std::invalid_argument("chunk size must be between 1 and " +
                                    std::to_string(MAX_CHUNK_SIZE));
    }

    std::vector<char> buffer(chunk_size);
    uint64_t total = 0;

    // an empty read is sent as-is and doubles as the terminator
    while (true) {
        source.read(buffer.data(), static_cast<std::streamsize>(chunk_size));
        if (source.bad()) {
            throw std::runtime_error("failed to read from chunk source");
        }
        auto n = static_cast<std::size_t>(source.gcount());

        write_block(reinterpret_cast<const uint8_t*>(buffer.data()), n);
        if (n == 0) {
            break;
        }
        total += n;
    }
    return total;
}

}  // namespace anp::net
