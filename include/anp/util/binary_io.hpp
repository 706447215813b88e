#ifndef ANP_UTIL_BINARY_IO_HPP
#define ANP_UTIL_BINARY_IO_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "anp/util/types.hpp"

namespace anp::util {
/*
    all integers on the wire are big-endian (network byte order).
    strings travel as UTF-16 with a leading byte order mark, the same bytes python's
    str.encode('utf16') produces on the nodes we talk to: FF FE then little-endian code units.
*/

// ============================================================================
// Big-endian integers
// ============================================================================

inline void write_uint32_be(uint8_t* out, uint32_t value) {
    out[0] = static_cast<uint8_t>((value >> 24) & 0xFF);  // most significant byte
    out[1] = static_cast<uint8_t>((value >> 16) & 0xFF);
    out[2] = static_cast<uint8_t>((value >> 8) & 0xFF);
    out[3] = static_cast<uint8_t>(value & 0xFF);  // least significant byte
    /*
        example: value = 0x12345678
        out: [0x12, 0x34, 0x56, 0x78]
    */
}

inline void write_uint64_be(uint8_t* out, uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        out[i] = static_cast<uint8_t>((value >> ((7 - i) * 8)) & 0xFF);
    }
}

inline uint32_t read_uint32_be(const uint8_t* data) {
    return (static_cast<uint32_t>(data[0]) << 24) | (static_cast<uint32_t>(data[1]) << 16) |
           (static_cast<uint32_t>(data[2]) << 8) | static_cast<uint32_t>(data[3]);
}

inline uint64_t read_uint64_be(const uint8_t* data) {
    uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value = (value << 8) | data[i];
    }
    return value;
}

// ============================================================================
// UTF-16 text
// ============================================================================

constexpr uint8_t UTF16_BOM_LE[2] = {0xFF, 0xFE};

// utf-8 text -> BOM + UTF-16LE. throws std::invalid_argument on malformed utf-8
[[nodiscard]] Bytes encode_utf16(std::string_view utf8);

// UTF-16 bytes (BOM selects byte order, little-endian without one) -> utf-8.
// throws std::invalid_argument on odd length or unpaired surrogates
[[nodiscard]] std::string decode_utf16(const uint8_t* data, std::size_t len);

[[nodiscard]] inline std::string decode_utf16(const Bytes& data) {
    return decode_utf16(data.data(), data.size());
}

}  // namespace anp::util

#endif
