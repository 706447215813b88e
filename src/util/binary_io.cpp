#include "anp/util/binary_io.hpp"

#include <stdexcept>

namespace anp::util {

namespace {

void append_unit_le(Bytes& out, uint16_t unit) {
    out.push_back(static_cast<uint8_t>(unit & 0xFF));
    out.push_back(static_cast<uint8_t>(unit >> 8));
}

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

// decode one code point starting at utf8[i], advancing i
uint32_t next_code_point(std::string_view utf8, std::size_t& i) {
    auto lead = static_cast<uint8_t>(utf8[i]);
    std::size_t extra = 0;
    uint32_t cp = 0;
    uint32_t min = 0;

    if (lead < 0x80) {
        ++i;
        return lead;
    } else if ((lead & 0xE0) == 0xC0) {
        extra = 1;
        cp = lead & 0x1F;
        min = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
        extra = 2;
        cp = lead & 0x0F;
        min = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
        extra = 3;
        cp = lead & 0x07;
        min = 0x10000;
    } else {
        throw std::invalid_argument("invalid utf-8 lead byte");
    }

    if (i + extra >= utf8.size()) {
        throw std::invalid_argument("truncated utf-8 sequence");
    }
    for (std::size_t k = 1; k <= extra; ++k) {
        auto b = static_cast<uint8_t>(utf8[i + k]);
        if ((b & 0xC0) != 0x80) {
            throw std::invalid_argument("invalid utf-8 continuation byte");
        }
        cp = (cp << 6) | (b & 0x3F);
    }
    if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        throw std::invalid_argument("invalid utf-8 code point");
    }
    i += extra + 1;
    return cp;
}

}  // namespace

Bytes encode_utf16(std::string_view utf8) {
    Bytes out;
    out.reserve(2 + utf8.size() * 2);
    out.push_back(UTF16_BOM_LE[0]);
    out.push_back(UTF16_BOM_LE[1]);

    std::size_t i = 0;
    while (i < utf8.size()) {
        uint32_t cp = next_code_point(utf8, i);
        if (cp < 0x10000) {
            append_unit_le(out, static_cast<uint16_t>(cp));
        } else {
            // supplementary plane -> surrogate pair
            cp -= 0x10000;
            append_unit_le(out, static_cast<uint16_t>(0xD800 | (cp >> 10)));
            append_unit_le(out, static_cast<uint16_t>(0xDC00 | (cp & 0x3FF)));
        }
    }
    return out;
}

std::string decode_utf16(const uint8_t* data, std::size_t len) {
    if (len % 2 != 0) {
        throw std::invalid_argument("odd number of bytes in utf-16 text");
    }

    bool big_endian = false;
    std::size_t offset = 0;
    if (len >= 2) {
        if (data[0] == 0xFF && data[1] == 0xFE) {
            offset = 2;
        } else if (data[0] == 0xFE && data[1] == 0xFF) {
            big_endian = true;
            offset = 2;
        }
    }

    auto unit_at = [&](std::size_t pos) -> uint16_t {
        if (big_endian) {
            return static_cast<uint16_t>((data[pos] << 8) | data[pos + 1]);
        }
        return static_cast<uint16_t>(data[pos] | (data[pos + 1] << 8));
    };

    std::string out;
    out.reserve((len - offset) / 2);

    while (offset < len) {
        uint16_t unit = unit_at(offset);
        offset += 2;

        if (unit >= 0xD800 && unit <= 0xDBFF) {
            if (offset >= len) {
                throw std::invalid_argument("unpaired high surrogate in utf-16 text");
            }
            uint16_t low = unit_at(offset);
            if (low < 0xDC00 || low > 0xDFFF) {
                throw std::invalid_argument("unpaired high surrogate in utf-16 text");
            }
            offset += 2;
            append_utf8(out, 0x10000 + ((static_cast<uint32_t>(unit - 0xD800) << 10) |
                                        static_cast<uint32_t>(low - 0xDC00)));
        } else if (unit >= 0xDC00 && unit <= 0xDFFF) {
            throw std::invalid_argument("unpaired low surrogate in utf-16 text");
        } else {
            append_utf8(out, unit);
        }
    }
    return out;
}

}  // namespace anp::util
