#include "dsss/fec.hpp"
#include <algorithm>

namespace dsss {
namespace bitcodec {

namespace {

constexpr char kReplacement[] = "\xEF\xBF\xBD";  // U+FFFD

} // namespace

Bits bytesToBits(ByteSpan data) {
    Bits bits;
    bits.reserve(data.size() * 8);
    for (uint8_t byte : data) {
        for (int b = 7; b >= 0; --b) {
            bits.push_back((byte >> b) & 1);
        }
    }
    return bits;
}

Bits textToBits(std::string_view text) {
    return bytesToBits(ByteSpan(reinterpret_cast<const uint8_t*>(text.data()), text.size()));
}

std::string bitsToText(BitSpan bits, size_t expected_bytes) {
    if (bits.empty()) return "";

    size_t used = std::min(bits.size(), expected_bytes * 8);
    size_t byte_count = (used + 7) / 8;

    Bytes packed(byte_count, 0);
    for (size_t i = 0; i < used; ++i) {
        if (bits[i] & 1) {
            packed[i / 8] |= static_cast<uint8_t>(0x80 >> (i % 8));
        }
    }
    return decodeUtf8Lossy(packed);
}

std::string decodeUtf8Lossy(ByteSpan data) {
    std::string out;
    out.reserve(data.size());

    size_t i = 0;
    while (i < data.size()) {
        uint8_t lead = data[i];
        if (lead < 0x80) {
            out.push_back(static_cast<char>(lead));
            ++i;
            continue;
        }

        // Sequence length and the allowed range of the second byte
        size_t len = 0;
        uint8_t lo = 0x80, hi = 0xBF;
        if (lead >= 0xC2 && lead <= 0xDF) {
            len = 2;
        } else if (lead == 0xE0) {
            len = 3; lo = 0xA0;
        } else if ((lead >= 0xE1 && lead <= 0xEC) || lead == 0xEE || lead == 0xEF) {
            len = 3;
        } else if (lead == 0xED) {
            len = 3; hi = 0x9F;
        } else if (lead == 0xF0) {
            len = 4; lo = 0x90;
        } else if (lead >= 0xF1 && lead <= 0xF3) {
            len = 4;
        } else if (lead == 0xF4) {
            len = 4; hi = 0x8F;
        } else {
            out += kReplacement;
            ++i;
            continue;
        }

        // Maximal valid prefix; the first bad byte starts the next round
        size_t j = 1;
        for (; j < len && i + j < data.size(); ++j) {
            uint8_t c = data[i + j];
            uint8_t c_lo = (j == 1) ? lo : 0x80;
            uint8_t c_hi = (j == 1) ? hi : 0xBF;
            if (c < c_lo || c > c_hi) break;
        }

        if (j == len) {
            out.append(reinterpret_cast<const char*>(&data[i]), len);
        } else {
            out += kReplacement;
        }
        i += j;
    }
    return out;
}

size_t utf8Length(std::string_view text) {
    size_t count = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) count++;
    }
    return count;
}

} // namespace bitcodec
} // namespace dsss
