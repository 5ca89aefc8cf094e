#include "dsss/fec.hpp"
#include "dsss/errors.hpp"
#include "dsss/logging.hpp"
#include <algorithm>

namespace dsss {
namespace fec {

namespace {

constexpr size_t kRepeatFactor = 3;
constexpr size_t kHammingData = 4;
constexpr size_t kHammingBlock = 7;

// Data bit positions inside a codeword (p1, p2, d1, p3, d2, d3, d4)
constexpr size_t kHammingDataPos[kHammingData] = {2, 4, 5, 6};

Bits truncated(Bits bits, size_t payload_bits) {
    if (bits.size() > payload_bits) bits.resize(payload_bits);
    return bits;
}

[[noreturn]] void unsupported(CodingScheme scheme) {
    throw InvalidArgument("Unsupported coding scheme: " +
                          std::to_string(static_cast<int>(scheme)));
}

} // namespace

Bits encodeManchester(BitSpan bits) {
    Bits out;
    out.reserve(bits.size() * 2);
    for (uint8_t b : bits) {
        out.push_back(b ? 1 : 0);
        out.push_back(b ? 0 : 1);
    }
    return out;
}

Bits decodeManchester(BitSpan received, size_t payload_bits) {
    Bits out;
    out.reserve(received.size() / 2);
    for (size_t i = 0; i + 1 < received.size(); i += 2) {
        out.push_back(received[i] > received[i + 1] ? 1 : 0);
    }
    return truncated(std::move(out), payload_bits);
}

Bits encodeRepetition(BitSpan bits, size_t repeat) {
    Bits out;
    out.reserve(bits.size() * repeat);
    for (uint8_t b : bits) {
        out.insert(out.end(), repeat, b);
    }
    return out;
}

Bits decodeRepetition(BitSpan received, size_t repeat, size_t payload_bits) {
    if (repeat == 0) {
        throw InvalidArgument("repeat factor must be > 0");
    }
    const size_t threshold = (repeat + 1) / 2;
    const size_t groups = received.size() / repeat;

    Bits out(groups);
    for (size_t g = 0; g < groups; ++g) {
        size_t votes = 0;
        for (size_t i = 0; i < repeat; ++i) {
            votes += received[g * repeat + i] ? 1 : 0;
        }
        out[g] = votes >= threshold ? 1 : 0;
    }
    return truncated(std::move(out), payload_bits);
}

Bits encodeHamming74(BitSpan bits, size_t& padding) {
    padding = (kHammingData - bits.size() % kHammingData) % kHammingData;

    Bits data(bits.begin(), bits.end());
    data.resize(bits.size() + padding, 0);

    Bits out;
    out.reserve(data.size() / kHammingData * kHammingBlock);
    for (size_t i = 0; i < data.size(); i += kHammingData) {
        uint8_t d1 = data[i], d2 = data[i + 1], d3 = data[i + 2], d4 = data[i + 3];
        uint8_t p1 = d1 ^ d2 ^ d4;
        uint8_t p2 = d1 ^ d3 ^ d4;
        uint8_t p3 = d2 ^ d3 ^ d4;
        out.insert(out.end(), {p1, p2, d1, p3, d2, d3, d4});
    }
    return out;
}

int hammingSyndrome(const uint8_t* c) {
    int s1 = (c[0] ^ c[2] ^ c[4] ^ c[6]) & 1;
    int s2 = (c[1] ^ c[2] ^ c[5] ^ c[6]) & 1;
    int s3 = (c[3] ^ c[4] ^ c[5] ^ c[6]) & 1;
    return s1 + 2 * s2 + 4 * s3;
}

Bits decodeHamming74(BitSpan received, size_t padding, size_t payload_bits) {
    const size_t blocks = received.size() / kHammingBlock;
    if (blocks == 0) return {};

    Bits data;
    data.reserve(blocks * kHammingData);
    size_t corrected = 0;

    for (size_t b = 0; b < blocks; ++b) {
        uint8_t block[kHammingBlock];
        std::copy_n(received.begin() + b * kHammingBlock, kHammingBlock, block);

        int syndrome = hammingSyndrome(block);
        if (syndrome != 0) {
            block[syndrome - 1] ^= 1;
            corrected++;
        }
        for (size_t pos : kHammingDataPos) {
            data.push_back(block[pos]);
        }
    }

    if (corrected > 0) {
        LOG_FEC(DEBUG, "Hamming(7,4): corrected %zu of %zu blocks", corrected, blocks);
    }

    if (padding > 0) {
        data.resize(data.size() - std::min(padding, data.size()));
    }
    return truncated(std::move(data), payload_bits);
}

EncodedBits encode(BitSpan bits, CodingScheme scheme) {
    EncodedBits result;
    result.meta.payload_bits = bits.size();

    switch (scheme) {
        case CodingScheme::NRZ:
            result.bits.assign(bits.begin(), bits.end());
            break;
        case CodingScheme::MANCHESTER:
            result.bits = encodeManchester(bits);
            break;
        case CodingScheme::REP3:
            result.meta.repeat = kRepeatFactor;
            result.bits = encodeRepetition(bits, kRepeatFactor);
            break;
        case CodingScheme::HAMMING74: {
            size_t padding = 0;
            result.bits = encodeHamming74(bits, padding);
            result.meta.padding = padding;
            break;
        }
        default:
            unsupported(scheme);
    }

    LOG_FEC(DEBUG, "%s: %zu payload bits -> %zu coded bits",
            codingSchemeName(scheme), bits.size(), result.bits.size());
    return result;
}

Bits decode(BitSpan received, CodingScheme scheme, const CodingMetadata& meta) {
    switch (scheme) {
        case CodingScheme::NRZ:
            return truncated(Bits(received.begin(), received.end()), meta.payload_bits);
        case CodingScheme::MANCHESTER:
            return decodeManchester(received, meta.payload_bits);
        case CodingScheme::REP3:
            return decodeRepetition(received, meta.repeat.value_or(kRepeatFactor), meta.payload_bits);
        case CodingScheme::HAMMING74:
            return decodeHamming74(received, meta.padding.value_or(0), meta.payload_bits);
        default:
            unsupported(scheme);
    }
}

double codeRate(CodingScheme scheme) {
    switch (scheme) {
        case CodingScheme::NRZ:        return 1.0;
        case CodingScheme::MANCHESTER: return 0.5;
        case CodingScheme::REP3:       return 1.0 / kRepeatFactor;
        case CodingScheme::HAMMING74:  return static_cast<double>(kHammingData) / kHammingBlock;
        default:
            unsupported(scheme);
    }
}

} // namespace fec
} // namespace dsss
