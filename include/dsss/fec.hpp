#pragma once

#include "types.hpp"

namespace dsss {

/**
 * Text <-> bit conversion
 *
 * Bits are unpacked MSB first from the UTF-8 bytes of the message.
 * Decoding never throws: invalid UTF-8 is replaced with U+FFFD.
 */
namespace bitcodec {

Bits textToBits(std::string_view text);
Bits bytesToBits(ByteSpan data);

// Truncate to expected_bytes*8 bits, zero-pad to a byte boundary, pack,
// then decode as UTF-8 with replacement
std::string bitsToText(BitSpan bits, size_t expected_bytes);

// Lossy UTF-8 decode: each maximal invalid subsequence becomes U+FFFD
std::string decodeUtf8Lossy(ByteSpan data);

// Number of code points: bytes that are not UTF-8 continuation bytes
size_t utf8Length(std::string_view text);

} // namespace bitcodec

/**
 * Decode parameters recorded at encode time.
 *
 * payload_bits is always set; repeat is only meaningful for REP3 and
 * padding only for HAMMING74.
 */
struct CodingMetadata {
    size_t payload_bits = 0;
    std::optional<size_t> repeat;
    std::optional<size_t> padding;
};

struct EncodedBits {
    Bits bits;
    CodingMetadata meta;
};

/**
 * Forward error coder
 *
 * Stateless; every scheme is a pure encode/decode pair selected by a
 * single switch. Unsupported schemes throw InvalidArgument.
 */
namespace fec {

EncodedBits encode(BitSpan bits, CodingScheme scheme);
Bits decode(BitSpan received, CodingScheme scheme, const CodingMetadata& meta);

// Code rate as payload bits per transmitted bit
double codeRate(CodingScheme scheme);

// Individual schemes
Bits encodeManchester(BitSpan bits);
Bits decodeManchester(BitSpan received, size_t payload_bits);

Bits encodeRepetition(BitSpan bits, size_t repeat);
Bits decodeRepetition(BitSpan received, size_t repeat, size_t payload_bits);

// Hamming(7,4), codeword order (p1, p2, d1, p3, d2, d3, d4)
Bits encodeHamming74(BitSpan bits, size_t& padding);
Bits decodeHamming74(BitSpan received, size_t padding, size_t payload_bits);

// Syndrome of one 7-bit block: 0 = clean, else 1-based error position
int hammingSyndrome(const uint8_t* block);

} // namespace fec

} // namespace dsss
