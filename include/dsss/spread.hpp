#pragma once

#include "types.hpp"

namespace dsss {

/**
 * PRN generator
 *
 * Chip sequences are a pure function of (secret, chips_per_bit), so the
 * transmitter and receiver can regenerate them independently. This is a
 * reproducibility mechanism only: the secrets are not security keys and
 * the sequence gives no confidentiality.
 */
namespace prn {

// Big-endian value of the first 8 bytes of SHA-256(secret)
uint64_t deriveSeed(std::string_view secret);

// chips_per_bit values, each -1 or +1 with equal probability
Chips chipSequence(std::string_view secret, size_t chips_per_bit);

// Spreading factor for a transmitter secret: max(8, 4 x characters)
size_t chipsPerBit(std::string_view secret);

} // namespace prn

/**
 * Spreader / Despreader
 */
namespace spread {

// NRZ level of a bit: 0 -> -1, 1 -> +1
inline Sample nrz(uint8_t bit) { return bit ? 1.0f : -1.0f; }
Samples nrz(BitSpan bits);

// Each bit's NRZ level held for chips_per_bit chips, times the tiled PRN.
// No bits -> chips_per_bit zeros.
Chips spreadBits(BitSpan bits, const Chips& prn, size_t chips_per_bit);

// Collapse oversampling, multiply by the local PRN, average per bit.
// Returns one soft metric per bit.
Samples despread(SampleSpan baseband, const Chips& prn,
                 size_t chips_per_bit, size_t oversampling);

// bit = 1 iff metric > 0
Bits hardDecision(SampleSpan metrics);

} // namespace spread

} // namespace dsss
