#include "dsss/spread.hpp"
#include "dsss/fec.hpp"
#include <algorithm>
#include <random>

#include <sodium.h>

namespace dsss {
namespace prn {

uint64_t deriveSeed(std::string_view secret) {
    unsigned char digest[crypto_hash_sha256_BYTES];
    crypto_hash_sha256(digest,
                       reinterpret_cast<const unsigned char*>(secret.data()),
                       secret.size());

    uint64_t seed = 0;
    for (int i = 0; i < 8; ++i) {
        seed = (seed << 8) | digest[i];
    }
    return seed;
}

Chips chipSequence(std::string_view secret, size_t chips_per_bit) {
    // Chips come straight from the engine's output words, LSB first. The
    // <random> distributions are implementation-defined and would give
    // different sequences on different standard libraries.
    std::mt19937_64 rng(deriveSeed(secret));

    Chips chips(chips_per_bit);
    uint64_t word = 0;
    for (size_t i = 0; i < chips_per_bit; ++i) {
        if (i % 64 == 0) word = rng();
        chips[i] = (word >> (i % 64)) & 1 ? 1.0f : -1.0f;
    }
    return chips;
}

size_t chipsPerBit(std::string_view secret) {
    return std::max<size_t>(8, 4 * bitcodec::utf8Length(secret));
}

} // namespace prn
} // namespace dsss
