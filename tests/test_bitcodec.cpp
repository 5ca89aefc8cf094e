#include "dsss/fec.hpp"
#include <iostream>
#include <string>
#include <vector>

using namespace dsss;

// Test 1: MSB-first unpacking
bool testMsbFirst() {
    std::cout << "Test 1: MSB-first bit order..." << std::flush;

    Bits bits = bitcodec::textToBits("A");  // 0x41
    Bits expected = {0, 1, 0, 0, 0, 0, 0, 1};
    if (bits != expected) {
        std::cout << " FAILED (wrong bits for 'A')\n";
        return false;
    }

    if (!bitcodec::textToBits("").empty()) {
        std::cout << " FAILED (empty text gave bits)\n";
        return false;
    }

    std::cout << " OK\n";
    return true;
}

// Test 2: Text survives a bit round trip, including multi-byte characters
bool testRoundTrip() {
    std::cout << "Test 2: Text round-trip..." << std::flush;

    std::vector<std::string> messages = {
        "HELLO DSSS",
        "x",
        "h\xC3\xA9llo w\xC3\xB6rld \xE2\x9C\x93",
        std::string(256, 'z'),
    };

    for (const auto& msg : messages) {
        Bits bits = bitcodec::textToBits(msg);
        if (bits.size() != msg.size() * 8) {
            std::cout << " FAILED (bit count " << bits.size() << ")\n";
            return false;
        }
        std::string back = bitcodec::bitsToText(bits, msg.size());
        if (back != msg) {
            std::cout << " FAILED (\"" << back << "\" != \"" << msg << "\")\n";
            return false;
        }
    }

    std::cout << " OK\n";
    return true;
}

// Test 3: Extra bits are cut off, a short tail is zero-padded
bool testTruncateAndPad() {
    std::cout << "Test 3: Truncate and pad..." << std::flush;

    Bits bits = bitcodec::textToBits("AB");
    if (bitcodec::bitsToText(bits, 1) != "A") {
        std::cout << " FAILED (no truncation)\n";
        return false;
    }

    // 7 bits of 0x40 -> padded with a trailing zero
    Bits seven = {0, 1, 0, 0, 0, 0, 0};
    if (bitcodec::bitsToText(seven, 1) != "@") {
        std::cout << " FAILED (no padding)\n";
        return false;
    }

    if (!bitcodec::bitsToText(Bits{}, 4).empty()) {
        std::cout << " FAILED (empty bits)\n";
        return false;
    }

    std::cout << " OK\n";
    return true;
}

// Test 4: Invalid UTF-8 becomes U+FFFD instead of failing
bool testLossyUtf8() {
    std::cout << "Test 4: Lossy UTF-8 decode..." << std::flush;

    const std::string replacement = "\xEF\xBF\xBD";

    struct Case {
        Bytes input;
        std::string expected;
    };
    std::vector<Case> cases = {
        {{0xFF, 0x41}, replacement + "A"},
        {{0xC3}, replacement},
        {{0xE2, 0x82}, replacement},              // truncated 3-byte sequence
        {{0xE2, 0x41}, replacement + "A"},
        {{0x80, 0x80}, replacement + replacement}, // stray continuation bytes
        {{0xED, 0xA0, 0x80}, replacement + replacement + replacement},  // surrogate
        {{0xC3, 0xA9}, "\xC3\xA9"},
    };

    for (size_t i = 0; i < cases.size(); ++i) {
        std::string out = bitcodec::decodeUtf8Lossy(cases[i].input);
        if (out != cases[i].expected) {
            std::cout << " FAILED (case " << i << ")\n";
            return false;
        }
    }

    // Flipped bits in the stream decode without throwing
    Bits bits = bitcodec::textToBits("ok");
    bits[0] = 1;
    std::string noisy = bitcodec::bitsToText(bits, 2);
    if (noisy.empty()) {
        std::cout << " FAILED (noisy decode empty)\n";
        return false;
    }

    std::cout << " OK\n";
    return true;
}

int main() {
    std::cout << "=== Bit Codec Tests ===\n\n";

    int failures = 0;
    if (!testMsbFirst()) failures++;
    if (!testRoundTrip()) failures++;
    if (!testTruncateAndPad()) failures++;
    if (!testLossyUtf8()) failures++;

    std::cout << "\n";
    if (failures == 0) {
        std::cout << "All tests passed!\n";
        return 0;
    }
    std::cout << failures << " test(s) FAILED\n";
    return 1;
}
