#include "dsss/spread.hpp"
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

using namespace dsss;

// Test 1: Seed is the big-endian head of SHA-256(secret)
bool testKnownSeed() {
    std::cout << "Test 1: Seed derivation..." << std::flush;

    // sha256("alpha") = 8ed3f6ad685b959e...
    uint64_t seed = prn::deriveSeed("alpha");
    if (seed != 0x8ed3f6ad685b959eULL) {
        std::cout << " FAILED (seed 0x" << std::hex << seed << std::dec << ")\n";
        return false;
    }

    if (prn::deriveSeed("alpha") == prn::deriveSeed("beta")) {
        std::cout << " FAILED (different secrets, same seed)\n";
        return false;
    }

    std::cout << " OK\n";
    return true;
}

// Test 2: Fixed reference sequence, identical on every platform
bool testReferenceSequence() {
    std::cout << "Test 2: Reference chip sequence..." << std::flush;

    const float expected[20] = {
         1, -1,  1, -1,  1, -1,  1,  1, -1,  1,
         1,  1,  1,  1, -1, -1, -1,  1,  1, -1,
    };

    Chips chips = prn::chipSequence("alpha", 20);
    if (chips.size() != 20) {
        std::cout << " FAILED (length " << chips.size() << ")\n";
        return false;
    }
    for (size_t i = 0; i < 20; ++i) {
        if (chips[i] != expected[i]) {
            std::cout << " FAILED at chip " << i << "\n";
            return false;
        }
    }

    std::cout << " OK\n";
    return true;
}

// Test 3: Same secret and length always give the same chips
bool testDeterminism() {
    std::cout << "Test 3: Determinism and chip values..." << std::flush;

    Chips a = prn::chipSequence("correct horse", 100);
    Chips b = prn::chipSequence("correct horse", 100);
    if (a != b) {
        std::cout << " FAILED (not deterministic)\n";
        return false;
    }

    for (float c : a) {
        if (c != 1.0f && c != -1.0f) {
            std::cout << " FAILED (chip value " << c << ")\n";
            return false;
        }
    }

    // A shorter sequence is a prefix of a longer one
    Chips prefix = prn::chipSequence("correct horse", 40);
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (prefix[i] != a[i]) {
            std::cout << " FAILED (prefix differs at " << i << ")\n";
            return false;
        }
    }

    std::cout << " OK\n";
    return true;
}

// Test 4: Different secrets give weakly correlated sequences
bool testCrossCorrelation() {
    std::cout << "Test 4: Different secrets..." << std::flush;

    const size_t n = 256;
    Chips a = prn::chipSequence("alpha", n);
    Chips b = prn::chipSequence("bravo", n);
    if (a == b) {
        std::cout << " FAILED (identical sequences)\n";
        return false;
    }

    double corr = 0.0;
    for (size_t i = 0; i < n; ++i) corr += a[i] * b[i];
    corr /= n;
    std::cout << " (corr=" << corr << ")";
    // Expected spread of random sequences is 1/sqrt(n) = 0.0625
    if (std::abs(corr) > 0.4) {
        std::cout << " FAILED (correlation too high)\n";
        return false;
    }

    // alpha vs impostor-key at the demo spreading factor correlates negatively
    Chips tx = prn::chipSequence("alpha", 20);
    Chips rx = prn::chipSequence("impostor-key", 20);
    float dot = 0.0f;
    for (size_t i = 0; i < 20; ++i) dot += tx[i] * rx[i];
    if (dot >= 0.0f) {
        std::cout << " FAILED (alpha/impostor-key dot=" << dot << ")\n";
        return false;
    }

    std::cout << " OK\n";
    return true;
}

// Test 5: Spreading factor from secret length
bool testChipsPerBit() {
    std::cout << "Test 5: Chips per bit..." << std::flush;

    if (prn::chipsPerBit("") != 8 || prn::chipsPerBit("ab") != 8 ||
        prn::chipsPerBit("abc") != 12 || prn::chipsPerBit("alpha") != 20 ||
        prn::chipsPerBit("impostor-key") != 48) {
        std::cout << " FAILED\n";
        return false;
    }

    // Counted in characters, not UTF-8 bytes
    const std::string key = "\xD0\xBA\xD0\xBB\xD1\x8E\xD1\x87";  // 4 Cyrillic letters
    if (prn::chipsPerBit(key) != 16) {
        std::cout << " FAILED (multi-byte secret: " << prn::chipsPerBit(key) << ")\n";
        return false;
    }

    std::string wide;
    for (int i = 0; i < 64; ++i) wide += "\xC3\xA9";
    if (prn::chipsPerBit(wide) != 256) {
        std::cout << " FAILED (64-character secret: " << prn::chipsPerBit(wide) << ")\n";
        return false;
    }

    std::cout << " OK\n";
    return true;
}

int main() {
    std::cout << "=== PRN Generator Tests ===\n\n";

    int failures = 0;
    if (!testKnownSeed()) failures++;
    if (!testReferenceSequence()) failures++;
    if (!testDeterminism()) failures++;
    if (!testCrossCorrelation()) failures++;
    if (!testChipsPerBit()) failures++;

    std::cout << "\n";
    if (failures == 0) {
        std::cout << "All tests passed!\n";
        return 0;
    }
    std::cout << failures << " test(s) FAILED\n";
    return 1;
}
