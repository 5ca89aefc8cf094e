#include "dsss/spread.hpp"
#include "dsss/dsp.hpp"
#include "dsss/errors.hpp"

namespace dsss {
namespace spread {

Samples nrz(BitSpan bits) {
    Samples out(bits.size());
    for (size_t i = 0; i < bits.size(); ++i) {
        out[i] = nrz(bits[i]);
    }
    return out;
}

Chips spreadBits(BitSpan bits, const Chips& prn, size_t chips_per_bit) {
    if (bits.empty()) {
        return Chips(chips_per_bit, 0.0f);
    }
    if (prn.empty()) {
        throw InvalidArgument("PRN sequence is empty");
    }

    Chips chips(bits.size() * chips_per_bit);
    for (size_t b = 0; b < bits.size(); ++b) {
        Sample level = nrz(bits[b]);
        for (size_t c = 0; c < chips_per_bit; ++c) {
            size_t idx = b * chips_per_bit + c;
            chips[idx] = level * prn[idx % prn.size()];
        }
    }
    return chips;
}

Samples despread(SampleSpan baseband, const Chips& prn,
                 size_t chips_per_bit, size_t oversampling) {
    Samples rx_chips = dsp::chunkMean(baseband, static_cast<long>(oversampling));

    Samples local = dsp::tile(prn, rx_chips.size());
    for (size_t i = 0; i < rx_chips.size(); ++i) {
        rx_chips[i] *= local[i];
    }

    return dsp::chunkMean(rx_chips, static_cast<long>(chips_per_bit));
}

Bits hardDecision(SampleSpan metrics) {
    Bits bits(metrics.size());
    for (size_t i = 0; i < metrics.size(); ++i) {
        bits[i] = metrics[i] > 0.0f ? 1 : 0;
    }
    return bits;
}

} // namespace spread
} // namespace dsss
