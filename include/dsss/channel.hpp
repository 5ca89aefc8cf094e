#pragma once

#include "types.hpp"
#include <random>

namespace dsss {

/**
 * Channel model
 *
 * Coherent carrier modulation/demodulation plus additive Gaussian noise.
 * The receiver mixes with the exact transmit carrier; no phase or
 * frequency recovery is modeled.
 *
 * Noise is nondeterministic unless a seed is supplied.
 */
class ChannelModel {
public:
    struct Config {
        double carrier_freq = 1e6;     // Hz
        double sample_rate = 8e5;      // Hz
        double noise_power = 0.0;      // Variance of the added noise
        double noise_bandwidth = 5e3;  // Hz, two-sided width around DC
        NoiseMode noise_mode = NoiseMode::BAND_LIMITED;
    };

    explicit ChannelModel(const Config& config);
    ChannelModel(const Config& config, uint64_t seed);

    // cos(2*pi*fc*n/fs) for n = 0..length-1
    Samples carrier(size_t length) const;

    // Multiply by the carrier
    Samples modulate(SampleSpan baseband) const;
    Samples demodulate(SampleSpan received) const;

    // Add noise according to config().noise_mode
    Samples addNoise(SampleSpan signal);

    // i.i.d. N(0, noise_power); pass-through if noise_power <= 0
    Samples addWhiteNoise(SampleSpan signal);

    // Noise confined to |f| <= min(bandwidth/2, fs/2), scaled to
    // noise_power; pass-through if noise_power <= 0 or bandwidth <= 0
    Samples addBandLimitedNoise(SampleSpan signal);

    // The shaped noise alone
    Samples bandLimitedNoise(size_t length);

    const Config& getConfig() const { return config_; }

private:
    Config config_;
    std::mt19937_64 rng_;
    std::normal_distribution<double> gaussian_;
};

} // namespace dsss
