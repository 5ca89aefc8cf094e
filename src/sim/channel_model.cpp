#define _USE_MATH_DEFINES  // For M_PI on MSVC
#include <cmath>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

#include "dsss/channel.hpp"
#include "dsss/dsp.hpp"
#include "dsss/logging.hpp"
#include <algorithm>

namespace dsss {

ChannelModel::ChannelModel(const Config& config)
    : ChannelModel(config, std::random_device{}())
{
}

ChannelModel::ChannelModel(const Config& config, uint64_t seed)
    : config_(config)
    , rng_(seed)
    , gaussian_(0.0, 1.0)
{
}

Samples ChannelModel::carrier(size_t length) const {
    Samples out(length);
    // Phase computed in double; float time would drift at MHz carriers
    const double w = 2.0 * M_PI * config_.carrier_freq / config_.sample_rate;
    for (size_t n = 0; n < length; ++n) {
        out[n] = static_cast<Sample>(std::cos(w * static_cast<double>(n)));
    }
    return out;
}

Samples ChannelModel::modulate(SampleSpan baseband) const {
    Samples out = carrier(baseband.size());
    for (size_t i = 0; i < out.size(); ++i) {
        out[i] *= baseband[i];
    }
    return out;
}

Samples ChannelModel::demodulate(SampleSpan received) const {
    return modulate(received);
}

Samples ChannelModel::addNoise(SampleSpan signal) {
    switch (config_.noise_mode) {
        case NoiseMode::WHITE:
            return addWhiteNoise(signal);
        case NoiseMode::BAND_LIMITED:
        default:
            return addBandLimitedNoise(signal);
    }
}

Samples ChannelModel::addWhiteNoise(SampleSpan signal) {
    Samples out(signal.begin(), signal.end());
    if (config_.noise_power <= 0.0) return out;

    const double sigma = std::sqrt(config_.noise_power);
    for (auto& s : out) {
        s += static_cast<Sample>(sigma * gaussian_(rng_));
    }

    LOG_CHAN(DEBUG, "White noise: power=%.4f over %zu samples", config_.noise_power, out.size());
    return out;
}

Samples ChannelModel::addBandLimitedNoise(SampleSpan signal) {
    Samples out(signal.begin(), signal.end());
    if (config_.noise_power <= 0.0 || config_.noise_bandwidth <= 0.0 || out.empty()) {
        return out;
    }

    Samples noise = bandLimitedNoise(out.size());
    for (size_t i = 0; i < out.size(); ++i) {
        out[i] += noise[i];
    }
    return out;
}

Samples ChannelModel::bandLimitedNoise(size_t length) {
    if (length == 0) return {};

    Samples raw(length);
    for (auto& s : raw) {
        s = static_cast<Sample>(gaussian_(rng_));
    }

    FFT fft(length);
    auto spectrum = fft.forwardReal(raw);

    const double half_bw = std::min(config_.noise_bandwidth / 2.0, config_.sample_rate / 2.0);
    size_t kept = 0;
    for (size_t k = 0; k < spectrum.size(); ++k) {
        if (dsp::binFrequency(k, length, config_.sample_rate) <= half_bw) {
            kept++;
        } else {
            spectrum[k] = Complex(0.0f, 0.0f);
        }
    }

    Samples shaped = fft.inverseReal(spectrum);

    double sigma = dsp::stddev(shaped);
    if (sigma > 0.0) {
        const float scale = static_cast<float>(std::sqrt(config_.noise_power) / sigma);
        for (auto& s : shaped) s *= scale;
    } else {
        std::fill(shaped.begin(), shaped.end(), 0.0f);
    }

    LOG_CHAN(DEBUG, "Band-limited noise: power=%.4f, half-bandwidth=%.1f Hz, %zu/%zu bins kept",
             config_.noise_power, half_bw, kept, spectrum.size());
    return shaped;
}

} // namespace dsss
