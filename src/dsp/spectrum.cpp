#include "dsss/dsp.hpp"
#include "dsss/errors.hpp"
#include <cmath>

namespace dsss {
namespace dsp {

float rms(SampleSpan samples) {
    if (samples.empty()) return 0;
    double sum_sq = 0;
    for (auto s : samples) sum_sq += static_cast<double>(s) * s;
    return static_cast<float>(std::sqrt(sum_sq / samples.size()));
}

double stddev(SampleSpan samples) {
    if (samples.empty()) return 0.0;
    double mean = 0.0;
    for (auto s : samples) mean += s;
    mean /= samples.size();

    double var = 0.0;
    for (auto s : samples) {
        double d = s - mean;
        var += d * d;
    }
    return std::sqrt(var / samples.size());
}

Samples oversample(SampleSpan values, size_t factor) {
    Samples out;
    out.reserve(values.size() * factor);
    for (auto v : values) {
        out.insert(out.end(), factor, v);
    }
    return out;
}

Samples tile(SampleSpan pattern, size_t length) {
    Samples out(length, 0.0f);
    if (pattern.empty()) return out;
    for (size_t i = 0; i < length; ++i) {
        out[i] = pattern[i % pattern.size()];
    }
    return out;
}

Samples chunkMean(SampleSpan values, long window_size) {
    if (window_size <= 0) {
        throw InvalidArgument("window size must be > 0, got " + std::to_string(window_size));
    }
    size_t window = static_cast<size_t>(window_size);
    size_t count = values.size() / window;

    Samples out(count);
    for (size_t w = 0; w < count; ++w) {
        double acc = 0.0;
        for (size_t i = 0; i < window; ++i) {
            acc += values[w * window + i];
        }
        out[w] = static_cast<Sample>(acc / window);
    }
    return out;
}

Spectrum spectrum(SampleSpan waveform, double sample_rate) {
    Spectrum result;
    if (waveform.empty()) {
        result.frequencies = {0.0f};
        result.magnitudes = {0.0f};
        return result;
    }

    const size_t n = waveform.size();
    FFT fft(n);
    auto bins = fft.forwardReal(waveform);

    result.frequencies.resize(bins.size());
    result.magnitudes.resize(bins.size());
    for (size_t k = 0; k < bins.size(); ++k) {
        result.frequencies[k] = static_cast<float>(binFrequency(k, n, sample_rate));
        result.magnitudes[k] = std::abs(bins[k]) / static_cast<float>(n);
    }
    return result;
}

} // namespace dsp
} // namespace dsss
