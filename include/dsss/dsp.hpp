#pragma once

#include "types.hpp"
#include <complex>
#include <memory>

namespace dsss {

using Complex = std::complex<float>;

/**
 * FFT wrapper around FFTW3 (single precision).
 *
 * Any length N >= 1 is accepted. Plans are created with FFTW_ESTIMATE so
 * construction is cheap enough to do per waveform.
 */
class FFT {
public:
    explicit FFT(size_t size);
    ~FFT();

    FFT(const FFT&) = delete;
    FFT& operator=(const FFT&) = delete;

    // Real forward FFT: N real -> N/2+1 complex
    void forwardReal(const Sample* in, Complex* out);
    std::vector<Complex> forwardReal(SampleSpan in);

    // Real inverse FFT: N/2+1 complex -> N real, normalized by 1/N
    void inverseReal(const Complex* in, Sample* out);
    Samples inverseReal(const std::vector<Complex>& in);

    size_t size() const { return size_; }
    size_t bins() const { return size_ / 2 + 1; }

private:
    size_t size_;
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Utility functions
namespace dsp {

// Compute RMS level
float rms(SampleSpan samples);

// Population standard deviation (divides by N)
double stddev(SampleSpan samples);

// Frequency of real-FFT bin k for an n-point transform
inline double binFrequency(size_t k, size_t n, double sample_rate) {
    return static_cast<double>(k) * sample_rate / static_cast<double>(n);
}

// Sample-and-hold: repeat every value `factor` times
Samples oversample(SampleSpan values, size_t factor);

// Repeat the whole sequence until it is `length` long (last copy cut short)
Samples tile(SampleSpan pattern, size_t length);

// Average consecutive non-overlapping windows; a trailing partial window
// is dropped. Throws InvalidArgument if window_size <= 0.
Samples chunkMean(SampleSpan values, long window_size);

// Uniform stride subsampling, stride = ceil(size / max_points)
template <typename T>
std::vector<T> decimate(const std::vector<T>& values, size_t max_points) {
    if (max_points == 0 || values.size() <= max_points) return values;
    size_t step = (values.size() + max_points - 1) / max_points;
    std::vector<T> out;
    out.reserve((values.size() + step - 1) / step);
    for (size_t i = 0; i < values.size(); i += step) {
        out.push_back(values[i]);
    }
    return out;
}

// One-sided magnitude spectrum (bins 0..N/2, |X[k]| / N).
// An empty waveform yields the single point (0 Hz, 0).
Spectrum spectrum(SampleSpan waveform, double sample_rate);

} // namespace dsp

} // namespace dsss
