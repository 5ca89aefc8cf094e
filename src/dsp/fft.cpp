#include "dsss/dsp.hpp"
#include <cstring>
#include <mutex>
#include <new>
#include <stdexcept>

#include <fftw3.h>

namespace dsss {

namespace {

// FFTW's planner is not re-entrant; only fftwf_execute may run concurrently
std::mutex& plannerMutex() {
    static std::mutex mutex;
    return mutex;
}

} // namespace

struct FFT::Impl {
    fftwf_plan forward_real_plan = nullptr;
    fftwf_plan inverse_real_plan = nullptr;
    fftwf_complex* buffer = nullptr;
    float* real_buffer = nullptr;

    ~Impl() {
        std::lock_guard<std::mutex> lock(plannerMutex());
        if (forward_real_plan) fftwf_destroy_plan(forward_real_plan);
        if (inverse_real_plan) fftwf_destroy_plan(inverse_real_plan);
        if (buffer) fftwf_free(buffer);
        if (real_buffer) fftwf_free(real_buffer);
    }
};

FFT::FFT(size_t size) : size_(size), impl_(std::make_unique<Impl>()) {
    if (size == 0) {
        throw std::invalid_argument("FFT size must be at least 1");
    }

    std::lock_guard<std::mutex> lock(plannerMutex());

    impl_->buffer = fftwf_alloc_complex(size / 2 + 1);
    impl_->real_buffer = fftwf_alloc_real(size);
    if (!impl_->buffer || !impl_->real_buffer) {
        throw std::bad_alloc();
    }

    impl_->forward_real_plan = fftwf_plan_dft_r2c_1d(
        static_cast<int>(size),
        impl_->real_buffer,
        impl_->buffer,
        FFTW_ESTIMATE
    );

    impl_->inverse_real_plan = fftwf_plan_dft_c2r_1d(
        static_cast<int>(size),
        impl_->buffer,
        impl_->real_buffer,
        FFTW_ESTIMATE
    );

    if (!impl_->forward_real_plan || !impl_->inverse_real_plan) {
        throw std::runtime_error("FFTW plan creation failed");
    }
}

FFT::~FFT() = default;

void FFT::forwardReal(const Sample* in, Complex* out) {
    std::memcpy(impl_->real_buffer, in, size_ * sizeof(float));
    fftwf_execute(impl_->forward_real_plan);
    for (size_t i = 0; i < bins(); ++i) {
        out[i] = Complex(impl_->buffer[i][0], impl_->buffer[i][1]);
    }
}

std::vector<Complex> FFT::forwardReal(SampleSpan in) {
    if (in.size() != size_) throw std::invalid_argument("Input size mismatch");
    std::vector<Complex> out(bins());
    forwardReal(in.data(), out.data());
    return out;
}

void FFT::inverseReal(const Complex* in, Sample* out) {
    for (size_t i = 0; i < bins(); ++i) {
        impl_->buffer[i][0] = in[i].real();
        impl_->buffer[i][1] = in[i].imag();
    }
    // c2r destroys its input array; buffer is scratch so that is fine
    fftwf_execute(impl_->inverse_real_plan);
    // FFTW doesn't normalize, so we do it
    float scale = 1.0f / size_;
    for (size_t i = 0; i < size_; ++i) {
        out[i] = impl_->real_buffer[i] * scale;
    }
}

Samples FFT::inverseReal(const std::vector<Complex>& in) {
    if (in.size() != bins()) throw std::invalid_argument("Input size mismatch");
    Samples out(size_);
    inverseReal(in.data(), out.data());
    return out;
}

} // namespace dsss
