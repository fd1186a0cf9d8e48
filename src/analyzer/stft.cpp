/**
 * MixGraph - STFT Implementation (FFTW)
 */

#include "stft.h"
#include <cmath>
#include <new>
#include <stdexcept>

namespace mixgraph {

std::mutex& fftw_planner_mutex() {
    static std::mutex mutex;
    return mutex;
}

RealFft::RealFft(size_t size) : size_(size) {
    if (size_ == 0) {
        throw std::invalid_argument("FFT size must be positive");
    }

    std::lock_guard<std::mutex> lock(fftw_planner_mutex());
    real_ = static_cast<double*>(fftw_malloc(sizeof(double) * size_));
    complex_ = static_cast<fftw_complex*>(fftw_malloc(sizeof(fftw_complex) * bins()));
    if (!real_ || !complex_) {
        if (real_) fftw_free(real_);
        if (complex_) fftw_free(complex_);
        throw std::bad_alloc();
    }

    forward_ = fftw_plan_dft_r2c_1d(static_cast<int>(size_), real_, complex_, FFTW_ESTIMATE);
    inverse_ = fftw_plan_dft_c2r_1d(static_cast<int>(size_), complex_, real_, FFTW_ESTIMATE);
    if (!forward_ || !inverse_) {
        if (forward_) fftw_destroy_plan(forward_);
        if (inverse_) fftw_destroy_plan(inverse_);
        fftw_free(real_);
        fftw_free(complex_);
        throw std::runtime_error("FFTW planning failed");
    }
}

RealFft::~RealFft() {
    std::lock_guard<std::mutex> lock(fftw_planner_mutex());
    if (forward_) fftw_destroy_plan(forward_);
    if (inverse_) fftw_destroy_plan(inverse_);
    fftw_free(real_);
    fftw_free(complex_);
}

void RealFft::forward() {
    fftw_execute(forward_);
}

void RealFft::inverse() {
    fftw_execute(inverse_);
}

size_t stft_frame_count(size_t samples, int hop_length) {
    if (hop_length <= 0) {
        return 0;
    }
    const size_t hop = static_cast<size_t>(hop_length);
    return (samples + hop - 1) / hop;
}

size_t for_each_power_frame(const std::vector<float>& signal, int n_fft, int hop_length,
                            const PowerFrameFn& fn) {
    if (signal.empty() || n_fft <= 0 || hop_length <= 0) {
        return 0;
    }

    const size_t n = signal.size();
    const size_t hop = static_cast<size_t>(hop_length);
    const size_t frames = stft_frame_count(n, hop_length);
    const long half = n_fft / 2;

    RealFft fft(static_cast<size_t>(n_fft));
    const size_t bins = fft.bins();
    std::vector<double> power(bins);

    // Periodic Hann window
    std::vector<double> window(n_fft);
    for (int i = 0; i < n_fft; ++i) {
        window[i] = 0.5 * (1.0 - std::cos(2.0 * M_PI * i / n_fft));
    }

    double* in = fft.input();
    for (size_t t = 0; t < frames; ++t) {
        long start = static_cast<long>(t * hop) - half;
        for (int i = 0; i < n_fft; ++i) {
            long idx = start + i;
            double sample = (idx >= 0 && idx < static_cast<long>(n)) ? signal[idx] : 0.0;
            in[i] = sample * window[i];
        }

        fft.forward();

        const fftw_complex* out = fft.spectrum();
        for (size_t k = 0; k < bins; ++k) {
            power[k] = out[k][0] * out[k][0] + out[k][1] * out[k][1];
        }
        fn(t, power.data(), bins);
    }

    return frames;
}

} // namespace mixgraph
