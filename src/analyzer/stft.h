/**
 * MixGraph - Short-Time Fourier Transform
 */

#ifndef MIXGRAPH_STFT_H
#define MIXGRAPH_STFT_H

#include <fftw3.h>
#include <cstddef>
#include <functional>
#include <mutex>
#include <vector>

namespace mixgraph {

/**
 * FFTW's planner is not thread-safe. Every plan creation and destruction
 * must hold this lock; fftw_execute on an existing plan does not.
 */
std::mutex& fftw_planner_mutex();

/**
 * Real <-> complex transform of a fixed size with its own aligned buffers.
 * forward() reads input() and writes spectrum(); inverse() reads
 * spectrum() (destroying it) and writes an unnormalised signal to input().
 */
class RealFft {
public:
    explicit RealFft(size_t size);
    ~RealFft();

    RealFft(const RealFft&) = delete;
    RealFft& operator=(const RealFft&) = delete;

    size_t size() const { return size_; }
    size_t bins() const { return size_ / 2 + 1; }

    double* input() { return real_; }
    fftw_complex* spectrum() { return complex_; }

    void forward();
    void inverse();

private:
    size_t size_;
    double* real_ = nullptr;
    fftw_complex* complex_ = nullptr;
    fftw_plan forward_ = nullptr;
    fftw_plan inverse_ = nullptr;
};

/**
 * Number of centred STFT frames: ceil(samples / hop_length).
 */
size_t stft_frame_count(size_t samples, int hop_length);

/**
 * Receives one power spectrum frame; power holds bins values and is only
 * valid for the duration of the call.
 */
using PowerFrameFn = std::function<void(size_t frame, const double* power, size_t bins)>;

/**
 * Hann-windowed power spectrum of each centred frame, streamed to fn in
 * frame order. Frame t is centred on sample t * hop_length and the signal
 * is zero-padded at both ends. Only one frame is held at a time. Returns
 * the number of frames delivered.
 */
size_t for_each_power_frame(const std::vector<float>& signal, int n_fft, int hop_length,
                            const PowerFrameFn& fn);

} // namespace mixgraph

#endif // MIXGRAPH_STFT_H
