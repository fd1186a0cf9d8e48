/**
 * MixGraph - Cross-Correlation Implementation
 *
 * corr[l] = sum_c sum_j hay[c][l + j] * needle[c][j], computed as
 * IFFT(HAY * conj(NEEDLE)). With an FFT size no smaller than the haystack
 * the valid lags never wrap.
 */

#include "correlation.h"
#include <algorithm>
#include <iterator>

namespace mixgraph {

namespace {

size_t next_power_of_two(size_t n) {
    size_t p = 1;
    while (p < n) p <<= 1;
    return p;
}

} // namespace

Correlator::Correlator(const std::vector<double>& haystack, int channels, size_t frames)
    : channels_(channels), frames_(frames) {
    if (channels_ <= 0 || frames_ == 0 || haystack.size() < static_cast<size_t>(channels_) * frames_) {
        channels_ = 0;
        frames_ = 0;
        return;
    }

    fft_ = std::make_unique<RealFft>(next_power_of_two(frames_));
    const size_t n = fft_->size();
    const size_t bins = fft_->bins();
    haystack_spectra_.resize(static_cast<size_t>(channels_) * bins);

    double* in = fft_->input();
    for (int c = 0; c < channels_; ++c) {
        const double* row = haystack.data() + c * frames_;
        std::copy(row, row + frames_, in);
        std::fill(in + frames_, in + n, 0.0);

        fft_->forward();

        const fftw_complex* out = fft_->spectrum();
        for (size_t k = 0; k < bins; ++k) {
            haystack_spectra_[c * bins + k] = {out[k][0], out[k][1]};
        }
    }
}

std::vector<double> Correlator::correlate(const std::vector<double>& needle, size_t needle_frames) {
    if (!fft_ || needle_frames == 0 || needle_frames > frames_ ||
        needle.size() < static_cast<size_t>(channels_) * needle_frames) {
        return {};
    }

    const size_t n = fft_->size();
    const size_t bins = fft_->bins();
    std::vector<std::complex<double>> accum(bins, {0.0, 0.0});

    double* in = fft_->input();
    for (int c = 0; c < channels_; ++c) {
        const double* row = needle.data() + c * needle_frames;
        std::copy(row, row + needle_frames, in);
        std::fill(in + needle_frames, in + n, 0.0);

        fft_->forward();

        const fftw_complex* out = fft_->spectrum();
        const std::complex<double>* hay = haystack_spectra_.data() + c * bins;
        for (size_t k = 0; k < bins; ++k) {
            accum[k] += hay[k] * std::conj(std::complex<double>(out[k][0], out[k][1]));
        }
    }

    // One inverse transform for the channel sum
    fftw_complex* spectrum = fft_->spectrum();
    for (size_t k = 0; k < bins; ++k) {
        spectrum[k][0] = accum[k].real();
        spectrum[k][1] = accum[k].imag();
    }
    fft_->inverse();

    const size_t lags = frames_ - needle_frames + 1;
    std::vector<double> scores(lags);
    const double scale = 1.0 / static_cast<double>(n);
    for (size_t l = 0; l < lags; ++l) {
        scores[l] = in[l] * scale;
    }
    return scores;
}

std::optional<CorrelationPeak> Correlator::best(const std::vector<double>& needle, size_t needle_frames) {
    return find_peak(correlate(needle, needle_frames));
}

std::optional<CorrelationPeak> find_peak(const std::vector<double>& scores) {
    if (scores.empty()) {
        return std::nullopt;
    }
    auto it = std::max_element(scores.begin(), scores.end());
    return CorrelationPeak{static_cast<size_t>(std::distance(scores.begin(), it)), *it};
}

} // namespace mixgraph
