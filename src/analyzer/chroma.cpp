/**
 * MixGraph - Chroma Extractor Implementation
 *
 * Filter bank: a Gaussian bump per pitch class in log-frequency, each
 * frequency column L2-normalised, weighted by a Gaussian over octaves
 * centred on octave 5 (two octaves wide).
 */

#include "chroma.h"
#include "stft.h"
#include <algorithm>
#include <cmath>
#include <limits>

namespace mixgraph {

namespace {

constexpr double kCenterOctave = 5.0;
constexpr double kOctaveWidth = 2.0;

} // namespace

ChromaExtractor::ChromaExtractor(const FingerprintConfig& config) : config_(config) {
    build_filter_bank();
}

void ChromaExtractor::build_filter_bank() {
    const int n_chroma = kPitchClasses;
    const int n_fft = config_.n_fft;
    bins_ = static_cast<size_t>(n_fft / 2 + 1);

    // Octaves are counted from A0 at the configured tuning
    double a4 = config_.tuning_a4 > 0.0f ? config_.tuning_a4 : 440.0;
    double a0 = a4 / 16.0;

    // Fractional chroma bin of every FFT bin; bin 0 is placed 1.5 octaves below bin 1
    std::vector<double> frq_bins(n_fft);
    for (int k = 1; k < n_fft; ++k) {
        double freq = static_cast<double>(k) * config_.sample_rate / n_fft;
        frq_bins[k] = n_chroma * std::log2(freq / a0);
    }
    frq_bins[0] = frq_bins[1] - 1.5 * n_chroma;

    std::vector<double> bin_width(n_fft, 1.0);
    for (int k = 0; k + 1 < n_fft; ++k) {
        bin_width[k] = std::max(frq_bins[k + 1] - frq_bins[k], 1.0);
    }

    const double half = std::round(n_chroma / 2.0);
    std::vector<double> weights(static_cast<size_t>(n_chroma) * n_fft);
    for (int k = 0; k < n_fft; ++k) {
        double norm = 0.0;
        for (int c = 0; c < n_chroma; ++c) {
            double d = std::fmod(frq_bins[k] - c + half + 10.0 * n_chroma, n_chroma);
            if (d < 0.0) d += n_chroma;
            d -= half;
            double w = std::exp(-0.5 * std::pow(2.0 * d / bin_width[k], 2.0));
            weights[c * n_fft + k] = w;
            norm += w * w;
        }

        norm = std::sqrt(norm);
        double octave = frq_bins[k] / n_chroma - kCenterOctave;
        double octave_weight = std::exp(-0.5 * std::pow(octave / kOctaveWidth, 2.0));
        for (int c = 0; c < n_chroma; ++c) {
            double& w = weights[c * n_fft + k];
            if (norm > 0.0) w /= norm;
            w *= octave_weight;
        }
    }

    // Rotate so that row 0 is C (the raw bank starts at A)
    filters_.assign(static_cast<size_t>(n_chroma) * bins_, 0.0);
    for (int c = 0; c < n_chroma; ++c) {
        int src = (c + 3) % n_chroma;
        for (size_t k = 0; k < bins_; ++k) {
            filters_[c * bins_ + k] = weights[src * n_fft + k];
        }
    }
}

FeatureMatrix ChromaExtractor::compute(const std::vector<float>& mono) const {
    const size_t frames = stft_frame_count(mono.size(), config_.hop_length);
    if (mono.empty() || frames == 0 || config_.n_fft <= 0) {
        return {};
    }

    FeatureMatrix chroma(kPitchClasses, frames);
    std::vector<double> column(kPitchClasses);

    for_each_power_frame(mono, config_.n_fft, config_.hop_length,
        [&](size_t t, const double* power, size_t bins) {
            const size_t used = std::min(bins, bins_);
            double peak = 0.0;

            for (int c = 0; c < kPitchClasses; ++c) {
                const double* w = filters_.data() + c * bins_;
                double sum = 0.0;
                for (size_t k = 0; k < used; ++k) {
                    sum += w[k] * power[k];
                }
                column[c] = sum;
                peak = std::max(peak, std::abs(sum));
            }

            // Near-silent frames are left unscaled
            double scale = peak > std::numeric_limits<float>::min() ? 1.0 / peak : 1.0;
            for (int c = 0; c < kPitchClasses; ++c) {
                chroma.at(c, t) = static_cast<float>(column[c] * scale);
            }
        });

    return chroma;
}

} // namespace mixgraph
