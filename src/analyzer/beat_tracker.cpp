/**
 * MixGraph - Beat Tracker Implementation
 *
 * Uses Essentia if available, otherwise falls back to the onset-envelope tracker.
 */

#include "beat_tracker.h"
#include "stft.h"
#include "../core/log.h"

#ifdef MIXGRAPH_HAS_ESSENTIA
#include <essentia/algorithmfactory.h>
#include <essentia/essentiamath.h>
#include <mutex>

namespace {
    class EssentiaManager {
    public:
        static EssentiaManager& instance() {
            static EssentiaManager instance;
            return instance;
        }

        void ensure_initialized() {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!initialized_) {
                essentia::init();
                initialized_ = true;
            }
        }

        // shutdown() is left to process exit; calling it from a static
        // destructor races other statics.

    private:
        EssentiaManager() : initialized_(false) {}
        ~EssentiaManager() = default;

        bool initialized_;
        std::mutex mutex_;
    };
}
#endif

#include <cmath>
#include <algorithm>
#include <memory>
#include <numeric>

namespace mixgraph {

BeatTracker::BeatTracker(const BeatAlignConfig& config, const Budget& budget)
    : config_(config), budget_(budget) {
#ifdef MIXGRAPH_HAS_ESSENTIA
    EssentiaManager::instance().ensure_initialized();
#endif
}

std::vector<float> BeatTracker::downbeats(const std::vector<float>& beats, int beats_per_measure) {
    std::vector<float> result;
    size_t step = beats_per_measure > 0 ? static_cast<size_t>(beats_per_measure) : 1;
    for (size_t i = 0; i < beats.size(); i += step) {
        result.push_back(beats[i]);
    }
    return result;
}

Result<BeatInfo> BeatTracker::track(const AudioBuffer& audio, const utils::Deadline& deadline) {
    if (audio.samples.empty()) {
        return ResultError{ErrorCode::BeatTrackingFailure, "Empty audio buffer"};
    }

#ifdef MIXGRAPH_HAS_ESSENTIA
    // RhythmExtractor2013 only supports 44.1 kHz
    if (audio.sample_rate == 44100) {
        try {
            using namespace essentia;
            using namespace essentia::standard;

            std::vector<Real> mono = audio.to_mono();

            AlgorithmFactory& factory = AlgorithmFactory::instance();
            std::unique_ptr<Algorithm> rhythm(factory.create("RhythmExtractor2013",
                "method", "multifeature",
                "minTempo", static_cast<int>(config_.min_bpm),
                "maxTempo", static_cast<int>(config_.max_bpm)));

            std::vector<Real> ticks, estimates, bpm_intervals;
            Real bpm, confidence;

            rhythm->input("signal").set(mono);
            rhythm->output("bpm").set(bpm);
            rhythm->output("ticks").set(ticks);
            rhythm->output("confidence").set(confidence);
            rhythm->output("estimates").set(estimates);
            rhythm->output("bpmIntervals").set(bpm_intervals);

            rhythm->compute();

            if (bpm > 0 && !ticks.empty()) {
                BeatInfo info;
                info.bpm = static_cast<float>(bpm);
                info.beats.assign(ticks.begin(), ticks.end());
                info.downbeats = downbeats(info.beats, config_.beats_per_measure);
                return info;
            }
        } catch (const std::exception& e) {
            log::warn("essentia beat tracking failed, using internal tracker: {}", e.what());
        }
    }
#endif

    return track_internal(audio, deadline);
}

Result<float> BeatTracker::detect_bpm(const AudioBuffer& audio) {
    auto info = track(audio);
    if (info.failed()) {
        return info.error_info();
    }
    return info.value().bpm;
}

Result<BeatInfo> BeatTracker::track_internal(const AudioBuffer& audio, const utils::Deadline& deadline) {
    auto onset_envelope = compute_onset_envelope(audio.to_mono());
    if (onset_envelope.size() < 3) {
        return ResultError{ErrorCode::BeatTrackingFailure, "Audio too short for beat tracking"};
    }

    if (budget_.max_correlation_frames > 0 && onset_envelope.size() > budget_.max_correlation_frames) {
        return ResultError{ErrorCode::Timeout, "Onset envelope exceeds frame budget"};
    }

    // Onset envelope is at a reduced sample rate
    double envelope_rate = static_cast<double>(audio.sample_rate) / kHopSize;
    double period = estimate_period(onset_envelope, envelope_rate, deadline);
    if (deadline.expired()) {
        return ResultError{ErrorCode::Timeout, "Beat tracking exceeded time budget"};
    }

    float bpm = static_cast<float>(60.0 * envelope_rate / period);

    // Fold into the configured range
    while (bpm < config_.min_bpm && bpm > 0.0f) bpm *= 2.0f;
    while (bpm > config_.max_bpm) bpm /= 2.0f;

    size_t min_distance = static_cast<size_t>(std::max(1.0, period * 0.7));

    // Adaptive threshold
    float mean = std::accumulate(onset_envelope.begin(), onset_envelope.end(), 0.0f) / onset_envelope.size();
    float sq_sum = 0.0f;
    for (float v : onset_envelope) {
        sq_sum += (v - mean) * (v - mean);
    }
    float std_dev = std::sqrt(sq_sum / onset_envelope.size());
    float threshold = mean + 0.5f * std_dev;

    auto peak_indices = pick_peaks(onset_envelope, threshold, min_distance);
    if (peak_indices.empty()) {
        return ResultError{ErrorCode::BeatTrackingFailure, "No beats detected"};
    }

    BeatInfo info;
    info.bpm = bpm;
    info.beats.reserve(peak_indices.size());
    for (size_t idx : peak_indices) {
        info.beats.push_back(static_cast<float>(idx / envelope_rate));
    }
    info.downbeats = downbeats(info.beats, config_.beats_per_measure);

    log::debug("beat tracker: {:.1f} BPM, {} beats", info.bpm, info.beats.size());
    return info;
}

std::vector<float> BeatTracker::compute_onset_envelope(const std::vector<float>& mono) {
    const size_t frames = stft_frame_count(mono.size(), kHopSize);
    if (mono.empty() || frames == 0) {
        return {};
    }

    std::vector<float> envelope(frames, 0.0f);
    std::vector<double> prev_db;
    std::vector<double> db;

    for_each_power_frame(mono, kFrameSize, kHopSize,
        [&](size_t t, const double* power, size_t bins) {
            db.resize(bins);
            for (size_t k = 0; k < bins; ++k) {
                db[k] = 10.0 * std::log10(power[k] + 1e-10);
            }

            // Spectral flux (half-wave rectified difference)
            if (t > 0) {
                double flux = 0.0;
                for (size_t k = 0; k < bins; ++k) {
                    double diff = db[k] - prev_db[k];
                    if (diff > 0.0) flux += diff;
                }
                envelope[t] = static_cast<float>(flux / bins);
            }
            prev_db.swap(db);
        });

    // Normalize
    float max_val = *std::max_element(envelope.begin(), envelope.end());
    if (max_val > 0) {
        for (float& v : envelope) {
            v /= max_val;
        }
    }

    return envelope;
}

double BeatTracker::estimate_period(const std::vector<float>& onset_envelope, double envelope_rate,
                                    const utils::Deadline& deadline) {
    // BPM range -> period in envelope frames
    size_t min_lag = static_cast<size_t>(std::ceil(envelope_rate * 60.0 / config_.max_bpm));
    size_t max_lag = static_cast<size_t>(std::floor(envelope_rate * 60.0 / config_.min_bpm));

    max_lag = std::min(max_lag, onset_envelope.size() / 2);
    min_lag = std::max<size_t>(min_lag, 1);
    if (max_lag < min_lag) {
        return envelope_rate * 60.0 / 120.0;  // Default
    }

    float best_corr = -1.0f;
    size_t best_lag = min_lag;

    for (size_t lag = min_lag; lag <= max_lag; ++lag) {
        if (deadline.expired()) break;

        float corr = 0.0f;
        size_t count = onset_envelope.size() - lag;
        for (size_t i = 0; i < count; ++i) {
            corr += onset_envelope[i] * onset_envelope[i + lag];
        }
        corr /= static_cast<float>(count);

        if (corr > best_corr) {
            best_corr = corr;
            best_lag = lag;
        }
    }

    return static_cast<double>(best_lag);
}

std::vector<size_t> BeatTracker::pick_peaks(const std::vector<float>& envelope, float threshold, size_t min_distance) {
    std::vector<size_t> peaks;

    for (size_t i = 1; i + 1 < envelope.size(); ++i) {
        if (envelope[i] > threshold &&
            envelope[i] > envelope[i - 1] &&
            envelope[i] >= envelope[i + 1]) {

            // Check minimum distance from last peak
            if (peaks.empty() || (i - peaks.back()) >= min_distance) {
                peaks.push_back(i);
            } else if (envelope[i] > envelope[peaks.back()]) {
                // Replace last peak if this one is stronger
                peaks.back() = i;
            }
        }
    }

    return peaks;
}

} // namespace mixgraph
