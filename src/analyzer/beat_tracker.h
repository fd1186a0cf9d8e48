/**
 * MixGraph - Beat Tracker
 */

#ifndef MIXGRAPH_BEAT_TRACKER_H
#define MIXGRAPH_BEAT_TRACKER_H

#include "mixgraph/types.h"
#include "../core/utils.h"
#include <vector>

namespace mixgraph {

struct BeatInfo {
    float bpm = 0.0f;
    std::vector<float> beats;       // Seconds
    std::vector<float> downbeats;   // Every beats_per_measure-th beat
};

/**
 * Tempo and beat detection.
 *
 * Uses Essentia's RhythmExtractor2013 on 44.1 kHz input when built with
 * Essentia, otherwise (or when Essentia fails) an onset-envelope tracker.
 */
class BeatTracker {
public:
    explicit BeatTracker(const BeatAlignConfig& config = {}, const Budget& budget = {});

    /**
     * Detect tempo, beats and downbeats.
     * @return BeatInfo, BeatTrackingFailure when no beat is found, or Timeout
     */
    Result<BeatInfo> track(const AudioBuffer& audio, const utils::Deadline& deadline = utils::Deadline());

    /**
     * Detect BPM only.
     * @return BPM within [min_bpm, max_bpm]
     */
    Result<float> detect_bpm(const AudioBuffer& audio);

    /**
     * Every n-th beat starting from the first.
     */
    static std::vector<float> downbeats(const std::vector<float>& beats, int beats_per_measure);

    static constexpr int kHopSize = 512;
    static constexpr int kFrameSize = 2048;

private:
    // Log-magnitude spectral flux, normalized to [0, 1]
    std::vector<float> compute_onset_envelope(const std::vector<float>& mono);

    // Auto-correlation based beat period in envelope frames
    double estimate_period(const std::vector<float>& onset_envelope, double envelope_rate,
                           const utils::Deadline& deadline);

    // Peak picking for beat positions
    std::vector<size_t> pick_peaks(const std::vector<float>& envelope, float threshold, size_t min_distance);

    Result<BeatInfo> track_internal(const AudioBuffer& audio, const utils::Deadline& deadline);

    BeatAlignConfig config_;
    Budget budget_;
};

} // namespace mixgraph

#endif // MIXGRAPH_BEAT_TRACKER_H
