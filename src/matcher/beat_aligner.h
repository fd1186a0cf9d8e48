/**
 * MixGraph - Beat Aligner
 */

#ifndef MIXGRAPH_BEAT_ALIGNER_H
#define MIXGRAPH_BEAT_ALIGNER_H

#include "refinement.h"
#include "../analyzer/beat_tracker.h"
#include <functional>
#include <map>
#include <mutex>
#include <optional>

namespace mixgraph {

// Loads mono PCM for beat tracking
using AudioLoader = std::function<Result<AudioBuffer>(const std::string& path)>;

/**
 * Snaps a rough window onto the mix's downbeat grid.
 *
 * The mix downbeat nearest the anchor (the rough start by default) becomes
 * the position of the song's first downbeat. Degrades to the rough
 * estimate (RoughOnly) when either track cannot be loaded or has no beats.
 * Safe to share between threads.
 */
class BeatAligner : public RefinementStrategy {
public:
    /**
     * @param loader Audio source; decodes with FFmpeg at 44.1 kHz mono when empty
     */
    explicit BeatAligner(const BeatAlignConfig& config = {}, const Budget& budget = {},
                         AudioLoader loader = nullptr);

    std::string name() const override { return "beat"; }

    RefinedMatch refine(const Fingerprint& song, const Fingerprint& mix,
                        const MatchWindow& rough,
                        const utils::Deadline& deadline = utils::Deadline()) override;

    /**
     * Refined mix start of the song: the mix downbeat nearest to the anchor
     * (the earlier one on ties), minus song_first_downbeat, clamped to
     * [0, mix_duration - song_duration]. The anchor is rough_start, or
     * rough_start + song_first_downbeat for DownbeatAnchor::SongDownbeat.
     *
     * @return nullopt when mix_downbeats is empty
     */
    static std::optional<double> align_to_downbeat(double rough_start, double song_first_downbeat,
                                                   const std::vector<float>& mix_downbeats,
                                                   double mix_duration, double song_duration,
                                                   DownbeatAnchor anchor = DownbeatAnchor::RoughStart);

private:
    Result<BeatInfo> beats_for(const std::string& path, const utils::Deadline& deadline);

    BeatAlignConfig config_;
    AudioLoader loader_;
    BeatTracker tracker_;

    std::mutex cache_mutex_;
    std::map<std::string, BeatInfo> beat_cache_;
};

} // namespace mixgraph

#endif // MIXGRAPH_BEAT_ALIGNER_H
