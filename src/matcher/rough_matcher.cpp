/**
 * MixGraph - Rough Matcher Implementation
 */

#include "rough_matcher.h"
#include "correlation.h"
#include "../core/log.h"

namespace mixgraph {

RoughMatcher::RoughMatcher(const RoughMatchConfig& config, const Budget& budget)
    : config_(config), budget_(budget) {}

Result<MatchWindow> RoughMatcher::match(const Fingerprint& song, const Fingerprint& mix,
                                        const utils::Deadline& deadline) const {
    if (song.features.empty() || mix.features.empty()) {
        return ResultError{ErrorCode::NoMatch, "Empty fingerprint"};
    }
    if (song.sample_rate != mix.sample_rate || song.hop_length != mix.hop_length ||
        song.features.channels != mix.features.channels) {
        return ResultError{ErrorCode::NoMatch, "Fingerprints computed with different parameters"};
    }
    if (song.frames() > mix.frames()) {
        return ResultError{ErrorCode::NoMatch, "Song is longer than mix"};
    }
    if (budget_.max_correlation_frames > 0 && mix.frames() > budget_.max_correlation_frames) {
        return ResultError{ErrorCode::Timeout, "Mix exceeds correlation frame budget"};
    }

    Correlator correlator(utils::normalize_matrix(mix.features), mix.features.channels, mix.frames());
    if (deadline.expired()) {
        return ResultError{ErrorCode::Timeout, "Rough match exceeded time budget"};
    }

    auto peak = correlator.best(utils::normalize_matrix(song.features), song.frames());
    if (!peak) {
        return ResultError{ErrorCode::NoMatch, "No valid alignment"};
    }

    log::debug("rough match {} in {}: frame {} score {:.1f}",
        song.source_path, mix.source_path, peak->lag, peak->score);

    if (peak->score < config_.confidence_threshold) {
        return ResultError{ErrorCode::NoMatch,
            fmt::format("Peak score {:.1f} below threshold {:.1f}", peak->score, config_.confidence_threshold)};
    }

    MatchWindow window;
    window.song_path = song.source_path;
    window.mix_path = mix.source_path;
    window.start_frame = peak->lag;
    window.start_in_mix = mix.frames_to_seconds(static_cast<double>(peak->lag));
    window.end_in_mix = window.start_in_mix + song.duration_seconds();
    window.confidence = peak->score;
    return window;
}

} // namespace mixgraph
