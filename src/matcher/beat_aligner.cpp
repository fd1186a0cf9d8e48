/**
 * MixGraph - Beat Aligner Implementation
 */

#include "beat_aligner.h"
#include "../decoder/decoder.h"
#include "../core/log.h"
#include <algorithm>
#include <cmath>
#include <memory>

namespace mixgraph {

BeatAligner::BeatAligner(const BeatAlignConfig& config, const Budget& budget, AudioLoader loader)
    : config_(config)
    , loader_(std::move(loader))
    , tracker_(config, budget) {
    if (!loader_) {
        auto decoder = std::make_shared<Decoder>();
        loader_ = [decoder](const std::string& path) {
            return decoder->decode(path, 44100, 1);
        };
    }
}

std::optional<double> BeatAligner::align_to_downbeat(double rough_start, double song_first_downbeat,
                                                     const std::vector<float>& mix_downbeats,
                                                     double mix_duration, double song_duration,
                                                     DownbeatAnchor anchor_kind) {
    if (mix_downbeats.empty()) {
        return std::nullopt;
    }

    const double anchor = anchor_kind == DownbeatAnchor::SongDownbeat
        ? rough_start + song_first_downbeat
        : rough_start;

    // First downbeat strictly after the anchor; its predecessor is at or before
    auto after = std::upper_bound(mix_downbeats.begin(), mix_downbeats.end(), anchor,
        [](double value, float beat) { return value < beat; });

    double chosen;
    if (after == mix_downbeats.begin()) {
        chosen = *after;
    } else if (after == mix_downbeats.end()) {
        chosen = *(after - 1);
    } else {
        double before = *(after - 1);
        chosen = (anchor - before) <= (*after - anchor) ? before : static_cast<double>(*after);
    }

    double upper = std::max(0.0, mix_duration - song_duration);
    return std::max(0.0, std::min(upper, chosen - song_first_downbeat));
}

Result<BeatInfo> BeatAligner::beats_for(const std::string& path, const utils::Deadline& deadline) {
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        auto it = beat_cache_.find(path);
        if (it != beat_cache_.end()) {
            return it->second;
        }
    }

    auto audio = loader_(path);
    if (audio.failed()) {
        return audio.error_info();
    }

    auto info = tracker_.track(audio.value(), deadline);
    if (info.failed()) {
        return info;
    }
    if (info.value().downbeats.empty()) {
        return ResultError{ErrorCode::BeatTrackingFailure, "No downbeats in " + path};
    }

    std::lock_guard<std::mutex> lock(cache_mutex_);
    beat_cache_[path] = info.value();
    return info;
}

RefinedMatch BeatAligner::refine(const Fingerprint& song, const Fingerprint& mix,
                                 const MatchWindow& rough, const utils::Deadline& deadline) {
    const std::string& song_path = rough.song_path.empty() ? song.source_path : rough.song_path;
    const std::string& mix_path = rough.mix_path.empty() ? mix.source_path : rough.mix_path;

    auto degrade = [&](const ResultError& error) {
        RefineStatus status = error.code == ErrorCode::Timeout ? RefineStatus::Timeout : RefineStatus::RoughOnly;
        log::warn("beat alignment of {} in {} degraded to rough estimate: {}",
            song_path, mix_path, error.message);
        return refined_from_rough(rough, status, name());
    };

    auto song_beats = beats_for(song_path, deadline);
    if (song_beats.failed()) {
        return degrade(song_beats.error_info());
    }

    auto mix_beats = beats_for(mix_path, deadline);
    if (mix_beats.failed()) {
        return degrade(mix_beats.error_info());
    }

    const double song_duration = song.duration_seconds();
    const double song_downbeat = song_beats.value().downbeats.front();
    auto start = align_to_downbeat(rough.start_in_mix, song_downbeat, mix_beats.value().downbeats,
                                   mix.duration_seconds(), song_duration, config_.anchor);
    if (!start) {
        return degrade(ResultError{ErrorCode::BeatTrackingFailure, "No mix downbeats"});
    }

    log::debug("beat alignment of {}: {:.3f}s -> {:.3f}s", song_path, rough.start_in_mix, *start);

    RefinedMatch result;
    result.song_start = 0.0;
    result.song_end = song_duration;
    result.mix_start = *start;
    result.mix_end = *start + song_duration;
    result.confidence = rough.confidence;
    result.status = RefineStatus::Refined;
    result.strategy = name();
    return result;
}

} // namespace mixgraph
