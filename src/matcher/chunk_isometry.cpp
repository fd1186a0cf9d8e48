/**
 * MixGraph - Chunk Isometry Refiner Implementation
 */

#include "chunk_isometry.h"
#include "correlation.h"
#include "../core/log.h"
#include <algorithm>
#include <cmath>

namespace mixgraph {

namespace {

constexpr double kChunkEpsilon = 1e-8;

bool block_in_bounds(const Fingerprint& song, long song_begin,
                     const Fingerprint& mix, long mix_begin, long size) {
    return size > 0 && song_begin >= 0 && mix_begin >= 0 &&
           song_begin + size <= static_cast<long>(song.frames()) &&
           mix_begin + size <= static_cast<long>(mix.frames());
}

double block_similarity(const Fingerprint& song, long song_begin,
                        const Fingerprint& mix, long mix_begin, long size) {
    return utils::block_cosine_similarity(song.features, song_begin, mix.features, mix_begin, size);
}

} // namespace

ChunkIsometryRefiner::ChunkIsometryRefiner(const ChunkRefineConfig& config, const Budget& budget)
    : config_(config), budget_(budget) {}

long ChunkIsometryRefiner::chunk_frames(const Fingerprint& song) const {
    long chunk = utils::seconds_to_frames(config_.chunk_seconds, song.sample_rate, song.hop_length);
    return std::min(std::max(chunk, 1L), static_cast<long>(song.frames()));
}

Result<std::vector<ChunkMatch>> ChunkIsometryRefiner::match_chunks(const Fingerprint& song, const Fingerprint& mix,
                                                                   size_t rough_frame, long chunk,
                                                                   const utils::Deadline& deadline) const {
    const long song_len = static_cast<long>(song.frames());
    const long mix_len = static_cast<long>(mix.frames());
    const long rough = static_cast<long>(rough_frame);

    if (chunk <= 0 || chunk > song_len) {
        return ResultError{ErrorCode::NoMatch, "Song too short for chunk matching"};
    }

    // Mix buffer around the rough estimate
    long buffer = utils::seconds_to_frames(config_.buffer_seconds, mix.sample_rate, mix.hop_length);
    long buf_begin = std::max(0L, rough - buffer);
    long buf_end = std::min(mix_len, rough + buffer + song_len);
    if (buf_end - buf_begin < chunk) {
        return ResultError{ErrorCode::NoMatch, "Mix buffer shorter than one chunk"};
    }

    size_t buf_frames = static_cast<size_t>(buf_end - buf_begin);
    if (budget_.max_correlation_frames > 0 && buf_frames > budget_.max_correlation_frames) {
        return ResultError{ErrorCode::Timeout, "Mix buffer exceeds correlation frame budget"};
    }

    FeatureMatrix buffer_matrix = mix.features.slice(static_cast<size_t>(buf_begin), static_cast<size_t>(buf_end));
    Correlator correlator(utils::normalize_matrix(buffer_matrix, kChunkEpsilon),
                          buffer_matrix.channels, buffer_matrix.frames);

    // Evenly spaced chunk starts over [0, song_len - chunk]
    const int n_chunks = std::max(1, config_.n_chunks);
    const long span = song_len - chunk;

    std::vector<ChunkMatch> matches;
    matches.reserve(n_chunks);
    long previous_start = -1;

    for (int i = 0; i < n_chunks; ++i) {
        if (deadline.expired()) {
            return ResultError{ErrorCode::Timeout, "Chunk matching exceeded time budget"};
        }

        long start = n_chunks > 1 ? static_cast<long>(static_cast<double>(span) * i / (n_chunks - 1)) : 0;
        if (start == previous_start) continue;
        previous_start = start;

        FeatureMatrix chunk_matrix = song.features.slice(static_cast<size_t>(start), static_cast<size_t>(start + chunk));
        auto peak = correlator.best(utils::normalize_matrix(chunk_matrix, kChunkEpsilon), chunk_matrix.frames);
        if (!peak) continue;

        ChunkMatch match;
        match.index = i;
        match.song_start = start;
        match.mix_start = buf_begin + static_cast<long>(peak->lag);
        match.score = peak->score;
        matches.push_back(match);
    }

    return matches;
}

std::vector<ChunkMatch> ChunkIsometryRefiner::find_largest_isometry(const std::vector<ChunkMatch>& matches,
                                                                    long tolerance) {
    // Offsets within one window of width tolerance agree pairwise
    std::vector<ChunkMatch> best;
    for (const auto& anchor : matches) {
        const long low = anchor.offset();
        std::vector<ChunkMatch> window;
        for (const auto& m : matches) {
            if (m.offset() >= low && m.offset() <= low + tolerance) {
                window.push_back(m);
            }
        }
        if (window.size() > best.size()) {
            best = std::move(window);
        }
    }

    return best;
}

FrameRegion ChunkIsometryRefiner::expand_isometry(const Fingerprint& song, const Fingerprint& mix,
                                                  const ChunkMatch& first, const ChunkMatch& last,
                                                  long chunk) const {
    const double threshold = config_.similarity_threshold;
    FrameRegion region;

    // Backward from the first matched chunk
    long s = first.song_start;
    long m = first.mix_start;
    while (block_in_bounds(song, s - chunk, mix, m - chunk, chunk) &&
           block_similarity(song, s - chunk, mix, m - chunk, chunk) >= threshold) {
        s -= chunk;
        m -= chunk;
    }
    region.song_begin = s;
    region.mix_begin = m;

    // Forward from the last matched chunk, itself included
    s = last.song_start;
    m = last.mix_start;
    while (block_in_bounds(song, s, mix, m, chunk) &&
           block_similarity(song, s, mix, m, chunk) >= threshold) {
        s += chunk;
        m += chunk;
    }
    region.song_end = s;
    region.mix_end = m;

    return region;
}

FrameRegion ChunkIsometryRefiner::refine_outer_chunks(const Fingerprint& song, const Fingerprint& mix,
                                                      FrameRegion r, long chunk) const {
    const double threshold = config_.min_similarity_threshold;
    const int factor = std::max(0, config_.min_chunk_factor);
    const long min_size = std::max(1L, chunk >> factor);

    // Trim weak edges, never past the opposite edge
    for (long size = chunk; size >= min_size; size /= 2) {
        if (r.song_end - r.song_begin > size && r.mix_end - r.mix_begin > size &&
            block_in_bounds(song, r.song_begin, mix, r.mix_begin, size) &&
            block_similarity(song, r.song_begin, mix, r.mix_begin, size) < threshold) {
            r.song_begin += size;
            r.mix_begin += size;
        }
        if (r.song_end - r.song_begin > size && r.mix_end - r.mix_begin > size &&
            block_in_bounds(song, r.song_end - size, mix, r.mix_end - size, size) &&
            block_similarity(song, r.song_end - size, mix, r.mix_end - size, size) < threshold) {
            r.song_end -= size;
            r.mix_end -= size;
        }
    }

    // Grow into strong neighbours
    for (long size = chunk; size >= min_size; size /= 2) {
        if (block_in_bounds(song, r.song_begin - size, mix, r.mix_begin - size, size) &&
            block_similarity(song, r.song_begin - size, mix, r.mix_begin - size, size) > threshold) {
            r.song_begin -= size;
            r.mix_begin -= size;
        }
        if (block_in_bounds(song, r.song_end, mix, r.mix_end, size) &&
            block_similarity(song, r.song_end, mix, r.mix_end, size) > threshold) {
            r.song_end += size;
            r.mix_end += size;
        }
    }

    r.song_begin = std::max(0L, r.song_begin);
    r.mix_begin = std::max(0L, r.mix_begin);
    r.song_end = std::min(static_cast<long>(song.frames()), r.song_end);
    r.mix_end = std::min(static_cast<long>(mix.frames()), r.mix_end);
    return r;
}

RefinedMatch ChunkIsometryRefiner::refine(const Fingerprint& song, const Fingerprint& mix,
                                          const MatchWindow& rough, const utils::Deadline& deadline) {
    RefinedMatch result;
    result.strategy = name();
    result.status = RefineStatus::NoMatch;

    if (song.features.empty() || mix.features.empty() ||
        song.features.channels != mix.features.channels) {
        return result;
    }

    const long chunk = chunk_frames(song);
    auto matches = match_chunks(song, mix, rough.start_frame, chunk, deadline);
    if (matches.failed()) {
        log::debug("chunk refinement of {}: {}", song.source_path, matches.error());
        if (matches.code() == ErrorCode::Timeout) {
            result.status = RefineStatus::Timeout;
        }
        return result;
    }

    std::vector<ChunkMatch> candidates = matches.value();
    if (config_.min_chunk_correlation > 0.0) {
        // Scores are raw sums over channels x chunk frames
        const double cells = static_cast<double>(song.features.channels) * chunk;
        const double min_correlation = config_.min_chunk_correlation;
        candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
            [&](const ChunkMatch& m) { return m.score / cells < min_correlation; }), candidates.end());
    }

    auto subset = find_largest_isometry(candidates, config_.isometry_tolerance);
    log::debug("chunk refinement of {}: {} of {} chunks isometric",
        song.source_path, subset.size(), matches.value().size());
    if (subset.empty()) {
        return result;
    }

    std::sort(subset.begin(), subset.end(), [](const ChunkMatch& a, const ChunkMatch& b) {
        if (a.song_start != b.song_start) return a.song_start < b.song_start;
        return a.mix_start < b.mix_start;
    });

    FrameRegion region = expand_isometry(song, mix, subset.front(), subset.back(), chunk);
    region = refine_outer_chunks(song, mix, region, chunk);
    if (region.empty()) {
        return result;
    }

    // A subset of chance agreements leaves a region that does not resemble the song
    const long min_span = std::max(1L, chunk >> std::max(0, config_.min_chunk_factor));
    const long span = std::min(region.song_end - region.song_begin, region.mix_end - region.mix_begin);
    const double region_similarity = block_similarity(song, region.song_begin, mix, region.mix_begin, span);
    if (span < min_span || region_similarity < config_.similarity_threshold) {
        log::debug("chunk refinement of {}: region similarity {:.3f} below {:.3f}",
            song.source_path, region_similarity, config_.similarity_threshold);
        return result;
    }

    result.song_start = song.frames_to_seconds(static_cast<double>(region.song_begin));
    result.song_end = song.frames_to_seconds(static_cast<double>(region.song_end));
    result.mix_start = mix.frames_to_seconds(static_cast<double>(region.mix_begin));
    result.mix_end = mix.frames_to_seconds(static_cast<double>(region.mix_end));
    result.confidence = static_cast<double>(subset.size()) / matches.value().size();
    result.status = RefineStatus::Refined;
    return result;
}

CertaintyProfile ChunkIsometryRefiner::certainty_profile(const Fingerprint& song, const Fingerprint& mix,
                                                         const RefinedMatch& refined) const {
    CertaintyProfile profile;
    if (!refined.usable() || song.features.channels != mix.features.channels) {
        return profile;
    }

    // Region boundaries are whole frames; round away conversion error
    auto to_frame = [](double seconds, const Fingerprint& fp) {
        return fp.hop_length > 0 ? std::lround(seconds * fp.sample_rate / fp.hop_length) : 0L;
    };
    long song_begin = std::max(0L, to_frame(refined.song_start, song));
    long song_end = std::min(static_cast<long>(song.frames()), to_frame(refined.song_end, song));
    long mix_begin = std::max(0L, to_frame(refined.mix_start, mix));
    long mix_end = std::min(static_cast<long>(mix.frames()), to_frame(refined.mix_end, mix));

    long duration = std::min(song_end - song_begin, mix_end - mix_begin);
    const int n_chunks = std::max(1, config_.profile_chunks);
    const double overlap = utils::clamp(config_.profile_overlap, 0.0, 0.99);

    double effective_chunks = n_chunks - (n_chunks - 1) * overlap;
    long chunk = static_cast<long>(duration / effective_chunks);
    long step = chunk - static_cast<long>(chunk * overlap);
    if (duration <= 0 || chunk <= 0 || step <= 0) {
        return profile;
    }
    profile.chunk_frames = static_cast<size_t>(chunk);

    const double time_offset = refined.song_start - refined.mix_start;
    double best = 0.0;
    double total = 0.0;

    for (long frame = 0; frame + chunk <= duration; frame += step) {
        FeatureMatrix song_chunk = song.features.slice(song_begin + frame, song_begin + frame + chunk);
        FeatureMatrix mix_chunk = mix.features.slice(mix_begin + frame, mix_begin + frame + chunk);
        auto a = utils::normalize_matrix(song_chunk, kChunkEpsilon);
        auto b = utils::normalize_matrix(mix_chunk, kChunkEpsilon);

        // Equal lengths leave a single valid lag
        double certainty = 0.0;
        for (size_t i = 0; i < a.size(); ++i) {
            certainty += a[i] * b[i];
        }

        double aligned_time = song.frames_to_seconds(static_cast<double>(song_begin + frame)) - time_offset;
        profile.time_points.push_back(aligned_time);
        profile.scores.push_back(certainty);
        total += certainty;

        if (profile.reference_chunk < 0 || certainty > best) {
            best = certainty;
            profile.reference_chunk = static_cast<int>(profile.scores.size()) - 1;
            profile.reference_song_frame = static_cast<size_t>(song_begin + frame);
            profile.reference_mix_frame = static_cast<size_t>(mix_begin + frame);
        }
    }

    if (!profile.scores.empty()) {
        profile.max_certainty = best;
        profile.mean_certainty = total / profile.scores.size();
    }
    return profile;
}

} // namespace mixgraph
