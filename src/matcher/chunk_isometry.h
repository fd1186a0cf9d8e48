/**
 * MixGraph - Chunk Isometry Refiner
 */

#ifndef MIXGRAPH_CHUNK_ISOMETRY_H
#define MIXGRAPH_CHUNK_ISOMETRY_H

#include "refinement.h"
#include <vector>

namespace mixgraph {

/**
 * Best placement of one song chunk inside the mix buffer (global frames).
 */
struct ChunkMatch {
    int index = 0;
    long song_start = 0;
    long mix_start = 0;
    double score = 0.0;

    long offset() const { return mix_start - song_start; }
};

/**
 * Matched song range [song_begin, song_end) and mix range
 * [mix_begin, mix_end), in frames.
 */
struct FrameRegion {
    long song_begin = 0;
    long song_end = 0;
    long mix_begin = 0;
    long mix_end = 0;

    bool empty() const { return song_end <= song_begin || mix_end <= mix_begin; }
};

/**
 * Refines a rough window by matching evenly spaced song chunks inside a
 * buffer around it, keeping the largest subset that agrees on one time
 * mapping, then growing and trimming the region's edges by chroma
 * similarity.
 */
class ChunkIsometryRefiner : public RefinementStrategy {
public:
    explicit ChunkIsometryRefiner(const ChunkRefineConfig& config = {}, const Budget& budget = {});

    std::string name() const override { return "chunk"; }

    RefinedMatch refine(const Fingerprint& song, const Fingerprint& mix,
                        const MatchWindow& rough,
                        const utils::Deadline& deadline = utils::Deadline()) override;

    /**
     * Per-chunk certainty over the aligned region of a refined match.
     */
    CertaintyProfile certainty_profile(const Fingerprint& song, const Fingerprint& mix,
                                       const RefinedMatch& refined) const;

    /* ------------------------------------------------------------------
     * Stages
     * ------------------------------------------------------------------ */

    // Chunk length in frames, capped at the song length
    long chunk_frames(const Fingerprint& song) const;

    Result<std::vector<ChunkMatch>> match_chunks(const Fingerprint& song, const Fingerprint& mix,
                                                 size_t rough_frame, long chunk,
                                                 const utils::Deadline& deadline) const;

    /**
     * Largest subset of matches whose offsets span at most tolerance
     * frames. Returned in chunk order.
     */
    static std::vector<ChunkMatch> find_largest_isometry(const std::vector<ChunkMatch>& matches,
                                                         long tolerance);

    FrameRegion expand_isometry(const Fingerprint& song, const Fingerprint& mix,
                                const ChunkMatch& first, const ChunkMatch& last, long chunk) const;

    FrameRegion refine_outer_chunks(const Fingerprint& song, const Fingerprint& mix,
                                    FrameRegion region, long chunk) const;

    const ChunkRefineConfig& config() const { return config_; }

private:
    ChunkRefineConfig config_;
    Budget budget_;
};

} // namespace mixgraph

#endif // MIXGRAPH_CHUNK_ISOMETRY_H
