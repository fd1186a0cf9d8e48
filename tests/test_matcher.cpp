/**
 * MixGraph - Matcher Tests
 * Tests for Correlator, RoughMatcher and ChunkIsometryRefiner
 */

#include "mixgraph/types.h"
#include "../src/core/utils.h"
#include "../src/core/log.h"
#include "../src/matcher/correlation.h"
#include "../src/matcher/rough_matcher.h"
#include "../src/matcher/chunk_isometry.h"

#include <iostream>
#include <random>
#include <cmath>

using namespace mixgraph;

/* ============================================================================
 * Test Utilities
 * ============================================================================ */

#define TEST(name) void test_##name()
#define RUN_TEST(name) do { \
    std::cout << "Test: " #name "... "; \
    try { \
        test_##name(); \
        std::cout << "PASSED\n"; \
    } catch (const std::exception& e) { \
        std::cout << "FAILED: " << e.what() << "\n"; \
        failed_tests++; \
    } \
} while(0)

static int failed_tests = 0;

void assert_near(double actual, double expected, double tolerance, const char* msg = "") {
    if (std::abs(actual - expected) > tolerance) {
        throw std::runtime_error(std::string(msg) +
            " Expected: " + std::to_string(expected) +
            ", Actual: " + std::to_string(actual));
    }
}

void assert_true(bool condition, const char* msg = "") {
    if (!condition) {
        throw std::runtime_error(std::string("Assertion failed: ") + msg);
    }
}

/* ============================================================================
 * Synthetic Chroma
 * ============================================================================ */

constexpr double kFrameSeconds = 512.0 / 22050.0;

// Chroma-like frames: one dominant pitch class per frame
FeatureMatrix random_chroma(size_t frames, unsigned seed) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> pitch(0, 11);
    FeatureMatrix m(12, frames);
    for (size_t t = 0; t < frames; ++t) {
        int dominant = pitch(rng);
        for (int c = 0; c < 12; ++c) {
            m.at(c, t) = c == dominant ? 1.0f : 0.05f;
        }
    }
    return m;
}

// Copy frames [src_begin, src_begin + count) of src into dst at dst_begin
void paste(FeatureMatrix& dst, size_t dst_begin, const FeatureMatrix& src, size_t src_begin, size_t count) {
    for (int c = 0; c < dst.channels; ++c) {
        for (size_t i = 0; i < count; ++i) {
            dst.at(c, dst_begin + i) = src.at(c, src_begin + i);
        }
    }
}

Fingerprint make_fingerprint(FeatureMatrix features, const std::string& label) {
    Fingerprint fp;
    fp.features = std::move(features);
    fp.source_path = label;
    return fp;
}

// Song embedded whole in a mix of random frames
struct Fixture {
    Fingerprint song;
    Fingerprint mix;
};

Fixture embedded(size_t song_frames, size_t mix_frames, size_t at, size_t copied = 0) {
    FeatureMatrix song = random_chroma(song_frames, 7);
    FeatureMatrix mix = random_chroma(mix_frames, 11);
    paste(mix, at, song, 0, copied > 0 ? copied : song_frames);
    return {make_fingerprint(song, "song"), make_fingerprint(mix, "mix")};
}

ChunkMatch chunk_match(int index, long song_start, long mix_start, double score) {
    ChunkMatch m;
    m.index = index;
    m.song_start = song_start;
    m.mix_start = mix_start;
    m.score = score;
    return m;
}

/* ============================================================================
 * Correlator Tests
 * ============================================================================ */

TEST(correlator_matches_direct_sum) {
    const int channels = 2;
    const size_t hay_frames = 50, needle_frames = 7;
    std::mt19937 rng(3);
    std::uniform_real_distribution<double> dist(-1.0, 1.0);

    std::vector<double> hay(channels * hay_frames), needle(channels * needle_frames);
    for (auto& v : hay) v = dist(rng);
    for (auto& v : needle) v = dist(rng);

    Correlator correlator(hay, channels, hay_frames);
    auto scores = correlator.correlate(needle, needle_frames);
    assert_true(scores.size() == hay_frames - needle_frames + 1, "Valid-mode length");

    for (size_t lag = 0; lag < scores.size(); ++lag) {
        double expected = 0.0;
        for (int c = 0; c < channels; ++c) {
            for (size_t i = 0; i < needle_frames; ++i) {
                expected += hay[c * hay_frames + lag + i] * needle[c * needle_frames + i];
            }
        }
        assert_near(scores[lag], expected, 1e-9, "Correlation at lag");
    }
}

TEST(correlator_rejects_long_needle) {
    std::vector<double> hay(12 * 10, 1.0), needle(12 * 11, 1.0);
    Correlator correlator(hay, 12, 10);
    assert_true(correlator.correlate(needle, 11).empty(), "Needle longer than haystack");
    assert_true(!correlator.best(needle, 11).has_value(), "No peak");
}

TEST(find_peak_first_maximum) {
    auto peak = find_peak({1.0, 3.0, 3.0, 2.0});
    assert_true(peak.has_value(), "Peak found");
    assert_true(peak->lag == 1, "First of tied maxima");
    assert_near(peak->score, 3.0, 1e-12, "Score");
    assert_true(!find_peak({}).has_value(), "Empty scores");
}

/* ============================================================================
 * RoughMatcher Tests
 * ============================================================================ */

TEST(rough_locates_embedded_song) {
    auto fx = embedded(1000, 3000, 800);
    RoughMatchConfig config;
    config.confidence_threshold = 1000.0;
    RoughMatcher matcher(config);

    auto result = matcher.match(fx.song, fx.mix);
    assert_true(result.ok(), "Match should succeed");
    assert_true(result.value().start_frame == 800, "Start frame");
    assert_near(result.value().start_in_mix, 800 * kFrameSeconds, 1e-9, "Start seconds");
    assert_near(result.value().end_in_mix - result.value().start_in_mix,
        fx.song.duration_seconds(), 1e-9, "Window length equals song duration");
    assert_true(result.value().confidence >= 1000.0, "Confidence above threshold");
}

TEST(rough_below_threshold) {
    auto fx = embedded(1000, 3000, 800);
    RoughMatchConfig config;
    config.confidence_threshold = 1e12;
    RoughMatcher matcher(config);

    auto result = matcher.match(fx.song, fx.mix);
    assert_true(result.failed(), "Should fail");
    assert_true(result.code() == ErrorCode::NoMatch, "NoMatch");
}

TEST(rough_song_longer_than_mix) {
    Fingerprint song = make_fingerprint(random_chroma(500, 1), "song");
    Fingerprint mix = make_fingerprint(random_chroma(400, 2), "mix");
    RoughMatcher matcher;
    auto result = matcher.match(song, mix);
    assert_true(result.code() == ErrorCode::NoMatch, "Song longer than mix is NoMatch");
}

TEST(rough_incompatible_parameters) {
    auto fx = embedded(100, 300, 50);
    fx.song.hop_length = 1024;
    RoughMatcher matcher;
    assert_true(matcher.match(fx.song, fx.mix).code() == ErrorCode::NoMatch, "Hop mismatch");

    Fingerprint empty;
    assert_true(matcher.match(empty, fx.mix).code() == ErrorCode::NoMatch, "Empty song");
}

TEST(rough_frame_budget) {
    auto fx = embedded(100, 3000, 50);
    Budget budget;
    budget.max_correlation_frames = 1000;
    RoughMatcher matcher(RoughMatchConfig(), budget);
    assert_true(matcher.match(fx.song, fx.mix).code() == ErrorCode::Timeout, "Budget exceeded");
}

/* ============================================================================
 * Isometry Tests
 * ============================================================================ */

TEST(isometry_largest_subset) {
    std::vector<ChunkMatch> matches = {
        chunk_match(0, 0, 100, 5000),       // offset 100
        chunk_match(1, 10, 112, 5000),      // 102
        chunk_match(2, 20, 520, 5000),      // 500
        chunk_match(3, 30, 129, 5000),      // 99
        chunk_match(4, 40, 190, 5000),      // 150
        chunk_match(5, 50, 151, 5000),      // 101
        chunk_match(6, 60, 160, 10.0),      // 100, low score
    };

    auto subset = ChunkIsometryRefiner::find_largest_isometry(matches, 10);
    assert_true(subset.size() == 5, "Five chunks agree");
    assert_true(subset[0].index == 0 && subset[1].index == 1 && subset[2].index == 3 &&
                subset[3].index == 5 && subset[4].index == 6, "Chunk order kept, low score counted");

    long lo = subset[0].offset(), hi = subset[0].offset();
    for (const auto& m : subset) {
        lo = std::min(lo, m.offset());
        hi = std::max(hi, m.offset());
    }
    assert_true(hi - lo <= 10, "Offsets within tolerance");
}

TEST(isometry_tie_takes_first_window) {
    std::vector<ChunkMatch> matches = {
        chunk_match(0, 0, 0, 5000),
        chunk_match(1, 0, 500, 5000),
        chunk_match(2, 0, 5, 5000),
        chunk_match(3, 0, 505, 5000),
    };
    auto subset = ChunkIsometryRefiner::find_largest_isometry(matches, 10);
    assert_true(subset.size() == 2, "Two chunks");
    assert_true(subset[0].index == 0 && subset[1].index == 2, "First maximal window");
}

TEST(isometry_ignores_scores) {
    std::vector<ChunkMatch> matches = {chunk_match(0, 0, 0, 1.0), chunk_match(1, 10, 12, -3.0)};
    assert_true(ChunkIsometryRefiner::find_largest_isometry(matches, 100).size() == 2, "Weak chunks still agree");
    assert_true(ChunkIsometryRefiner::find_largest_isometry({}, 100).empty(), "No chunks");
}

/* ============================================================================
 * Region Expansion Tests
 * ============================================================================ */

TEST(expand_to_song_bounds) {
    auto fx = embedded(1050, 3000, 800);
    ChunkIsometryRefiner refiner;
    ChunkMatch anchor = chunk_match(0, 400, 1200, 5000);

    FrameRegion region = refiner.expand_isometry(fx.song, fx.mix, anchor, anchor, 100);
    assert_true(region.song_begin == 0 && region.mix_begin == 800, "Backward to song start");
    assert_true(region.song_end == 1000 && region.mix_end == 1800, "Forward in whole chunks");

    region = refiner.refine_outer_chunks(fx.song, fx.mix, region, 100);
    assert_true(region.song_begin == 0 && region.mix_begin == 800, "Start unchanged");
    assert_true(region.song_end == 1050 && region.mix_end == 1850, "Half chunk grown at the end");
}

TEST(refine_outer_never_inverts) {
    FeatureMatrix song = random_chroma(200, 21);
    FeatureMatrix mix = random_chroma(200, 22);
    Fingerprint s = make_fingerprint(song, "song");
    Fingerprint m = make_fingerprint(mix, "mix");

    FrameRegion region;
    region.song_begin = 0;
    region.song_end = 10;
    region.mix_begin = 50;
    region.mix_end = 60;

    ChunkIsometryRefiner refiner;
    FrameRegion out = refiner.refine_outer_chunks(s, m, region, 100);
    assert_true(!out.empty(), "Region stays non-empty");
    assert_true(out.song_end - out.song_begin == out.mix_end - out.mix_begin, "Song and mix spans agree");
}

/* ============================================================================
 * Chunk Refinement Tests
 * ============================================================================ */

TEST(chunk_refine_full_song) {
    auto fx = embedded(1500, 4000, 1000);
    ChunkIsometryRefiner refiner;
    assert_true(refiner.chunk_frames(fx.song) == 215, "Five second chunks");

    MatchWindow rough;
    rough.start_frame = 1000;
    rough.start_in_mix = 1000 * kFrameSeconds;
    rough.end_in_mix = rough.start_in_mix + fx.song.duration_seconds();

    RefinedMatch refined = refiner.refine(fx.song, fx.mix, rough);
    assert_true(refined.status == RefineStatus::Refined, "Refined");
    assert_true(refined.strategy == "chunk", "Strategy name");
    assert_near(refined.song_start, 0.0, 1e-9, "Song start");
    assert_near(refined.song_end, 1500 * kFrameSeconds, 1e-9, "Song end");
    assert_near(refined.mix_start, 1000 * kFrameSeconds, 1e-9, "Mix start");
    assert_near(refined.mix_end, 2500 * kFrameSeconds, 1e-9, "Mix end");
    assert_near(refined.confidence, 1.0, 1e-9, "Every chunk agrees");
}

TEST(chunk_refine_song_cut_short) {
    // Only the first 1200 song frames are played in the mix
    auto fx = embedded(1500, 4000, 1000, 1200);
    ChunkIsometryRefiner refiner;

    MatchWindow rough;
    rough.start_frame = 1000;
    rough.start_in_mix = 1000 * kFrameSeconds;
    rough.end_in_mix = rough.start_in_mix + fx.song.duration_seconds();

    RefinedMatch refined = refiner.refine(fx.song, fx.mix, rough);
    assert_true(refined.status == RefineStatus::Refined, "Refined");
    assert_near(refined.song_start, 0.0, 1e-9, "Song start");
    assert_near(refined.song_end, 1200 * kFrameSeconds, 30 * kFrameSeconds, "Song end near the cut");
    assert_near(refined.mix_start - refined.song_start, 1000 * kFrameSeconds, 1e-9, "Offset kept");
    assert_near(refined.mix_end - refined.song_end, 1000 * kFrameSeconds, 1e-9, "Offset kept at end");
    assert_true(refined.confidence > 0.5 && refined.confidence < 1.0, "Only some chunks agree");
}

TEST(chunk_refine_no_match) {
    Fingerprint song = make_fingerprint(random_chroma(1000, 31), "song");
    Fingerprint mix = make_fingerprint(random_chroma(3000, 32), "mix");
    ChunkIsometryRefiner refiner;

    MatchWindow rough;
    rough.start_frame = 500;
    RefinedMatch refined = refiner.refine(song, mix, rough);
    assert_true(refined.status == RefineStatus::NoMatch, "Unrelated audio");
    assert_true(!refined.usable(), "Not usable");
}

TEST(chunk_refine_short_chunks) {
    // 1.5 s chunks are 64 frames; a perfect chunk scores about 12 * 64
    auto fx = embedded(300, 1200, 200);
    ChunkRefineConfig config;
    config.chunk_seconds = 1.5;
    config.n_chunks = 8;
    ChunkIsometryRefiner refiner(config);
    assert_true(refiner.chunk_frames(fx.song) == 64, "Chunk length");

    auto matches = refiner.match_chunks(fx.song, fx.mix, 200, 64, utils::Deadline());
    assert_true(matches.ok(), "Chunks matched");
    for (const auto& m : matches.value()) {
        assert_true(m.offset() == 200, "Chunk found at its true offset");
        assert_true(m.score < 1000.0, "Raw score stays small");
    }

    MatchWindow rough;
    rough.start_frame = 200;
    RefinedMatch refined = refiner.refine(fx.song, fx.mix, rough);
    assert_true(refined.status == RefineStatus::Refined, "Refined");
    assert_near(refined.song_start, 0.0, 1e-9, "Song start");
    assert_near(refined.song_end, 300 * kFrameSeconds, 1e-9, "Song end");
    assert_near(refined.mix_start, 200 * kFrameSeconds, 1e-9, "Mix start");
    assert_near(refined.mix_end, 500 * kFrameSeconds, 1e-9, "Mix end");
    assert_near(refined.confidence, 1.0, 1e-9, "Every chunk agrees");
}

TEST(chunk_refine_correlation_floor) {
    auto fx = embedded(300, 1200, 200);
    ChunkRefineConfig config;
    config.chunk_seconds = 1.5;
    config.n_chunks = 8;

    MatchWindow rough;
    rough.start_frame = 200;

    // Aligned chunks correlate at about 1 per channel and frame
    config.min_chunk_correlation = 0.9;
    assert_true(ChunkIsometryRefiner(config).refine(fx.song, fx.mix, rough).status == RefineStatus::Refined,
                "Floor below aligned correlation");

    config.min_chunk_correlation = 1.5;
    assert_true(ChunkIsometryRefiner(config).refine(fx.song, fx.mix, rough).status == RefineStatus::NoMatch,
                "Floor above any correlation");
}

TEST(chunk_refine_frame_budget) {
    auto fx = embedded(1500, 4000, 1000);
    Budget budget;
    budget.max_correlation_frames = 500;
    ChunkIsometryRefiner refiner(ChunkRefineConfig(), budget);

    MatchWindow rough;
    rough.start_frame = 1000;
    assert_true(refiner.refine(fx.song, fx.mix, rough).status == RefineStatus::Timeout, "Timeout");
}

TEST(rough_only_strategy) {
    MatchWindow rough;
    rough.start_in_mix = 12.0;
    rough.end_in_mix = 212.0;
    rough.confidence = 15000.0;

    RoughOnlyStrategy strategy;
    Fingerprint empty;
    RefinedMatch refined = strategy.refine(empty, empty, rough);
    assert_true(refined.status == RefineStatus::RoughOnly, "RoughOnly status");
    assert_near(refined.song_start, 0.0, 1e-12, "Song start");
    assert_near(refined.song_end, 200.0, 1e-12, "Whole song");
    assert_near(refined.mix_start, 12.0, 1e-12, "Mix start");
    assert_near(refined.mix_end, 212.0, 1e-12, "Mix end");
}

/* ============================================================================
 * Certainty Profile Tests
 * ============================================================================ */

TEST(certainty_profile_of_refined_match) {
    auto fx = embedded(1500, 4000, 1000);
    ChunkIsometryRefiner refiner;

    MatchWindow rough;
    rough.start_frame = 1000;
    RefinedMatch refined = refiner.refine(fx.song, fx.mix, rough);
    assert_true(refined.status == RefineStatus::Refined, "Refined");

    CertaintyProfile profile = refiner.certainty_profile(fx.song, fx.mix, refined);
    assert_true(!profile.scores.empty(), "Profile computed");
    assert_true(profile.scores.size() <= 20, "At most the configured chunk count");
    assert_true(profile.time_points.size() == profile.scores.size(), "One time point per chunk");
    assert_true(profile.reference_chunk >= 0, "Reference chunk chosen");
    assert_true(profile.max_certainty >= profile.mean_certainty, "Max at least mean");
    assert_true(profile.reference_mix_frame - profile.reference_song_frame == 1000, "Reference offset");

    // Identical aligned chunks score their element count
    double full = 12.0 * profile.chunk_frames;
    assert_true(profile.max_certainty > 0.99 * full, "Aligned chunks fully certain");

    assert_near(profile.time_points.front(), refined.mix_start, 1e-9, "Times on the mix timeline");
    for (size_t i = 1; i < profile.time_points.size(); ++i) {
        assert_true(profile.time_points[i] > profile.time_points[i - 1], "Times ascending");
    }
}

TEST(certainty_profile_of_unusable_match) {
    auto fx = embedded(300, 900, 100);
    ChunkIsometryRefiner refiner;
    RefinedMatch none;
    none.status = RefineStatus::NoMatch;
    CertaintyProfile profile = refiner.certainty_profile(fx.song, fx.mix, none);
    assert_true(profile.scores.empty(), "No profile without a match");
    assert_true(profile.reference_chunk == -1, "No reference chunk");
}

/* ============================================================================
 * Main
 * ============================================================================ */

int main() {
    log::set_level(log::Level::Error);

    std::cout << "======================================\n";
    std::cout << "MixGraph - Matcher Tests\n";
    std::cout << "======================================\n\n";

    std::cout << "--- Correlator ---\n";
    RUN_TEST(correlator_matches_direct_sum);
    RUN_TEST(correlator_rejects_long_needle);
    RUN_TEST(find_peak_first_maximum);

    std::cout << "\n--- RoughMatcher ---\n";
    RUN_TEST(rough_locates_embedded_song);
    RUN_TEST(rough_below_threshold);
    RUN_TEST(rough_song_longer_than_mix);
    RUN_TEST(rough_incompatible_parameters);
    RUN_TEST(rough_frame_budget);

    std::cout << "\n--- Isometry ---\n";
    RUN_TEST(isometry_largest_subset);
    RUN_TEST(isometry_tie_takes_first_window);
    RUN_TEST(isometry_ignores_scores);

    std::cout << "\n--- Region Expansion ---\n";
    RUN_TEST(expand_to_song_bounds);
    RUN_TEST(refine_outer_never_inverts);

    std::cout << "\n--- Chunk Refinement ---\n";
    RUN_TEST(chunk_refine_full_song);
    RUN_TEST(chunk_refine_song_cut_short);
    RUN_TEST(chunk_refine_no_match);
    RUN_TEST(chunk_refine_short_chunks);
    RUN_TEST(chunk_refine_correlation_floor);
    RUN_TEST(chunk_refine_frame_budget);
    RUN_TEST(rough_only_strategy);

    std::cout << "\n--- Certainty Profile ---\n";
    RUN_TEST(certainty_profile_of_refined_match);
    RUN_TEST(certainty_profile_of_unusable_match);

    std::cout << "\n======================================\n";
    if (failed_tests == 0) {
        std::cout << "All tests PASSED!\n";
    } else {
        std::cout << failed_tests << " test(s) FAILED\n";
    }
    std::cout << "======================================\n";

    return failed_tests > 0 ? 1 : 0;
}
