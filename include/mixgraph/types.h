/**
 * MixGraph - Internal Types
 */

#ifndef MIXGRAPH_TYPES_H
#define MIXGRAPH_TYPES_H

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <variant>
#include <memory>
#include <cstdint>
#include <cstddef>

namespace mixgraph {

/* ============================================================================
 * Result Type
 * ============================================================================ */

enum class ErrorCode {
    Unknown,
    InvalidArgument,
    MissingInput,           // Audio or cache file absent
    DecodeError,            // Unreadable / corrupt audio
    NoMatch,                // Below confidence threshold, or no isometric subset
    BeatTrackingFailure,
    Timeout,                // Wall-clock or frame budget exceeded
    StoreError,
    GraphPath
};

const char* error_code_name(ErrorCode code);

// Error wrapper type to avoid variant<T, T> when T = std::string
struct ResultError {
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
    ResultError() = default;
    ResultError(std::string m) : message(std::move(m)) {}
    ResultError(const char* m) : message(m) {}
    ResultError(ErrorCode c, std::string m) : code(c), message(std::move(m)) {}
};

template<typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(ResultError error) : data_(std::move(error)) {}
    Result(const char* error) : data_(ResultError{error}) {}

    // Only enable this constructor when T is not std::string to avoid ambiguity
    template<typename U = T, typename = std::enable_if_t<!std::is_same_v<U, std::string>>>
    Result(std::string error) : data_(ResultError{std::move(error)}) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    bool failed() const { return !ok(); }

    T& value() { return std::get<T>(data_); }
    const T& value() const { return std::get<T>(data_); }

    const std::string& error() const { return std::get<ResultError>(data_).message; }
    ErrorCode code() const { return ok() ? ErrorCode::Unknown : std::get<ResultError>(data_).code; }
    const ResultError& error_info() const { return std::get<ResultError>(data_); }

private:
    std::variant<T, ResultError> data_;
};

/* ============================================================================
 * Audio Types
 * ============================================================================ */

struct AudioBuffer {
    std::vector<float> samples;  // Interleaved when channels > 1
    int sample_rate = 22050;
    int channels = 1;

    size_t frame_count() const {
        return channels > 0 ? samples.size() / channels : 0;
    }

    float duration_seconds() const {
        return sample_rate > 0 ? static_cast<float>(frame_count()) / sample_rate : 0.0f;
    }

    std::vector<float> to_mono() const {
        if (channels <= 1) return samples;
        std::vector<float> mono(frame_count());
        for (size_t i = 0; i < mono.size(); ++i) {
            float sum = 0.0f;
            for (int c = 0; c < channels; ++c) {
                sum += samples[i * channels + c];
            }
            mono[i] = sum / channels;
        }
        return mono;
    }
};

/* ============================================================================
 * Feature Types
 * ============================================================================ */

/**
 * Row-major channels x frames matrix (12 x T for chroma).
 */
struct FeatureMatrix {
    int channels = 0;
    size_t frames = 0;
    std::vector<float> data;

    FeatureMatrix() = default;
    FeatureMatrix(int ch, size_t n) : channels(ch), frames(n), data(static_cast<size_t>(ch) * n, 0.0f) {}

    float& at(int channel, size_t frame) { return data[channel * frames + frame]; }
    float at(int channel, size_t frame) const { return data[channel * frames + frame]; }

    const float* row(int channel) const { return data.data() + channel * frames; }
    float* row(int channel) { return data.data() + channel * frames; }

    bool empty() const { return frames == 0 || channels == 0; }

    // Copy of frames [begin, end)
    FeatureMatrix slice(size_t begin, size_t end) const;
};

struct Fingerprint {
    FeatureMatrix features;             // 12 x T chroma
    int sample_rate = 22050;
    int hop_length = 512;
    std::string source_path;
    std::string cache_key;

    size_t frames() const { return features.frames; }

    double frames_to_seconds(double frames) const {
        return sample_rate > 0 ? frames * hop_length / sample_rate : 0.0;
    }

    double duration_seconds() const { return frames_to_seconds(static_cast<double>(features.frames)); }
};

/* ============================================================================
 * Match Types
 * ============================================================================ */

struct MatchWindow {
    std::string song_path;
    std::string mix_path;
    double start_in_mix = 0.0;          // Seconds
    double end_in_mix = 0.0;
    double confidence = 0.0;            // Peak correlation energy
    size_t start_frame = 0;
};

enum class RefineStatus {
    Refined,
    RoughOnly,          // Strategy degraded to the rough estimate
    NoMatch,
    Timeout
};

const char* refine_status_name(RefineStatus status);

struct RefinedMatch {
    double song_start = 0.0;            // Seconds into the song
    double song_end = 0.0;
    double mix_start = 0.0;             // Seconds into the mix
    double mix_end = 0.0;
    double confidence = 0.0;
    RefineStatus status = RefineStatus::NoMatch;
    std::string strategy;

    bool usable() const {
        return status == RefineStatus::Refined || status == RefineStatus::RoughOnly;
    }
};

struct CertaintyProfile {
    std::vector<double> time_points;    // Aligned to song start
    std::vector<double> scores;
    int reference_chunk = -1;
    size_t reference_song_frame = 0;
    size_t reference_mix_frame = 0;
    size_t chunk_frames = 0;
    double max_certainty = 0.0;
    double mean_certainty = 0.0;
};

/* ============================================================================
 * Transition Types
 * ============================================================================ */

// XT: one song's detected window inside one mix
struct TransitionCandidate {
    std::string song_path;
    std::string mix_path;
    double offset = 0.0;                // mix time = song time + offset
    double cross_in = 0.0;
    double cross_out = 0.0;
};

// XTY: a hand-off from song X to song Y inside one mix
struct TransitionPair {
    std::string song_x;
    std::string song_y;
    std::string mix;
    double offset_x = 0.0;
    double offset_y = 0.0;
    double cross_out_x = 0.0;
    double cross_in_y = 0.0;

    double gap() const { return cross_in_y - cross_out_x; }
};

struct MatchRecord {
    std::string song_path;
    std::string mix_path;
    MatchWindow rough;
    RefinedMatch refined;
    std::optional<TransitionCandidate> candidate;
};

/* ============================================================================
 * Configuration
 * ============================================================================ */

struct FingerprintConfig {
    int sample_rate = 22050;            // Analysis rate the decoder resamples to
    int hop_length = 512;
    int n_fft = 2048;
    float tuning_a4 = 440.0f;
};

struct RoughMatchConfig {
    double confidence_threshold = 10000.0;  // Unnormalized correlation energy
};

struct ChunkRefineConfig {
    double chunk_seconds = 5.0;
    int n_chunks = 30;
    double buffer_seconds = 30.0;
    int isometry_tolerance = 100;       // Frames
    double similarity_threshold = 0.6;
    double min_similarity_threshold = 0.8;
    int min_chunk_factor = 4;
    double min_chunk_correlation = 0.0;  // Per channel and frame; 0 keeps every chunk

    // Certainty profile
    int profile_chunks = 20;
    double profile_overlap = 0.9;
};

// Time that is snapped to the nearest mix downbeat
enum class DownbeatAnchor {
    RoughStart,         // The rough-match start in the mix
    SongDownbeat        // The song's first downbeat at its rough position
};

struct BeatAlignConfig {
    DownbeatAnchor anchor = DownbeatAnchor::RoughStart;
    int beats_per_measure = 4;
    float min_bpm = 60.0f;
    float max_bpm = 200.0f;
};

struct PairingConfig {
    double max_gap = 45.0;              // Seconds
    double min_gap = 5.0;
};

struct GraphConfig {
    double crossfade_length = 0.0;      // Added to cross_out_x for source_end
    size_t beam_width = 3;              // 0 = unbounded
    bool exhaustive = false;
};

/**
 * Bounds on pathological inputs. Zero disables a bound.
 */
struct Budget {
    double time_budget_seconds = 0.0;
    size_t max_correlation_frames = 0;
};

struct EngineConfig {
    std::string cache_path = "mixgraph.db";
    FingerprintConfig fingerprint;
    RoughMatchConfig rough;
    ChunkRefineConfig chunk;
    BeatAlignConfig beat;
    PairingConfig pairing;
    GraphConfig graph;
    Budget budget;
    int worker_threads = 0;             // 0 = hardware concurrency
    std::string default_strategy = "chunk";
};

} // namespace mixgraph

#endif // MIXGRAPH_TYPES_H
