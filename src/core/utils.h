/**
 * MixGraph - Utility Functions
 */

#ifndef MIXGRAPH_UTILS_H
#define MIXGRAPH_UTILS_H

#include "mixgraph/types.h"
#include <string>
#include <vector>
#include <cmath>
#include <chrono>
#include <algorithm>
#include <filesystem>

namespace mixgraph {
namespace utils {

/* ============================================================================
 * Math Utilities
 * ============================================================================ */

inline double clamp(double value, double min_val, double max_val) {
    return std::max(min_val, std::min(max_val, value));
}

/**
 * Frame <-> time conversions (frame k starts at k * hop samples).
 */
inline double frames_to_seconds(double frames, int sample_rate, int hop_length) {
    return sample_rate > 0 ? frames * hop_length / sample_rate : 0.0;
}

inline long seconds_to_frames(double seconds, int sample_rate, int hop_length) {
    if (hop_length <= 0) return 0;
    return static_cast<long>(std::floor(seconds * sample_rate / hop_length));
}

/* ============================================================================
 * Matrix Math
 * ============================================================================ */

/**
 * Cosine similarity of two equally sized channel x frame blocks taken
 * from [a_begin, a_begin + size) and [b_begin, b_begin + size).
 * Returns -1 when either block is out of bounds.
 */
inline double block_cosine_similarity(const FeatureMatrix& a, long a_begin,
                                      const FeatureMatrix& b, long b_begin,
                                      long size) {
    if (size <= 0 || a_begin < 0 || b_begin < 0 ||
        a_begin + size > static_cast<long>(a.frames) ||
        b_begin + size > static_cast<long>(b.frames) ||
        a.channels != b.channels) {
        return -1.0;
    }

    double dot = 0.0, norm_a = 0.0, norm_b = 0.0;
    for (int c = 0; c < a.channels; ++c) {
        const float* ra = a.row(c) + a_begin;
        const float* rb = b.row(c) + b_begin;
        for (long i = 0; i < size; ++i) {
            dot += static_cast<double>(ra[i]) * rb[i];
            norm_a += static_cast<double>(ra[i]) * ra[i];
            norm_b += static_cast<double>(rb[i]) * rb[i];
        }
    }
    return dot / (std::sqrt(norm_a) * std::sqrt(norm_b) + 1e-8);
}

/**
 * Zero mean, unit variance over the whole matrix. A constant matrix is
 * only mean-centred. epsilon is added to the standard deviation.
 */
inline std::vector<double> normalize_matrix(const FeatureMatrix& m, double epsilon = 0.0) {
    std::vector<double> out(m.data.begin(), m.data.end());
    if (out.empty()) return out;

    double mean = 0.0;
    for (double v : out) mean += v;
    mean /= out.size();

    double var = 0.0;
    for (double v : out) var += (v - mean) * (v - mean);
    double std_dev = std::sqrt(var / out.size()) + epsilon;

    for (double& v : out) {
        v -= mean;
        if (std_dev > 0.0) v /= std_dev;
    }
    return out;
}

/* ============================================================================
 * File Utilities
 * ============================================================================ */

inline bool file_exists(const std::string& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

/* ============================================================================
 * Time Utilities
 * ============================================================================ */

inline int64_t current_timestamp() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

/**
 * Wall-clock deadline derived from a Budget. A zero budget never expires.
 */
class Deadline {
public:
    Deadline() = default;
    explicit Deadline(double seconds)
        : enabled_(seconds > 0.0)
        , end_(std::chrono::steady_clock::now() +
               std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                   std::chrono::duration<double>(seconds > 0.0 ? seconds : 0.0))) {}

    bool expired() const {
        return enabled_ && std::chrono::steady_clock::now() >= end_;
    }

private:
    bool enabled_ = false;
    std::chrono::steady_clock::time_point end_{};
};

} // namespace utils
} // namespace mixgraph

#endif // MIXGRAPH_UTILS_H
