/**
 * MixGraph - Feature Extractor Implementation
 */

#include "feature_extractor.h"
#include "../core/content_hash.h"
#include "../core/store.h"
#include "../core/utils.h"
#include "../core/log.h"
#include <fmt/format.h>

namespace mixgraph {

FeatureExtractor::FeatureExtractor(const FingerprintConfig& config, FingerprintStore* store)
    : config_(config)
    , store_(store)
    , chroma_(config)
    , decoder_(std::make_unique<Decoder>()) {}

FeatureExtractor::~FeatureExtractor() = default;

std::string FeatureExtractor::cache_key_for(const std::string& content_hash) const {
    return fmt::format("{}:sr{}:hop{}:fft{}:a{:.2f}:v{}",
        content_hash, config_.sample_rate, config_.hop_length, config_.n_fft,
        config_.tuning_a4, kFeatureVersion);
}

Result<Fingerprint> FeatureExtractor::compute_fingerprint(const std::string& audio_path) {
    if (!utils::file_exists(audio_path)) {
        return ResultError{ErrorCode::MissingInput, "Audio file not found: " + audio_path};
    }

    std::string key;
    if (store_) {
        auto hash = hash_file(audio_path);
        if (hash.failed()) {
            return hash.error_info();
        }
        key = cache_key_for(hash.value());

        auto cached = store_->get_fingerprint(key);
        if (cached) {
            log::debug("fingerprint cache hit: {}", audio_path);
            cached->source_path = audio_path;
            return std::move(*cached);
        }
        log::debug("fingerprint cache miss: {}", audio_path);
    }

    auto decoded = decoder_->decode_for_analysis(audio_path, config_.sample_rate);
    if (decoded.failed()) {
        log::warn("cannot fingerprint {}: {}", audio_path, decoded.error());
        if (decoded.code() == ErrorCode::MissingInput) {
            return decoded.error_info();
        }
        return ResultError{ErrorCode::DecodeError, decoded.error()};
    }

    auto computed = compute_from_buffer(decoded.value(), audio_path);
    if (computed.failed()) {
        return computed;
    }

    Fingerprint& fp = computed.value();
    fp.cache_key = key;

    if (store_) {
        auto stored = store_->upsert_fingerprint(fp);
        if (stored.failed()) {
            // A cache write failure does not invalidate the fingerprint
            log::warn("fingerprint cache write failed for {}: {}", audio_path, stored.error());
        }
    }

    return computed;
}

Result<Fingerprint> FeatureExtractor::compute_from_buffer(const AudioBuffer& audio, const std::string& source_label) {
    if (audio.samples.empty()) {
        return ResultError{ErrorCode::DecodeError, "Empty audio buffer: " + source_label};
    }
    if (audio.sample_rate != config_.sample_rate) {
        return ResultError{ErrorCode::InvalidArgument,
            fmt::format("Expected {} Hz audio, got {} Hz", config_.sample_rate, audio.sample_rate)};
    }

    Fingerprint fp;
    fp.features = chroma_.compute(audio.to_mono());
    fp.sample_rate = config_.sample_rate;
    fp.hop_length = config_.hop_length;
    fp.source_path = source_label;

    if (fp.features.empty()) {
        return ResultError{ErrorCode::DecodeError, "No chroma frames: " + source_label};
    }

    return fp;
}

} // namespace mixgraph
