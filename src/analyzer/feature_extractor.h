/**
 * MixGraph - Feature Extractor
 */

#ifndef MIXGRAPH_FEATURE_EXTRACTOR_H
#define MIXGRAPH_FEATURE_EXTRACTOR_H

#include "mixgraph/types.h"
#include "chroma.h"
#include "../decoder/decoder.h"
#include <memory>
#include <string>

namespace mixgraph {

class FingerprintStore;

/**
 * Computes chroma fingerprints of audio files, reading and writing the
 * fingerprint cache when a store is attached.
 */
class FeatureExtractor {
public:
    // Bumped whenever the chroma computation changes output
    static constexpr int kFeatureVersion = 1;

    /**
     * @param store Optional cache (not owned; may be nullptr)
     */
    explicit FeatureExtractor(const FingerprintConfig& config = {}, FingerprintStore* store = nullptr);
    ~FeatureExtractor();

    FeatureExtractor(const FeatureExtractor&) = delete;
    FeatureExtractor& operator=(const FeatureExtractor&) = delete;

    /**
     * Fingerprint an audio file.
     *
     * @return Fingerprint, or MissingInput when the file does not exist and
     *         DecodeError when it cannot be decoded
     */
    Result<Fingerprint> compute_fingerprint(const std::string& audio_path);

    /**
     * Fingerprint PCM already in memory. Bypasses the cache.
     */
    Result<Fingerprint> compute_from_buffer(const AudioBuffer& audio, const std::string& source_label = "");

    /**
     * Cache key for a file's content hash under the current parameters.
     */
    std::string cache_key_for(const std::string& content_hash) const;

    const FingerprintConfig& config() const { return config_; }

private:
    FingerprintConfig config_;
    FingerprintStore* store_;
    ChromaExtractor chroma_;
    std::unique_ptr<Decoder> decoder_;
};

} // namespace mixgraph

#endif // MIXGRAPH_FEATURE_EXTRACTOR_H
