/**
 * MixGraph - Chroma Extractor
 */

#ifndef MIXGRAPH_CHROMA_H
#define MIXGRAPH_CHROMA_H

#include "mixgraph/types.h"
#include <vector>

namespace mixgraph {

/**
 * Short-time chroma transform: power STFT folded onto 12 pitch classes
 * (C first) and normalised per frame by its maximum.
 */
class ChromaExtractor {
public:
    static constexpr int kPitchClasses = 12;

    explicit ChromaExtractor(const FingerprintConfig& config = {});

    /**
     * @return 12 x ceil(samples / hop) matrix; empty for empty input
     */
    FeatureMatrix compute(const std::vector<float>& mono) const;

    const FingerprintConfig& config() const { return config_; }

private:
    // 12 x bins filter bank
    void build_filter_bank();

    FingerprintConfig config_;
    size_t bins_ = 0;
    std::vector<double> filters_;
};

} // namespace mixgraph

#endif // MIXGRAPH_CHROMA_H
