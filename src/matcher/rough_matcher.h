/**
 * MixGraph - Rough Matcher
 */

#ifndef MIXGRAPH_ROUGH_MATCHER_H
#define MIXGRAPH_ROUGH_MATCHER_H

#include "mixgraph/types.h"
#include "../core/utils.h"

namespace mixgraph {

/**
 * Locates a whole song inside a mix by cross-correlating their
 * normalised chroma matrices.
 */
class RoughMatcher {
public:
    explicit RoughMatcher(const RoughMatchConfig& config = {}, const Budget& budget = {});

    /**
     * @return Window whose length equals the song duration, or NoMatch when
     *         the peak score is below the confidence threshold, the song is
     *         longer than the mix, or the fingerprints are incompatible.
     *         Timeout when a budget is exceeded.
     */
    Result<MatchWindow> match(const Fingerprint& song, const Fingerprint& mix,
                              const utils::Deadline& deadline = utils::Deadline()) const;

    const RoughMatchConfig& config() const { return config_; }

private:
    RoughMatchConfig config_;
    Budget budget_;
};

} // namespace mixgraph

#endif // MIXGRAPH_ROUGH_MATCHER_H
