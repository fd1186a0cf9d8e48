/**
 * MixGraph - Refinement Strategies
 */

#ifndef MIXGRAPH_REFINEMENT_H
#define MIXGRAPH_REFINEMENT_H

#include "mixgraph/types.h"
#include "../core/utils.h"
#include <string>

namespace mixgraph {

/**
 * Turns a rough window into precise song/mix boundaries.
 * Implementations never throw; failure is reported through the status.
 */
class RefinementStrategy {
public:
    virtual ~RefinementStrategy() = default;

    virtual std::string name() const = 0;

    virtual RefinedMatch refine(const Fingerprint& song, const Fingerprint& mix,
                                const MatchWindow& rough,
                                const utils::Deadline& deadline = utils::Deadline()) = 0;
};

/**
 * The rough window taken as-is: the whole song at the rough offset.
 */
inline RefinedMatch refined_from_rough(const MatchWindow& rough, RefineStatus status, const std::string& strategy) {
    RefinedMatch match;
    match.song_start = 0.0;
    match.song_end = rough.end_in_mix - rough.start_in_mix;
    match.mix_start = rough.start_in_mix;
    match.mix_end = rough.end_in_mix;
    match.confidence = rough.confidence;
    match.status = status;
    match.strategy = strategy;
    return match;
}

class RoughOnlyStrategy : public RefinementStrategy {
public:
    std::string name() const override { return "rough"; }

    RefinedMatch refine(const Fingerprint&, const Fingerprint&, const MatchWindow& rough,
                        const utils::Deadline& = utils::Deadline()) override {
        return refined_from_rough(rough, RefineStatus::RoughOnly, name());
    }
};

} // namespace mixgraph

#endif // MIXGRAPH_REFINEMENT_H
