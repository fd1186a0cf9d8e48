/**
 * MixGraph - Transition Pairing
 */

#ifndef MIXGRAPH_PAIRING_H
#define MIXGRAPH_PAIRING_H

#include "mixgraph/types.h"
#include <optional>
#include <vector>

namespace mixgraph {

/**
 * XT candidate of a refined match: cross_in/cross_out are the mix
 * boundaries and offset maps song time to mix time.
 *
 * @return nullopt unless the match is usable and cross_in < cross_out
 */
std::optional<TransitionCandidate> make_candidate(const RefinedMatch& match,
                                                  const std::string& song_path,
                                                  const std::string& mix_path);

/**
 * Every ordered (X, Y) of distinct songs in the same mix whose gap
 * Y.cross_in - X.cross_out lies strictly between min_gap and max_gap.
 * Mixes are visited in first-seen order, candidates in input order.
 */
std::vector<TransitionPair> pair_transitions(const std::vector<TransitionCandidate>& candidates,
                                             const PairingConfig& config = {});

} // namespace mixgraph

#endif // MIXGRAPH_PAIRING_H
