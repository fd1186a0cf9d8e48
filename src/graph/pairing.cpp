/**
 * MixGraph - Transition Pairing Implementation
 */

#include "pairing.h"
#include <map>

namespace mixgraph {

std::optional<TransitionCandidate> make_candidate(const RefinedMatch& match,
                                                  const std::string& song_path,
                                                  const std::string& mix_path) {
    if (!match.usable() || !(match.mix_start < match.mix_end)) {
        return std::nullopt;
    }

    TransitionCandidate candidate;
    candidate.song_path = song_path;
    candidate.mix_path = mix_path;
    candidate.cross_in = match.mix_start;
    candidate.cross_out = match.mix_end;
    candidate.offset = match.mix_start - match.song_start;
    return candidate;
}

std::vector<TransitionPair> pair_transitions(const std::vector<TransitionCandidate>& candidates,
                                             const PairingConfig& config) {
    // Group by mix, keeping first-seen order
    std::vector<std::vector<const TransitionCandidate*>> groups;
    std::map<std::string, size_t> group_index;
    for (const auto& c : candidates) {
        auto it = group_index.find(c.mix_path);
        if (it == group_index.end()) {
            group_index.emplace(c.mix_path, groups.size());
            groups.push_back({&c});
        } else {
            groups[it->second].push_back(&c);
        }
    }

    std::vector<TransitionPair> pairs;
    for (const auto& group : groups) {
        for (const TransitionCandidate* x : group) {
            for (const TransitionCandidate* y : group) {
                if (x->song_path == y->song_path) continue;

                double gap = y->cross_in - x->cross_out;
                if (gap <= config.min_gap || gap >= config.max_gap) continue;

                TransitionPair pair;
                pair.song_x = x->song_path;
                pair.song_y = y->song_path;
                pair.mix = x->mix_path;
                pair.offset_x = x->offset;
                pair.offset_y = y->offset;
                pair.cross_out_x = x->cross_out;
                pair.cross_in_y = y->cross_in;
                pairs.push_back(std::move(pair));
            }
        }
    }

    return pairs;
}

} // namespace mixgraph
