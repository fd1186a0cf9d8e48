/**
 * MixGraph - Transition Graph Implementation
 */

#include "transition_graph.h"
#include <algorithm>

namespace mixgraph {

size_t TransitionGraph::add_song(const std::string& song_id, const std::map<std::string, std::string>& metadata) {
    auto it = index_.find(song_id);
    if (it != index_.end()) {
        auto& existing = nodes_[it->second].metadata;
        for (const auto& [key, value] : metadata) {
            existing[key] = value;
        }
        return it->second;
    }

    size_t index = nodes_.size();
    nodes_.push_back(SongNode{song_id, metadata});
    adjacency_.emplace_back();
    index_.emplace(song_id, index);
    return index;
}

void TransitionGraph::add_transition(const TransitionPair& pair, double crossfade_length) {
    size_t source = add_song(pair.song_x);
    size_t target = add_song(pair.song_y);

    TransitionEdge edge;
    edge.source = source;
    edge.target = target;
    edge.source_end = pair.cross_out_x + crossfade_length;
    edge.target_start = pair.cross_in_y;
    edge.mix_id = pair.mix;
    edge.pair = pair;

    adjacency_[source].push_back(std::move(edge));
    edge_count_++;
}

std::optional<size_t> TransitionGraph::index_of(const std::string& song_id) const {
    auto it = index_.find(song_id);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<size_t> TransitionGraph::neighbors(size_t index) const {
    std::vector<size_t> result;
    for (const auto& edge : adjacency_.at(index)) {
        if (std::find(result.begin(), result.end(), edge.target) == result.end()) {
            result.push_back(edge.target);
        }
    }
    return result;
}

std::vector<const TransitionEdge*> TransitionGraph::edges_between(size_t source, size_t target) const {
    std::vector<const TransitionEdge*> result;
    for (const auto& edge : adjacency_.at(source)) {
        if (edge.target == target) {
            result.push_back(&edge);
        }
    }
    return result;
}

TransitionGraph build_graph(const std::vector<TransitionPair>& pairs, double crossfade_length) {
    TransitionGraph graph;
    for (const auto& pair : pairs) {
        graph.add_transition(pair, crossfade_length);
    }
    return graph;
}

} // namespace mixgraph
