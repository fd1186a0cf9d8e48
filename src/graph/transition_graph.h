/**
 * MixGraph - Transition Graph
 */

#ifndef MIXGRAPH_TRANSITION_GRAPH_H
#define MIXGRAPH_TRANSITION_GRAPH_H

#include "mixgraph/types.h"
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace mixgraph {

struct SongNode {
    std::string song_id;
    std::map<std::string, std::string> metadata;
};

/**
 * One observed hand-off between two songs in one mix.
 */
struct TransitionEdge {
    size_t source = 0;
    size_t target = 0;
    double source_end = 0.0;        // cross_out_x + crossfade length
    double target_start = 0.0;      // cross_in_y
    std::string mix_id;
    TransitionPair pair;
};

/**
 * Directed multigraph of songs. Nodes are addressed by dense index in
 * insertion order; parallel edges (several mixes with the same hand-off)
 * are kept.
 */
class TransitionGraph {
public:
    TransitionGraph() = default;

    /**
     * Add a song, or merge metadata into an existing one.
     * @return Node index
     */
    size_t add_song(const std::string& song_id, const std::map<std::string, std::string>& metadata = {});

    /**
     * Add an X -> Y edge, creating missing nodes.
     */
    void add_transition(const TransitionPair& pair, double crossfade_length = 0.0);

    std::optional<size_t> index_of(const std::string& song_id) const;

    const SongNode& song(size_t index) const { return nodes_.at(index); }

    const std::vector<TransitionEdge>& out_edges(size_t index) const { return adjacency_.at(index); }

    // Distinct targets of a node's out-edges, in first-seen order
    std::vector<size_t> neighbors(size_t index) const;

    std::vector<const TransitionEdge*> edges_between(size_t source, size_t target) const;

    size_t node_count() const { return nodes_.size(); }
    size_t edge_count() const { return edge_count_; }

private:
    std::vector<SongNode> nodes_;
    std::vector<std::vector<TransitionEdge>> adjacency_;
    std::unordered_map<std::string, size_t> index_;
    size_t edge_count_ = 0;
};

TransitionGraph build_graph(const std::vector<TransitionPair>& pairs, double crossfade_length = 0.0);

} // namespace mixgraph

#endif // MIXGRAPH_TRANSITION_GRAPH_H
