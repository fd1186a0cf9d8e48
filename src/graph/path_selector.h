/**
 * MixGraph - Path Selector
 */

#ifndef MIXGRAPH_PATH_SELECTOR_H
#define MIXGRAPH_PATH_SELECTOR_H

#include "transition_graph.h"
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace mixgraph {

// Song sequence as node indices
using GraphPath = std::vector<size_t>;

/**
 * A requested hop has no usable edge.
 */
class GraphPathError : public std::runtime_error {
public:
    GraphPathError(const std::string& message, size_t hop)
        : std::runtime_error(message), hop_(hop) {}

    // Index of the failing hop within the path
    size_t hop() const { return hop_; }

private:
    size_t hop_;
};

/**
 * Strategy for choosing a long simple path through the graph.
 */
class PathPolicy {
public:
    virtual ~PathPolicy() = default;
    virtual std::string name() const = 0;
    virtual GraphPath find_sequence(const TransitionGraph& graph) const = 0;
};

/**
 * Beam search from every start node. Partial paths are ranked by how many
 * out-edges of their last node lead to unvisited songs; the top beam_width
 * survive each step (0 keeps all). Longest terminal path wins, the first
 * found on ties.
 */
class BeamSearchPolicy : public PathPolicy {
public:
    explicit BeamSearchPolicy(size_t beam_width = 3) : beam_width_(beam_width) {}

    std::string name() const override { return "beam"; }
    GraphPath find_sequence(const TransitionGraph& graph) const override;

    size_t beam_width() const { return beam_width_; }

private:
    size_t beam_width_;
};

/**
 * Longest simple path by exhaustive depth-first search. Exponential;
 * only for small graphs.
 */
class ExhaustivePolicy : public PathPolicy {
public:
    std::string name() const override { return "exhaustive"; }
    GraphPath find_sequence(const TransitionGraph& graph) const override;
};

// Preference among the surviving parallel edges of one hop
using EdgeScore = std::function<double(const TransitionEdge&)>;

/**
 * Pick one edge per consecutive pair of the path. After the first hop an
 * edge must satisfy source_end >= previous.target_start. Among survivors the
 * highest score wins (source_end by default; first on ties).
 *
 * @throws GraphPathError when a hop has no surviving edge
 */
std::vector<TransitionEdge> resolve_edges(const TransitionGraph& graph, const GraphPath& path,
                                          const EdgeScore& score = nullptr);

/**
 * Path policy bound to one graph.
 */
class PathSelector {
public:
    PathSelector(const TransitionGraph& graph, std::unique_ptr<PathPolicy> policy);

    GraphPath find_sequence() const;

    std::vector<TransitionEdge> resolve_edges(const GraphPath& path, const EdgeScore& score = nullptr) const;

    std::vector<std::string> song_ids(const GraphPath& path) const;

    const PathPolicy& policy() const { return *policy_; }

private:
    const TransitionGraph& graph_;
    std::unique_ptr<PathPolicy> policy_;
};

/**
 * Policy selected by configuration.
 */
std::unique_ptr<PathPolicy> make_path_policy(const GraphConfig& config);

} // namespace mixgraph

#endif // MIXGRAPH_PATH_SELECTOR_H
