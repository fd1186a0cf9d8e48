/**
 * MixGraph - Path Selector Implementation
 */

#include "path_selector.h"
#include "../core/log.h"
#include <algorithm>
#include <fmt/format.h>

namespace mixgraph {

namespace {

bool contains(const GraphPath& path, size_t node) {
    return std::find(path.begin(), path.end(), node) != path.end();
}

// Out-edges of the path's last node that lead to unvisited songs
size_t open_edges(const TransitionGraph& graph, const GraphPath& path) {
    size_t count = 0;
    for (const auto& edge : graph.out_edges(path.back())) {
        if (!contains(path, edge.target)) count++;
    }
    return count;
}

} // namespace

/* ============================================================================
 * Beam Search
 * ============================================================================ */

GraphPath BeamSearchPolicy::find_sequence(const TransitionGraph& graph) const {
    GraphPath best;

    for (size_t start = 0; start < graph.node_count(); ++start) {
        std::vector<GraphPath> beam{GraphPath{start}};

        while (!beam.empty()) {
            std::vector<GraphPath> next;

            for (const auto& path : beam) {
                bool extended = false;
                for (size_t target : graph.neighbors(path.back())) {
                    if (contains(path, target)) continue;
                    GraphPath longer = path;
                    longer.push_back(target);
                    next.push_back(std::move(longer));
                    extended = true;
                }

                if (!extended && path.size() > best.size()) {
                    best = path;
                }
            }

            std::vector<std::pair<size_t, GraphPath>> ranked;
            ranked.reserve(next.size());
            for (auto& path : next) {
                size_t score = open_edges(graph, path);
                ranked.emplace_back(score, std::move(path));
            }
            std::stable_sort(ranked.begin(), ranked.end(),
                [](const auto& a, const auto& b) { return a.first > b.first; });

            if (beam_width_ > 0 && ranked.size() > beam_width_) {
                ranked.resize(beam_width_);
            }

            beam.clear();
            for (auto& entry : ranked) {
                beam.push_back(std::move(entry.second));
            }
        }
    }

    return best;
}

/* ============================================================================
 * Exhaustive Search
 * ============================================================================ */

GraphPath ExhaustivePolicy::find_sequence(const TransitionGraph& graph) const {
    const size_t n = graph.node_count();
    std::vector<std::vector<size_t>> neighbors(n);
    for (size_t i = 0; i < n; ++i) {
        neighbors[i] = graph.neighbors(i);
    }

    GraphPath best;
    std::vector<bool> visited(n, false);

    for (size_t start = 0; start < n; ++start) {
        GraphPath path{start};
        std::vector<size_t> cursor{0};
        visited[start] = true;

        while (!path.empty()) {
            size_t node = path.back();
            size_t& next = cursor.back();

            size_t target = n;
            while (next < neighbors[node].size()) {
                size_t candidate = neighbors[node][next++];
                if (!visited[candidate]) {
                    target = candidate;
                    break;
                }
            }

            if (target < n) {
                visited[target] = true;
                path.push_back(target);
                cursor.push_back(0);
            } else {
                if (path.size() > best.size()) {
                    best = path;
                }
                visited[node] = false;
                path.pop_back();
                cursor.pop_back();
            }
        }
    }

    return best;
}

/* ============================================================================
 * Edge Resolution
 * ============================================================================ */

std::vector<TransitionEdge> resolve_edges(const TransitionGraph& graph, const GraphPath& path,
                                          const EdgeScore& score) {
    std::vector<TransitionEdge> resolved;
    if (path.size() < 2) {
        return resolved;
    }

    for (size_t node : path) {
        if (node >= graph.node_count()) {
            throw GraphPathError(fmt::format("Path references unknown node {}", node), 0);
        }
    }

    for (size_t hop = 0; hop + 1 < path.size(); ++hop) {
        const TransitionEdge* chosen = nullptr;
        double chosen_score = 0.0;

        for (const TransitionEdge* edge : graph.edges_between(path[hop], path[hop + 1])) {
            if (!resolved.empty() && edge->source_end < resolved.back().target_start) {
                continue;
            }
            double s = score ? score(*edge) : edge->source_end;
            if (!chosen || s > chosen_score) {
                chosen = edge;
                chosen_score = s;
            }
        }

        if (!chosen) {
            throw GraphPathError(fmt::format("No usable transition from {} to {}",
                graph.song(path[hop]).song_id, graph.song(path[hop + 1]).song_id), hop);
        }
        resolved.push_back(*chosen);
    }

    return resolved;
}

/* ============================================================================
 * PathSelector
 * ============================================================================ */

PathSelector::PathSelector(const TransitionGraph& graph, std::unique_ptr<PathPolicy> policy)
    : graph_(graph), policy_(policy ? std::move(policy) : std::make_unique<BeamSearchPolicy>()) {}

GraphPath PathSelector::find_sequence() const {
    GraphPath path = policy_->find_sequence(graph_);
    log::debug("{} path search: {} of {} songs", policy_->name(), path.size(), graph_.node_count());
    return path;
}

std::vector<TransitionEdge> PathSelector::resolve_edges(const GraphPath& path, const EdgeScore& score) const {
    return mixgraph::resolve_edges(graph_, path, score);
}

std::vector<std::string> PathSelector::song_ids(const GraphPath& path) const {
    std::vector<std::string> ids;
    ids.reserve(path.size());
    for (size_t node : path) {
        ids.push_back(graph_.song(node).song_id);
    }
    return ids;
}

std::unique_ptr<PathPolicy> make_path_policy(const GraphConfig& config) {
    if (config.exhaustive) {
        return std::make_unique<ExhaustivePolicy>();
    }
    return std::make_unique<BeamSearchPolicy>(config.beam_width);
}

} // namespace mixgraph
