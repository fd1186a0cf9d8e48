/**
 * MixGraph - Main Engine Class
 */

#ifndef MIXGRAPH_ENGINE_H
#define MIXGRAPH_ENGINE_H

#include "mixgraph/types.h"
#include "../core/store.h"
#include "../analyzer/feature_extractor.h"
#include "../matcher/rough_matcher.h"
#include "../matcher/refinement.h"
#include "../graph/path_selector.h"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace mixgraph {

/**
 * Batch progress callback, called once per finished pair.
 */
using ProgressCallback = std::function<void(const std::string& song, const std::string& mix, int processed, int total)>;

struct PairRequest {
    std::string song_path;
    std::string mix_path;
};

/**
 * Main MixGraph Engine class.
 * Coordinates fingerprinting, matching, refinement and set planning.
 */
class Engine {
public:
    explicit Engine(const EngineConfig& config = EngineConfig());
    ~Engine();

    // Non-copyable
    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    /**
     * Check if engine initialized successfully.
     */
    bool is_valid() const;

    /**
     * Get last error message.
     */
    const std::string& error() const { return last_error_; }

    const EngineConfig& config() const { return config_; }

    /* ========================================================================
     * Analysis
     * ======================================================================== */

    /**
     * Fingerprint one file through the cache.
     */
    Result<Fingerprint> fingerprint(const std::string& audio_path);

    /**
     * Locate a song inside a mix.
     *
     * @param strategy Refinement strategy name; empty selects the default
     * @return MatchRecord (refined.status tells whether refinement held),
     *         or MissingInput / DecodeError / NoMatch / Timeout /
     *         InvalidArgument for an unknown strategy
     */
    Result<MatchRecord> analyze_pair(const std::string& song_path, const std::string& mix_path,
                                     const std::string& strategy = "");

    /**
     * Analyze many pairs on the worker pool. Failed pairs are logged and
     * skipped; results keep input order.
     */
    std::vector<MatchRecord> analyze_batch(const std::vector<PairRequest>& pairs,
                                           const std::string& strategy = "",
                                           ProgressCallback callback = nullptr);

    /**
     * Certainty profile of a refined match.
     */
    Result<CertaintyProfile> certainty_profile(const MatchRecord& record);

    /* ========================================================================
     * Set Planning
     * ======================================================================== */

    /**
     * Pair candidates, build the transition graph, choose a path and
     * resolve one edge per hop.
     *
     * @throws GraphPathError when a hop of the chosen path has no usable edge
     */
    std::vector<TransitionEdge> plan_set(const std::vector<TransitionCandidate>& candidates);

    /* ========================================================================
     * Strategies
     * ======================================================================== */

    /**
     * Register (or replace) a refinement strategy under its name().
     */
    void register_strategy(std::unique_ptr<RefinementStrategy> strategy);

    RefinementStrategy* strategy(const std::string& name);

    std::vector<std::string> strategy_names() const;

private:
    EngineConfig config_;
    std::unique_ptr<FingerprintStore> store_;
    std::unique_ptr<FeatureExtractor> extractor_;
    std::unique_ptr<RoughMatcher> rough_matcher_;
    std::map<std::string, std::unique_ptr<RefinementStrategy>> strategies_;

    std::string last_error_;
};

} // namespace mixgraph

#endif // MIXGRAPH_ENGINE_H
