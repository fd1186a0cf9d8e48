/**
 * MixGraph - Main Engine Implementation
 */

#include "engine.h"
#include "../matcher/chunk_isometry.h"
#include "../matcher/beat_aligner.h"
#include "../graph/pairing.h"
#include "../graph/transition_graph.h"
#include "../core/utils.h"
#include "../core/log.h"
#include <algorithm>
#include <atomic>
#include <mutex>
#include <optional>
#include <thread>

namespace mixgraph {

Engine::Engine(const EngineConfig& config)
    : config_(config)
    , store_(std::make_unique<FingerprintStore>(config.cache_path)) {

    if (!store_->is_open()) {
        last_error_ = "Failed to open fingerprint cache: " + store_->error();
        return;
    }

    extractor_ = std::make_unique<FeatureExtractor>(config_.fingerprint, store_.get());
    rough_matcher_ = std::make_unique<RoughMatcher>(config_.rough, config_.budget);

    register_strategy(std::make_unique<RoughOnlyStrategy>());
    register_strategy(std::make_unique<ChunkIsometryRefiner>(config_.chunk, config_.budget));
    register_strategy(std::make_unique<BeatAligner>(config_.beat, config_.budget));
}

Engine::~Engine() = default;

bool Engine::is_valid() const {
    return store_ && store_->is_open();
}

void Engine::register_strategy(std::unique_ptr<RefinementStrategy> strategy) {
    if (!strategy) return;
    std::string name = strategy->name();
    strategies_[name] = std::move(strategy);
}

RefinementStrategy* Engine::strategy(const std::string& name) {
    auto it = strategies_.find(name.empty() ? config_.default_strategy : name);
    return it == strategies_.end() ? nullptr : it->second.get();
}

std::vector<std::string> Engine::strategy_names() const {
    std::vector<std::string> names;
    for (const auto& [name, strategy] : strategies_) {
        names.push_back(name);
    }
    return names;
}

Result<Fingerprint> Engine::fingerprint(const std::string& audio_path) {
    if (!is_valid()) {
        return ResultError{ErrorCode::StoreError, "Engine not initialized"};
    }
    return extractor_->compute_fingerprint(audio_path);
}

Result<MatchRecord> Engine::analyze_pair(const std::string& song_path, const std::string& mix_path,
                                         const std::string& strategy_name) {
    if (!is_valid()) {
        return ResultError{ErrorCode::StoreError, "Engine not initialized"};
    }
    if (song_path.empty() || mix_path.empty()) {
        return ResultError{ErrorCode::InvalidArgument, "Song and mix paths are required"};
    }

    RefinementStrategy* refiner = strategy(strategy_name);
    if (!refiner) {
        return ResultError{ErrorCode::InvalidArgument, "Unknown refinement strategy: " + strategy_name};
    }

    utils::Deadline deadline(config_.budget.time_budget_seconds);

    auto song = extractor_->compute_fingerprint(song_path);
    if (song.failed()) {
        return song.error_info();
    }
    auto mix = extractor_->compute_fingerprint(mix_path);
    if (mix.failed()) {
        return mix.error_info();
    }

    auto rough = rough_matcher_->match(song.value(), mix.value(), deadline);
    if (rough.failed()) {
        return rough.error_info();
    }

    MatchRecord record;
    record.song_path = song_path;
    record.mix_path = mix_path;
    record.rough = rough.value();
    record.refined = refiner->refine(song.value(), mix.value(), record.rough, deadline);
    record.candidate = make_candidate(record.refined, song_path, mix_path);

    if (record.refined.status == RefineStatus::Timeout) {
        return ResultError{ErrorCode::Timeout, "Refinement exceeded budget: " + song_path};
    }

    log::info("{} in {}: {:.2f}s - {:.2f}s ({}, {})",
        song_path, mix_path, record.refined.mix_start, record.refined.mix_end,
        refiner->name(), refine_status_name(record.refined.status));
    return record;
}

std::vector<MatchRecord> Engine::analyze_batch(const std::vector<PairRequest>& pairs,
                                               const std::string& strategy_name,
                                               ProgressCallback callback) {
    std::vector<std::optional<MatchRecord>> slots(pairs.size());
    if (pairs.empty()) {
        return {};
    }

    size_t workers = config_.worker_threads > 0
        ? static_cast<size_t>(config_.worker_threads)
        : std::max(1u, std::thread::hardware_concurrency());
    workers = std::min(workers, pairs.size());

    std::atomic<size_t> next{0};
    std::atomic<int> processed{0};
    std::mutex callback_mutex;
    const int total = static_cast<int>(pairs.size());

    auto worker = [&]() {
        for (size_t i = next.fetch_add(1); i < pairs.size(); i = next.fetch_add(1)) {
            const auto& pair = pairs[i];
            auto result = analyze_pair(pair.song_path, pair.mix_path, strategy_name);
            if (result.ok()) {
                slots[i] = std::move(result.value());
            } else {
                log::warn("skipping {} in {}: {} ({})", pair.song_path, pair.mix_path,
                    result.error(), error_code_name(result.code()));
            }

            int done = ++processed;
            if (callback) {
                std::lock_guard<std::mutex> lock(callback_mutex);
                callback(pair.song_path, pair.mix_path, done, total);
            }
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(workers);
    for (size_t t = 0; t < workers; ++t) {
        threads.emplace_back(worker);
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::vector<MatchRecord> records;
    for (auto& slot : slots) {
        if (slot) records.push_back(std::move(*slot));
    }
    log::info("batch: {} of {} pairs matched", records.size(), pairs.size());
    return records;
}

Result<CertaintyProfile> Engine::certainty_profile(const MatchRecord& record) {
    if (!is_valid()) {
        return ResultError{ErrorCode::StoreError, "Engine not initialized"};
    }
    if (!record.refined.usable()) {
        return ResultError{ErrorCode::NoMatch, "Match has no aligned region"};
    }

    auto song = extractor_->compute_fingerprint(record.song_path);
    if (song.failed()) {
        return song.error_info();
    }
    auto mix = extractor_->compute_fingerprint(record.mix_path);
    if (mix.failed()) {
        return mix.error_info();
    }

    ChunkIsometryRefiner refiner(config_.chunk, config_.budget);
    return refiner.certainty_profile(song.value(), mix.value(), record.refined);
}

std::vector<TransitionEdge> Engine::plan_set(const std::vector<TransitionCandidate>& candidates) {
    auto pairs = pair_transitions(candidates, config_.pairing);
    TransitionGraph graph = build_graph(pairs, config_.graph.crossfade_length);
    log::info("transition graph: {} songs, {} transitions", graph.node_count(), graph.edge_count());

    PathSelector selector(graph, make_path_policy(config_.graph));
    GraphPath path = selector.find_sequence();
    return selector.resolve_edges(path);
}

} // namespace mixgraph
