/**
 * MixGraph - C API Implementation
 */

#include "mixgraph/mixgraph.h"
#include "../pipeline/engine.h"
#include "../core/log.h"
#include <cstring>
#include <cstdlib>

using namespace mixgraph;

/* ============================================================================
 * Internal Structures
 * ============================================================================ */

struct MixGraphEngine {
    std::unique_ptr<Engine> engine;
    std::string last_error;
    std::vector<TransitionCandidate> candidates;
};

namespace {

MixGraphError to_c_error(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidArgument:     return MIXGRAPH_ERROR_INVALID_ARGUMENT;
        case ErrorCode::MissingInput:        return MIXGRAPH_ERROR_FILE_NOT_FOUND;
        case ErrorCode::DecodeError:         return MIXGRAPH_ERROR_DECODE_FAILED;
        case ErrorCode::NoMatch:             return MIXGRAPH_ERROR_NO_MATCH;
        case ErrorCode::BeatTrackingFailure: return MIXGRAPH_ERROR_BEAT_TRACKING;
        case ErrorCode::Timeout:             return MIXGRAPH_ERROR_TIMEOUT;
        case ErrorCode::StoreError:          return MIXGRAPH_ERROR_DATABASE_ERROR;
        case ErrorCode::GraphPath:           return MIXGRAPH_ERROR_GRAPH_PATH;
        case ErrorCode::Unknown:
        default:                             return MIXGRAPH_ERROR_UNKNOWN;
    }
}

MixGraphRefineStatus to_c_status(RefineStatus status) {
    switch (status) {
        case RefineStatus::Refined:   return MIXGRAPH_REFINED;
        case RefineStatus::RoughOnly: return MIXGRAPH_ROUGH_ONLY;
        case RefineStatus::Timeout:   return MIXGRAPH_TIMED_OUT;
        case RefineStatus::NoMatch:
        default:                      return MIXGRAPH_NO_MATCH;
    }
}

} // namespace

/* ============================================================================
 * Engine Lifecycle
 * ============================================================================ */

MixGraphEngine* mixgraph_create(const char* cache_path) {
    if (!cache_path) return nullptr;

    EngineConfig config;
    config.cache_path = cache_path;

    auto handle = new MixGraphEngine();
    handle->engine = std::make_unique<Engine>(config);

    if (!handle->engine->is_valid()) {
        log::error("{}", handle->engine->error());
        delete handle;
        return nullptr;
    }

    return handle;
}

void mixgraph_destroy(MixGraphEngine* engine) {
    delete engine;
}

const char* mixgraph_get_error(MixGraphEngine* engine) {
    if (!engine) return "Invalid engine";
    return engine->last_error.c_str();
}

void mixgraph_set_log_level(MixGraphLogLevel level) {
    switch (level) {
        case MIXGRAPH_LOG_DEBUG: log::set_level(log::Level::Debug); break;
        case MIXGRAPH_LOG_INFO:  log::set_level(log::Level::Info); break;
        case MIXGRAPH_LOG_WARN:  log::set_level(log::Level::Warn); break;
        case MIXGRAPH_LOG_ERROR: log::set_level(log::Level::Error); break;
        case MIXGRAPH_LOG_OFF:
        default:                 log::set_level(log::Level::Off); break;
    }
}

/* ============================================================================
 * Matching
 * ============================================================================ */

MixGraphError mixgraph_match(
    MixGraphEngine* engine,
    const char* song_path,
    const char* mix_path,
    const char* strategy,
    MixGraphMatch* out_match
) {
    if (!engine || !engine->engine || !song_path || !mix_path || !out_match) {
        return MIXGRAPH_ERROR_INVALID_ARGUMENT;
    }

    auto result = engine->engine->analyze_pair(song_path, mix_path, strategy ? strategy : "");
    if (result.failed()) {
        engine->last_error = result.error();
        return to_c_error(result.code());
    }

    const MatchRecord& record = result.value();
    std::memset(out_match, 0, sizeof(MixGraphMatch));
    out_match->rough_start = record.rough.start_in_mix;
    out_match->rough_end = record.rough.end_in_mix;
    out_match->rough_confidence = record.rough.confidence;
    out_match->song_start = record.refined.song_start;
    out_match->song_end = record.refined.song_end;
    out_match->mix_start = record.refined.mix_start;
    out_match->mix_end = record.refined.mix_end;
    out_match->confidence = record.refined.confidence;
    out_match->status = to_c_status(record.refined.status);

    if (record.candidate) {
        out_match->has_candidate = 1;
        out_match->offset = record.candidate->offset;
        out_match->cross_in = record.candidate->cross_in;
        out_match->cross_out = record.candidate->cross_out;
    }

    return MIXGRAPH_OK;
}

/* ============================================================================
 * Set Planning
 * ============================================================================ */

MixGraphError mixgraph_add_candidate(MixGraphEngine* engine, const MixGraphCandidate* candidate) {
    if (!engine || !candidate || !candidate->song_path || !candidate->mix_path) {
        return MIXGRAPH_ERROR_INVALID_ARGUMENT;
    }
    if (!(candidate->cross_in < candidate->cross_out)) {
        engine->last_error = "Candidate requires cross_in < cross_out";
        return MIXGRAPH_ERROR_INVALID_ARGUMENT;
    }

    TransitionCandidate c;
    c.song_path = candidate->song_path;
    c.mix_path = candidate->mix_path;
    c.offset = candidate->offset;
    c.cross_in = candidate->cross_in;
    c.cross_out = candidate->cross_out;
    engine->candidates.push_back(std::move(c));
    return MIXGRAPH_OK;
}

void mixgraph_clear_candidates(MixGraphEngine* engine) {
    if (!engine) return;
    engine->candidates.clear();
}

int mixgraph_candidate_count(MixGraphEngine* engine) {
    if (!engine) return 0;
    return static_cast<int>(engine->candidates.size());
}

MixGraphError mixgraph_plan(
    MixGraphEngine* engine,
    MixGraphTransition** out_transitions,
    int* out_count
) {
    if (!engine || !engine->engine || !out_transitions || !out_count) {
        return MIXGRAPH_ERROR_INVALID_ARGUMENT;
    }

    *out_transitions = nullptr;
    *out_count = 0;

    std::vector<TransitionEdge> edges;
    try {
        edges = engine->engine->plan_set(engine->candidates);
    } catch (const GraphPathError& e) {
        engine->last_error = e.what();
        return MIXGRAPH_ERROR_GRAPH_PATH;
    }

    if (edges.empty()) {
        return MIXGRAPH_OK;
    }

    auto* transitions = new MixGraphTransition[edges.size()];
    for (size_t i = 0; i < edges.size(); ++i) {
        transitions[i].source_song = strdup(edges[i].pair.song_x.c_str());
        transitions[i].target_song = strdup(edges[i].pair.song_y.c_str());
        transitions[i].mix = strdup(edges[i].mix_id.c_str());
        transitions[i].source_end = edges[i].source_end;
        transitions[i].target_start = edges[i].target_start;
    }

    *out_transitions = transitions;
    *out_count = static_cast<int>(edges.size());
    return MIXGRAPH_OK;
}

void mixgraph_free_transitions(MixGraphTransition* transitions, int count) {
    if (!transitions) return;
    for (int i = 0; i < count; ++i) {
        free(const_cast<char*>(transitions[i].source_song));
        free(const_cast<char*>(transitions[i].target_song));
        free(const_cast<char*>(transitions[i].mix));
    }
    delete[] transitions;
}
