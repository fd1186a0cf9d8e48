/**
 * MixGraph - Public C API
 *
 * Locates known songs inside recorded DJ mixes, collects the observed
 * song-to-song hand-offs into a transition graph and plans a set from it.
 */

#ifndef MIXGRAPH_H
#define MIXGRAPH_H

#ifdef __cplusplus
extern "C" {
#endif

#include <stdint.h>
#include <stddef.h>

/* ============================================================================
 * Types
 * ============================================================================ */

typedef struct MixGraphEngine MixGraphEngine;

typedef enum {
    MIXGRAPH_OK = 0,
    MIXGRAPH_ERROR_INVALID_ARGUMENT = -1,
    MIXGRAPH_ERROR_FILE_NOT_FOUND = -2,
    MIXGRAPH_ERROR_DECODE_FAILED = -3,
    MIXGRAPH_ERROR_NO_MATCH = -4,
    MIXGRAPH_ERROR_BEAT_TRACKING = -5,
    MIXGRAPH_ERROR_TIMEOUT = -6,
    MIXGRAPH_ERROR_DATABASE_ERROR = -7,
    MIXGRAPH_ERROR_GRAPH_PATH = -8,
    MIXGRAPH_ERROR_NOT_INITIALIZED = -9,
    MIXGRAPH_ERROR_UNKNOWN = -10,
} MixGraphError;

typedef enum {
    MIXGRAPH_LOG_DEBUG = 0,
    MIXGRAPH_LOG_INFO = 1,
    MIXGRAPH_LOG_WARN = 2,
    MIXGRAPH_LOG_ERROR = 3,
    MIXGRAPH_LOG_OFF = 4,
} MixGraphLogLevel;

typedef enum {
    MIXGRAPH_REFINED = 0,
    MIXGRAPH_ROUGH_ONLY = 1,    /* Refinement degraded to the rough estimate */
    MIXGRAPH_NO_MATCH = 2,
    MIXGRAPH_TIMED_OUT = 3,
} MixGraphRefineStatus;

/* Result of locating one song in one mix. Times in seconds. */
typedef struct {
    double rough_start;         /* Rough window in the mix */
    double rough_end;
    double rough_confidence;    /* Peak correlation score */

    double song_start;          /* Refined region */
    double song_end;
    double mix_start;
    double mix_end;
    double confidence;
    MixGraphRefineStatus status;

    int has_candidate;          /* Non-zero when the fields below are set */
    double offset;              /* mix time = song time + offset */
    double cross_in;
    double cross_out;
} MixGraphMatch;

/* One song's detected window inside one mix */
typedef struct {
    const char* song_path;
    const char* mix_path;
    double offset;
    double cross_in;
    double cross_out;
} MixGraphCandidate;

/* One resolved hand-off of a planned set; strings owned by the array */
typedef struct {
    const char* source_song;
    const char* target_song;
    const char* mix;
    double source_end;          /* Mix time the outgoing song stops */
    double target_start;        /* Mix time the incoming song starts */
} MixGraphTransition;

/* ============================================================================
 * Engine Lifecycle
 * ============================================================================ */

/**
 * Create a new engine.
 *
 * @param cache_path SQLite fingerprint cache (created if missing, ":memory:" allowed)
 * @return Engine instance, or NULL on failure
 */
MixGraphEngine* mixgraph_create(const char* cache_path);

/**
 * Destroy an engine instance and free all resources.
 */
void mixgraph_destroy(MixGraphEngine* engine);

/**
 * Get the last error message.
 */
const char* mixgraph_get_error(MixGraphEngine* engine);

/**
 * Set the process-wide log threshold (default INFO).
 */
void mixgraph_set_log_level(MixGraphLogLevel level);

/* ============================================================================
 * Matching
 * ============================================================================ */

/**
 * Locate a song inside a mix.
 *
 * @param strategy "rough", "chunk", "beat", or NULL for the default
 * @param out_match Filled on MIXGRAPH_OK
 */
MixGraphError mixgraph_match(
    MixGraphEngine* engine,
    const char* song_path,
    const char* mix_path,
    const char* strategy,
    MixGraphMatch* out_match
);

/* ============================================================================
 * Set Planning
 * ============================================================================ */

/**
 * Queue a candidate for the next plan. Requires cross_in < cross_out.
 */
MixGraphError mixgraph_add_candidate(MixGraphEngine* engine, const MixGraphCandidate* candidate);

void mixgraph_clear_candidates(MixGraphEngine* engine);

int mixgraph_candidate_count(MixGraphEngine* engine);

/**
 * Plan a set from the queued candidates.
 *
 * @param out_transitions Receives an array to release with mixgraph_free_transitions
 * @param out_count Number of transitions (0 when no hand-off was found)
 * @return MIXGRAPH_ERROR_GRAPH_PATH when a hop of the chosen path has no usable edge
 */
MixGraphError mixgraph_plan(
    MixGraphEngine* engine,
    MixGraphTransition** out_transitions,
    int* out_count
);

void mixgraph_free_transitions(MixGraphTransition* transitions, int count);

#ifdef __cplusplus
}
#endif

#endif /* MIXGRAPH_H */
