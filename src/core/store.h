/**
 * MixGraph - Fingerprint Store
 */

#ifndef MIXGRAPH_STORE_H
#define MIXGRAPH_STORE_H

#include "mixgraph/types.h"
#include <sqlite3.h>
#include <string>
#include <vector>
#include <optional>
#include <mutex>

namespace mixgraph {

/**
 * SQLite-backed fingerprint cache.
 *
 * Entries are keyed by a content hash of the source audio combined with the
 * processing parameters, so two files sharing a name never collide and a
 * change of hop length or sample rate never returns stale features.
 * All access is serialized; one store may be shared by worker threads.
 */
class FingerprintStore {
public:
    explicit FingerprintStore(const std::string& db_path);
    ~FingerprintStore();

    // Non-copyable
    FingerprintStore(const FingerprintStore&) = delete;
    FingerprintStore& operator=(const FingerprintStore&) = delete;

    bool is_open() const { return db_ != nullptr; }
    const std::string& error() const { return last_error_; }

    /**
     * Insert or replace a fingerprint under its cache_key.
     */
    Result<int64_t> upsert_fingerprint(const Fingerprint& fingerprint);

    /**
     * Get a fingerprint by cache key.
     */
    std::optional<Fingerprint> get_fingerprint(const std::string& cache_key);

    bool contains(const std::string& cache_key);

    int get_fingerprint_count();

    bool delete_fingerprint(const std::string& cache_key);

    /**
     * Remove entries whose source files no longer exist.
     */
    int cleanup_missing_files();

private:
    void init_schema();

    std::vector<uint8_t> serialize_floats(const std::vector<float>& data);
    std::vector<float> deserialize_floats(const void* data, int size);

    sqlite3* db_ = nullptr;
    std::string last_error_;
    std::mutex mutex_;
};

} // namespace mixgraph

#endif // MIXGRAPH_STORE_H
