/**
 * MixGraph - Fingerprint Store Implementation
 */

#include "store.h"
#include "utils.h"
#include "log.h"
#include <cstring>
#include <filesystem>

namespace mixgraph {

FingerprintStore::FingerprintStore(const std::string& db_path) {
    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        last_error_ = sqlite3_errmsg(db_);
        sqlite3_close(db_);
        db_ = nullptr;
        return;
    }

    // Enable WAL mode for better concurrency
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);

    init_schema();
}

FingerprintStore::~FingerprintStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void FingerprintStore::init_schema() {
    const char* schema = R"(
        CREATE TABLE IF NOT EXISTS fingerprints (
            cache_key TEXT PRIMARY KEY NOT NULL,
            source_path TEXT NOT NULL,
            sample_rate INTEGER NOT NULL,
            hop_length INTEGER NOT NULL,
            channels INTEGER NOT NULL,
            frames INTEGER NOT NULL,
            features BLOB,
            created_at INTEGER DEFAULT 0
        );

        CREATE INDEX IF NOT EXISTS idx_fingerprints_source ON fingerprints(source_path);
    )";

    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, schema, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        last_error_ = err_msg ? err_msg : "Failed to create schema";
        sqlite3_free(err_msg);
        log::error("fingerprint store schema: {}", last_error_);
    }
}

std::vector<uint8_t> FingerprintStore::serialize_floats(const std::vector<float>& data) {
    std::vector<uint8_t> result(data.size() * sizeof(float));
    if (!result.empty()) {
        std::memcpy(result.data(), data.data(), result.size());
    }
    return result;
}

std::vector<float> FingerprintStore::deserialize_floats(const void* data, int size) {
    if (!data || size <= 0) return {};

    size_t count = size / sizeof(float);
    std::vector<float> result(count);
    std::memcpy(result.data(), data, count * sizeof(float));
    return result;
}

Result<int64_t> FingerprintStore::upsert_fingerprint(const Fingerprint& fingerprint) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return ResultError{ErrorCode::StoreError, "Database not open"};
    if (fingerprint.cache_key.empty()) {
        return ResultError{ErrorCode::InvalidArgument, "Fingerprint has no cache key"};
    }

    const char* sql = R"(
        INSERT INTO fingerprints (cache_key, source_path, sample_rate, hop_length, channels, frames, features, created_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(cache_key) DO UPDATE SET
            source_path = excluded.source_path,
            sample_rate = excluded.sample_rate,
            hop_length = excluded.hop_length,
            channels = excluded.channels,
            frames = excluded.frames,
            features = excluded.features,
            created_at = excluded.created_at
    )";

    sqlite3_stmt* stmt;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return ResultError{ErrorCode::StoreError, std::string("Prepare failed: ") + sqlite3_errmsg(db_)};
    }

    auto features = serialize_floats(fingerprint.features.data);

    sqlite3_bind_text(stmt, 1, fingerprint.cache_key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, fingerprint.source_path.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 3, fingerprint.sample_rate);
    sqlite3_bind_int(stmt, 4, fingerprint.hop_length);
    sqlite3_bind_int(stmt, 5, fingerprint.features.channels);
    sqlite3_bind_int64(stmt, 6, static_cast<sqlite3_int64>(fingerprint.features.frames));
    sqlite3_bind_blob(stmt, 7, features.data(), static_cast<int>(features.size()), SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 8, utils::current_timestamp());

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return ResultError{ErrorCode::StoreError, std::string("Insert failed: ") + sqlite3_errmsg(db_)};
    }

    return static_cast<int64_t>(sqlite3_last_insert_rowid(db_));
}

std::optional<Fingerprint> FingerprintStore::get_fingerprint(const std::string& cache_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return std::nullopt;

    const char* sql = "SELECT cache_key, source_path, sample_rate, hop_length, channels, frames, features "
                      "FROM fingerprints WHERE cache_key = ?";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }

    sqlite3_bind_text(stmt, 1, cache_key.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<Fingerprint> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        Fingerprint fp;
        fp.cache_key = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        const char* source = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
        fp.source_path = source ? source : "";
        fp.sample_rate = sqlite3_column_int(stmt, 2);
        fp.hop_length = sqlite3_column_int(stmt, 3);
        fp.features.channels = sqlite3_column_int(stmt, 4);
        fp.features.frames = static_cast<size_t>(sqlite3_column_int64(stmt, 5));
        fp.features.data = deserialize_floats(sqlite3_column_blob(stmt, 6), sqlite3_column_bytes(stmt, 6));

        // A truncated blob is treated as a miss
        if (fp.features.data.size() == static_cast<size_t>(fp.features.channels) * fp.features.frames) {
            result = std::move(fp);
        } else {
            log::warn("discarding corrupt cache entry {}", cache_key);
        }
    }

    sqlite3_finalize(stmt);
    return result;
}

bool FingerprintStore::contains(const std::string& cache_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return false;

    const char* sql = "SELECT 1 FROM fingerprints WHERE cache_key = ?";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }

    sqlite3_bind_text(stmt, 1, cache_key.c_str(), -1, SQLITE_TRANSIENT);
    bool found = sqlite3_step(stmt) == SQLITE_ROW;
    sqlite3_finalize(stmt);
    return found;
}

int FingerprintStore::get_fingerprint_count() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return 0;

    const char* sql = "SELECT COUNT(*) FROM fingerprints";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }

    int count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int(stmt, 0);
    }

    sqlite3_finalize(stmt);
    return count;
}

bool FingerprintStore::delete_fingerprint(const std::string& cache_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return false;

    const char* sql = "DELETE FROM fingerprints WHERE cache_key = ?";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }

    sqlite3_bind_text(stmt, 1, cache_key.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    return rc == SQLITE_DONE;
}

int FingerprintStore::cleanup_missing_files() {
    std::vector<std::string> stale;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!db_) return 0;

        const char* sql = "SELECT cache_key, source_path FROM fingerprints";
        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return 0;
        }

        while (sqlite3_step(stmt) == SQLITE_ROW) {
            const char* key = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
            const char* path = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
            if (key && path && !utils::file_exists(path)) {
                stale.emplace_back(key);
            }
        }
        sqlite3_finalize(stmt);
    }

    int removed = 0;
    for (const auto& key : stale) {
        if (delete_fingerprint(key)) {
            removed++;
        }
    }

    if (removed > 0) {
        log::info("removed {} cache entries for missing files", removed);
    }
    return removed;
}

} // namespace mixgraph
