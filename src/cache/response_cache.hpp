#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

struct sqlite3;

namespace toolcage {

struct CacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t total_requests = 0;
    double hit_rate = 0.0;  // percent
    uint64_t entries = 0;

    // hit_rate rendered as e.g. "66.7%"
    nlohmann::json to_json() const;
};

// Persistent TTL cache of model responses, keyed by a digest of the request.
// One SQLite connection shared behind a mutex.
class ResponseCache {
public:
    // Creates cache_dir if needed and opens <cache_dir>/cache.db.
    // Throws std::runtime_error on failure.
    ResponseCache(const std::string& cache_dir, uint32_t ttl_seconds);
    ~ResponseCache();

    ResponseCache(const ResponseCache&) = delete;
    ResponseCache& operator=(const ResponseCache&) = delete;

    // SHA-256 hex of the canonical {messages, model, tools} document
    static std::string make_key(const std::string& model,
                                const nlohmann::json& messages,
                                const nlohmann::json& tools);

    // Expired entries are removed and count as a miss.
    std::optional<nlohmann::json> get(const std::string& key);

    void put(const std::string& key, const nlohmann::json& value);

    CacheStats stats() const;

    uint32_t prune_expired();
    uint32_t clear();

    const std::string& db_path() const { return db_path_; }

private:
    void init_schema();
    uint64_t count_entries() const;
    void delete_key(const std::string& key);

    std::string db_path_;
    uint32_t ttl_seconds_;
    sqlite3* db_ = nullptr;
    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
    mutable std::mutex mutex_;
};

} // namespace toolcage
