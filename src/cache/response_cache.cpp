#include "response_cache.hpp"
#include "../util.hpp"
#include <sqlite3.h>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace toolcage {

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

nlohmann::json CacheStats::to_json() const {
    char rate[32];
    std::snprintf(rate, sizeof(rate), "%.1f%%", hit_rate);
    return {
        {"hits", hits},
        {"misses", misses},
        {"total_requests", total_requests},
        {"hit_rate", std::string(rate)},
        {"entries", entries},
    };
}

ResponseCache::ResponseCache(const std::string& cache_dir, uint32_t ttl_seconds)
    : ttl_seconds_(ttl_seconds) {
    std::error_code ec;
    std::filesystem::create_directories(cache_dir, ec);
    if (ec) {
        throw std::runtime_error("ResponseCache: cannot create " + cache_dir + ": " +
                                 ec.message());
    }
    db_path_ = (std::filesystem::path(cache_dir) / "cache.db").string();

    if (sqlite3_open(db_path_.c_str(), &db_) != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw std::runtime_error("ResponseCache: failed to open database: " + err);
    }

    sqlite3_busy_timeout(db_, 5000);
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);

    init_schema();
}

ResponseCache::~ResponseCache() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void ResponseCache::init_schema() {
    const char* create_table =
        "CREATE TABLE IF NOT EXISTS cache ("
        "  key   TEXT PRIMARY KEY,"
        "  value TEXT NOT NULL,"
        "  ts    REAL NOT NULL"
        ");";
    char* errmsg = nullptr;
    if (sqlite3_exec(db_, create_table, nullptr, nullptr, &errmsg) != SQLITE_OK) {
        std::string err = errmsg ? errmsg : "unknown error";
        sqlite3_free(errmsg);
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("ResponseCache: failed to create schema: " + err);
    }
}

std::string ResponseCache::make_key(const std::string& model,
                                    const nlohmann::json& messages,
                                    const nlohmann::json& tools) {
    // nlohmann::json objects iterate in key order, so dump() is canonical
    nlohmann::json doc = {
        {"model", model},
        {"messages", messages},
        {"tools", tools},
    };
    return sha256_hex(doc.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

void ResponseCache::delete_key(const std::string& key) {
    StmtGuard g;
    const char* sql = "DELETE FROM cache WHERE key = ?;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) return;
    sqlite3_bind_text(g.stmt, 1, key.c_str(), -1, SQLITE_STATIC);
    sqlite3_step(g.stmt);
}

std::optional<nlohmann::json> ResponseCache::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    const char* sql = "SELECT value, ts FROM cache WHERE key = ?;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        ++misses_;
        return std::nullopt;
    }
    sqlite3_bind_text(g.stmt, 1, key.c_str(), -1, SQLITE_STATIC);

    if (sqlite3_step(g.stmt) != SQLITE_ROW) {
        ++misses_;
        return std::nullopt;
    }

    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(g.stmt, 0));
    std::string value = text ? text : "";
    double ts = sqlite3_column_double(g.stmt, 1);
    sqlite3_finalize(g.stmt);
    g.stmt = nullptr;

    if (epoch_seconds_precise() - ts > static_cast<double>(ttl_seconds_)) {
        delete_key(key);
        ++misses_;
        return std::nullopt;
    }

    nlohmann::json parsed = nlohmann::json::parse(value, nullptr, false);
    if (parsed.is_discarded()) {
        std::cerr << "[cache] Dropping unreadable entry " << key << "\n";
        delete_key(key);
        ++misses_;
        return std::nullopt;
    }

    ++hits_;
    return parsed;
}

void ResponseCache::put(const std::string& key, const nlohmann::json& value) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    const char* sql = "INSERT OR REPLACE INTO cache (key, value, ts) VALUES (?, ?, ?);";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        std::cerr << "[cache] Write failed: " << sqlite3_errmsg(db_) << "\n";
        return;
    }
    std::string serialized =
        value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    sqlite3_bind_text(g.stmt, 1, key.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 2, serialized.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_double(g.stmt, 3, epoch_seconds_precise());
    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        std::cerr << "[cache] Write failed: " << sqlite3_errmsg(db_) << "\n";
    }
}

uint64_t ResponseCache::count_entries() const {
    StmtGuard g;
    const char* sql = "SELECT COUNT(*) FROM cache;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) return 0;
    if (sqlite3_step(g.stmt) != SQLITE_ROW) return 0;
    return static_cast<uint64_t>(sqlite3_column_int64(g.stmt, 0));
}

CacheStats ResponseCache::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    CacheStats s;
    s.hits = hits_;
    s.misses = misses_;
    s.total_requests = hits_ + misses_;
    s.hit_rate = s.total_requests > 0
        ? 100.0 * static_cast<double>(hits_) / static_cast<double>(s.total_requests)
        : 0.0;
    s.entries = count_entries();
    return s;
}

uint32_t ResponseCache::prune_expired() {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    const char* sql = "DELETE FROM cache WHERE ts < ?;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) return 0;
    sqlite3_bind_double(g.stmt, 1, epoch_seconds_precise() - ttl_seconds_);
    if (sqlite3_step(g.stmt) != SQLITE_DONE) return 0;

    auto removed = static_cast<uint32_t>(sqlite3_changes(db_));
    std::cerr << "[cache] Pruned " << removed << " expired entries\n";
    return removed;
}

uint32_t ResponseCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    if (sqlite3_prepare_v2(db_, "DELETE FROM cache;", -1, &g.stmt, nullptr) != SQLITE_OK) {
        return 0;
    }
    if (sqlite3_step(g.stmt) != SQLITE_DONE) return 0;

    auto removed = static_cast<uint32_t>(sqlite3_changes(db_));
    std::cerr << "[cache] Cleared " << removed << " entries\n";
    return removed;
}

} // namespace toolcage
