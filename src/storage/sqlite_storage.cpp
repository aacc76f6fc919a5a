#include "sqlite_storage.hpp"
#include "../plugin.hpp"
#include <sqlite3.h>
#include <filesystem>
#include <stdexcept>

static memocache::StorageRegistrar reg_sqlite("sqlite",
    [](const memocache::Config& config) {
        return std::make_unique<memocache::SqliteStorage>(config.resolved_storage_path());
    });

namespace memocache {

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

static nlohmann::json column_json(sqlite3_stmt* stmt, int col, const std::string& key) {
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    try {
        return nlohmann::json::parse(text ? text : "null");
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("SqliteStorage: corrupt value for key " + key + ": " + e.what());
    }
}

SqliteStorage::SqliteStorage(const std::string& path) : path_(path) {
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }

    if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw std::runtime_error("SqliteStorage: failed to open database: " + err);
    }

    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);

    init_schema();
}

SqliteStorage::~SqliteStorage() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SqliteStorage::fail(const std::string& what) const {
    throw std::runtime_error("SqliteStorage: " + what + ": " + sqlite3_errmsg(db_));
}

void SqliteStorage::init_schema() {
    const char* create_table =
        "CREATE TABLE IF NOT EXISTS memocache_store ("
        "  key   TEXT PRIMARY KEY,"
        "  value TEXT NOT NULL"
        ");";
    char* err = nullptr;
    if (sqlite3_exec(db_, create_table, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("SqliteStorage: failed to create schema: " + msg);
    }
}

nlohmann::json SqliteStorage::save(const std::string& key, const nlohmann::json& value,
                                   const Args&) {
    std::string text = value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

    StmtGuard g;
    const char* sql = "INSERT OR REPLACE INTO memocache_store (key, value) VALUES (?, ?);";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) fail("prepare save");
    sqlite3_bind_text(g.stmt, 1, key.c_str(), static_cast<int>(key.size()), SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 2, text.c_str(), -1, SQLITE_STATIC);
    if (sqlite3_step(g.stmt) != SQLITE_DONE) fail("save");
    return value;
}

Cached SqliteStorage::retrieve(const std::string& key, const Args&) {
    StmtGuard g;
    const char* sql = "SELECT value FROM memocache_store WHERE key = ?;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) fail("prepare retrieve");
    sqlite3_bind_text(g.stmt, 1, key.c_str(), static_cast<int>(key.size()), SQLITE_STATIC);

    int rc = sqlite3_step(g.stmt);
    if (rc == SQLITE_DONE) return not_cached;
    if (rc != SQLITE_ROW) fail("retrieve");
    return column_json(g.stmt, 0, key);
}

Cached SqliteStorage::remove(const std::string& key, const Args& args) {
    Cached removed = retrieve(key, args);
    if (!removed) return not_cached;

    StmtGuard g;
    const char* sql = "DELETE FROM memocache_store WHERE key = ?;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) fail("prepare remove");
    sqlite3_bind_text(g.stmt, 1, key.c_str(), static_cast<int>(key.size()), SQLITE_STATIC);
    if (sqlite3_step(g.stmt) != SQLITE_DONE) fail("remove");
    return removed;
}

void SqliteStorage::empty() {
    if (sqlite3_exec(db_, "DELETE FROM memocache_store;", nullptr, nullptr, nullptr) != SQLITE_OK) {
        fail("empty");
    }
}

StoreContents SqliteStorage::contents() const {
    StmtGuard g;
    const char* sql = "SELECT key, value FROM memocache_store;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) fail("prepare contents");

    StoreContents out;
    while (sqlite3_step(g.stmt) == SQLITE_ROW) {
        const auto* k = reinterpret_cast<const char*>(sqlite3_column_text(g.stmt, 0));
        std::string key = k ? std::string(k, static_cast<size_t>(sqlite3_column_bytes(g.stmt, 0)))
                            : std::string();
        out.emplace(key, column_json(g.stmt, 1, key));
    }
    return out;
}

} // namespace memocache
