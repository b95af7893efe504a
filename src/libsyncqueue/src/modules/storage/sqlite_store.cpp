#include "sqlite_store.hpp"
#include <sqlite3.h>
#include <chrono>
#include <iostream>

namespace syncqueue {

struct SqliteStore::Impl {
    sqlite3* db = nullptr;
    std::string path;

    ~Impl() {
        if (db) sqlite3_close(db);
    }

    bool exec(const std::string& sql) {
        char* err = nullptr;
        if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
            std::cerr << "[SqliteStore] SQLite error: " << (err ? err : "unknown") << std::endl;
            sqlite3_free(err);
            return false;
        }
        return true;
    }

    bool open(const std::string& db_path) {
        path = db_path;
        if (sqlite3_open(db_path.c_str(), &db) != SQLITE_OK) {
            std::cerr << "[SqliteStore] Cannot open database: "
                      << (db ? sqlite3_errmsg(db) : "out of memory") << std::endl;
            if (db) {
                sqlite3_close(db);
                db = nullptr;
            }
            return false;
        }

        // WAL keeps readers off the writer's back
        if (!exec("PRAGMA journal_mode=WAL")) {
            std::cerr << "[SqliteStore] WAL unavailable, using default journal" << std::endl;
        }

        const char* create_table_sql = R"(
            CREATE TABLE IF NOT EXISTS kv_store (
                key TEXT PRIMARY KEY NOT NULL,
                value BLOB NOT NULL,
                updated_at INTEGER NOT NULL
            );
        )";

        if (!exec(create_table_sql)) {
            sqlite3_close(db);
            db = nullptr;
            return false;
        }
        return true;
    }
};

SqliteStore::SqliteStore(const std::string& db_path) : impl_(std::make_unique<Impl>()) {
    if (impl_->open(db_path)) {
        std::cout << "[SqliteStore] Opened database at: " << db_path << std::endl;
    } else {
        warn_unavailable("open");
    }
}

SqliteStore::~SqliteStore() = default;

bool SqliteStore::available() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return impl_->db != nullptr;
}

void SqliteStore::warn_unavailable(const char* operation) {
    if (!warned_.exchange(true)) {
        std::cerr << "[SqliteStore] Storage unavailable (" << operation << "), "
                  << "running without durable queue at: " << impl_->path << std::endl;
    }
}

std::optional<SqliteStore::Bytes> SqliteStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (!impl_->db) {
        warn_unavailable("get");
        return std::nullopt;
    }

    sqlite3_stmt* stmt = nullptr;
    const char* sql = "SELECT value FROM kv_store WHERE key = ?";

    if (sqlite3_prepare_v2(impl_->db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "[SqliteStore] Failed to prepare query: "
                  << sqlite3_errmsg(impl_->db) << std::endl;
        return std::nullopt;
    }

    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_STATIC);

    std::optional<Bytes> result;
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        const void* blob = sqlite3_column_blob(stmt, 0);
        int blob_size = sqlite3_column_bytes(stmt, 0);
        Bytes value;
        if (blob && blob_size > 0) {
            value.assign(static_cast<const uint8_t*>(blob),
                         static_cast<const uint8_t*>(blob) + blob_size);
        }
        result = std::move(value);
    } else if (rc != SQLITE_DONE) {
        std::cerr << "[SqliteStore] Failed to read key " << key << ": "
                  << sqlite3_errmsg(impl_->db) << std::endl;
    }

    sqlite3_finalize(stmt);
    return result;
}

bool SqliteStore::set(const std::string& key, const Bytes& value) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (!impl_->db) {
        warn_unavailable("set");
        return false;
    }

    sqlite3_stmt* stmt = nullptr;
    const char* sql = R"(
        INSERT OR REPLACE INTO kv_store (key, value, updated_at)
        VALUES (?, ?, ?)
    )";

    if (sqlite3_prepare_v2(impl_->db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "[SqliteStore] Failed to prepare statement: "
                  << sqlite3_errmsg(impl_->db) << std::endl;
        return false;
    }

    auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_STATIC);
    // zero-length blobs bind as NULL, which the NOT NULL column rejects
    static const uint8_t empty = 0;
    sqlite3_bind_blob(stmt, 2, value.empty() ? &empty : value.data(),
                      static_cast<int>(value.size()), SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 3, now);

    bool success = sqlite3_step(stmt) == SQLITE_DONE;
    if (!success) {
        std::cerr << "[SqliteStore] Failed to write key " << key << ": "
                  << sqlite3_errmsg(impl_->db) << std::endl;
    }
    sqlite3_finalize(stmt);

    return success;
}

bool SqliteStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (!impl_->db) {
        warn_unavailable("remove");
        return false;
    }

    sqlite3_stmt* stmt = nullptr;
    const char* sql = "DELETE FROM kv_store WHERE key = ?";

    if (sqlite3_prepare_v2(impl_->db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "[SqliteStore] Failed to prepare statement: "
                  << sqlite3_errmsg(impl_->db) << std::endl;
        return false;
    }

    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_STATIC);
    bool success = sqlite3_step(stmt) == SQLITE_DONE;
    if (!success) {
        std::cerr << "[SqliteStore] Failed to delete key " << key << ": "
                  << sqlite3_errmsg(impl_->db) << std::endl;
    }
    sqlite3_finalize(stmt);

    return success;
}

DurableStorePtr make_sqlite_store(const std::string& db_path) {
    return std::make_shared<SqliteStore>(db_path);
}

} // namespace syncqueue
