#include "database.hpp"
#include "utils/logger.hpp"
#include <filesystem>

namespace jukebox {

namespace {

std::string column_text(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

} // namespace

Database::Database(ClockFn clock) : clock_(std::move(clock)) {}

Database::~Database() {
    close();
}

bool Database::initialize(const std::string& db_path) {
    std::lock_guard<std::mutex> lock(db_mutex_);

    // Create data directory if it doesn't exist
    std::filesystem::path path(db_path);
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            log_error("Cannot create database directory " + path.parent_path().string() + ": " + ec.message());
            return false;
        }
    }

    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        log_error(std::string("Cannot open database: ") + sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    // WAL keeps readers off the writer's back
    execute("PRAGMA journal_mode = WAL;");

    if (!create_tables()) {
        log_error("Failed to create tables");
        return false;
    }

    log_info("Database initialized at " + db_path);
    return true;
}

void Database::close() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool Database::create_tables() {
    const char* sql = R"(
        -- Plain string values, optionally expiring
        CREATE TABLE IF NOT EXISTS kv (
            key TEXT PRIMARY KEY,
            value TEXT NOT NULL,
            expires_at INTEGER
        );
        CREATE INDEX IF NOT EXISTS idx_kv_expires ON kv(expires_at);

        -- Hash fields
        CREATE TABLE IF NOT EXISTS hashes (
            key TEXT NOT NULL,
            field TEXT NOT NULL,
            value TEXT NOT NULL,
            PRIMARY KEY (key, field)
        );

        -- Set members
        CREATE TABLE IF NOT EXISTS sets (
            key TEXT NOT NULL,
            member TEXT NOT NULL,
            PRIMARY KEY (key, member)
        );
    )";

    return execute(sql);
}

bool Database::execute(const std::string& sql) {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        log_error(std::string("SQL error: ") + (error_msg ? error_msg : "unknown"));
        sqlite3_free(error_msg);
        return false;
    }
    return true;
}

int64_t Database::now_ms() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(clock_().time_since_epoch()).count();
}

int Database::purge_expired() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return 0;

    sqlite3_stmt* stmt;
    const char* sql = "DELETE FROM kv WHERE expires_at IS NOT NULL AND expires_at <= ?";
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }

    sqlite3_bind_int64(stmt, 1, now_ms());
    sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    return sqlite3_changes(db_);
}

// ==================== Strings ====================

std::optional<std::string> Database::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return std::nullopt;

    sqlite3_stmt* stmt;
    const char* sql = "SELECT value, expires_at FROM kv WHERE key = ?";
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }

    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<std::string> result;
    bool expired = false;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        if (sqlite3_column_type(stmt, 1) != SQLITE_NULL && sqlite3_column_int64(stmt, 1) <= now_ms()) {
            expired = true;
        } else {
            result = column_text(stmt, 0);
        }
    }
    sqlite3_finalize(stmt);

    if (expired) {
        // Lazy expiry
        sqlite3_stmt* del_stmt;
        if (sqlite3_prepare_v2(db_, "DELETE FROM kv WHERE key = ?", -1, &del_stmt, nullptr) == SQLITE_OK) {
            sqlite3_bind_text(del_stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_step(del_stmt);
            sqlite3_finalize(del_stmt);
        }
    }

    return result;
}

bool Database::set(const std::string& key, const std::string& value, std::optional<std::chrono::seconds> ttl) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return false;

    const char* sql = R"(
        INSERT INTO kv (key, value, expires_at)
        VALUES (?, ?, ?)
        ON CONFLICT(key) DO UPDATE SET value = excluded.value, expires_at = excluded.expires_at
    )";

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }

    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, value.c_str(), -1, SQLITE_TRANSIENT);
    if (ttl) {
        auto ttl_ms = std::chrono::duration_cast<std::chrono::milliseconds>(*ttl).count();
        sqlite3_bind_int64(stmt, 3, now_ms() + ttl_ms);
    } else {
        sqlite3_bind_null(stmt, 3);
    }

    bool success = sqlite3_step(stmt) == SQLITE_DONE;
    sqlite3_finalize(stmt);
    return success;
}

bool Database::del(const std::string& key) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return false;

    bool success = true;
    for (const char* sql : {"DELETE FROM kv WHERE key = ?",
                            "DELETE FROM hashes WHERE key = ?",
                            "DELETE FROM sets WHERE key = ?"}) {
        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            success = false;
            continue;
        }
        sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
        success = sqlite3_step(stmt) == SQLITE_DONE && success;
        sqlite3_finalize(stmt);
    }
    return success;
}

bool Database::exists(const std::string& key) {
    return get(key).has_value();
}

// ==================== Hashes ====================

bool Database::hset(const std::string& key, const std::string& field, const std::string& value) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return false;

    const char* sql = R"(
        INSERT INTO hashes (key, field, value)
        VALUES (?, ?, ?)
        ON CONFLICT(key, field) DO UPDATE SET value = excluded.value
    )";

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }

    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, field.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, value.c_str(), -1, SQLITE_TRANSIENT);

    bool success = sqlite3_step(stmt) == SQLITE_DONE;
    sqlite3_finalize(stmt);
    return success;
}

std::optional<std::string> Database::hget(const std::string& key, const std::string& field) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return std::nullopt;

    sqlite3_stmt* stmt;
    const char* sql = "SELECT value FROM hashes WHERE key = ? AND field = ?";
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }

    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, field.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<std::string> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = column_text(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return result;
}

std::map<std::string, std::string> Database::hgetall(const std::string& key) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    std::map<std::string, std::string> result;
    if (!db_) return result;

    sqlite3_stmt* stmt;
    const char* sql = "SELECT field, value FROM hashes WHERE key = ?";
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return result;
    }

    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        result[column_text(stmt, 0)] = column_text(stmt, 1);
    }
    sqlite3_finalize(stmt);
    return result;
}

// ==================== Sets ====================

bool Database::sadd(const std::string& key, const std::string& member) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return false;

    sqlite3_stmt* stmt;
    const char* sql = "INSERT OR IGNORE INTO sets (key, member) VALUES (?, ?)";
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }

    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, member.c_str(), -1, SQLITE_TRANSIENT);

    bool success = sqlite3_step(stmt) == SQLITE_DONE;
    sqlite3_finalize(stmt);
    return success;
}

std::vector<std::string> Database::smembers(const std::string& key) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    std::vector<std::string> members;
    if (!db_) return members;

    sqlite3_stmt* stmt;
    const char* sql = "SELECT member FROM sets WHERE key = ? ORDER BY member";
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return members;
    }

    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        members.push_back(column_text(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return members;
}

bool Database::srem(const std::string& key, const std::string& member) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return false;

    sqlite3_stmt* stmt;
    const char* sql = "DELETE FROM sets WHERE key = ? AND member = ?";
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }

    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, member.c_str(), -1, SQLITE_TRANSIENT);

    bool success = sqlite3_step(stmt) == SQLITE_DONE;
    sqlite3_finalize(stmt);
    return success;
}

} // namespace jukebox
