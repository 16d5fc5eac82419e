#include "state/sqlite_state_store.hpp"

#include <chrono>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "utils/logging.hpp"

namespace sandcell::state {
namespace {

std::string NowIso() {
    const auto now = std::chrono::system_clock::now();
    const auto time = std::chrono::system_clock::to_time_t(now);
    std::tm utc_time{};
    gmtime_r(&time, &utc_time);
    std::ostringstream oss;
    oss << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string SafeText(const unsigned char* text) {
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

}  // namespace

SqliteStateStore::SqliteStateStore(std::filesystem::path db_path)
    : db_path_(std::move(db_path)) {
    EnsureSchema();
}

SqliteStateStore::~SqliteStateStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SqliteStateStore::Save(const std::string& session_id, const std::string& bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        throw std::runtime_error("snapshot store is not open: " + db_path_.string());
    }
    sqlite3_stmt* stmt = nullptr;
    const std::string upsert_sql =
        "INSERT INTO snapshots(session_id, bytes, updated_at) VALUES(?, ?, ?) "
        "ON CONFLICT(session_id) DO UPDATE SET bytes=excluded.bytes, updated_at=excluded.updated_at;";
    int rc = sqlite3_prepare_v2(db_, upsert_sql.c_str(), -1, &stmt, nullptr);
    if (rc == SQLITE_OK) {
        const auto updated_at = NowIso();
        sqlite3_bind_text(stmt, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_blob(stmt, 2, bytes.data(), static_cast<int>(bytes.size()), SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 3, updated_at.c_str(), -1, SQLITE_TRANSIENT);
        rc = sqlite3_step(stmt);
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(std::string("snapshot save failed: ") + sqlite3_errmsg(db_));
    }
}

std::optional<std::string> SqliteStateStore::Load(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return std::nullopt;
    }
    sqlite3_stmt* stmt = nullptr;
    const std::string sql = "SELECT bytes FROM snapshots WHERE session_id = ?;";
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    sqlite3_bind_text(stmt, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);
    std::optional<std::string> bytes;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        const auto* blob = static_cast<const char*>(sqlite3_column_blob(stmt, 0));
        const auto size = sqlite3_column_bytes(stmt, 0);
        bytes = blob ? std::string(blob, static_cast<std::size_t>(size)) : std::string();
    }
    sqlite3_finalize(stmt);
    return bytes;
}

void SqliteStateStore::Erase(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return;
    }
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "DELETE FROM snapshots WHERE session_id = ?;", -1, &stmt, nullptr) == SQLITE_OK) {
        sqlite3_bind_text(stmt, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_step(stmt);
    }
    sqlite3_finalize(stmt);
}

std::vector<std::string> SqliteStateStore::Sessions() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    if (!db_) {
        return ids;
    }
    sqlite3_stmt* stmt = nullptr;
    const std::string sql = "SELECT session_id FROM snapshots ORDER BY session_id ASC;";
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return ids;
    }
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        ids.push_back(SafeText(sqlite3_column_text(stmt, 0)));
    }
    sqlite3_finalize(stmt);
    return ids;
}

void SqliteStateStore::EnsureSchema() {
    if (db_) {
        return;
    }
    std::error_code ec;
    if (db_path_.has_parent_path()) {
        std::filesystem::create_directories(db_path_.parent_path(), ec);
    }
    if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
        utils::Log(utils::LogLevel::kError, "state", "failed to open sqlite db", {{"path", db_path_.string()}});
        sqlite3_close(db_);
        db_ = nullptr;
        return;
    }
    Exec(db_, "PRAGMA journal_mode=WAL;");
    Exec(db_, "CREATE TABLE IF NOT EXISTS snapshots ("
             "session_id TEXT PRIMARY KEY,"
             "bytes BLOB,"
             "updated_at TEXT"
             ");");
}

bool SqliteStateStore::Exec(sqlite3* db, const std::string& sql) {
    char* err = nullptr;
    const auto rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        if (err) {
            utils::Log(utils::LogLevel::kError, "state", "sqlite exec error", {{"error", err}});
            sqlite3_free(err);
        }
        return false;
    }
    return true;
}

}  // namespace sandcell::state
