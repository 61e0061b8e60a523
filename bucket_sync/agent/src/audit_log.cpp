#include "audit_log.hpp"

#include <filesystem>
#include <stdexcept>

#include <sqlite3.h>

namespace bucket_sync::agent {

namespace {

std::string column_text(sqlite3_stmt* stmt, int column) {
    const auto* text = sqlite3_column_text(stmt, column);
    return text ? reinterpret_cast<const char*>(text) : std::string{};
}

}  // namespace

AuditLog::AuditLog(const std::string& database_path) {
    const auto parent = std::filesystem::path(database_path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }
    if (sqlite3_open(database_path.c_str(), &db_) != SQLITE_OK) {
        const std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open audit database " + database_path + ": " + msg);
    }
    sqlite3_busy_timeout(db_, 5000);
}

AuditLog::~AuditLog() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void AuditLog::initialize_schema() {
    const char* ddl = R"SQL(
        CREATE TABLE IF NOT EXISTS audit_events (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            upload_id TEXT NOT NULL,
            log_key TEXT NOT NULL,
            kind TEXT NOT NULL,
            logged_at TEXT NOT NULL,
            document TEXT NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_audit_events_upload ON audit_events(upload_id);
    )SQL";

    std::lock_guard<std::mutex> lock(mutex_);
    char* err = nullptr;
    if (sqlite3_exec(db_, ddl, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw std::runtime_error("Failed to initialize audit log: " + msg);
    }
}

void AuditLog::append(const std::string& upload_id,
                      const std::string& log_key,
                      const std::string& kind,
                      const std::string& logged_at,
                      const std::string& document) {
    const char* sql = R"SQL(
        INSERT INTO audit_events(upload_id, log_key, kind, logged_at, document)
        VALUES(?,?,?,?,?)
    )SQL";

    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("Failed to prepare audit insert: ") + sqlite3_errmsg(db_));
    }
    sqlite3_bind_text(stmt, 1, upload_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, log_key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, kind.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, logged_at.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 5, document.c_str(), -1, SQLITE_TRANSIENT);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(std::string("Failed to write audit entry: ") + sqlite3_errmsg(db_));
    }
}

std::vector<AuditEntry> AuditLog::entries(const std::string& upload_id) const {
    const char* sql = R"SQL(
        SELECT log_key,kind,logged_at,document FROM audit_events
        WHERE upload_id=?
        ORDER BY id
    )SQL";

    std::lock_guard<std::mutex> lock(mutex_);
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("Failed to query audit log: ") + sqlite3_errmsg(db_));
    }
    sqlite3_bind_text(stmt, 1, upload_id.c_str(), -1, SQLITE_TRANSIENT);

    std::vector<AuditEntry> out;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        out.push_back(AuditEntry{column_text(stmt, 0), column_text(stmt, 1), column_text(stmt, 2),
                                 column_text(stmt, 3)});
    }
    sqlite3_finalize(stmt);
    return out;
}

}  // namespace bucket_sync::agent
