#pragma once

#include <mutex>
#include <string>
#include <vector>

struct sqlite3;

namespace bucket_sync::agent {

struct AuditEntry {
    std::string log_key;
    std::string kind;
    std::string logged_at;
    std::string document;
};

// Append-only store of request and summary documents per upload.
class AuditLog {
public:
    explicit AuditLog(const std::string& database_path);
    ~AuditLog();

    AuditLog(const AuditLog&) = delete;
    AuditLog& operator=(const AuditLog&) = delete;

    void initialize_schema();

    // Throws std::runtime_error when the row cannot be written.
    void append(const std::string& upload_id,
                const std::string& log_key,
                const std::string& kind,
                const std::string& logged_at,
                const std::string& document);

    // Insertion order.
    std::vector<AuditEntry> entries(const std::string& upload_id) const;

private:
    sqlite3* db_{};
    mutable std::mutex mutex_;
};

}  // namespace bucket_sync::agent
