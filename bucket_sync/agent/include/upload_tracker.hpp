#pragma once

#include "audit_log.hpp"
#include "logger.hpp"
#include "models.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace bucket_sync::agent {

struct TrackerOptions {
    // Empty: state kept in memory only.
    std::filesystem::path state_file;
    // Empty: no audit log. Otherwise the audit database is log_dir/audit.db.
    std::filesystem::path log_dir;
};

// Owns every UploadState. One lock guards the map and the state file; the
// file is rewritten in full after each mutation.
class UploadTracker {
public:
    UploadTracker(TrackerOptions options, Logger& logger);

    UploadTracker(const UploadTracker&) = delete;
    UploadTracker& operator=(const UploadTracker&) = delete;

    void register_upload(const UploadRequest& request);

    std::optional<UploadState> get_state(const std::string& upload_id) const;
    std::vector<std::string> upload_ids() const;

    void mark_complete(const std::string& upload_id, const std::string& file_path, const UploadResult& result);

    void register_chunked_session(const std::string& upload_id,
                                  const std::string& file_path,
                                  const std::string& session_id,
                                  int part_number,
                                  std::uint64_t offset);

    // Files that are new, modified since completion, or mid-session.
    std::set<std::string> get_incomplete_files(const std::string& upload_id) const;

    void log_upload_request(const UploadRequest& request);
    void log_upload_summary(const UploadSummary& summary);

    std::vector<AuditEntry> audit_entries(const std::string& upload_id) const;

private:
    void load_state();
    void save_state() const;
    void append_audit(const std::string& upload_id, const std::string& kind, const std::string& document);

    TrackerOptions options_;
    Logger& logger_;
    std::unique_ptr<AuditLog> audit_;
    std::map<std::string, UploadState> states_;
    mutable std::mutex mutex_;
};

}  // namespace bucket_sync::agent
