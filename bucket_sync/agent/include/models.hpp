#pragma once

#include "object_store.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace bucket_sync::agent {

struct RequestMetadata {
    std::optional<std::string> name;
    std::optional<std::string> type;
    std::optional<std::string> description;
};

// One logical directory-to-bucket upload task. Validated on construction;
// immutable afterwards.
class UploadRequest {
public:
    UploadRequest(std::string upload_id,
                  std::filesystem::path source_folder,
                  std::string destination_bucket,
                  std::string pattern = "*",
                  RequestMetadata metadata = {});

    const std::string& upload_id() const { return upload_id_; }
    const std::filesystem::path& source_folder() const { return source_folder_; }
    const std::string& destination_bucket() const { return destination_bucket_; }
    const std::string& pattern() const { return pattern_; }
    const RequestMetadata& metadata() const { return metadata_; }

    // Display metadata as object user metadata (absent fields omitted).
    ObjectMetadata object_metadata() const;

private:
    std::string upload_id_;
    std::filesystem::path source_folder_;
    std::string destination_bucket_;
    std::string pattern_;
    RequestMetadata metadata_;
};

struct UploadResult {
    std::filesystem::path file_path;
    std::string key;
    bool success = false;
    std::optional<std::string> error;
    std::optional<std::uint64_t> size_bytes;
    std::optional<std::string> etag;
    std::optional<std::string> session_id;
    std::optional<int> part_number;
    std::optional<std::uint64_t> offset;
};

struct UploadSummary {
    std::string upload_id;
    std::size_t total_files = 0;
    std::size_t successful_uploads = 0;
    std::size_t failed_uploads = 0;
    std::vector<UploadResult> results;
};

// In-progress chunked-session descriptor.
struct ChunkedSession {
    std::string session_id;
    int part_number = 0;
    std::uint64_t offset = 0;

    bool operator==(const ChunkedSession&) const = default;
};

struct UploadState {
    std::string upload_id;
    std::string source_folder;
    std::string destination_bucket;
    std::string pattern;
    std::vector<std::string> completed_files;
    std::map<std::string, ChunkedSession> in_progress_files;
    std::map<std::string, double> last_modified_times;

    bool is_completed(const std::string& file_path) const;
};

struct MonitoredFolder {
    std::string upload_id;
    std::filesystem::path source_folder;
    std::string destination;
    std::string pattern;
    std::filesystem::file_time_type last_check;
    std::set<std::filesystem::path> known_files;
};

void to_json(nlohmann::json& json, const ChunkedSession& session);
void from_json(const nlohmann::json& json, ChunkedSession& session);
void to_json(nlohmann::json& json, const UploadState& state);
void from_json(const nlohmann::json& json, UploadState& state);

}  // namespace bucket_sync::agent
