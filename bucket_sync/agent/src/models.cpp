#include "models.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace bucket_sync::agent {

UploadRequest::UploadRequest(std::string upload_id,
                             std::filesystem::path source_folder,
                             std::string destination_bucket,
                             std::string pattern,
                             RequestMetadata metadata)
    : upload_id_(std::move(upload_id)),
      source_folder_(std::move(source_folder)),
      destination_bucket_(std::move(destination_bucket)),
      pattern_(pattern.empty() ? "*" : std::move(pattern)),
      metadata_(std::move(metadata)) {
    if (upload_id_.empty()) {
        throw std::invalid_argument("upload_id cannot be empty");
    }
    if (destination_bucket_.empty()) {
        throw std::invalid_argument("destination_bucket cannot be empty");
    }
    if (!std::filesystem::exists(source_folder_)) {
        throw std::invalid_argument("Source folder " + source_folder_.string() + " does not exist");
    }
    if (!std::filesystem::is_directory(source_folder_)) {
        throw std::invalid_argument(source_folder_.string() + " is not a directory");
    }
}

ObjectMetadata UploadRequest::object_metadata() const {
    ObjectMetadata metadata;
    if (metadata_.name) {
        metadata.emplace("name", *metadata_.name);
    }
    if (metadata_.type) {
        metadata.emplace("type", *metadata_.type);
    }
    if (metadata_.description) {
        metadata.emplace("description", *metadata_.description);
    }
    return metadata;
}

bool UploadState::is_completed(const std::string& file_path) const {
    return std::find(completed_files.begin(), completed_files.end(), file_path) != completed_files.end();
}

void to_json(nlohmann::json& json, const ChunkedSession& session) {
    json = nlohmann::json{
        {"upload_id", session.session_id},
        {"part_number", session.part_number},
        {"offset", session.offset},
    };
}

void from_json(const nlohmann::json& json, ChunkedSession& session) {
    json.at("upload_id").get_to(session.session_id);
    session.part_number = json.value("part_number", 0);
    session.offset = json.value("offset", std::uint64_t{0});
}

void to_json(nlohmann::json& json, const UploadState& state) {
    json = nlohmann::json{
        {"upload_id", state.upload_id},
        {"source_folder", state.source_folder},
        {"destination_bucket", state.destination_bucket},
        {"pattern", state.pattern},
        {"completed_files", state.completed_files},
        {"in_progress_files", state.in_progress_files},
        {"last_modified_times", state.last_modified_times},
    };
}

void from_json(const nlohmann::json& json, UploadState& state) {
    json.at("upload_id").get_to(state.upload_id);
    json.at("source_folder").get_to(state.source_folder);
    json.at("destination_bucket").get_to(state.destination_bucket);
    json.at("pattern").get_to(state.pattern);
    state.completed_files = json.value("completed_files", std::vector<std::string>{});
    state.in_progress_files = json.value("in_progress_files", std::map<std::string, ChunkedSession>{});
    state.last_modified_times = json.value("last_modified_times", std::map<std::string, double>{});
}

}  // namespace bucket_sync::agent
