#include "upload_tracker.hpp"

#include "file_scanner.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace bucket_sync::agent {

namespace fs = std::filesystem;
using nlohmann::json;

namespace {

std::string format_now(const char* format) {
    const auto now = std::chrono::system_clock::now();
    const std::time_t now_c = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf{};
    localtime_r(&now_c, &tm_buf);
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, format);
    return oss.str();
}

template <typename T>
json optional_json(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

}  // namespace

UploadTracker::UploadTracker(TrackerOptions options, Logger& logger)
    : options_(std::move(options)), logger_(logger) {
    if (!options_.log_dir.empty()) {
        try {
            fs::create_directories(options_.log_dir);
            audit_ = std::make_unique<AuditLog>((options_.log_dir / "audit.db").string());
            audit_->initialize_schema();
        } catch (const std::exception& ex) {
            logger_.error(std::string("Audit log disabled: ") + ex.what());
            audit_.reset();
        }
    }
    std::lock_guard<std::mutex> lock(mutex_);
    load_state();
}

void UploadTracker::load_state() {
    if (options_.state_file.empty()) {
        return;
    }
    std::error_code ec;
    if (!fs::exists(options_.state_file, ec)) {
        return;
    }
    try {
        std::ifstream in(options_.state_file);
        if (!in) {
            throw std::runtime_error("cannot open " + options_.state_file.string());
        }
        const json data = json::parse(in);
        std::map<std::string, UploadState> loaded;
        for (const auto& entry : data.value("upload_states", json::array())) {
            auto state = entry.get<UploadState>();
            loaded[state.upload_id] = std::move(state);
        }
        states_ = std::move(loaded);
        logger_.info("Loaded " + std::to_string(states_.size()) + " upload states from " +
                     options_.state_file.string());
    } catch (const std::exception& ex) {
        states_.clear();
        logger_.error(std::string("Error loading state file: ") + ex.what());
    }
}

void UploadTracker::save_state() const {
    if (options_.state_file.empty()) {
        return;
    }
    try {
        json states = json::array();
        for (const auto& [id, state] : states_) {
            states.push_back(state);
        }
        const auto parent = options_.state_file.parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent);
        }
        std::ofstream out(options_.state_file, std::ios::trunc);
        if (!out) {
            throw std::runtime_error("cannot open " + options_.state_file.string() + " for writing");
        }
        out << json{{"upload_states", states}}.dump(2);
        if (!out) {
            throw std::runtime_error("write to " + options_.state_file.string() + " failed");
        }
        logger_.debug("Saved " + std::to_string(states_.size()) + " upload states to " +
                      options_.state_file.string());
    } catch (const std::exception& ex) {
        logger_.error(std::string("Error saving state file: ") + ex.what());
    }
}

void UploadTracker::register_upload(const UploadRequest& request) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        UploadState state;
        state.upload_id = request.upload_id();
        state.source_folder = request.source_folder().string();
        state.destination_bucket = request.destination_bucket();
        state.pattern = request.pattern();
        states_[request.upload_id()] = std::move(state);
        save_state();
    }
    log_upload_request(request);
}

std::optional<UploadState> UploadTracker::get_state(const std::string& upload_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = states_.find(upload_id);
    if (it == states_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> UploadTracker::upload_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(states_.size());
    for (const auto& [id, state] : states_) {
        ids.push_back(id);
    }
    return ids;
}

void UploadTracker::mark_complete(const std::string& upload_id,
                                  const std::string& file_path,
                                  const UploadResult& result) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = states_.find(upload_id);
    if (it == states_.end()) {
        logger_.warn("mark_complete for unknown upload " + upload_id);
        return;
    }
    UploadState& state = it->second;
    state.in_progress_files.erase(file_path);
    if (result.success) {
        if (!state.is_completed(file_path)) {
            state.completed_files.push_back(file_path);
        }
        // Refreshed on every success so a re-uploaded file stops counting as modified.
        try {
            state.last_modified_times[file_path] = modification_time(file_path);
        } catch (const fs::filesystem_error& ex) {
            logger_.warn("Cannot read modification time of " + file_path + ": " + ex.what());
        }
    }
    save_state();
}

void UploadTracker::register_chunked_session(const std::string& upload_id,
                                             const std::string& file_path,
                                             const std::string& session_id,
                                             int part_number,
                                             std::uint64_t offset) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = states_.find(upload_id);
    if (it == states_.end()) {
        return;
    }
    auto& completed = it->second.completed_files;
    completed.erase(std::remove(completed.begin(), completed.end(), file_path), completed.end());
    it->second.in_progress_files[file_path] = ChunkedSession{session_id, part_number, offset};
    save_state();
}

std::set<std::string> UploadTracker::get_incomplete_files(const std::string& upload_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = states_.find(upload_id);
    if (it == states_.end()) {
        return {};
    }
    const UploadState& state = it->second;

    std::error_code ec;
    const auto current = list_matching_files(state.source_folder, PathPattern(state.pattern), ec);
    if (ec) {
        logger_.error("Error scanning " + state.source_folder + ": " + ec.message());
    }

    std::set<std::string> incomplete;
    for (const auto& file : current) {
        const std::string path = file.string();
        double mtime = 0;
        try {
            mtime = modification_time(file);
        } catch (const fs::filesystem_error&) {
            continue;
        }
        const auto recorded = state.last_modified_times.find(path);
        const double recorded_mtime = recorded == state.last_modified_times.end() ? 0 : recorded->second;
        if (!state.is_completed(path) || mtime != recorded_mtime) {
            incomplete.insert(path);
        }
    }
    for (const auto& [path, session] : state.in_progress_files) {
        incomplete.insert(path);
    }
    return incomplete;
}

void UploadTracker::append_audit(const std::string& upload_id, const std::string& kind, const std::string& document) {
    if (!audit_) {
        return;
    }
    const std::string log_key = "upload_" + upload_id + "_" + format_now("%Y%m%d_%H%M%S");
    try {
        audit_->append(upload_id, log_key, kind, format_now("%Y-%m-%dT%H:%M:%S"), document);
    } catch (const std::runtime_error& ex) {
        logger_.error(std::string("Audit write failed: ") + ex.what());
    }
}

void UploadTracker::log_upload_request(const UploadRequest& request) {
    const auto& metadata = request.metadata();
    const json document = {
        {"timestamp", format_now("%Y-%m-%dT%H:%M:%S")},
        {"upload_id", request.upload_id()},
        {"source_folder", request.source_folder().string()},
        {"destination_bucket", request.destination_bucket()},
        {"pattern", request.pattern()},
        {"metadata",
         {{"name", optional_json(metadata.name)},
          {"type", optional_json(metadata.type)},
          {"description", optional_json(metadata.description)}}},
    };
    append_audit(request.upload_id(), "request", document.dump(2));
    logger_.info("Starting upload " + request.upload_id());
}

void UploadTracker::log_upload_summary(const UploadSummary& summary) {
    json results = json::array();
    for (const auto& result : summary.results) {
        results.push_back({
            {"file_path", result.file_path.string()},
            {"s3_key", result.key},
            {"success", result.success},
            {"error", optional_json(result.error)},
            {"size_bytes", optional_json(result.size_bytes)},
            {"etag", optional_json(result.etag)},
        });
    }
    const json document = {
        {"timestamp", format_now("%Y-%m-%dT%H:%M:%S")},
        {"upload_id", summary.upload_id},
        {"total_files", summary.total_files},
        {"successful_uploads", summary.successful_uploads},
        {"failed_uploads", summary.failed_uploads},
        {"results", results},
    };
    append_audit(summary.upload_id, "summary", document.dump(2));
    logger_.info("Completed upload " + summary.upload_id + ": " + std::to_string(summary.successful_uploads) + "/" +
                 std::to_string(summary.total_files) + " files uploaded successfully");
}

std::vector<AuditEntry> UploadTracker::audit_entries(const std::string& upload_id) const {
    if (!audit_) {
        return {};
    }
    return audit_->entries(upload_id);
}

}  // namespace bucket_sync::agent
