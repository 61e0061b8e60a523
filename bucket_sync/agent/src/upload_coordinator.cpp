#include "upload_coordinator.hpp"

#include <stdexcept>
#include <system_error>
#include <utility>

namespace bucket_sync::agent {

namespace fs = std::filesystem;

UploadCoordinator::UploadCoordinator(CoordinatorOptions options, ObjectStore& store, Logger& logger)
    : options_(std::move(options)),
      store_(store),
      logger_(logger),
      scanner_(logger),
      tracker_(TrackerOptions{options_.state_file, options_.log_dir}, logger),
      monitor_(logger, options_.scan_interval, options_.monitor_stop_timeout) {
    monitor_.set_change_handler(
        [this](const std::string& upload_id, const std::set<fs::path>& changed) { handle_file_changes(upload_id, changed); });
    resume_incomplete_uploads();
}

UploadCoordinator::~UploadCoordinator() {
    stop_all();
}

std::shared_ptr<Uploader> UploadCoordinator::make_uploader(const std::string& upload_id) {
    auto uploader = std::make_shared<Uploader>(upload_id, store_, options_.uploader, logger_);
    uploader->set_part_observer(
        [this, upload_id](const fs::path& file, const std::string& session_id, int part_number, std::uint64_t offset) {
            tracker_.register_chunked_session(upload_id, file.string(), session_id, part_number, offset);
        });
    return uploader;
}

void UploadCoordinator::resume_incomplete_uploads() {
    for (const auto& upload_id : tracker_.upload_ids()) {
        const auto state = tracker_.get_state(upload_id);
        if (!state) {
            continue;
        }
        std::error_code ec;
        if (!fs::is_directory(state->source_folder, ec)) {
            logger_.warn("Cannot resume upload " + upload_id + ": source folder " + state->source_folder +
                         " is missing");
            continue;
        }
        logger_.info("Resuming upload " + upload_id + " from " + state->source_folder);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            active_[upload_id] = ActiveUpload{make_uploader(upload_id), state->source_folder,
                                              state->destination_bucket, {}};
        }
        monitor_.register_folder(
            WatchTarget{upload_id, state->source_folder, state->destination_bucket, state->pattern});

        const auto incomplete = tracker_.get_incomplete_files(upload_id);
        if (!incomplete.empty()) {
            process_files(upload_id, std::vector<fs::path>(incomplete.begin(), incomplete.end()));
        }
    }
}

void UploadCoordinator::start_upload(const UploadRequest& request) {
    std::error_code ec;
    if (!fs::is_directory(request.source_folder(), ec)) {
        throw std::runtime_error("Source folder does not exist: " + request.source_folder().string());
    }

    tracker_.register_upload(request);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_[request.upload_id()] = ActiveUpload{make_uploader(request.upload_id()), request.source_folder(),
                                                    request.destination_bucket(), request.object_metadata()};
    }
    monitor_.register_folder(WatchTarget{request.upload_id(), request.source_folder(), request.destination_bucket(),
                                         request.pattern()});

    const auto files = scanner_.scan(request);
    if (!files.empty()) {
        process_files(request.upload_id(), files);
    }
}

void UploadCoordinator::handle_file_changes(const std::string& upload_id, const std::set<fs::path>& changed) {
    if (!tracker_.get_state(upload_id)) {
        return;
    }
    logger_.info("Processing " + std::to_string(changed.size()) + " changed files for upload " + upload_id);
    process_files(upload_id, std::vector<fs::path>(changed.begin(), changed.end()));
}

void UploadCoordinator::process_files(const std::string& upload_id, const std::vector<fs::path>& files) {
    if (files.empty()) {
        return;
    }
    ActiveUpload active;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = active_.find(upload_id);
        if (it == active_.end()) {
            logger_.warn("No active uploader for " + upload_id);
            return;
        }
        active = it->second;
    }

    std::vector<TransferItem> items;
    items.reserve(files.size());
    for (const auto& file : files) {
        items.push_back(TransferItem{file, scanner_.relative_path(file, active.source_folder).generic_string()});
    }

    const UploadSummary summary = active.uploader->upload_files(items, active.bucket, active.metadata);
    for (const auto& result : summary.results) {
        if (result.success) {
            tracker_.mark_complete(upload_id, result.file_path.string(), result);
        }
    }
    tracker_.log_upload_summary(summary);
}

void UploadCoordinator::stop_upload(const std::string& upload_id) {
    monitor_.unregister_folder(upload_id);
    ActiveUpload dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = active_.find(upload_id);
        if (it != active_.end()) {
            dropped = std::move(it->second);
            active_.erase(it);
        }
    }
    logger_.info("Stopped upload task " + upload_id);
}

void UploadCoordinator::stop_all() {
    monitor_.stop_all();
    std::map<std::string, ActiveUpload> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dropped.swap(active_);
    }
}

std::vector<std::string> UploadCoordinator::active_uploads() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(active_.size());
    for (const auto& [id, active] : active_) {
        ids.push_back(id);
    }
    return ids;
}

}  // namespace bucket_sync::agent
