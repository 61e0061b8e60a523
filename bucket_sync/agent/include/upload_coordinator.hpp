#pragma once

#include "file_scanner.hpp"
#include "folder_monitor.hpp"
#include "logger.hpp"
#include "models.hpp"
#include "object_store.hpp"
#include "upload_tracker.hpp"
#include "uploader.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace bucket_sync::agent {

struct CoordinatorOptions {
    std::filesystem::path state_file = "upload_state.json";
    std::filesystem::path log_dir;
    std::chrono::milliseconds scan_interval = std::chrono::seconds(30);
    std::chrono::milliseconds monitor_stop_timeout = std::chrono::seconds(5);
    UploaderOptions uploader{};
};

// Wires scanner, tracker, monitor and one uploader per active upload.
// Persisted uploads are resumed on construction.
class UploadCoordinator {
public:
    UploadCoordinator(CoordinatorOptions options, ObjectStore& store, Logger& logger);
    ~UploadCoordinator();

    UploadCoordinator(const UploadCoordinator&) = delete;
    UploadCoordinator& operator=(const UploadCoordinator&) = delete;

    // Throws std::runtime_error if the source folder is gone.
    void start_upload(const UploadRequest& request);

    // Persisted state is kept.
    void stop_upload(const std::string& upload_id);
    void stop_all();

    std::vector<std::string> active_uploads() const;

    UploadTracker& tracker() { return tracker_; }
    FolderMonitor& monitor() { return monitor_; }

private:
    struct ActiveUpload {
        std::shared_ptr<Uploader> uploader;
        std::filesystem::path source_folder;
        std::string bucket;
        ObjectMetadata metadata;
    };

    void resume_incomplete_uploads();
    std::shared_ptr<Uploader> make_uploader(const std::string& upload_id);
    void handle_file_changes(const std::string& upload_id, const std::set<std::filesystem::path>& changed);
    void process_files(const std::string& upload_id, const std::vector<std::filesystem::path>& files);

    CoordinatorOptions options_;
    ObjectStore& store_;
    Logger& logger_;
    FileScanner scanner_;
    UploadTracker tracker_;
    std::map<std::string, ActiveUpload> active_;
    mutable std::mutex mutex_;
    FolderMonitor monitor_;
};

}  // namespace bucket_sync::agent
