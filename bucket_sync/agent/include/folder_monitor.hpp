#pragma once

#include "logger.hpp"
#include "models.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace bucket_sync::agent {

struct WatchTarget {
    std::string upload_id;
    std::filesystem::path source_folder;
    std::string destination;
    std::string pattern = "*";
};

// Receives every file found new or modified by one poll, as a single batch.
using ChangeHandler = std::function<void(const std::string& upload_id, const std::set<std::filesystem::path>& changed)>;

// Polls each registered folder on its own thread.
class FolderMonitor {
public:
    explicit FolderMonitor(Logger& logger,
                           std::chrono::milliseconds scan_interval = std::chrono::seconds(30),
                           std::chrono::milliseconds stop_timeout = std::chrono::seconds(5));
    ~FolderMonitor();

    FolderMonitor(const FolderMonitor&) = delete;
    FolderMonitor& operator=(const FolderMonitor&) = delete;

    // Last registration wins.
    void set_change_handler(ChangeHandler handler);

    // False (and a warning) when the upload id is already watched.
    bool register_folder(const WatchTarget& target);

    // False (and a warning) when the upload id is not watched. Waits at most
    // stop_timeout for the poll thread; one still inside the change handler
    // keeps running and is joined by stop_all().
    bool unregister_folder(const std::string& upload_id);

    // Stops every target and joins every poll thread, waiting for change
    // handlers that are still running.
    void stop_all();

    bool is_watching(const std::string& upload_id) const;
    std::vector<std::string> watched_uploads() const;
    std::optional<MonitoredFolder> snapshot(const std::string& upload_id) const;

private:
    struct HandlerSlot;
    struct PollTask;

    struct Watch {
        std::shared_ptr<PollTask> task;
        std::thread thread;
        std::shared_future<void> finished;
    };

    static void run(std::shared_ptr<PollTask> task);
    static void poll_once(PollTask& task);

    void stop_watch(const std::string& upload_id, Watch watch, bool bounded);

    Logger& logger_;
    std::chrono::milliseconds scan_interval_;
    std::chrono::milliseconds stop_timeout_;
    std::shared_ptr<HandlerSlot> handler_;
    std::map<std::string, Watch> watches_;
    std::vector<std::thread> retired_;
    mutable std::mutex mutex_;
};

}  // namespace bucket_sync::agent
