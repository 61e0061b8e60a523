#include "folder_monitor.hpp"

#include "file_scanner.hpp"
#include "path_pattern.hpp"

#include <condition_variable>
#include <system_error>
#include <utility>

namespace bucket_sync::agent {

namespace fs = std::filesystem;

struct FolderMonitor::HandlerSlot {
    std::mutex mutex;
    ChangeHandler handler;
};

struct FolderMonitor::PollTask {
    PollTask(MonitoredFolder initial, std::chrono::milliseconds every, Logger& log, std::shared_ptr<HandlerSlot> slot)
        : folder(std::move(initial)),
          pattern(folder.pattern),
          interval(every),
          logger(log),
          handler(std::move(slot)) {}

    MonitoredFolder folder;
    PathPattern pattern;
    std::chrono::milliseconds interval;
    Logger& logger;
    std::shared_ptr<HandlerSlot> handler;

    std::mutex mutex;
    std::condition_variable cv;
    bool stop_requested = false;
    std::promise<void> finished;

    bool stopping() {
        std::lock_guard<std::mutex> lock(mutex);
        return stop_requested;
    }
};

FolderMonitor::FolderMonitor(Logger& logger, std::chrono::milliseconds scan_interval,
                             std::chrono::milliseconds stop_timeout)
    : logger_(logger),
      scan_interval_(scan_interval),
      stop_timeout_(stop_timeout),
      handler_(std::make_shared<HandlerSlot>()) {}

FolderMonitor::~FolderMonitor() {
    stop_all();
}

void FolderMonitor::set_change_handler(ChangeHandler handler) {
    std::lock_guard<std::mutex> lock(handler_->mutex);
    handler_->handler = std::move(handler);
}

bool FolderMonitor::register_folder(const WatchTarget& target) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (watches_.count(target.upload_id) != 0) {
        logger_.warn("Folder already being monitored for upload " + target.upload_id);
        return false;
    }

    MonitoredFolder folder;
    folder.upload_id = target.upload_id;
    folder.source_folder = target.source_folder;
    folder.destination = target.destination;
    folder.pattern = target.pattern.empty() ? "*" : target.pattern;
    folder.last_check = fs::file_time_type::clock::now();

    std::error_code ec;
    const auto initial = list_matching_files(folder.source_folder, PathPattern(folder.pattern), ec);
    if (ec) {
        logger_.warn("Initial listing of " + folder.source_folder.string() + " failed: " + ec.message());
    }
    folder.known_files.insert(initial.begin(), initial.end());

    auto task = std::make_shared<PollTask>(std::move(folder), scan_interval_, logger_, handler_);
    Watch watch;
    watch.task = task;
    watch.finished = task->finished.get_future().share();
    watch.thread = std::thread(&FolderMonitor::run, task);
    watches_.emplace(target.upload_id, std::move(watch));

    logger_.info("Started monitoring " + target.source_folder.string() + " for upload " + target.upload_id);
    return true;
}

bool FolderMonitor::unregister_folder(const std::string& upload_id) {
    Watch watch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = watches_.find(upload_id);
        if (it == watches_.end()) {
            logger_.warn("No monitored folder found for upload " + upload_id);
            return false;
        }
        watch = std::move(it->second);
        watches_.erase(it);
    }
    stop_watch(upload_id, std::move(watch), true);
    return true;
}

void FolderMonitor::stop_all() {
    std::map<std::string, Watch> watches;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        watches.swap(watches_);
    }
    for (auto& [id, watch] : watches) {
        std::lock_guard<std::mutex> lock(watch.task->mutex);
        watch.task->stop_requested = true;
        watch.task->cv.notify_all();
    }
    for (auto& [id, watch] : watches) {
        stop_watch(id, std::move(watch), false);
    }

    std::vector<std::thread> retired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        retired.swap(retired_);
    }
    for (auto& thread : retired) {
        if (thread.get_id() == std::this_thread::get_id()) {
            thread.detach();
        } else {
            thread.join();
        }
    }
}

void FolderMonitor::stop_watch(const std::string& upload_id, Watch watch, bool bounded) {
    {
        std::lock_guard<std::mutex> lock(watch.task->mutex);
        watch.task->stop_requested = true;
    }
    watch.task->cv.notify_all();

    if (watch.thread.get_id() == std::this_thread::get_id()) {
        // Stopped from inside its own change handler.
        std::lock_guard<std::mutex> lock(mutex_);
        retired_.push_back(std::move(watch.thread));
    } else if (!bounded || watch.finished.wait_for(stop_timeout_) == std::future_status::ready) {
        watch.thread.join();
    } else {
        logger_.warn("Monitor thread for upload " + upload_id + " is still running its change handler");
        std::lock_guard<std::mutex> lock(mutex_);
        retired_.push_back(std::move(watch.thread));
    }
    logger_.info("Stopped monitoring folder for upload " + upload_id);
}

bool FolderMonitor::is_watching(const std::string& upload_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return watches_.count(upload_id) != 0;
}

std::vector<std::string> FolderMonitor::watched_uploads() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(watches_.size());
    for (const auto& [id, watch] : watches_) {
        ids.push_back(id);
    }
    return ids;
}

std::optional<MonitoredFolder> FolderMonitor::snapshot(const std::string& upload_id) const {
    std::shared_ptr<PollTask> task;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = watches_.find(upload_id);
        if (it == watches_.end()) {
            return std::nullopt;
        }
        task = it->second.task;
    }
    std::lock_guard<std::mutex> lock(task->mutex);
    return task->folder;
}

void FolderMonitor::run(std::shared_ptr<PollTask> task) {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(task->mutex);
            if (task->cv.wait_for(lock, task->interval, [&] { return task->stop_requested; })) {
                break;
            }
        }
        poll_once(*task);
    }
    task->finished.set_value();
}

void FolderMonitor::poll_once(PollTask& task) {
    std::set<fs::path> changed;
    try {
        const auto now = fs::file_time_type::clock::now();

        fs::path source;
        fs::file_time_type previous_check;
        std::set<fs::path> known;
        {
            std::lock_guard<std::mutex> lock(task.mutex);
            source = task.folder.source_folder;
            previous_check = task.folder.last_check;
            known = task.folder.known_files;
        }

        std::error_code ec;
        const auto current = list_matching_files(source, task.pattern, ec);
        if (ec) {
            task.logger.error("Error listing " + source.string() + ": " + ec.message());
            return;
        }

        for (const auto& file : current) {
            if (known.count(file) == 0) {
                changed.insert(file);
                continue;
            }
            std::error_code mtime_ec;
            const auto written = fs::last_write_time(file, mtime_ec);
            if (!mtime_ec && written > previous_check) {
                changed.insert(file);
            }
        }

        std::lock_guard<std::mutex> lock(task.mutex);
        task.folder.known_files = std::set<fs::path>(current.begin(), current.end());
        task.folder.last_check = now;
    } catch (const std::exception& ex) {
        task.logger.error("Error monitoring folder for upload " + task.folder.upload_id + ": " + ex.what());
        return;
    }

    if (changed.empty() || task.stopping()) {
        return;
    }

    ChangeHandler handler;
    {
        std::lock_guard<std::mutex> lock(task.handler->mutex);
        handler = task.handler->handler;
    }
    if (!handler) {
        return;
    }
    task.logger.info("Detected " + std::to_string(changed.size()) + " changed files for upload " +
                     task.folder.upload_id);
    try {
        handler(task.folder.upload_id, changed);
    } catch (const std::exception& ex) {
        task.logger.error("Change handler failed for upload " + task.folder.upload_id + ": " + ex.what());
    } catch (...) {
        task.logger.error("Change handler failed for upload " + task.folder.upload_id + " with a non-standard exception");
    }
}

}  // namespace bucket_sync::agent
