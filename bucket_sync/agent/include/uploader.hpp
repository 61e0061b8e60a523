#pragma once

#include "logger.hpp"
#include "models.hpp"
#include "object_store.hpp"
#include "retry_policy.hpp"
#include "task_executor.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace bucket_sync::agent {

struct UploaderOptions {
    std::size_t max_workers = 5;
    // Files larger than this go through a chunked session with parts of this size.
    std::uint64_t chunk_size = 8ULL * 1024 * 1024;
    RetryPolicy put_retry{};
    RetryPolicy part_retry{};
};

struct TransferItem {
    std::filesystem::path path;
    std::string key;
};

// Called when a chunked session opens (part 0, offset 0) and after every part.
using PartObserver = std::function<void(const std::filesystem::path& file,
                                        const std::string& session_id,
                                        int part_number,
                                        std::uint64_t offset)>;

class Uploader {
public:
    Uploader(std::string upload_id, ObjectStore& store, UploaderOptions options, Logger& logger);
    ~Uploader();

    Uploader(const Uploader&) = delete;
    Uploader& operator=(const Uploader&) = delete;

    void set_part_observer(PartObserver observer);

    // Never throws; failures are reported in the result.
    UploadResult upload_file(const std::filesystem::path& file,
                             const std::string& bucket,
                             const std::string& key,
                             const ObjectMetadata& metadata = {});

    // Blocks until every item has finished.
    UploadSummary upload_files(const std::vector<TransferItem>& items,
                               const std::string& bucket,
                               const ObjectMetadata& metadata = {});

    // Keys each file by its file name.
    UploadSummary upload_files(const std::vector<std::filesystem::path>& files,
                               const std::string& bucket,
                               const ObjectMetadata& metadata = {});

    const std::string& upload_id() const { return upload_id_; }
    const UploaderOptions& options() const { return options_; }

private:
    UploadResult upload_simple(const std::filesystem::path& file,
                               const std::string& bucket,
                               const std::string& key,
                               const ObjectMetadata& metadata,
                               std::uint64_t size);

    UploadResult upload_chunked(const std::filesystem::path& file,
                                const std::string& bucket,
                                const std::string& key,
                                const ObjectMetadata& metadata,
                                std::uint64_t size);

    void notify_part(const std::filesystem::path& file, const std::string& session_id, int part_number,
                     std::uint64_t offset);

    RetryListener retry_logger(const std::string& what) const;

    std::string upload_id_;
    ObjectStore& store_;
    UploaderOptions options_;
    Logger& logger_;
    TaskExecutor executor_;
    PartObserver observer_;
    std::mutex observer_mutex_;
};

}  // namespace bucket_sync::agent
