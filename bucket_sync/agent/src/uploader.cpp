#include "uploader.hpp"

#include <fstream>
#include <future>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace bucket_sync::agent {

namespace fs = std::filesystem;

namespace {

std::vector<std::byte> read_whole_file(const fs::path& file, std::uint64_t size) {
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Unable to open " + file.string());
    }
    std::vector<std::byte> buffer(size);
    in.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(size));
    buffer.resize(static_cast<std::size_t>(in.gcount()));
    return buffer;
}

UploadResult failed_result(const fs::path& file, const std::string& key, const std::string& error) {
    UploadResult result;
    result.file_path = file;
    result.key = key;
    result.success = false;
    result.error = error;
    std::error_code ec;
    const auto size = fs::file_size(file, ec);
    if (!ec) {
        result.size_bytes = size;
    }
    return result;
}

}  // namespace

Uploader::Uploader(std::string upload_id, ObjectStore& store, UploaderOptions options, Logger& logger)
    : upload_id_(std::move(upload_id)),
      store_(store),
      options_(std::move(options)),
      logger_(logger),
      executor_(options_.max_workers == 0 ? 1 : options_.max_workers) {
    if (options_.chunk_size == 0) {
        throw std::invalid_argument("chunk_size must be positive");
    }
}

Uploader::~Uploader() {
    executor_.shutdown();
}

void Uploader::set_part_observer(PartObserver observer) {
    std::lock_guard<std::mutex> lock(observer_mutex_);
    observer_ = std::move(observer);
}

void Uploader::notify_part(const fs::path& file, const std::string& session_id, int part_number,
                           std::uint64_t offset) {
    PartObserver observer;
    {
        std::lock_guard<std::mutex> lock(observer_mutex_);
        observer = observer_;
    }
    if (observer) {
        observer(file, session_id, part_number, offset);
    }
}

RetryListener Uploader::retry_logger(const std::string& what) const {
    return [this, what](int attempt, const RemoteError& error, std::chrono::milliseconds delay) {
        logger_.warn(what + " failed (attempt " + std::to_string(attempt) + "): " + error.what() + "; retrying in " +
                     std::to_string(delay.count()) + "ms");
    };
}

UploadResult Uploader::upload_file(const fs::path& file,
                                   const std::string& bucket,
                                   const std::string& key,
                                   const ObjectMetadata& metadata) {
    std::error_code ec;
    const auto size = fs::file_size(file, ec);
    if (ec) {
        logger_.error("Error uploading " + file.string() + " to " + key + ": " + ec.message());
        return failed_result(file, key, ec.message());
    }
    if (size > options_.chunk_size) {
        return upload_chunked(file, bucket, key, metadata, size);
    }
    return upload_simple(file, bucket, key, metadata, size);
}

UploadResult Uploader::upload_simple(const fs::path& file,
                                     const std::string& bucket,
                                     const std::string& key,
                                     const ObjectMetadata& metadata,
                                     std::uint64_t size) {
    UploadResult result;
    result.file_path = file;
    result.key = key;
    result.size_bytes = size;
    try {
        const auto body = read_whole_file(file, size);
        result.size_bytes = body.size();
        std::string etag = with_retry(
            options_.put_retry, [&] { return store_.put_object(bucket, key, body, metadata); },
            retry_logger("Upload of " + file.string()));
        if (etag.empty()) {
            try {
                if (const auto info = store_.head_object(bucket, key)) {
                    etag = info->etag;
                }
            } catch (const RemoteError& error) {
                logger_.warn("Uploaded " + file.string() + " but could not fetch its ETag: " + error.what());
            }
        }
        if (!etag.empty()) {
            result.etag = etag;
        }
        result.success = true;
        logger_.debug("Uploaded " + file.string() + " to " + bucket + "/" + key);
    } catch (const std::exception& ex) {
        logger_.error("Error uploading " + file.string() + " to " + key + ": " + ex.what());
        result.success = false;
        result.error = ex.what();
        result.etag.reset();
    }
    return result;
}

UploadResult Uploader::upload_chunked(const fs::path& file,
                                      const std::string& bucket,
                                      const std::string& key,
                                      const ObjectMetadata& metadata,
                                      std::uint64_t size) {
    UploadResult result;
    result.file_path = file;
    result.key = key;
    result.size_bytes = size;

    std::string session_id;
    try {
        session_id = with_retry(
            options_.put_retry, [&] { return store_.create_multipart_upload(bucket, key, metadata); },
            retry_logger("Opening session for " + file.string()));
    } catch (const std::exception& ex) {
        logger_.error("Error in multipart upload for " + file.string() + " to " + key + ": " + ex.what());
        result.error = ex.what();
        return result;
    }
    result.session_id = session_id;

    int part_number = 0;
    std::uint64_t offset = 0;
    try {
        notify_part(file, session_id, part_number, offset);

        std::ifstream in(file, std::ios::binary);
        if (!in) {
            throw std::runtime_error("Unable to open " + file.string());
        }
        std::vector<CompletedPart> parts;
        std::vector<std::byte> chunk(static_cast<std::size_t>(options_.chunk_size));
        while (offset < size) {
            in.read(reinterpret_cast<char*>(chunk.data()), static_cast<std::streamsize>(chunk.size()));
            const auto read = static_cast<std::size_t>(in.gcount());
            if (read == 0) {
                throw std::runtime_error(file.string() + " shrank during upload");
            }
            const std::span<const std::byte> body(chunk.data(), read);
            const int next_part = part_number + 1;
            const std::string etag = with_retry(
                options_.part_retry, [&] { return store_.upload_part(bucket, key, session_id, next_part, body); },
                retry_logger("Part " + std::to_string(next_part) + " of " + file.string()));
            parts.push_back(CompletedPart{next_part, etag});
            part_number = next_part;
            offset += read;
            notify_part(file, session_id, part_number, offset);
        }

        with_retry(
            options_.put_retry, [&] { return store_.complete_multipart_upload(bucket, key, session_id, parts); },
            retry_logger("Completing session for " + file.string()));

        result.success = true;
        result.part_number = part_number;
        result.offset = offset;
        if (!parts.empty()) {
            result.etag = parts.back().etag;
        }
        logger_.debug("Uploaded " + file.string() + " to " + bucket + "/" + key + " in " +
                      std::to_string(part_number) + " parts");
    } catch (const std::exception& ex) {
        logger_.error("Error in multipart upload for " + file.string() + " to " + key + ": " + ex.what());
        try {
            store_.abort_multipart_upload(bucket, key, session_id);
        } catch (const std::exception& abort_ex) {
            logger_.error("Failed to abort session " + session_id + ": " + abort_ex.what());
        }
        result.success = false;
        result.error = ex.what();
        result.part_number = part_number;
        result.offset = offset;
        result.etag.reset();
    }
    return result;
}

UploadSummary Uploader::upload_files(const std::vector<TransferItem>& items,
                                     const std::string& bucket,
                                     const ObjectMetadata& metadata) {
    std::vector<std::future<UploadResult>> futures;
    futures.reserve(items.size());
    for (const auto& item : items) {
        try {
            futures.push_back(executor_.submit(
                [this, item, &bucket, &metadata] { return upload_file(item.path, bucket, item.key, metadata); }));
        } catch (const std::runtime_error& ex) {
            std::promise<UploadResult> rejected;
            rejected.set_value(failed_result(item.path, item.key, ex.what()));
            futures.push_back(rejected.get_future());
        }
    }

    UploadSummary summary;
    summary.upload_id = upload_id_;
    summary.total_files = items.size();
    for (std::size_t i = 0; i < futures.size(); ++i) {
        UploadResult result;
        try {
            result = futures[i].get();
        } catch (const std::exception& ex) {
            logger_.error("Unexpected error uploading " + items[i].path.string() + ": " + ex.what());
            result = failed_result(items[i].path, items[i].key, ex.what());
        }
        if (result.success) {
            ++summary.successful_uploads;
        } else {
            ++summary.failed_uploads;
        }
        summary.results.push_back(std::move(result));
    }
    return summary;
}

UploadSummary Uploader::upload_files(const std::vector<fs::path>& files,
                                     const std::string& bucket,
                                     const ObjectMetadata& metadata) {
    std::vector<TransferItem> items;
    items.reserve(files.size());
    for (const auto& file : files) {
        items.push_back(TransferItem{file, file.filename().string()});
    }
    return upload_files(items, bucket, metadata);
}

}  // namespace bucket_sync::agent
