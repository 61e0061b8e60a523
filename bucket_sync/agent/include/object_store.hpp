#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace bucket_sync::agent {

using ObjectMetadata = std::map<std::string, std::string>;

struct CompletedPart {
    int part_number = 0;
    std::string etag;
};

struct ObjectInfo {
    std::string etag;
    std::uint64_t size = 0;
};

// Error reported by the remote store. `code` is the store's error code
// (e.g. "SlowDown", "AccessDenied"); `http_status` is 0 when the request
// never produced a response.
class RemoteError : public std::runtime_error {
public:
    RemoteError(std::string code, const std::string& message, int http_status = 0);

    const std::string& code() const noexcept { return code_; }
    int http_status() const noexcept { return http_status_; }
    bool retryable() const;

private:
    std::string code_;
    int http_status_;
};

// True for transient error codes: request timeouts, connection errors,
// throttling, service unavailable and generic 5xx codes.
bool is_retryable_error(std::string_view code);

// Capability interface over an S3-compatible store. Every operation throws
// RemoteError on failure.
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    // Returns the object's integrity tag (may be empty if the store sent none).
    virtual std::string put_object(const std::string& bucket,
                                   const std::string& key,
                                   std::span<const std::byte> body,
                                   const ObjectMetadata& metadata) = 0;

    virtual std::string create_multipart_upload(const std::string& bucket,
                                                const std::string& key,
                                                const ObjectMetadata& metadata) = 0;

    virtual std::string upload_part(const std::string& bucket,
                                    const std::string& key,
                                    const std::string& session_id,
                                    int part_number,
                                    std::span<const std::byte> body) = 0;

    virtual std::string complete_multipart_upload(const std::string& bucket,
                                                  const std::string& key,
                                                  const std::string& session_id,
                                                  const std::vector<CompletedPart>& parts) = 0;

    virtual void abort_multipart_upload(const std::string& bucket,
                                        const std::string& key,
                                        const std::string& session_id) = 0;

    // std::nullopt when the object does not exist.
    virtual std::optional<ObjectInfo> head_object(const std::string& bucket, const std::string& key) = 0;
};

}  // namespace bucket_sync::agent
