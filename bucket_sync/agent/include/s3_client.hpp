#pragma once

#include "object_store.hpp"

#include <aws/core/Aws.h>
#include <aws/core/client/AWSError.h>
#include <aws/core/client/ClientConfiguration.h>
#include <aws/s3/S3Errors.h>

#include <memory>
#include <string>

namespace Aws::S3 {
class S3Client;
}

namespace bucket_sync::agent {

struct Credentials {
    std::string access_key;
    std::string secret_key;
    std::string session_token;
};

struct S3Options {
    // Empty means the SDK's regional AWS endpoint.
    std::string endpoint = "https://s3.amazonaws.com";
    std::string region = "us-east-1";
    // Empty keys fall back to the SDK's default credential chain.
    Credentials credentials;
    int connect_timeout_seconds = 10;
    int request_timeout_seconds = 300;
};

// Initializes the AWS SDK for the lifetime of the object. Every S3Client must
// be destroyed before its SdkSession.
class SdkSession {
public:
    SdkSession() { Aws::InitAPI(options_); }
    ~SdkSession() { Aws::ShutdownAPI(options_); }

    SdkSession(const SdkSession&) = delete;
    SdkSession& operator=(const SdkSession&) = delete;

private:
    Aws::SDKOptions options_;
};

// ObjectStore over aws-sdk-cpp with path-style addressing, so any
// S3-compatible endpoint works. The SDK's own retries are disabled; callers
// retry through RetryPolicy.
class S3Client : public ObjectStore {
public:
    explicit S3Client(const S3Options& options);
    ~S3Client() override;

    S3Client(const S3Client&) = delete;
    S3Client& operator=(const S3Client&) = delete;

    std::string put_object(const std::string& bucket,
                           const std::string& key,
                           std::span<const std::byte> body,
                           const ObjectMetadata& metadata) override;

    std::string create_multipart_upload(const std::string& bucket,
                                        const std::string& key,
                                        const ObjectMetadata& metadata) override;

    std::string upload_part(const std::string& bucket,
                            const std::string& key,
                            const std::string& session_id,
                            int part_number,
                            std::span<const std::byte> body) override;

    std::string complete_multipart_upload(const std::string& bucket,
                                          const std::string& key,
                                          const std::string& session_id,
                                          const std::vector<CompletedPart>& parts) override;

    void abort_multipart_upload(const std::string& bucket,
                                const std::string& key,
                                const std::string& session_id) override;

    std::optional<ObjectInfo> head_object(const std::string& bucket, const std::string& key) override;

private:
    std::unique_ptr<Aws::S3::S3Client> client_;
};

// Throws std::invalid_argument for an endpoint scheme other than http/https.
Aws::Client::ClientConfiguration make_client_configuration(const S3Options& options);

RemoteError to_remote_error(const Aws::Client::AWSError<Aws::S3::S3Errors>& error);

// Maps an HTTP status to the store's error code when the response carries none.
std::string error_code_for_status(int status);

// Base64 MD5 of the body, for the Content-MD5 header.
std::string content_md5(std::span<const std::byte> body);

std::string strip_quotes(std::string etag);

}  // namespace bucket_sync::agent
