#include "s3_client.hpp"

#include "base64.hpp"

#include <aws/core/auth/AWSCredentials.h>
#include <aws/core/auth/AWSAuthSigner.h>
#include <aws/core/client/RetryStrategy.h>
#include <aws/core/utils/memory/stl/AWSStringStream.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/model/AbortMultipartUploadRequest.h>
#include <aws/s3/model/CompleteMultipartUploadRequest.h>
#include <aws/s3/model/CompletedMultipartUpload.h>
#include <aws/s3/model/CompletedPart.h>
#include <aws/s3/model/CreateMultipartUploadRequest.h>
#include <aws/s3/model/HeadObjectRequest.h>
#include <aws/s3/model/PutObjectRequest.h>
#include <aws/s3/model/UploadPartRequest.h>

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>

namespace bucket_sync::agent {

namespace {

constexpr const char* kAllocationTag = "bucket_sync";

std::shared_ptr<Aws::IOStream> body_stream(std::span<const std::byte> body) {
    auto stream = Aws::MakeShared<Aws::StringStream>(kAllocationTag);
    stream->write(reinterpret_cast<const char*>(body.data()), static_cast<std::streamsize>(body.size()));
    return stream;
}

template <typename Request>
void add_metadata(Request& request, const ObjectMetadata& metadata) {
    for (const auto& [name, value] : metadata) {
        std::string lowered = name;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
        request.AddMetadata(lowered, value);
    }
}

}  // namespace

Aws::Client::ClientConfiguration make_client_configuration(const S3Options& options) {
    Aws::Client::ClientConfiguration config;
    config.region = options.region;
    config.connectTimeoutMs = options.connect_timeout_seconds * 1000L;
    config.requestTimeoutMs = options.request_timeout_seconds * 1000L;
    config.retryStrategy = Aws::MakeShared<Aws::Client::DefaultRetryStrategy>(kAllocationTag, 0);

    if (options.endpoint.empty()) {
        return config;
    }
    std::string host = options.endpoint;
    const auto scheme_end = host.find("://");
    if (scheme_end != std::string::npos) {
        const std::string scheme = host.substr(0, scheme_end);
        if (scheme == "http") {
            config.scheme = Aws::Http::Scheme::HTTP;
        } else if (scheme == "https") {
            config.scheme = Aws::Http::Scheme::HTTPS;
        } else {
            throw std::invalid_argument("Unsupported endpoint scheme: " + scheme);
        }
        host = host.substr(scheme_end + 3);
    } else {
        config.scheme = Aws::Http::Scheme::HTTPS;
    }
    while (!host.empty() && host.back() == '/') {
        host.pop_back();
    }
    if (host.empty()) {
        throw std::invalid_argument("Endpoint has no host: " + options.endpoint);
    }
    config.endpointOverride = host;
    return config;
}

std::string error_code_for_status(int status) {
    switch (status) {
        case 403:
            return "AccessDenied";
        case 404:
            return "NotFound";
        case 500:
            return "InternalError";
        case 503:
            return "ServiceUnavailable";
        default:
            return status >= 500 ? "InternalError" : "HttpError";
    }
}

RemoteError to_remote_error(const Aws::Client::AWSError<Aws::S3::S3Errors>& error) {
    const int status = std::max(0, static_cast<int>(error.GetResponseCode()));
    std::string code;
    if (error.GetErrorType() == Aws::S3::S3Errors::NETWORK_CONNECTION) {
        code = "ConnectionError";
    } else {
        code = error.GetExceptionName();
        if (code.empty() && error.GetErrorType() == Aws::S3::S3Errors::REQUEST_TIMEOUT) {
            code = "RequestTimeout";
        }
    }
    if (code.empty()) {
        code = status == 0 ? "ConnectionError" : error_code_for_status(status);
    }
    std::string message = error.GetMessage();
    if (message.empty()) {
        message = "request failed with HTTP " + std::to_string(status);
    }
    return RemoteError(code, message, status);
}

std::string content_md5(std::span<const std::byte> body) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_length = 0;
    if (EVP_Digest(body.data(), body.size(), digest.data(), &digest_length, EVP_md5(), nullptr) != 1) {
        throw std::runtime_error("MD5 digest failed");
    }
    return util::base64_encode(std::span<const unsigned char>(digest.data(), digest_length));
}

std::string strip_quotes(std::string etag) {
    if (etag.size() >= 2 && etag.front() == '"' && etag.back() == '"') {
        return etag.substr(1, etag.size() - 2);
    }
    return etag;
}

S3Client::S3Client(const S3Options& options) {
    const auto config = make_client_configuration(options);
    const auto signing = Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never;
    if (options.credentials.access_key.empty() || options.credentials.secret_key.empty()) {
        client_ = std::make_unique<Aws::S3::S3Client>(config, signing, false);
    } else {
        const Aws::Auth::AWSCredentials credentials(options.credentials.access_key, options.credentials.secret_key,
                                                    options.credentials.session_token);
        client_ = std::make_unique<Aws::S3::S3Client>(credentials, config, signing, false);
    }
}

S3Client::~S3Client() = default;

std::string S3Client::put_object(const std::string& bucket,
                                 const std::string& key,
                                 std::span<const std::byte> body,
                                 const ObjectMetadata& metadata) {
    Aws::S3::Model::PutObjectRequest request;
    request.SetBucket(bucket);
    request.SetKey(key);
    request.SetContentType("application/octet-stream");
    request.SetContentLength(static_cast<long long>(body.size()));
    request.SetContentMD5(content_md5(body));
    request.SetBody(body_stream(body));
    add_metadata(request, metadata);

    auto outcome = client_->PutObject(request);
    if (!outcome.IsSuccess()) {
        throw to_remote_error(outcome.GetError());
    }
    return strip_quotes(outcome.GetResult().GetETag());
}

std::string S3Client::create_multipart_upload(const std::string& bucket,
                                              const std::string& key,
                                              const ObjectMetadata& metadata) {
    Aws::S3::Model::CreateMultipartUploadRequest request;
    request.SetBucket(bucket);
    request.SetKey(key);
    request.SetContentType("application/octet-stream");
    add_metadata(request, metadata);

    auto outcome = client_->CreateMultipartUpload(request);
    if (!outcome.IsSuccess()) {
        throw to_remote_error(outcome.GetError());
    }
    std::string session_id = outcome.GetResult().GetUploadId();
    if (session_id.empty()) {
        throw RemoteError("MalformedResponse", "CreateMultipartUpload response has no UploadId");
    }
    return session_id;
}

std::string S3Client::upload_part(const std::string& bucket,
                                  const std::string& key,
                                  const std::string& session_id,
                                  int part_number,
                                  std::span<const std::byte> body) {
    Aws::S3::Model::UploadPartRequest request;
    request.SetBucket(bucket);
    request.SetKey(key);
    request.SetUploadId(session_id);
    request.SetPartNumber(part_number);
    request.SetContentLength(static_cast<long long>(body.size()));
    request.SetContentMD5(content_md5(body));
    request.SetBody(body_stream(body));

    auto outcome = client_->UploadPart(request);
    if (!outcome.IsSuccess()) {
        throw to_remote_error(outcome.GetError());
    }
    std::string etag = strip_quotes(outcome.GetResult().GetETag());
    if (etag.empty()) {
        throw RemoteError("MalformedResponse", "UploadPart response has no ETag");
    }
    return etag;
}

std::string S3Client::complete_multipart_upload(const std::string& bucket,
                                                const std::string& key,
                                                const std::string& session_id,
                                                const std::vector<CompletedPart>& parts) {
    Aws::S3::Model::CompletedMultipartUpload upload;
    for (const auto& part : parts) {
        Aws::S3::Model::CompletedPart completed;
        completed.SetPartNumber(part.part_number);
        completed.SetETag("\"" + part.etag + "\"");
        upload.AddParts(std::move(completed));
    }

    Aws::S3::Model::CompleteMultipartUploadRequest request;
    request.SetBucket(bucket);
    request.SetKey(key);
    request.SetUploadId(session_id);
    request.SetMultipartUpload(std::move(upload));

    auto outcome = client_->CompleteMultipartUpload(request);
    if (!outcome.IsSuccess()) {
        throw to_remote_error(outcome.GetError());
    }
    return strip_quotes(outcome.GetResult().GetETag());
}

void S3Client::abort_multipart_upload(const std::string& bucket,
                                      const std::string& key,
                                      const std::string& session_id) {
    Aws::S3::Model::AbortMultipartUploadRequest request;
    request.SetBucket(bucket);
    request.SetKey(key);
    request.SetUploadId(session_id);

    auto outcome = client_->AbortMultipartUpload(request);
    if (!outcome.IsSuccess()) {
        throw to_remote_error(outcome.GetError());
    }
}

std::optional<ObjectInfo> S3Client::head_object(const std::string& bucket, const std::string& key) {
    Aws::S3::Model::HeadObjectRequest request;
    request.SetBucket(bucket);
    request.SetKey(key);

    auto outcome = client_->HeadObject(request);
    if (!outcome.IsSuccess()) {
        if (outcome.GetError().GetResponseCode() == Aws::Http::HttpResponseCode::NOT_FOUND) {
            return std::nullopt;
        }
        throw to_remote_error(outcome.GetError());
    }
    ObjectInfo info;
    info.etag = strip_quotes(outcome.GetResult().GetETag());
    info.size = static_cast<std::uint64_t>(std::max<long long>(0, outcome.GetResult().GetContentLength()));
    return info;
}

}  // namespace bucket_sync::agent
