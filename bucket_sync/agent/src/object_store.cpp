#include "object_store.hpp"

#include <array>
#include <utility>

namespace bucket_sync::agent {

namespace {

constexpr std::array<std::string_view, 24> kRetryableCodes = {
    "RequestTimeout",
    "RequestTimeoutException",
    "PriorRequestNotComplete",
    "ConnectionError",
    "HTTPClientError",
    "Throttling",
    "ThrottlingException",
    "ThrottledException",
    "RequestThrottledException",
    "RequestThrottled",
    "TooManyRequestsException",
    "ProvisionedThroughputExceededException",
    "TransactionInProgressException",
    "RequestLimitExceeded",
    "BandwidthLimitExceeded",
    "LimitExceededException",
    "SlowDown",
    "ServiceUnavailable",
    "InternalError",
    "InternalServerError",
    "500",
    "502",
    "503",
    "504",
};

}  // namespace

RemoteError::RemoteError(std::string code, const std::string& message, int http_status)
    : std::runtime_error(code + ": " + message), code_(std::move(code)), http_status_(http_status) {}

bool RemoteError::retryable() const {
    return is_retryable_error(code_) || http_status_ >= 500;
}

bool is_retryable_error(std::string_view code) {
    for (const auto candidate : kRetryableCodes) {
        if (candidate == code) {
            return true;
        }
    }
    return false;
}

}  // namespace bucket_sync::agent
