#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace bucket_sync::agent {

struct AgentConfig {
    std::string state_file = "upload_state.json";
    std::string log_dir = "logs";
    std::string log_file;
    std::string log_level = "info";
    std::uint32_t scan_interval_seconds = 30;
    std::size_t max_workers = 5;
    std::uint64_t chunk_size_bytes = 8ULL * 1024 * 1024;
    int retry_attempts = 3;
    std::uint32_t retry_base_delay_ms = 1000;
    std::uint32_t retry_max_delay_ms = 5000;
    std::uint32_t monitor_stop_timeout_ms = 5000;
    std::string s3_endpoint = "https://s3.amazonaws.com";
    std::string s3_region = "us-east-1";
    std::string s3_access_key;
    std::string s3_secret_key;
    std::string s3_session_token;
    int s3_connect_timeout_seconds = 10;
    int s3_request_timeout_seconds = 300;
};

AgentConfig load_config(const std::string& path);

// Fills empty credential fields from the AWS_* environment variables.
void apply_environment(AgentConfig& config);

}  // namespace bucket_sync::agent
