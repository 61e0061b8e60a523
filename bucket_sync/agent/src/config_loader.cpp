#include "config_loader.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace bucket_sync::agent {

namespace {

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

void fill_from_env(std::string& field, const char* name) {
    if (!field.empty()) {
        return;
    }
    if (const char* value = std::getenv(name)) {
        field = value;
    }
}

}

AgentConfig load_config(const std::string& path) {
    AgentConfig config;
    std::ifstream stream(path);
    if (!stream.is_open()) {
        std::cerr << "[WARN] Unable to open config file " << path
                  << ", falling back to defaults" << std::endl;
        return config;
    }

    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        const auto equals_pos = line.find('=');
        if (equals_pos == std::string::npos) {
            continue;
        }
        const std::string key = trim(line.substr(0, equals_pos));
        const std::string value = trim(line.substr(equals_pos + 1));

        if (key == "state_file") {
            config.state_file = value;
        } else if (key == "log_dir") {
            config.log_dir = value;
        } else if (key == "log_file") {
            config.log_file = value;
        } else if (key == "log_level") {
            config.log_level = value;
        } else if (key == "scan_interval_seconds") {
            config.scan_interval_seconds = static_cast<std::uint32_t>(std::stoul(value));
        } else if (key == "max_workers") {
            config.max_workers = static_cast<std::size_t>(std::stoul(value));
        } else if (key == "chunk_size_bytes") {
            config.chunk_size_bytes = static_cast<std::uint64_t>(std::stoull(value));
        } else if (key == "retry_attempts") {
            config.retry_attempts = std::stoi(value);
        } else if (key == "retry_base_delay_ms") {
            config.retry_base_delay_ms = static_cast<std::uint32_t>(std::stoul(value));
        } else if (key == "retry_max_delay_ms") {
            config.retry_max_delay_ms = static_cast<std::uint32_t>(std::stoul(value));
        } else if (key == "monitor_stop_timeout_ms") {
            config.monitor_stop_timeout_ms = static_cast<std::uint32_t>(std::stoul(value));
        } else if (key == "s3_endpoint") {
            config.s3_endpoint = value;
        } else if (key == "s3_region") {
            config.s3_region = value;
        } else if (key == "s3_access_key") {
            config.s3_access_key = value;
        } else if (key == "s3_secret_key") {
            config.s3_secret_key = value;
        } else if (key == "s3_session_token") {
            config.s3_session_token = value;
        } else if (key == "s3_connect_timeout_seconds") {
            config.s3_connect_timeout_seconds = std::stoi(value);
        } else if (key == "s3_request_timeout_seconds") {
            config.s3_request_timeout_seconds = std::stoi(value);
        }
    }

    return config;
}

void apply_environment(AgentConfig& config) {
    fill_from_env(config.s3_access_key, "AWS_ACCESS_KEY_ID");
    fill_from_env(config.s3_secret_key, "AWS_SECRET_ACCESS_KEY");
    fill_from_env(config.s3_session_token, "AWS_SESSION_TOKEN");
}

}  // namespace bucket_sync::agent
