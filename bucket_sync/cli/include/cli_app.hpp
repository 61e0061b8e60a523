#pragma once

#include "config_loader.hpp"
#include "logger.hpp"
#include "object_store.hpp"
#include "upload_coordinator.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace bucket_sync::cli {

struct CliOptions {
    std::string command;
    std::vector<std::string> positionals;
    std::string config_path = "bucket_sync.conf";
    bool verbose = false;
    std::optional<std::string> upload_id;
    std::string pattern = "*";
    std::optional<std::string> name;
    std::optional<std::string> type;
    std::optional<std::string> description;
    std::optional<std::size_t> workers;
    std::optional<std::string> log_dir;
};

// Throws std::invalid_argument on unknown options, missing option values or
// the wrong number of positional arguments for the command.
CliOptions parse_arguments(const std::vector<std::string>& args);

void print_usage(std::ostream& out);

// Random RFC 4122 version-4 identifier.
std::string generate_upload_id();

class CliApp {
public:
    explicit CliApp(CliOptions options);

    // Process exit code.
    int run();

private:
    int run_start();
    int run_resume();
    int run_batch();
    int run_list();
    int run_history();

    agent::CoordinatorOptions coordinator_options() const;
    agent::UploaderOptions uploader_options() const;
    std::unique_ptr<agent::ObjectStore> make_store() const;
    void wait_for_signal() const;

    CliOptions options_;
    agent::AgentConfig config_;
    std::unique_ptr<agent::Logger> logger_;
};

}  // namespace bucket_sync::cli
