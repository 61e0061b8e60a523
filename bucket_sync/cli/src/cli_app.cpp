#include "cli_app.hpp"

#include "file_scanner.hpp"
#include "models.hpp"
#include "s3_client.hpp"
#include "upload_tracker.hpp"
#include "uploader.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <utility>

namespace bucket_sync::cli {

namespace {

std::atomic<bool> g_should_run{true};

void handle_signal(int) {
    g_should_run = false;
}

std::size_t expected_positionals(const std::string& command) {
    if (command == "start" || command == "batch") {
        return 2;
    }
    if (command == "history") {
        return 1;
    }
    if (command == "resume" || command == "list") {
        return 0;
    }
    throw std::invalid_argument("Unknown command: " + command);
}

agent::RequestMetadata request_metadata(const CliOptions& options) {
    return agent::RequestMetadata{options.name, options.type, options.description};
}

}  // namespace

CliOptions parse_arguments(const std::vector<std::string>& args) {
    CliOptions options;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        const auto value = [&]() -> std::string {
            if (i + 1 >= args.size()) {
                throw std::invalid_argument("Option " + arg + " requires a value");
            }
            return args[++i];
        };

        if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "-c" || arg == "--config") {
            options.config_path = value();
        } else if (arg == "-i" || arg == "--upload-id") {
            options.upload_id = value();
        } else if (arg == "-p" || arg == "--pattern") {
            options.pattern = value();
        } else if (arg == "-n" || arg == "--name") {
            options.name = value();
        } else if (arg == "-t" || arg == "--type") {
            options.type = value();
        } else if (arg == "-d" || arg == "--description") {
            options.description = value();
        } else if (arg == "-w" || arg == "--workers") {
            const std::string text = value();
            std::size_t workers = 0;
            try {
                workers = std::stoul(text);
            } catch (const std::logic_error&) {
                throw std::invalid_argument("Invalid worker count: " + text);
            }
            if (workers == 0) {
                throw std::invalid_argument("Worker count must be positive");
            }
            options.workers = workers;
        } else if (arg == "-l" || arg == "--log-dir") {
            options.log_dir = value();
        } else if (!arg.empty() && arg[0] == '-') {
            throw std::invalid_argument("Unknown option: " + arg);
        } else if (options.command.empty()) {
            options.command = arg;
        } else {
            options.positionals.push_back(arg);
        }
    }

    if (options.command.empty()) {
        throw std::invalid_argument("Missing command");
    }
    if (options.positionals.size() != expected_positionals(options.command)) {
        throw std::invalid_argument("Wrong number of arguments for " + options.command);
    }
    return options;
}

void print_usage(std::ostream& out) {
    out << "Usage: bucket_sync [-c config] [-v] <command> [options]\n"
        << "Commands:\n"
        << "  start <source_folder> <bucket>   upload and keep monitoring until interrupted\n"
        << "  batch <source_folder> <bucket>   upload once and exit\n"
        << "  resume                           resume persisted uploads and monitor\n"
        << "  list                             show persisted uploads\n"
        << "  history <upload_id>              show audit records of an upload\n"
        << "Options for start/batch:\n"
        << "  -i, --upload-id <id>\n"
        << "  -p, --pattern <glob>      default *\n"
        << "  -n, --name <name>\n"
        << "  -t, --type <type>\n"
        << "  -d, --description <text>\n"
        << "  -w, --workers <count>\n"
        << "  -l, --log-dir <dir>" << std::endl;
}

std::string generate_upload_id() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<int> dist(0, 255);
    unsigned char bytes[16];
    for (auto& byte : bytes) {
        byte = static_cast<unsigned char>(dist(gen));
    }
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0f) | 0x40);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3f) | 0x80);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << '-';
        }
        oss << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return oss.str();
}

CliApp::CliApp(CliOptions options) : options_(std::move(options)) {
    config_ = agent::load_config(options_.config_path);
    agent::apply_environment(config_);
    if (options_.log_dir) {
        config_.log_dir = *options_.log_dir;
    }
    if (options_.workers) {
        config_.max_workers = *options_.workers;
    }
    const auto level = options_.verbose ? agent::LogLevel::kDebug : agent::parse_log_level(config_.log_level);
    logger_ = std::make_unique<agent::Logger>(config_.log_file, level);
}

agent::UploaderOptions CliApp::uploader_options() const {
    agent::RetryPolicy retry;
    retry.max_attempts = config_.retry_attempts;
    retry.base_delay = std::chrono::milliseconds(config_.retry_base_delay_ms);
    retry.max_delay = std::chrono::milliseconds(config_.retry_max_delay_ms);

    agent::UploaderOptions options;
    options.max_workers = config_.max_workers;
    options.chunk_size = config_.chunk_size_bytes;
    options.put_retry = retry;
    options.part_retry = retry;
    return options;
}

agent::CoordinatorOptions CliApp::coordinator_options() const {
    agent::CoordinatorOptions options;
    options.state_file = config_.state_file;
    options.log_dir = config_.log_dir;
    options.scan_interval = std::chrono::seconds(config_.scan_interval_seconds);
    options.monitor_stop_timeout = std::chrono::milliseconds(config_.monitor_stop_timeout_ms);
    options.uploader = uploader_options();
    return options;
}

std::unique_ptr<agent::ObjectStore> CliApp::make_store() const {
    agent::S3Options options;
    options.endpoint = config_.s3_endpoint;
    options.region = config_.s3_region;
    options.credentials = agent::Credentials{config_.s3_access_key, config_.s3_secret_key, config_.s3_session_token};
    options.connect_timeout_seconds = config_.s3_connect_timeout_seconds;
    options.request_timeout_seconds = config_.s3_request_timeout_seconds;
    if (options.credentials.access_key.empty() || options.credentials.secret_key.empty()) {
        logger_->info("No S3 credentials configured; using the default AWS credential chain");
    }
    return std::make_unique<agent::S3Client>(options);
}

void CliApp::wait_for_signal() const {
    g_should_run = true;
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
    while (g_should_run.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
}

int CliApp::run() {
    try {
        if (options_.command == "start") {
            return run_start();
        }
        if (options_.command == "resume") {
            return run_resume();
        }
        if (options_.command == "batch") {
            return run_batch();
        }
        if (options_.command == "list") {
            return run_list();
        }
        if (options_.command == "history") {
            return run_history();
        }
        print_usage(std::cerr);
        return 2;
    } catch (const std::exception& ex) {
        logger_->error(std::string("Error: ") + ex.what());
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }
}

int CliApp::run_start() {
    const agent::UploadRequest request(options_.upload_id.value_or(generate_upload_id()), options_.positionals[0],
                                       options_.positionals[1], options_.pattern, request_metadata(options_));
    auto store = make_store();
    agent::UploadCoordinator coordinator(coordinator_options(), *store, *logger_);
    coordinator.start_upload(request);

    std::cout << "Started upload " << request.upload_id() << ". Press Ctrl+C to stop." << std::endl;
    wait_for_signal();

    std::cout << "Stopping upload " << request.upload_id() << "..." << std::endl;
    coordinator.stop_upload(request.upload_id());
    coordinator.stop_all();
    return 0;
}

int CliApp::run_resume() {
    auto store = make_store();
    agent::UploadCoordinator coordinator(coordinator_options(), *store, *logger_);
    const auto active = coordinator.active_uploads();
    if (active.empty()) {
        std::cout << "No uploads to resume" << std::endl;
        return 0;
    }
    std::cout << "Resumed " << active.size() << " uploads. Press Ctrl+C to stop." << std::endl;
    wait_for_signal();
    coordinator.stop_all();
    return 0;
}

int CliApp::run_batch() {
    std::optional<agent::UploadRequest> request;
    try {
        request.emplace(options_.upload_id.value_or(generate_upload_id()), options_.positionals[0],
                        options_.positionals[1], options_.pattern, request_metadata(options_));
    } catch (const std::invalid_argument& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }

    agent::FileScanner scanner(*logger_);
    const auto files = scanner.scan(*request);
    std::vector<agent::TransferItem> items;
    items.reserve(files.size());
    for (const auto& file : files) {
        items.push_back(agent::TransferItem{file, scanner.relative_path(file, request->source_folder()).generic_string()});
    }

    auto store = make_store();
    agent::Uploader uploader(request->upload_id(), *store, uploader_options(), *logger_);
    const auto summary = uploader.upload_files(items, request->destination_bucket(), request->object_metadata());

    std::cout << "Upload " << summary.upload_id << ": " << summary.total_files << " files, "
              << summary.successful_uploads << " succeeded, " << summary.failed_uploads << " failed" << std::endl;
    if (summary.failed_uploads == 0) {
        return 0;
    }
    std::cout << "Failed files:" << std::endl;
    for (const auto& result : summary.results) {
        if (!result.success) {
            std::cout << "  " << result.file_path.string() << ": " << result.error.value_or("unknown error")
                      << std::endl;
        }
    }
    return 1;
}

int CliApp::run_list() {
    agent::UploadTracker tracker(agent::TrackerOptions{config_.state_file, {}}, *logger_);
    const auto ids = tracker.upload_ids();
    if (ids.empty()) {
        std::cout << "No uploads found" << std::endl;
        return 0;
    }
    for (const auto& id : ids) {
        const auto state = tracker.get_state(id);
        if (!state) {
            continue;
        }
        std::cout << "\nUpload ID: " << state->upload_id << "\n"
                  << "Source: " << state->source_folder << "\n"
                  << "Destination: " << state->destination_bucket << "\n"
                  << "Pattern: " << state->pattern << "\n"
                  << "Completed Files: " << state->completed_files.size() << "\n"
                  << "In Progress: " << state->in_progress_files.size() << std::endl;
    }
    return 0;
}

int CliApp::run_history() {
    agent::UploadTracker tracker(agent::TrackerOptions{{}, config_.log_dir}, *logger_);
    const auto entries = tracker.audit_entries(options_.positionals[0]);
    if (entries.empty()) {
        std::cout << "No audit records for " << options_.positionals[0] << std::endl;
        return 0;
    }
    for (const auto& entry : entries) {
        std::cout << "== " << entry.log_key << " [" << entry.kind << "] " << entry.logged_at << "\n"
                  << entry.document << std::endl;
    }
    return 0;
}

}  // namespace bucket_sync::cli
