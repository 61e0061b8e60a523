#include "cli_app.hpp"

#include <cassert>
#include <iostream>
#include <regex>
#include <stdexcept>
#include <string>
#include <vector>

using namespace bucket_sync::cli;

namespace {

bool rejects(const std::vector<std::string>& args) {
    try {
        parse_arguments(args);
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

}  // namespace

void test_start_with_options() {
    const CliOptions options = parse_arguments({"-c", "/etc/sync.conf", "start", "/data/photos", "media",
                                                "-i", "nightly", "-p", "**/*.jpg", "-n", "Photos", "-w", "8", "-v"});
    assert(options.command == "start");
    assert((options.positionals == std::vector<std::string>{"/data/photos", "media"}));
    assert(options.config_path == "/etc/sync.conf");
    assert(options.upload_id == "nightly");
    assert(options.pattern == "**/*.jpg");
    assert(options.name == "Photos");
    assert(!options.type);
    assert(options.workers == 8u);
    assert(options.verbose);
    std::cout << "✓ start with options" << std::endl;
}

void test_defaults() {
    const CliOptions options = parse_arguments({"list"});
    assert(options.command == "list");
    assert(options.positionals.empty());
    assert(options.config_path == "bucket_sync.conf");
    assert(options.pattern == "*");
    assert(!options.upload_id);
    assert(!options.workers);
    assert(!options.verbose);
    std::cout << "✓ defaults" << std::endl;
}

void test_rejects_malformed_arguments() {
    assert(rejects({}));
    assert(rejects({"sync", "a", "b"}));
    assert(rejects({"start", "/data"}));
    assert(rejects({"history"}));
    assert(rejects({"resume", "extra"}));
    assert(rejects({"start", "/data", "bucket", "-p"}));
    assert(rejects({"start", "/data", "bucket", "--bogus"}));
    assert(rejects({"batch", "/data", "bucket", "-w", "0"}));
    assert(rejects({"batch", "/data", "bucket", "-w", "lots"}));
    assert(!rejects({"history", "abc"}));
    std::cout << "✓ rejects malformed arguments" << std::endl;
}

void test_generated_ids_are_v4_uuids() {
    const std::regex uuid("[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}");
    const std::string first = generate_upload_id();
    const std::string second = generate_upload_id();
    assert(std::regex_match(first, uuid));
    assert(std::regex_match(second, uuid));
    assert(first != second);
    std::cout << "✓ generated ids are v4 uuids" << std::endl;
}

int main() {
    test_start_with_options();
    test_defaults();
    test_rejects_malformed_arguments();
    test_generated_ids_are_v4_uuids();
    std::cout << "All CLI option tests passed" << std::endl;
    return 0;
}
