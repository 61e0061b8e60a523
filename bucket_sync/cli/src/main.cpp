#include "cli_app.hpp"
#include "s3_client.hpp"

#include <iostream>
#include <string>
#include <utility>
#include <vector>

int main(int argc, char* argv[]) {
    const std::vector<std::string> args(argv + 1, argv + argc);

    bucket_sync::cli::CliOptions options;
    try {
        options = bucket_sync::cli::parse_arguments(args);
    } catch (const std::invalid_argument& ex) {
        std::cerr << ex.what() << std::endl;
        bucket_sync::cli::print_usage(std::cerr);
        return 2;
    }

    bucket_sync::agent::SdkSession sdk;
    try {
        bucket_sync::cli::CliApp app(std::move(options));
        return app.run();
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
}
