#include "file_scanner.hpp"

#include <algorithm>
#include <chrono>

namespace bucket_sync::agent {

namespace fs = std::filesystem;

namespace {

template <typename Iterator>
void collect(Iterator it, const fs::path& folder, const PathPattern& pattern, std::vector<fs::path>& out,
             std::error_code& ec) {
    for (; !ec && it != Iterator{}; it.increment(ec)) {
        std::error_code status_ec;
        if (!it->is_regular_file(status_ec)) {
            continue;
        }
        if (pattern.matches(it->path().lexically_relative(folder))) {
            out.push_back(it->path());
        }
    }
}

}  // namespace

std::vector<fs::path> list_matching_files(const fs::path& folder, const PathPattern& pattern, std::error_code& ec) {
    std::vector<fs::path> files;
    if (pattern.recursive()) {
        collect(fs::recursive_directory_iterator(folder, fs::directory_options::skip_permission_denied, ec), folder,
                pattern, files, ec);
    } else {
        collect(fs::directory_iterator(folder, fs::directory_options::skip_permission_denied, ec), folder, pattern,
                files, ec);
    }
    std::sort(files.begin(), files.end());
    return files;
}

double modification_time(const fs::path& file) {
    const auto written = fs::last_write_time(file);
    const auto system = std::chrono::file_clock::to_sys(written);
    return std::chrono::duration<double>(system.time_since_epoch()).count();
}

FileScanner::FileScanner(Logger& logger) : logger_(logger) {}

std::vector<fs::path> FileScanner::scan_folder(const fs::path& folder, const std::string& pattern) const {
    std::error_code ec;
    if (!fs::exists(folder, ec)) {
        logger_.error("Folder " + folder.string() + " does not exist");
        return {};
    }
    auto files = list_matching_files(folder, PathPattern(pattern), ec);
    if (ec) {
        logger_.error("Error scanning folder " + folder.string() + ": " + ec.message());
    }
    return files;
}

std::vector<fs::path> FileScanner::scan(const UploadRequest& request) const {
    return scan_folder(request.source_folder(), request.pattern());
}

fs::path FileScanner::relative_path(const fs::path& file, const fs::path& base) const {
    const fs::path relative = file.lexically_normal().lexically_relative(base.lexically_normal());
    if (relative.empty() || *relative.begin() == "..") {
        logger_.error("File " + file.string() + " is not under " + base.string());
        return file;
    }
    return relative;
}

}  // namespace bucket_sync::agent
