#pragma once

#include "logger.hpp"
#include "models.hpp"
#include "path_pattern.hpp"

#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace bucket_sync::agent {

// Regular files under `folder` whose path relative to it matches `pattern`,
// sorted. Directory iteration errors are reported through `ec`.
std::vector<std::filesystem::path> list_matching_files(const std::filesystem::path& folder,
                                                       const PathPattern& pattern,
                                                       std::error_code& ec);

// Modification time in seconds since the epoch, as recorded in the state file.
double modification_time(const std::filesystem::path& file);

class FileScanner {
public:
    explicit FileScanner(Logger& logger);

    std::vector<std::filesystem::path> scan_folder(const std::filesystem::path& folder,
                                                   const std::string& pattern = "*") const;

    std::vector<std::filesystem::path> scan(const UploadRequest& request) const;

    // Falls back to `file` unchanged (and logs) when it is not under `base`.
    std::filesystem::path relative_path(const std::filesystem::path& file, const std::filesystem::path& base) const;

private:
    Logger& logger_;
};

}  // namespace bucket_sync::agent
