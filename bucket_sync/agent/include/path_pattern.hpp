#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace bucket_sync::agent {

// Glob pattern evaluated against paths relative to a root, one segment at a
// time with fnmatch(3) rules. A "**" segment spans zero or more directories.
class PathPattern {
public:
    explicit PathPattern(std::string pattern = "*");

    bool matches(const std::filesystem::path& relative) const;

    const std::string& text() const { return text_; }

    // False when only the root's own entries can match.
    bool recursive() const { return segments_.size() > 1; }

private:
    std::string text_;
    std::vector<std::string> segments_;
};

}  // namespace bucket_sync::agent
