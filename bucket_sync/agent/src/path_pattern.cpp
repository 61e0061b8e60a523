#include "path_pattern.hpp"

#include <fnmatch.h>

#include <cstddef>
#include <utility>

namespace bucket_sync::agent {

namespace {

std::vector<std::string> split(const std::string& text) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (start <= text.size()) {
        auto end = text.find('/', start);
        if (end == std::string::npos) {
            end = text.size();
        }
        if (end > start) {
            out.push_back(text.substr(start, end - start));
        }
        start = end + 1;
    }
    return out;
}

bool match_from(const std::vector<std::string>& pattern,
                std::size_t p,
                const std::vector<std::string>& parts,
                std::size_t i) {
    if (p == pattern.size()) {
        return i == parts.size();
    }
    if (pattern[p] == "**") {
        if (p + 1 == pattern.size()) {
            return i < parts.size();
        }
        // The file name itself is never consumed by "**".
        for (std::size_t skip = i; skip < parts.size(); ++skip) {
            if (match_from(pattern, p + 1, parts, skip)) {
                return true;
            }
        }
        return false;
    }
    if (i == parts.size()) {
        return false;
    }
    if (::fnmatch(pattern[p].c_str(), parts[i].c_str(), 0) != 0) {
        return false;
    }
    return match_from(pattern, p + 1, parts, i + 1);
}

}  // namespace

PathPattern::PathPattern(std::string pattern)
    : text_(pattern.empty() ? "*" : std::move(pattern)), segments_(split(text_)) {
    if (segments_.empty()) {
        segments_.push_back("*");
    }
}

bool PathPattern::matches(const std::filesystem::path& relative) const {
    return match_from(segments_, 0, split(relative.generic_string()), 0);
}

}  // namespace bucket_sync::agent
