#include "glob_expander.h"

#include <glob.h>

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <system_error>

#include "debug.h"
#include "pattern_matcher.h"

namespace glob_expander {

namespace {

namespace fs = std::filesystem;

std::vector<std::string> split_segments(const std::string& pattern) {
    std::vector<std::string> segments;
    std::string current;
    for (size_t i = 0; i < pattern.size(); ++i) {
        char c = pattern[i];
        if (c == '\\' && i + 1 < pattern.size()) {
            current += c;
            current += pattern[++i];
            continue;
        }
        if (c == '/') {
            if (!current.empty()) {
                segments.push_back(current);
            }
            current.clear();
            continue;
        }
        current += c;
    }
    if (!current.empty()) {
        segments.push_back(current);
    }
    return segments;
}

std::string join_path(const std::string& base, const std::string& name) {
    if (base.empty()) {
        return name;
    }
    if (base == "/") {
        return "/" + name;
    }
    return base + "/" + name;
}

bool segment_allows_hidden(const std::string& segment) {
    return (!segment.empty() && segment[0] == '.') ||
           (segment.size() > 1 && segment[0] == '\\' && segment[1] == '.');
}

// Immediate children of base, sorted, without "." and "..".
std::vector<fs::directory_entry> list_directory(const std::string& base) {
    std::vector<fs::directory_entry> entries;
    std::error_code ec;
    fs::directory_iterator it(base.empty() ? "." : base, ec);
    if (ec) {
        return entries;
    }
    for (const auto& entry : it) {
        entries.push_back(entry);
    }
    std::sort(entries.begin(), entries.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b) {
                  return a.path().filename() < b.path().filename();
              });
    return entries;
}

bool is_real_directory(const fs::directory_entry& entry) {
    std::error_code ec;
    return entry.is_directory(ec) && !entry.is_symlink(ec);
}

class RecursiveGlob {
   public:
    explicit RecursiveGlob(std::vector<std::string> segments) : segments_(std::move(segments)) {
    }

    void walk(const std::string& base, size_t index) {
        if (index == segments_.size()) {
            if (!base.empty()) {
                results_.push_back(base);
            }
            return;
        }

        const std::string& segment = segments_[index];
        if (segment == "**") {
            if (index + 1 == segments_.size()) {
                collect_descendants(base);
                return;
            }
            walk_any_depth(base, index + 1);
            return;
        }

        if (!PatternMatcher::has_glob_chars(segment)) {
            std::string path = join_path(base, PatternMatcher::unescape(segment));
            std::error_code ec;
            if (index + 1 == segments_.size()) {
                if (fs::exists(fs::symlink_status(path, ec))) {
                    results_.push_back(path);
                }
            } else if (fs::is_directory(path, ec)) {
                walk(path, index + 1);
            }
            return;
        }

        bool allow_hidden = segment_allows_hidden(segment);
        bool last = index + 1 == segments_.size();
        for (const auto& entry : list_directory(base)) {
            std::string name = entry.path().filename().string();
            if (name[0] == '.' && !allow_hidden) {
                continue;
            }
            if (!matcher_.matches_single_pattern(name, segment)) {
                continue;
            }
            std::error_code ec;
            if (!last && !entry.is_directory(ec)) {
                continue;
            }
            walk(join_path(base, name), index + 1);
        }
    }

    std::vector<std::string> take_results() {
        std::sort(results_.begin(), results_.end());
        results_.erase(std::unique(results_.begin(), results_.end()), results_.end());
        return std::move(results_);
    }

   private:
    std::vector<std::string> segments_;
    std::vector<std::string> results_;
    PatternMatcher matcher_;

    void walk_any_depth(const std::string& base, size_t next_index) {
        walk(base, next_index);
        for (const auto& entry : list_directory(base)) {
            std::string name = entry.path().filename().string();
            if (name[0] == '.' || !is_real_directory(entry)) {
                continue;
            }
            walk_any_depth(join_path(base, name), next_index);
        }
    }

    void collect_descendants(const std::string& base) {
        for (const auto& entry : list_directory(base)) {
            std::string name = entry.path().filename().string();
            if (name[0] == '.') {
                continue;
            }
            std::string path = join_path(base, name);
            results_.push_back(path);
            if (is_real_directory(entry)) {
                collect_descendants(path);
            }
        }
    }
};

bool has_globstar_segment(const std::vector<std::string>& segments) {
    return std::find(segments.begin(), segments.end(), "**") != segments.end();
}

}  // namespace

std::vector<std::string> match_paths(const std::string& pattern, bool globstar) {
    std::vector<std::string> result;
    if (!PatternMatcher::has_glob_chars(pattern)) {
        return result;
    }

    auto segments = split_segments(pattern);
    if (globstar && has_globstar_segment(segments)) {
        RecursiveGlob walker(segments);
        walker.walk(!pattern.empty() && pattern[0] == '/' ? "/" : "", 0);
        result = walker.take_results();
        debug_msg("globstar '%s' matched %zu paths", pattern.c_str(), result.size());
        return result;
    }

    glob_t glob_result;
    std::memset(&glob_result, 0, sizeof(glob_result));

    int return_value = glob(pattern.c_str(), 0, nullptr, &glob_result);
    if (return_value == 0) {
        for (size_t i = 0; i < glob_result.gl_pathc; ++i) {
            result.emplace_back(glob_result.gl_pathv[i]);
        }
    }
    globfree(&glob_result);
    return result;
}

std::vector<std::string> pathname_expand(const std::string& pattern, bool globstar) {
    auto result = match_paths(pattern, globstar);
    if (result.empty()) {
        result.push_back(PatternMatcher::unescape(pattern));
    }
    return result;
}

}  // namespace glob_expander
