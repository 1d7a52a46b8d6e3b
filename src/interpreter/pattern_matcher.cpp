#include "pattern_matcher.h"

#include <cctype>
#include <string>
#include <vector>

namespace {

bool matches_named_class(char c, const std::string& name) {
    auto uc = static_cast<unsigned char>(c);
    if (name == "alpha") {
        return std::isalpha(uc) != 0;
    }
    if (name == "digit") {
        return std::isdigit(uc) != 0;
    }
    if (name == "alnum") {
        return std::isalnum(uc) != 0;
    }
    if (name == "space") {
        return std::isspace(uc) != 0;
    }
    if (name == "upper") {
        return std::isupper(uc) != 0;
    }
    if (name == "lower") {
        return std::islower(uc) != 0;
    }
    if (name == "punct") {
        return std::ispunct(uc) != 0;
    }
    if (name == "xdigit") {
        return std::isxdigit(uc) != 0;
    }
    if (name == "blank") {
        return c == ' ' || c == '\t';
    }
    return false;
}

std::vector<std::string> split_alternatives(const std::string& pattern) {
    std::vector<std::string> parts;
    std::string current;
    int bracket_depth = 0;
    for (size_t i = 0; i < pattern.size(); ++i) {
        char c = pattern[i];
        if (c == '\\' && i + 1 < pattern.size()) {
            current += c;
            current += pattern[++i];
            continue;
        }
        if (c == '[') {
            ++bracket_depth;
        } else if (c == ']' && bracket_depth > 0) {
            --bracket_depth;
        } else if (c == '|' && bracket_depth == 0) {
            parts.push_back(current);
            current.clear();
            continue;
        }
        current += c;
    }
    parts.push_back(current);
    return parts;
}

}  // namespace

bool PatternMatcher::has_glob_chars(const std::string& pattern) {
    for (size_t i = 0; i < pattern.size(); ++i) {
        char c = pattern[i];
        if (c == '\\') {
            ++i;
            continue;
        }
        if (c == '*' || c == '?' || c == '[') {
            return true;
        }
    }
    return false;
}

std::string PatternMatcher::unescape(const std::string& pattern) {
    std::string result;
    result.reserve(pattern.size());
    for (size_t i = 0; i < pattern.size(); ++i) {
        if (pattern[i] == '\\' && i + 1 < pattern.size()) {
            ++i;
        }
        result += pattern[i];
    }
    return result;
}

std::string PatternMatcher::escape(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        if (c == '*' || c == '?' || c == '[' || c == ']' || c == '\\' || c == '|') {
            result += '\\';
        }
        result += c;
    }
    return result;
}

bool PatternMatcher::matches_pattern(const std::string& text, const std::string& pattern) const {
    if (pattern.find('|') == std::string::npos) {
        return matches_single_pattern(text, pattern);
    }
    for (const auto& alternative : split_alternatives(pattern)) {
        if (matches_single_pattern(text, alternative)) {
            return true;
        }
    }
    return false;
}

bool PatternMatcher::matches_single_pattern(const std::string& text,
                                            const std::string& pattern) const {
    size_t ti = 0;
    size_t pi = 0;
    size_t star_idx = std::string::npos;
    size_t match_idx = 0;

    auto backtrack = [&]() {
        if (star_idx == std::string::npos) {
            return false;
        }
        pi = star_idx + 1;
        ti = ++match_idx;
        return true;
    };

    while (ti < text.length() || pi < pattern.length()) {
        if (ti >= text.length()) {
            while (pi < pattern.length() && pattern[pi] == '*') {
                pi++;
            }
            return pi == pattern.length();
        }

        if (pi >= pattern.length()) {
            if (!backtrack()) {
                return false;
            }
            continue;
        }

        char pc = pattern[pi];
        if (pc == '*') {
            star_idx = pi;
            match_idx = ti;
            pi++;
            continue;
        }
        if (pc == '?') {
            ti++;
            pi++;
            continue;
        }
        if (pc == '[') {
            size_t next = 0;
            bool matched = false;
            if (match_char_class(text[ti], pattern, pi, next, matched)) {
                if (matched) {
                    ti++;
                    pi = next;
                    continue;
                }
                if (!backtrack()) {
                    return false;
                }
                continue;
            }
            // unterminated class: '[' is literal
        }
        if (pc == '\\' && pi + 1 < pattern.length()) {
            if (pattern[pi + 1] == text[ti]) {
                ti++;
                pi += 2;
            } else if (!backtrack()) {
                return false;
            }
            continue;
        }
        if (pc == text[ti]) {
            ti++;
            pi++;
        } else if (!backtrack()) {
            return false;
        }
    }

    return true;
}

bool PatternMatcher::match_char_class(char c, const std::string& pattern, size_t start,
                                      size_t& next, bool& matched) const {
    size_t i = start + 1;
    bool negated = false;
    if (i < pattern.size() && (pattern[i] == '!' || pattern[i] == '^')) {
        negated = true;
        ++i;
    }

    bool found = false;
    bool first = true;
    while (i < pattern.size()) {
        char ch = pattern[i];
        if (ch == ']' && !first) {
            next = i + 1;
            matched = negated ? !found : found;
            return true;
        }
        first = false;

        if (ch == '[' && i + 1 < pattern.size() && pattern[i + 1] == ':') {
            size_t close = pattern.find(":]", i + 2);
            if (close != std::string::npos) {
                if (matches_named_class(c, pattern.substr(i + 2, close - i - 2))) {
                    found = true;
                }
                i = close + 2;
                continue;
            }
        }

        if (ch == '\\' && i + 1 < pattern.size()) {
            ch = pattern[++i];
        }

        if (i + 2 < pattern.size() && pattern[i + 1] == '-' && pattern[i + 2] != ']') {
            char range_end = pattern[i + 2];
            size_t advance = 3;
            if (range_end == '\\' && i + 3 < pattern.size()) {
                range_end = pattern[i + 3];
                advance = 4;
            }
            if (c >= ch && c <= range_end) {
                found = true;
            }
            i += advance;
            continue;
        }

        if (c == ch) {
            found = true;
        }
        ++i;
    }

    next = std::string::npos;
    return false;
}
