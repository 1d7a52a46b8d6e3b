/*
  pattern_matcher.h

  This file is part of esh, an embeddable shell

  MIT License

  Copyright (c) 2026 Caden Finley

  Permission is hereby granted, free of charge, to any person obtaining a copy
  of this software and associated documentation files (the "Software"), to deal
  in the Software without restriction, including without limitation the rights
  to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
  copies of the Software, and to permit persons to whom the Software is
  furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all
  copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
  IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
  FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
  AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
  LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
  OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
  SOFTWARE.
*/

#pragma once

#include <cstddef>
#include <string>

// Shell glob matching: `*`, `?`, bracket classes with `!`/`^` negation, ranges and
// [:name:] classes, backslash escapes and `|`-separated alternatives.
class PatternMatcher {
   public:
    PatternMatcher() = default;
    ~PatternMatcher() = default;

    PatternMatcher(const PatternMatcher&) = delete;
    PatternMatcher& operator=(const PatternMatcher&) = delete;
    PatternMatcher(PatternMatcher&&) = default;
    PatternMatcher& operator=(PatternMatcher&&) = default;

    bool matches_pattern(const std::string& text, const std::string& pattern) const;
    // Same without splitting on `|`; used for pathname segments and ${var#pattern}.
    bool matches_single_pattern(const std::string& text, const std::string& pattern) const;

    static bool has_glob_chars(const std::string& pattern);
    // Removes backslash escapes, leaving the literal text.
    static std::string unescape(const std::string& pattern);
    // Backslash-escapes every glob metacharacter in text.
    static std::string escape(const std::string& text);

   private:
    // Matches c against the class starting at pattern[start] == '['. On success next is the
    // index after the closing bracket. Returns false with next == npos if unterminated.
    bool match_char_class(char c, const std::string& pattern, size_t start, size_t& next,
                          bool& matched) const;
};
