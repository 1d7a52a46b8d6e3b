#include "case_evaluator.h"

#include <cctype>

#include "debug.h"

namespace case_evaluator {

namespace {

bool is_blank(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string trim(const std::string& text, bool keep_escaped_tail) {
    size_t start = 0;
    while (start < text.size() && is_blank(text[start])) {
        ++start;
    }
    size_t end = text.size();
    while (end > start && is_blank(text[end - 1])) {
        if (keep_escaped_tail && end - 1 > start && text[end - 2] == '\\') {
            break;
        }
        --end;
    }
    return text.substr(start, end - start);
}

}  // namespace

std::string normalize_case_value(const std::string& value) {
    return trim(value, false);
}

std::string normalize_case_pattern(const std::string& pattern) {
    return trim(pattern, true);
}

ExecResult execute_case(const ast::CaseStatement& statement, const std::string& value,
                        const std::function<std::string(const ast::Word&)>& expand_pattern,
                        const PatternMatcher& matcher,
                        const std::function<ExecResult(const ast::BlockStatement&)>& run_body) {
    const std::string subject = normalize_case_value(value);
    const auto& clauses = statement.clauses;
    ExecResult last = ExecResult::normal(0);

    size_t index = 0;
    bool run_without_test = false;
    while (index < clauses.size()) {
        const ast::CaseClause& clause = clauses[index];

        bool matched = run_without_test;
        for (size_t p = 0; !matched && p < clause.patterns.size(); ++p) {
            std::string pattern = normalize_case_pattern(expand_pattern(clause.patterns[p]));
            matched = matcher.matches_single_pattern(subject, pattern);
        }
        run_without_test = false;

        if (!matched) {
            ++index;
            continue;
        }

        debug_msg("case '%s' matched clause %zu", subject.c_str(), index);
        last = run_body(clause.body);
        if (!last.is_normal()) {
            return last;
        }

        switch (clause.terminator) {
            case ast::CaseTerminator::BREAK:
                return last;
            case ast::CaseTerminator::FALLTHROUGH:
                run_without_test = true;
                break;
            case ast::CaseTerminator::CONTINUE_TEST:
                break;
        }
        ++index;
    }
    return last;
}

}  // namespace case_evaluator
