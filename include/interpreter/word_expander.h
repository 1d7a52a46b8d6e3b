#pragma once

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "arithmetic_evaluator.h"
#include "ast.h"
#include "command_substitution_evaluator.h"
#include "environment.h"
#include "error_out.h"
#include "parameter_expansion_evaluator.h"
#include "shell_options.h"

// Expands AST words: tilde, parameters, arithmetic, command and process substitution, then
// IFS splitting and pathname expansion for unquoted results.
class WordExpander {
   public:
    using CommandRunner =
        std::function<CommandSubstitutionEvaluator::CaptureResult(const std::string&)>;
    using ProcessSubstituter = std::function<std::string(const std::string&, bool)>;
    // Receives diagnostics that do not fail the expansion.
    using ErrorSink = std::function<void(const ErrorInfo&)>;

    // A run of text produced by one `$` form; lists come from $@, $* and ${name[@]}.
    struct Segment {
        std::string text;
        bool is_list = false;
        bool star = false;
        std::vector<std::string> items;
    };

    WordExpander(Environment& env, const ShellOptions& options, CommandRunner run_command,
                 ProcessSubstituter substitute_process);

    WordExpander(const WordExpander&) = delete;
    WordExpander& operator=(const WordExpander&) = delete;

    // Single string result: no field splitting, no pathname expansion.
    std::string expand(const ast::Word& word);
    // Full expansion into fields.
    std::vector<std::string> expand_word_fields(const ast::Word& word);
    std::vector<std::string> expand_words(const std::vector<ast::Word>& words);
    // Like expand(), with tilde expansion also after ':' and '='.
    std::string expand_assignment_value(const ast::Word& word);
    // Pattern text for matching: quoted characters come back backslash-escaped.
    std::string expand_pattern(const ast::Word& word);

    // Expands `$...` forms and backticks inside plain text, honoring \$ \` \" \\ escapes.
    std::string expand_variables_in_string(const std::string& text);
    // Here-document body expansion; \" stays as written.
    std::string expand_here_document(const std::string& body);

    // Arithmetic in expansion context: failures are reported and yield 0.
    long long evaluate_arithmetic(const std::string& expression);

    // Defaults to print_error on stderr.
    void set_error_sink(ErrorSink sink) {
        error_sink_ = std::move(sink);
    }

    std::optional<std::string> lookup(const std::string& name);
    std::vector<std::string> lookup_list(const std::string& base);

    // Assigns value to name or name[index]; append concatenates or appends an element.
    void assign(const std::string& name, const std::optional<std::string>& index,
                const std::string& value, bool append = false);

    // Exit status of the most recent command substitution.
    std::optional<int> last_substitution_status() const {
        return last_substitution_status_;
    }
    void reset_substitution_status() {
        last_substitution_status_.reset();
    }

   private:
    struct Mode {
        bool split = false;
        bool assignment = false;
    };

    Environment& env_;
    const ShellOptions& options_;
    CommandRunner run_command_;
    ProcessSubstituter substitute_process_;
    ErrorSink error_sink_;
    ArithmeticEvaluator arithmetic_;
    ParameterExpansionEvaluator parameters_;
    std::optional<int> last_substitution_status_;

    class FieldBuilder;

    void expand_parts(const ast::Word& word, Mode mode, FieldBuilder& builder);
    void add_double_quoted(const std::string& text, FieldBuilder& builder);
    void add_unquoted(const Segment& segment, FieldBuilder& builder);

    std::vector<Segment> scan_double_quoted(const std::string& text, bool here_document);
    size_t expand_dollar(const std::string& text, size_t index, Segment& out);
    Segment evaluate_parameter(const ast::ParamExpandExpression& expr);
    Segment variable_segment(const std::string& name);
    std::string command_substitute(const std::string& command);

    std::optional<std::string> expand_tilde_prefix(const std::string& user) const;
    std::string tilde_expand_after_colons(const std::string& text) const;

    // Assigns through a reference such as "name" or "name[sub]".
    void assign_reference(const std::string& reference, const std::string& value);
    std::optional<std::string> lookup_checked(const std::string& name);
    std::size_t count_elements(const std::string& name);
    std::vector<std::string> list_keys(const std::string& base);
    std::string ifs_join_separator() const;
    long long evaluate_index(const std::string& subscript);
};
