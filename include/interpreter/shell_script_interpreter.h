#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ast.h"
#include "builtin.h"
#include "command_substitution_evaluator.h"
#include "environment.h"
#include "exec.h"
#include "exec_result.h"
#include "function_evaluator.h"
#include "io_context.h"
#include "job_control.h"
#include "pattern_matcher.h"
#include "shell_options.h"
#include "signal_handler.h"
#include "word_expander.h"

// Walks the AST and runs it. One instance is one shell session: it owns the variables, the
// options, the function table and the job table, and every call takes the descriptors to use
// as an IoContext.
class ShellScriptInterpreter {
   public:
    explicit ShellScriptInterpreter(bool import_process_env = true);
    ~ShellScriptInterpreter();

    ShellScriptInterpreter(const ShellScriptInterpreter&) = delete;
    ShellScriptInterpreter& operator=(const ShellScriptInterpreter&) = delete;
    ShellScriptInterpreter(ShellScriptInterpreter&&) = delete;
    ShellScriptInterpreter& operator=(ShellScriptInterpreter&&) = delete;

    // Parses and runs a whole script. Errors are reported on io.err; the return value is the
    // exit status the script ends with.
    int execute_script(const std::string& text, const IoContext& io = IoContext::standard());

    // Parses and runs text in this session and hands back the raw result, so `exit`, loop
    // control and failures reach the caller. Used by eval and command substitution.
    ExecResult evaluate(const std::string& text, const IoContext& io);

    ExecResult execute_program(const ast::Program& program, const IoContext& io);

    void set_script_name(const std::string& name);
    void set_positional_parameters(const std::vector<std::string>& params);

    bool has_function(const std::string& name) const;
    bool remove_function(const std::string& name);
    std::vector<std::string> get_function_names() const;

    std::optional<std::string> get_env(const std::string& name) const {
        return env_.get(name);
    }
    void set_env(const std::string& name, const std::string& value) {
        env_.set(name, value);
    }
    const Environment::VariableMap& get_env_map() const {
        return env_.get_env_map();
    }

    Environment& environment() {
        return env_;
    }
    ShellOptions& options() {
        return options_;
    }
    JobManager& job_manager() {
        return jobs_;
    }
    WordExpander& expander() {
        return expander_;
    }
    const Built_ins& builtins() const {
        return builtins_;
    }

   private:
    struct ExpandedAssignment {
        const ast::Assignment* source;
        std::string value;
    };

    Environment env_;
    ShellOptions options_;
    JobManager jobs_;
    SignalHandler signals_;
    Exec exec_;
    Built_ins builtins_;
    CommandSubstitutionEvaluator substitutions_;
    WordExpander expander_;
    PatternMatcher pattern_matcher_;
    function_evaluator::FunctionMap functions_;

    // Nesting of condition positions where a non-zero status must not trigger errexit.
    int errexit_suppression_ = 0;
    // Loops currently running; break and continue outside any loop are ignored.
    int loop_depth_ = 0;
    // Descriptors of the statement being run, inherited by command substitution.
    IoContext current_io_;

    bool errexit_active() const {
        return options_.errexit && errexit_suppression_ == 0;
    }

    int run_substitution(const std::string& text, int out_fd);

    ExecResult execute_list(const ast::StatementList& statements, const IoContext& io);
    ExecResult execute_block(const ast::BlockStatement& block, const IoContext& io);
    ExecResult execute_statement(const ast::Statement& statement, const IoContext& io);
    ExecResult dispatch_statement(const ast::Statement& statement, const IoContext& io);
    // Reports a failure and turns it into a status, or into an exit under errexit.
    ExecResult settle(ExecResult result, const IoContext& io);

    ExecResult execute_pipeline(const ast::CommandStatement& first, const IoContext& io);
    ExecResult run_pipeline(const std::vector<const ast::CommandStatement*>& stages,
                            const IoContext& io);
    ExecResult run_in_background(const std::vector<const ast::CommandStatement*>& stages,
                                 const IoContext& io);
    ProcessSpec prepare_stage(const ast::CommandStatement& stage, const IoContext& stage_io,
                              std::vector<std::unique_ptr<RedirectScope>>& scopes);

    ExecResult execute_single(const ast::CommandStatement& command, const IoContext& io);
    ExecResult execute_simple(const ast::CommandStatement& command, const IoContext& io);
    ExecResult dispatch_command(const std::vector<std::string>& argv,
                                const std::vector<ExpandedAssignment>& assignments,
                                const IoContext& io);
    ExecResult execute_double_bracket(const ast::CommandStatement& command, const IoContext& io);
    ExecResult call_function(const function_evaluator::FunctionBody& body,
                             const std::vector<std::string>& argv, const IoContext& io);

    ExecResult execute_and_or(const ast::AndOrStatement& list, const IoContext& io);
    ExecResult run_and_or_list(const ast::AndOrStatement& list, const IoContext& io);
    ExecResult run_and_or_part(const ast::CommandStatement& part, const IoContext& io,
                               bool suppress_errexit);
    ExecResult execute_if(const ast::IfStatement& statement, const IoContext& io);
    ExecResult execute_for(const ast::ForStatement& statement, const IoContext& io);
    ExecResult execute_while(const ast::WhileStatement& statement, const IoContext& io);
    ExecResult execute_case(const ast::CaseStatement& statement, const IoContext& io);
    ExecResult execute_array_assignment(const ast::ArrayAssignment& statement);

    std::vector<std::string> expand_argv(const ast::CommandStatement& command);
    std::vector<ExpandedAssignment> expand_assignments(const ast::CommandStatement& command);
    std::vector<ResolvedRedirect> resolve_redirects(const std::vector<ast::Redirect>& redirects,
                                                    const IoContext& io);
    void trace_command(const std::vector<ExpandedAssignment>& assignments,
                       const std::vector<std::string>& argv, const IoContext& io) const;
    int child_status(const ExecResult& result, const IoContext& io) const;
};
