#include "shell_script_interpreter.h"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <type_traits>
#include <utility>
#include <variant>

#include "case_evaluator.h"
#include "conditional_evaluator.h"
#include "debug.h"
#include "error_out.h"
#include "esh_filesystem.h"
#include "loop_evaluator.h"
#include "parser.h"
#include "test_command.h"

namespace {

template <typename>
inline constexpr bool always_false_v = false;

// Restores a value when the scope ends.
template <typename T>
class ScopedValue {
   public:
    ScopedValue(T& target, T value) : target_(target), saved_(std::move(target)) {
        target_ = std::move(value);
    }
    ~ScopedValue() {
        target_ = std::move(saved_);
    }

    ScopedValue(const ScopedValue&) = delete;
    ScopedValue& operator=(const ScopedValue&) = delete;

   private:
    T& target_;
    T saved_;
};

class ScopedIncrement {
   public:
    explicit ScopedIncrement(int& counter, bool active = true)
        : counter_(counter), active_(active) {
        if (active_) {
            ++counter_;
        }
    }
    ~ScopedIncrement() {
        if (active_) {
            --counter_;
        }
    }

    ScopedIncrement(const ScopedIncrement&) = delete;
    ScopedIncrement& operator=(const ScopedIncrement&) = delete;

   private:
    int& counter_;
    bool active_;
};

// Prefix assignments of a builtin or function call; the previous values come back afterwards.
class TemporaryAssignments {
   public:
    explicit TemporaryAssignments(Environment& env) : env_(env) {
    }
    ~TemporaryAssignments() {
        for (auto it = saved_.rbegin(); it != saved_.rend(); ++it) {
            if (it->second.has_value()) {
                env_.set(it->first, *it->second);
            } else {
                env_.unset(it->first);
            }
        }
    }

    TemporaryAssignments(const TemporaryAssignments&) = delete;
    TemporaryAssignments& operator=(const TemporaryAssignments&) = delete;

    void set(const std::string& name, const std::string& value) {
        saved_.emplace_back(name, env_.get(name));
        env_.set(name, value);
    }

   private:
    Environment& env_;
    std::vector<std::pair<std::string, std::optional<std::string>>> saved_;
};

template <typename F>
ExecResult capture_errors(F&& body) {
    try {
        return body();
    } catch (const ExecutionError& e) {
        return ExecResult::failure(e);
    } catch (const std::exception& e) {
        return ExecResult::failure(ErrorType::RUNTIME_ERROR, "", e.what(), 1);
    }
}

bool is_plain_literal(const ast::Word& word) {
    if (word.parts.empty()) {
        return false;
    }
    for (const auto& part : word.parts) {
        if (!std::holds_alternative<ast::Identifier>(part)) {
            return false;
        }
    }
    return true;
}

bool redirects_stdin(const std::vector<ast::Redirect>& redirects) {
    for (const auto& redirect : redirects) {
        if (redirect.fd != STDIN_FILENO) {
            continue;
        }
        switch (redirect.type) {
            case ast::RedirectType::INPUT:
            case ast::RedirectType::HEREDOC:
            case ast::RedirectType::HEREDOC_STRIP:
            case ast::RedirectType::HERE_STRING:
            case ast::RedirectType::DUP_IN:
            case ast::RedirectType::READ_WRITE:
                return true;
            default:
                break;
        }
    }
    return false;
}

std::string describe_stage(const ast::CommandStatement& stage) {
    if (stage.compound) {
        return "{ ... }";
    }
    std::string text;
    for (const auto& assignment : stage.assignments) {
        text += assignment.name + (assignment.append ? "+=" : "=") +
                assignment.value.to_string() + " ";
    }
    if (stage.command.has_value()) {
        text += stage.command->to_string();
    }
    for (const auto& arg : stage.args) {
        text += " " + arg.to_string();
    }
    while (!text.empty() && text.back() == ' ') {
        text.pop_back();
    }
    return text;
}

std::string describe_pipeline(const std::vector<const ast::CommandStatement*>& stages) {
    std::string text;
    for (size_t i = 0; i < stages.size(); ++i) {
        if (i > 0) {
            text += " | ";
        }
        text += describe_stage(*stages[i]);
    }
    return text;
}

// Reads a here-document body line by line from fd up to the delimiter line or end of input.
std::string read_here_document_body(int fd, const ast::HereDoc& here_doc) {
    std::string body;
    std::string line;
    bool finished = false;

    auto take_line = [&]() {
        if (here_doc.strip_tabs) {
            size_t tabs = line.find_first_not_of('\t');
            line.erase(0, tabs == std::string::npos ? line.size() : tabs);
        }
        if (line == here_doc.delimiter) {
            finished = true;
        } else {
            body += line + "\n";
        }
        line.clear();
    };

    while (!finished) {
        char c = '\0';
        ssize_t n = read(fd, &c, 1);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            if (!line.empty()) {
                take_line();
            }
            break;
        }
        if (c == '\n') {
            take_line();
        } else {
            line += c;
        }
    }
    return body;
}

}  // namespace

ShellScriptInterpreter::ShellScriptInterpreter(bool import_process_env)
    : env_(import_process_env),
      exec_(jobs_),
      substitutions_([this](const std::string& text, int out_fd) {
          return run_substitution(text, out_fd);
      }),
      expander_(
          env_, options_,
          [this](const std::string& command) {
              return substitutions_.capture_command_output(command);
          },
          [this](const std::string& command, bool is_input) {
              return substitutions_.create_process_substitution(command, is_input);
          }) {
    expander_.set_error_sink(
        [this](const ErrorInfo& info) { print_error(info, current_io_.err); });
    if (!env_.get("0").has_value()) {
        env_.set("0", "esh");
    }
}

ShellScriptInterpreter::~ShellScriptInterpreter() {
    substitutions_.cleanup_temp_files();
}

void ShellScriptInterpreter::set_script_name(const std::string& name) {
    env_.set("0", name);
}

void ShellScriptInterpreter::set_positional_parameters(const std::vector<std::string>& params) {
    env_.set_positional_parameters(params);
}

bool ShellScriptInterpreter::has_function(const std::string& name) const {
    return function_evaluator::has_function(functions_, name);
}

bool ShellScriptInterpreter::remove_function(const std::string& name) {
    return functions_.erase(name) > 0;
}

std::vector<std::string> ShellScriptInterpreter::get_function_names() const {
    return function_evaluator::get_function_names(functions_);
}

int ShellScriptInterpreter::execute_script(const std::string& text, const IoContext& io) {
    PerformanceTracker tracker("execute_script");
    if (options_.verbose) {
        std::string echoed = text;
        if (!echoed.empty() && echoed.back() != '\n') {
            echoed += '\n';
        }
        (void)esh_filesystem::write_all(io.err, echoed);
    }

    ExecResult result = evaluate(text, io);
    int status = result.exit_status();
    if (result.is_failure()) {
        print_error(result.error().info(), io.err);
    }
    env_.set_last_status(status);
    return status;
}

ExecResult ShellScriptInterpreter::evaluate(const std::string& text, const IoContext& io) {
    ast::Program program;
    try {
        Parser parser;
        program = parser.parse(text);
    } catch (const ExecutionError& e) {
        return ExecResult::failure(e);
    }
    return execute_program(program, io);
}

ExecResult ShellScriptInterpreter::execute_program(const ast::Program& program,
                                                   const IoContext& io) {
    return execute_list(program.statements, io);
}

int ShellScriptInterpreter::run_substitution(const std::string& text, int out_fd) {
    IoContext io = current_io_;
    io.out = out_fd;
    ScopedValue<int> depth(loop_depth_, 0);

    ExecResult result = evaluate(text, io);
    if (result.is_failure()) {
        print_error(result.error().info(), io.err);
    }
    return result.exit_status();
}

ExecResult ShellScriptInterpreter::execute_list(const ast::StatementList& statements,
                                                const IoContext& io) {
    ExecResult last = ExecResult::normal(env_.last_status());
    for (const auto& statement : statements) {
        last = execute_statement(*statement, io);
        if (!last.is_normal()) {
            return last;
        }
    }
    return last;
}

ExecResult ShellScriptInterpreter::execute_block(const ast::BlockStatement& block,
                                                 const IoContext& io) {
    return execute_list(block.statements, io);
}

ExecResult ShellScriptInterpreter::execute_statement(const ast::Statement& statement,
                                                     const IoContext& io) {
    if (SignalHandler::has_pending_signal()) {
        int signum = SignalHandler::take_pending_signal();
        debug_msg("statement skipped: pending %s", SignalHandler::get_signal_name(signum));
        return ExecResult::failure(ErrorType::INTERRUPTED, SignalHandler::get_signal_name(signum),
                                   "interrupted", 128 + signum);
    }

    ScopedValue<IoContext> io_scope(current_io_, io);
    ExecResult result = settle(capture_errors([&]() { return dispatch_statement(statement, io); }),
                               io);
    if (result.is_normal() || result.is_exit()) {
        env_.set_last_status(result.exit_status());
    }
    return result;
}

ExecResult ShellScriptInterpreter::settle(ExecResult result, const IoContext& io) {
    if (!result.is_failure()) {
        return result;
    }
    const ExecutionError& error = result.error();
    if (error.type() == ErrorType::INTERRUPTED) {
        return result;
    }

    print_error(error.info(), io.err);
    int status = result.exit_status();
    env_.set_last_status(status);
    if (errexit_active()) {
        debug_msg("errexit: leaving after failure with status %d", status);
        return ExecResult::exit(status);
    }
    return ExecResult::normal(status);
}

ExecResult ShellScriptInterpreter::dispatch_statement(const ast::Statement& statement,
                                                      const IoContext& io) {
    return std::visit(
        [&](const auto& node) -> ExecResult {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, ast::CommandStatement>) {
                return execute_pipeline(node, io);
            } else if constexpr (std::is_same_v<T, ast::AndOrStatement>) {
                return execute_and_or(node, io);
            } else if constexpr (std::is_same_v<T, ast::IfStatement>) {
                return execute_if(node, io);
            } else if constexpr (std::is_same_v<T, ast::ForStatement>) {
                return execute_for(node, io);
            } else if constexpr (std::is_same_v<T, ast::WhileStatement>) {
                return execute_while(node, io);
            } else if constexpr (std::is_same_v<T, ast::CaseStatement>) {
                return execute_case(node, io);
            } else if constexpr (std::is_same_v<T, ast::FunctionStatement>) {
                functions_[node.name] = node.body;
                debug_msg("defined function %s", node.name.c_str());
                return ExecResult::normal(0);
            } else if constexpr (std::is_same_v<T, ast::BlockStatement>) {
                return execute_block(node, io);
            } else if constexpr (std::is_same_v<T, ast::BreakStatement>) {
                return loop_depth_ > 0 ? ExecResult::break_loop(node.level) : ExecResult::normal(0);
            } else if constexpr (std::is_same_v<T, ast::ContinueStatement>) {
                return loop_depth_ > 0 ? ExecResult::continue_loop(node.level)
                                       : ExecResult::normal(0);
            } else if constexpr (std::is_same_v<T, ast::ArrayAssignment>) {
                return execute_array_assignment(node);
            } else {
                static_assert(always_false_v<T>, "unhandled statement kind");
            }
        },
        statement.node);
}

ExecResult ShellScriptInterpreter::execute_pipeline(const ast::CommandStatement& first,
                                                    const IoContext& io) {
    std::vector<const ast::CommandStatement*> stages;
    for (const ast::CommandStatement* stage = &first; stage != nullptr; stage = stage->pipe.get()) {
        stages.push_back(stage);
    }

    if (first.background) {
        return run_in_background(stages, io);
    }

    ExecResult result;
    {
        ScopedIncrement suppression(errexit_suppression_, first.negated);
        if (stages.size() == 1) {
            result = execute_single(first, io);
        } else {
            result = run_pipeline(stages, io);
        }
    }
    if (!result.is_normal()) {
        return result;
    }

    int status = result.exit_status();
    if (first.negated) {
        status = status == 0 ? 1 : 0;
    }
    env_.set_last_status(status);

    bool compound_only = stages.size() == 1 && first.compound;
    if (status != 0 && !first.negated && !compound_only && errexit_active()) {
        debug_msg("errexit: '%s' exited %d", describe_pipeline(stages).c_str(), status);
        return ExecResult::exit(status);
    }
    return ExecResult::normal(status);
}

ExecResult ShellScriptInterpreter::run_pipeline(
    const std::vector<const ast::CommandStatement*>& stages, const IoContext& io) {
    PipelineFds pipes(stages.size());
    std::vector<std::unique_ptr<RedirectScope>> scopes;
    std::vector<ProcessSpec> specs;
    specs.reserve(stages.size());

    for (size_t i = 0; i < stages.size(); ++i) {
        IoContext stage_io = io;
        if (i > 0) {
            stage_io.in = pipes.read_end(i - 1);
        }
        if (i + 1 < stages.size()) {
            stage_io.out = pipes.write_end(i);
        }
        specs.push_back(prepare_stage(*stages[i], stage_io, scopes));
    }

    debug_msg("pipeline of %zu stages: %s", stages.size(), describe_pipeline(stages).c_str());
    return exec_.run_foreground(specs, pipes, describe_pipeline(stages));
}

ExecResult ShellScriptInterpreter::run_in_background(
    const std::vector<const ast::CommandStatement*>& stages, const IoContext& io) {
    PipelineFds pipes(stages.size());
    std::vector<std::unique_ptr<RedirectScope>> scopes;
    std::vector<ProcessSpec> specs;
    specs.reserve(stages.size());

    esh_filesystem::FdGuard null_input;
    if (!redirects_stdin(stages.front()->redirects)) {
        auto opened = esh_filesystem::safe_open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (opened.is_error()) {
            throw ExecutionError(ErrorType::REDIRECT_ERROR, "/dev/null", opened.error());
        }
        null_input.reset(opened.value());
    }

    for (size_t i = 0; i < stages.size(); ++i) {
        IoContext stage_io = io;
        if (i == 0 && null_input.get() >= 0) {
            stage_io.in = null_input.get();
        }
        if (i > 0) {
            stage_io.in = pipes.read_end(i - 1);
        }
        if (i + 1 < stages.size()) {
            stage_io.out = pipes.write_end(i);
        }
        specs.push_back(prepare_stage(*stages[i], stage_io, scopes));
    }

    BackgroundJob job = exec_.run_background(specs, pipes, describe_pipeline(stages), io.err);
    env_.set("!", std::to_string(job.pid));
    return ExecResult::normal(0);
}

ProcessSpec ShellScriptInterpreter::prepare_stage(
    const ast::CommandStatement& stage, const IoContext& stage_io,
    std::vector<std::unique_ptr<RedirectScope>>& scopes) {
    ProcessSpec spec;

    if (stage.compound) {
        auto redirects = resolve_redirects(stage.redirects, stage_io);
        scopes.push_back(std::make_unique<RedirectScope>(stage_io, redirects, options_.noclobber));
        spec.io = scopes.back()->io();
        const ast::Statement* compound = stage.compound.get();
        spec.run_in_child = [this, compound](const IoContext& child_io) {
            return child_status(execute_statement(*compound, child_io), child_io);
        };
        return spec;
    }

    if (stage.command.has_value() && stage.command->is_literal("[[")) {
        auto redirects = resolve_redirects(stage.redirects, stage_io);
        scopes.push_back(std::make_unique<RedirectScope>(stage_io, redirects, options_.noclobber));
        spec.io = scopes.back()->io();
        const ast::CommandStatement* command = &stage;
        spec.run_in_child = [this, command](const IoContext& child_io) {
            return child_status(capture_errors([&]() {
                                    return execute_double_bracket(*command, child_io);
                                }),
                                child_io);
        };
        return spec;
    }

    std::vector<std::string> argv = expand_argv(stage);
    std::vector<ExpandedAssignment> assignments = expand_assignments(stage);
    auto redirects = resolve_redirects(stage.redirects, stage_io);
    if (options_.xtrace) {
        trace_command(assignments, argv, stage_io);
    }
    scopes.push_back(std::make_unique<RedirectScope>(stage_io, redirects, options_.noclobber));
    spec.io = scopes.back()->io();

    bool external = !argv.empty() && !builtins_.is_builtin_command(argv[0]) &&
                    !has_function(argv[0]);
    if (external) {
        spec.args = argv;
        for (const auto& assignment : assignments) {
            if (!assignment.source->index.has_value()) {
                spec.env.emplace_back(assignment.source->name, assignment.value);
            }
        }
        return spec;
    }

    spec.run_in_child = [this, argv, assignments](const IoContext& child_io) {
        return child_status(
            capture_errors([&]() { return dispatch_command(argv, assignments, child_io); }),
            child_io);
    };
    return spec;
}

ExecResult ShellScriptInterpreter::execute_single(const ast::CommandStatement& command,
                                                  const IoContext& io) {
    if (command.compound) {
        auto redirects = resolve_redirects(command.redirects, io);
        RedirectScope scope(io, redirects, options_.noclobber);
        return execute_statement(*command.compound, scope.io());
    }
    return execute_simple(command, io);
}

ExecResult ShellScriptInterpreter::execute_simple(const ast::CommandStatement& command,
                                                  const IoContext& io) {
    if (command.command.has_value() && command.command->is_literal("[[")) {
        auto redirects = resolve_redirects(command.redirects, io);
        RedirectScope scope(io, redirects, options_.noclobber);
        return execute_double_bracket(command, scope.io());
    }

    expander_.reset_substitution_status();
    std::vector<std::string> argv = expand_argv(command);
    std::vector<ExpandedAssignment> assignments = expand_assignments(command);
    auto redirects = resolve_redirects(command.redirects, io);

    if (options_.xtrace) {
        trace_command(assignments, argv, io);
    }

    RedirectScope scope(io, redirects, options_.noclobber);
    return dispatch_command(argv, assignments, scope.io());
}

ExecResult ShellScriptInterpreter::dispatch_command(
    const std::vector<std::string>& argv, const std::vector<ExpandedAssignment>& assignments,
    const IoContext& io) {
    if (argv.empty()) {
        for (const auto& assignment : assignments) {
            const ast::Assignment& source = *assignment.source;
            expander_.assign(source.name, source.index, assignment.value, source.append);
        }
        return ExecResult::normal(expander_.last_substitution_status().value_or(0));
    }

    const std::string& name = argv[0];
    bool is_builtin = builtins_.is_builtin_command(name);
    auto function = functions_.find(name);
    bool is_function = !is_builtin && function != functions_.end();

    if (is_builtin || is_function) {
        TemporaryAssignments temporary(env_);
        for (const auto& assignment : assignments) {
            const ast::Assignment& source = *assignment.source;
            if (source.index.has_value()) {
                expander_.assign(source.name, source.index, assignment.value, source.append);
            } else {
                temporary.set(source.name, source.append
                                               ? env_.get_or_empty(source.name) + assignment.value
                                               : assignment.value);
            }
        }

        ExecResult result;
        if (is_builtin) {
            debug_msg("builtin %s", name.c_str());
            BuiltinContext ctx{env_, options_, jobs_, io, *this};
            result = builtins_.builtin_command(argv, ctx);
        } else {
            function_evaluator::FunctionBody body = function->second;
            result = call_function(body, argv, io);
        }

        if (result.is_loop_control() && loop_depth_ == 0) {
            return ExecResult::normal(0);
        }
        return result;
    }

    ProcessSpec spec;
    spec.args = argv;
    spec.io = io;
    for (const auto& assignment : assignments) {
        const ast::Assignment& source = *assignment.source;
        if (source.index.has_value()) {
            continue;
        }
        spec.env.emplace_back(source.name, source.append
                                               ? env_.get_or_empty(source.name) + assignment.value
                                               : assignment.value);
    }

    std::vector<ProcessSpec> stages;
    stages.push_back(std::move(spec));
    PipelineFds pipes(1);
    return exec_.run_foreground(stages, pipes, join_arguments(argv));
}

ExecResult ShellScriptInterpreter::call_function(const function_evaluator::FunctionBody& body,
                                                 const std::vector<std::string>& argv,
                                                 const IoContext& io) {
    debug_msg("calling function %s with %zu arguments", argv[0].c_str(), argv.size() - 1);
    return function_evaluator::invoke_function(
        *body, env_, argv,
        [this, &io](const ast::BlockStatement& block) { return execute_block(block, io); });
}

ExecResult ShellScriptInterpreter::execute_double_bracket(const ast::CommandStatement& command,
                                                          const IoContext& io) {
    std::vector<conditional_evaluator::ConditionOperand> operands;
    operands.reserve(command.args.size());
    std::vector<std::string> traced{"[["};
    for (const auto& word : command.args) {
        conditional_evaluator::ConditionOperand operand;
        operand.text = expander_.expand(word);
        operand.pattern = expander_.expand_pattern(word);
        operand.quoted = !is_plain_literal(word);
        traced.push_back(operand.text);
        operands.push_back(std::move(operand));
    }
    traced.emplace_back("]]");

    if (options_.xtrace) {
        trace_command({}, traced, io);
    }

    int status = conditional_evaluator::evaluate_double_bracket(
        operands,
        [this](const std::vector<std::string>& args) {
            return evaluate_test_expression(args, &env_);
        },
        pattern_matcher_);
    return ExecResult::normal(status);
}

ExecResult ShellScriptInterpreter::execute_and_or(const ast::AndOrStatement& list,
                                                  const IoContext& io) {
    if (!list.background) {
        return run_and_or_list(list, io);
    }

    std::vector<ProcessSpec> specs(1);
    specs[0].io = io;
    const ast::AndOrStatement* statement = &list;
    specs[0].run_in_child = [this, statement](const IoContext& child_io) {
        return child_status(run_and_or_list(*statement, child_io), child_io);
    };

    esh_filesystem::FdGuard null_input;
    auto opened = esh_filesystem::safe_open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (opened.is_error()) {
        throw ExecutionError(ErrorType::REDIRECT_ERROR, "/dev/null", opened.error());
    }
    null_input.reset(opened.value());
    specs[0].io.in = null_input.get();

    PipelineFds pipes(1);
    BackgroundJob job =
        exec_.run_background(specs, pipes, describe_stage(*list.first) + " ...", io.err);
    env_.set("!", std::to_string(job.pid));
    return ExecResult::normal(0);
}

ExecResult ShellScriptInterpreter::run_and_or_list(const ast::AndOrStatement& list,
                                                   const IoContext& io) {
    ExecResult result = run_and_or_part(*list.first, io, !list.rest.empty());
    for (size_t i = 0; i < list.rest.size(); ++i) {
        if (!result.is_normal()) {
            return result;
        }
        const auto& entry = list.rest[i];
        bool succeeded = result.exit_status() == 0;
        // && runs on success, || on failure; a skipped part keeps the previous status.
        if ((entry.first == ast::AndOrOperator::AND) != succeeded) {
            continue;
        }
        result = run_and_or_part(*entry.second, io, i + 1 < list.rest.size());
    }
    return result;
}

ExecResult ShellScriptInterpreter::run_and_or_part(const ast::CommandStatement& part,
                                                   const IoContext& io, bool suppress_errexit) {
    ScopedIncrement suppression(errexit_suppression_, suppress_errexit);
    ExecResult result = settle(capture_errors([&]() { return execute_pipeline(part, io); }), io);
    if (result.is_normal()) {
        env_.set_last_status(result.exit_status());
    }
    return result;
}

ExecResult ShellScriptInterpreter::execute_if(const ast::IfStatement& statement,
                                              const IoContext& io) {
    return conditional_evaluator::execute_if(
        statement,
        [this, &io](const ast::BlockStatement& condition) {
            ScopedIncrement suppression(errexit_suppression_);
            return execute_block(condition, io);
        },
        [this, &io](const ast::BlockStatement& body) { return execute_block(body, io); });
}

ExecResult ShellScriptInterpreter::execute_for(const ast::ForStatement& statement,
                                               const IoContext& io) {
    std::vector<std::string> items = statement.in_list.has_value()
                                         ? expander_.expand_words(*statement.in_list)
                                         : env_.positional_parameters();
    debug_msg("for %s over %zu items", statement.variable.c_str(), items.size());

    ScopedIncrement depth(loop_depth_);
    return loop_evaluator::execute_for(
        items, [this, &statement](const std::string& value) { env_.set(statement.variable, value); },
        statement.body,
        [this, &io](const ast::BlockStatement& body) { return execute_block(body, io); });
}

ExecResult ShellScriptInterpreter::execute_while(const ast::WhileStatement& statement,
                                                 const IoContext& io) {
    ScopedIncrement depth(loop_depth_);
    return loop_evaluator::execute_condition_loop(
        statement,
        [this, &io](const ast::BlockStatement& condition) {
            ScopedIncrement suppression(errexit_suppression_);
            return execute_block(condition, io);
        },
        [this, &io](const ast::BlockStatement& body) { return execute_block(body, io); });
}

ExecResult ShellScriptInterpreter::execute_case(const ast::CaseStatement& statement,
                                                const IoContext& io) {
    std::string value = expander_.expand(statement.value);
    return case_evaluator::execute_case(
        statement, value, [this](const ast::Word& word) { return expander_.expand_pattern(word); },
        pattern_matcher_,
        [this, &io](const ast::BlockStatement& body) { return execute_block(body, io); });
}

ExecResult ShellScriptInterpreter::execute_array_assignment(const ast::ArrayAssignment& statement) {
    expander_.reset_substitution_status();
    const std::string& name = statement.name;

    if (env_.kind_of(name) == VariableKind::ASSOC) {
        if (!statement.append) {
            env_.set_assoc(name, {});
        }
        for (const auto& element : statement.elements) {
            if (!element.key.has_value()) {
                throw ExecutionError(ErrorType::VARIABLE_ERROR, name,
                                     "must use subscript when assigning associative array");
            }
            expander_.assign(name, element.key, expander_.expand_assignment_value(element.value));
        }
        return ExecResult::normal(expander_.last_substitution_status().value_or(0));
    }

    long long index = 0;
    if (statement.append) {
        if (env_.kind_of(name) == VariableKind::SCALAR) {
            auto scalar = env_.get(name);
            env_.set_array(name, scalar.has_value() ? std::vector<std::string>{*scalar}
                                                    : std::vector<std::string>{});
        }
        const auto* existing = env_.get_array(name);
        index = existing == nullptr ? 0 : static_cast<long long>(existing->size());
    } else {
        env_.set_array(name, {});
    }

    for (const auto& element : statement.elements) {
        if (element.key.has_value()) {
            index = expander_.evaluate_arithmetic(*element.key);
            expander_.assign(name, std::to_string(index),
                             expander_.expand_assignment_value(element.value));
            ++index;
            continue;
        }
        for (const auto& field : expander_.expand_word_fields(element.value)) {
            expander_.assign(name, std::to_string(index), field);
            ++index;
        }
    }
    return ExecResult::normal(expander_.last_substitution_status().value_or(0));
}

std::vector<std::string> ShellScriptInterpreter::expand_argv(
    const ast::CommandStatement& command) {
    std::vector<std::string> argv;
    if (!command.command.has_value()) {
        return argv;
    }
    argv = expander_.expand_word_fields(*command.command);
    for (const auto& arg : command.args) {
        auto fields = expander_.expand_word_fields(arg);
        argv.insert(argv.end(), fields.begin(), fields.end());
    }
    return argv;
}

std::vector<ShellScriptInterpreter::ExpandedAssignment> ShellScriptInterpreter::expand_assignments(
    const ast::CommandStatement& command) {
    std::vector<ExpandedAssignment> assignments;
    assignments.reserve(command.assignments.size());
    for (const auto& assignment : command.assignments) {
        assignments.push_back({&assignment, expander_.expand_assignment_value(assignment.value)});
    }
    return assignments;
}

std::vector<ResolvedRedirect> ShellScriptInterpreter::resolve_redirects(
    const std::vector<ast::Redirect>& redirects, const IoContext& io) {
    std::vector<ResolvedRedirect> resolved;
    resolved.reserve(redirects.size());

    for (const auto& redirect : redirects) {
        ResolvedRedirect entry;
        entry.type = redirect.type;
        entry.fd = redirect.fd;

        switch (redirect.type) {
            case ast::RedirectType::HEREDOC:
            case ast::RedirectType::HEREDOC_STRIP: {
                const ast::HereDoc& here_doc = redirect.here_doc;
                std::string body = here_doc.collected
                                       ? here_doc.content
                                       : read_here_document_body(io.in, here_doc);
                entry.body = here_doc.quoted ? body : expander_.expand_here_document(body);
                break;
            }
            case ast::RedirectType::HERE_STRING:
                entry.body = expander_.expand(redirect.target);
                break;
            default: {
                auto fields = expander_.expand_word_fields(redirect.target);
                if (fields.size() != 1) {
                    throw ExecutionError(ErrorType::REDIRECT_ERROR, redirect.target.to_string(),
                                         "ambiguous redirect");
                }
                entry.target = fields.front();
                break;
            }
        }
        resolved.push_back(std::move(entry));
    }
    return resolved;
}

void ShellScriptInterpreter::trace_command(const std::vector<ExpandedAssignment>& assignments,
                                           const std::vector<std::string>& argv,
                                           const IoContext& io) const {
    std::string line = "+";
    for (const auto& assignment : assignments) {
        line += " " + assignment.source->name;
        if (assignment.source->index.has_value()) {
            line += "[" + *assignment.source->index + "]";
        }
        line += (assignment.source->append ? "+=" : "=") + assignment.value;
    }
    for (const auto& arg : argv) {
        line += " " + arg;
    }
    line += "\n";
    (void)esh_filesystem::write_all(io.err, line);
}

int ShellScriptInterpreter::child_status(const ExecResult& result, const IoContext& io) const {
    if (result.is_failure()) {
        print_error(result.error().info(), io.err);
    }
    return result.exit_status();
}
