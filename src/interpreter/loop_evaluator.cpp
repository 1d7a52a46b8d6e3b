#include "loop_evaluator.h"

#include "debug.h"

namespace loop_evaluator {

LoopCommandOutcome handle_loop_command_result(const ExecResult& result) {
    if (result.is_break()) {
        if (result.levels() > 1) {
            return {LoopFlow::BREAK, true, ExecResult::break_loop(result.levels() - 1)};
        }
        return {LoopFlow::BREAK, false, ExecResult::normal(0)};
    }
    if (result.is_continue()) {
        if (result.levels() > 1) {
            return {LoopFlow::CONTINUE, true, ExecResult::continue_loop(result.levels() - 1)};
        }
        return {LoopFlow::CONTINUE, false, ExecResult::normal(0)};
    }
    if (result.is_exit() || result.is_failure()) {
        return {LoopFlow::BREAK, true, result};
    }
    return {LoopFlow::NONE, false, result};
}

ExecResult execute_for(const std::vector<std::string>& items,
                       const std::function<void(const std::string&)>& assign,
                       const ast::BlockStatement& body, const BlockRunner& run_body) {
    int status = 0;
    for (const auto& item : items) {
        assign(item);
        LoopCommandOutcome outcome = handle_loop_command_result(run_body(body));
        if (outcome.propagate) {
            return outcome.result;
        }
        status = outcome.result.exit_status();
        if (outcome.flow == LoopFlow::BREAK) {
            break;
        }
    }
    return ExecResult::normal(status);
}

ExecResult execute_condition_loop(const ast::WhileStatement& loop, const BlockRunner& run_condition,
                                  const BlockRunner& run_body) {
    int status = 0;
    int iterations = 0;
    while (true) {
        LoopCommandOutcome condition = handle_loop_command_result(run_condition(loop.condition));
        if (condition.propagate) {
            return condition.result;
        }
        if (condition.flow == LoopFlow::BREAK) {
            break;
        }
        if (condition.flow == LoopFlow::CONTINUE) {
            continue;
        }
        bool holds = condition.result.exit_status() == 0;
        if (holds == loop.until) {
            break;
        }

        LoopCommandOutcome outcome = handle_loop_command_result(run_body(loop.body));
        ++iterations;
        if (outcome.propagate) {
            return outcome.result;
        }
        status = outcome.result.exit_status();
        if (outcome.flow == LoopFlow::BREAK) {
            break;
        }
    }
    debug_msg("%s loop finished after %d iteration(s)", loop.until ? "until" : "while",
              iterations);
    return ExecResult::normal(status);
}

}  // namespace loop_evaluator
