#pragma once

#include <utility>
#include <variant>

#include "error_out.h"

struct NormalCompletion {
    int status = 0;
};

struct BreakSignal {
    int levels = 1;
};

struct ContinueSignal {
    int levels = 1;
};

struct ExitSignal {
    int code = 0;
};

struct Failure {
    ExecutionError error;
};

using ExecOutcome = std::variant<NormalCompletion, BreakSignal, ContinueSignal, ExitSignal, Failure>;

// Result of executing one statement. Loop control and script exit travel here as tagged
// variants so they are never confused with errors.
class ExecResult {
   public:
    ExecResult() : outcome_(NormalCompletion{0}) {
    }

    static ExecResult normal(int status = 0) {
        return ExecResult(NormalCompletion{status});
    }
    static ExecResult break_loop(int levels = 1) {
        return ExecResult(BreakSignal{levels});
    }
    static ExecResult continue_loop(int levels = 1) {
        return ExecResult(ContinueSignal{levels});
    }
    static ExecResult exit(int code) {
        return ExecResult(ExitSignal{code});
    }
    static ExecResult failure(ExecutionError error) {
        return ExecResult(Failure{std::move(error)});
    }
    static ExecResult failure(ErrorType type, const std::string& command,
                              const std::string& message, int exit_code = -1) {
        return failure(ExecutionError(type, command, message, exit_code));
    }

    bool is_normal() const {
        return std::holds_alternative<NormalCompletion>(outcome_);
    }
    bool is_break() const {
        return std::holds_alternative<BreakSignal>(outcome_);
    }
    bool is_continue() const {
        return std::holds_alternative<ContinueSignal>(outcome_);
    }
    bool is_exit() const {
        return std::holds_alternative<ExitSignal>(outcome_);
    }
    bool is_failure() const {
        return std::holds_alternative<Failure>(outcome_);
    }
    bool is_loop_control() const {
        return is_break() || is_continue();
    }
    bool succeeded() const {
        return is_normal() && exit_status() == 0;
    }

    // Value $? takes after this result.
    int exit_status() const;

    int levels() const;

    const ExecutionError& error() const {
        return std::get<Failure>(outcome_).error;
    }

    const ExecOutcome& outcome() const {
        return outcome_;
    }

   private:
    explicit ExecResult(ExecOutcome outcome) : outcome_(std::move(outcome)) {
    }

    ExecOutcome outcome_;
};
