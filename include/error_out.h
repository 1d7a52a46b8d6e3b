#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include <cstdint>

enum class ErrorSeverity : std::uint8_t {
    INFO = 0,
    WARNING = 1,
    ERROR = 2,
    CRITICAL = 3
};

enum class ErrorType : std::uint8_t {
    COMMAND_NOT_FOUND,
    COMMAND_FAILED,
    REDIRECT_ERROR,
    PIPE_ERROR,
    VARIABLE_ERROR,
    ARITHMETIC_ERROR,
    INVALID_EXPRESSION,
    INTERRUPTED,
    UNKNOWN_STATEMENT,
    SYNTAX_ERROR,
    PERMISSION_DENIED,
    FILE_NOT_FOUND,
    INVALID_ARGUMENT,
    RUNTIME_ERROR,
    UNKNOWN_ERROR
};

struct ErrorInfo {
    ErrorType type;
    ErrorSeverity severity;
    std::string command_used;
    std::string message;
    std::vector<std::string> suggestions;

    ErrorInfo();

    ErrorInfo(ErrorType t, ErrorSeverity s, const std::string& cmd, const std::string& msg,
              const std::vector<std::string>& sugg);

    ErrorInfo(ErrorType t, const std::string& cmd, const std::string& msg,
              const std::vector<std::string>& sugg = {});

    static ErrorSeverity get_default_severity(ErrorType type);
};

const char* error_type_text(ErrorType type);

// Exit status a failure of the given type reports when no child status is known.
int default_exit_code(ErrorType type);

// "esh: cmd: <type text>: message" followed by any suggestions, newline terminated.
std::string format_error(const ErrorInfo& error);

void print_error(const ErrorInfo& error);
// Writes to the given descriptor instead of std::cerr; used where stderr is redirected.
void print_error(const ErrorInfo& error, int fd);

class ExecutionError : public std::runtime_error {
   public:
    ExecutionError(ErrorType type, const std::string& command, const std::string& message,
                   int exit_code = -1);
    explicit ExecutionError(ErrorInfo info, int exit_code = -1);

    const ErrorInfo& info() const {
        return info_;
    }
    ErrorType type() const {
        return info_.type;
    }
    int exit_code() const {
        return exit_code_;
    }

   private:
    ErrorInfo info_;
    int exit_code_;
};
