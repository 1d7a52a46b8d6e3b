#include "error_out.h"

#include "esh_filesystem.h"

#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace {

std::string compose_what(const ErrorInfo& info) {
    std::string text;
    if (!info.command_used.empty()) {
        text += info.command_used;
        text += ": ";
    }
    text += error_type_text(info.type);
    if (!info.message.empty()) {
        text += ": ";
        text += info.message;
    }
    return text;
}

}  // namespace

const char* error_type_text(ErrorType type) {
    switch (type) {
        case ErrorType::COMMAND_NOT_FOUND:
            return "command not found";
        case ErrorType::COMMAND_FAILED:
            return "command failed";
        case ErrorType::REDIRECT_ERROR:
            return "redirection error";
        case ErrorType::PIPE_ERROR:
            return "pipe error";
        case ErrorType::VARIABLE_ERROR:
            return "variable error";
        case ErrorType::ARITHMETIC_ERROR:
            return "arithmetic error";
        case ErrorType::INVALID_EXPRESSION:
            return "invalid expression";
        case ErrorType::INTERRUPTED:
            return "interrupted";
        case ErrorType::UNKNOWN_STATEMENT:
            return "unknown statement";
        case ErrorType::SYNTAX_ERROR:
            return "syntax error";
        case ErrorType::PERMISSION_DENIED:
            return "permission denied";
        case ErrorType::FILE_NOT_FOUND:
            return "file not found";
        case ErrorType::INVALID_ARGUMENT:
            return "invalid argument";
        case ErrorType::RUNTIME_ERROR:
            return "runtime error";
        case ErrorType::UNKNOWN_ERROR:
        default:
            return "unknown error";
    }
}

int default_exit_code(ErrorType type) {
    switch (type) {
        case ErrorType::COMMAND_NOT_FOUND:
            return 127;
        case ErrorType::PERMISSION_DENIED:
            return 126;
        case ErrorType::INTERRUPTED:
            return 130;
        case ErrorType::SYNTAX_ERROR:
            return 2;
        default:
            return 1;
    }
}

std::string format_error(const ErrorInfo& error) {
    std::string text = "esh: " + compose_what(error) + "\n";

    if (error.suggestions.empty()) {
        return text;
    }

    std::vector<std::string> commands;
    for (const auto& suggestion : error.suggestions) {
        if (suggestion.find("Did you mean '") != std::string::npos) {
            size_t start = suggestion.find('\'') + 1;
            size_t end = suggestion.find('\'', start);
            if (end != std::string::npos && end > start) {
                commands.push_back(suggestion.substr(start, end - start));
            }
        }
    }

    if (!commands.empty()) {
        text += "Did you mean: ";
        for (size_t i = 0; i < commands.size(); ++i) {
            text += commands[i];
            if (i < commands.size() - 1) {
                text += ", ";
            }
        }
        text += "?\n";
    }

    for (const auto& suggestion : error.suggestions) {
        if (suggestion.find("Did you mean '") == std::string::npos) {
            text += suggestion + "\n";
        }
    }
    return text;
}

void print_error(const ErrorInfo& error) {
    std::cerr << format_error(error);
}

void print_error(const ErrorInfo& error, int fd) {
    if (fd < 0) {
        return;
    }
    // A failed diagnostic write has nowhere left to be reported.
    (void)esh_filesystem::write_all(fd, format_error(error));
}

ErrorInfo::ErrorInfo()
    : type(ErrorType::UNKNOWN_ERROR),
      severity(ErrorSeverity::ERROR),
      command_used(""),
      message(""),
      suggestions() {
}

ErrorInfo::ErrorInfo(ErrorType t, ErrorSeverity s, const std::string& cmd, const std::string& msg,
                     const std::vector<std::string>& sugg)
    : type(t), severity(s), command_used(cmd), message(msg), suggestions(sugg) {
}

ErrorInfo::ErrorInfo(ErrorType t, const std::string& cmd, const std::string& msg,
                     const std::vector<std::string>& sugg)
    : type(t),
      severity(get_default_severity(t)),
      command_used(cmd),
      message(msg),
      suggestions(sugg) {
}

ErrorSeverity ErrorInfo::get_default_severity(ErrorType type) {
    switch (type) {
        case ErrorType::SYNTAX_ERROR:
            return ErrorSeverity::CRITICAL;
        case ErrorType::INVALID_ARGUMENT:
            return ErrorSeverity::WARNING;
        case ErrorType::INTERRUPTED:
            return ErrorSeverity::INFO;
        default:
            return ErrorSeverity::ERROR;
    }
}

ExecutionError::ExecutionError(ErrorType type, const std::string& command,
                               const std::string& message, int exit_code)
    : ExecutionError(ErrorInfo{type, command, message}, exit_code) {
}

ExecutionError::ExecutionError(ErrorInfo info, int exit_code)
    : std::runtime_error(compose_what(info)),
      info_(std::move(info)),
      exit_code_(exit_code >= 0 ? exit_code : default_exit_code(info_.type)) {
}
