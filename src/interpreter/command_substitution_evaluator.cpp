#include "command_substitution_evaluator.h"

#include <fcntl.h>
#include <unistd.h>

#include <thread>
#include <utility>

#include "debug.h"
#include "error_out.h"
#include "esh_filesystem.h"
#include "signal_handler.h"

CommandSubstitutionEvaluator::CommandSubstitutionEvaluator(CommandExecutor executor)
    : command_executor_(std::move(executor)) {
}

CommandSubstitutionEvaluator::~CommandSubstitutionEvaluator() {
    cleanup_temp_files();
}

void CommandSubstitutionEvaluator::cleanup_temp_files() {
    for (const auto& path : temp_files_) {
        esh_filesystem::cleanup_temp_file(path);
    }
    temp_files_.clear();
}

CommandSubstitutionEvaluator::CaptureResult CommandSubstitutionEvaluator::capture_command_output(
    const std::string& command) {
    CaptureResult result;

    int pipe_fds[2];
    auto pipe_result = esh_filesystem::create_pipe_cloexec(pipe_fds);
    if (pipe_result.is_error()) {
        throw ExecutionError(ErrorType::PIPE_ERROR, "$(" + command + ")", pipe_result.error());
    }

    esh_filesystem::FdGuard read_end(pipe_fds[0]);
    esh_filesystem::FdGuard write_end(pipe_fds[1]);

    std::string buffer;
    std::thread drainer;
    {
        SignalMask blocked(SignalHandler::worker_blocked_signals());
        drainer = std::thread([&buffer, fd = read_end.get()]() {
            auto data = esh_filesystem::read_all(fd);
            if (data.is_ok()) {
                buffer = std::move(data.value());
            }
        });
    }

    try {
        result.exit_code = command_executor_(command, write_end.get());
    } catch (...) {
        write_end.reset();
        drainer.join();
        throw;
    }

    write_end.reset();
    drainer.join();

    while (!buffer.empty() && buffer.back() == '\n') {
        buffer.pop_back();
    }
    result.output = std::move(buffer);
    debug_msg("command substitution '%s' exited %d with %zu bytes", command.c_str(),
              result.exit_code, result.output.size());
    return result;
}

std::string CommandSubstitutionEvaluator::create_process_substitution(const std::string& command,
                                                                      bool is_input) {
    auto temp = esh_filesystem::create_temp_file("esh_procsub");
    if (temp.is_error()) {
        throw ExecutionError(ErrorType::RUNTIME_ERROR, command, temp.error());
    }
    std::string path = temp.value();
    temp_files_.push_back(path);

    if (!is_input) {
        return path;
    }

    auto fd = esh_filesystem::safe_open(path, O_WRONLY | O_TRUNC | O_CLOEXEC, 0600);
    if (fd.is_error()) {
        throw ExecutionError(ErrorType::REDIRECT_ERROR, path, fd.error());
    }
    esh_filesystem::FdGuard guard(fd.value());
    int status = command_executor_(command, guard.get());
    debug_msg("process substitution '%s' exited %d into %s", command.c_str(), status,
              path.c_str());
    return path;
}

std::optional<size_t> CommandSubstitutionEvaluator::find_matching_paren(const std::string& text,
                                                                        size_t start_index) {
    int depth = 1;
    char quote = '\0';
    for (size_t i = start_index; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\\' && quote != '\'') {
            ++i;
            continue;
        }
        if (quote != '\0') {
            if (c == quote) {
                quote = '\0';
            }
            continue;
        }
        if (c == '\'' || c == '"' || c == '`') {
            quote = c;
        } else if (c == '(') {
            depth++;
        } else if (c == ')') {
            depth--;
            if (depth == 0) {
                return i;
            }
        }
    }
    return std::nullopt;
}

size_t CommandSubstitutionEvaluator::find_closing_backtick(const std::string& input, size_t start) {
    bool bt_escaped = false;
    for (size_t pos = start; pos < input.size(); ++pos) {
        if (bt_escaped) {
            bt_escaped = false;
            continue;
        }
        if (input[pos] == '\\') {
            bt_escaped = true;
            continue;
        }
        if (input[pos] == '`') {
            return pos;
        }
    }
    return std::string::npos;
}

std::string CommandSubstitutionEvaluator::unescape_backtick_command(const std::string& content) {
    std::string command;
    command.reserve(content.size());
    for (size_t i = 0; i < content.size(); ++i) {
        if (content[i] == '\\' && i + 1 < content.size() &&
            (content[i + 1] == '`' || content[i + 1] == '\\' || content[i + 1] == '$')) {
            ++i;
        }
        command += content[i];
    }
    return command;
}
