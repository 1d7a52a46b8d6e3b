#include "echo_command.h"

namespace {

bool is_octal_digit(char c) {
    return c >= '0' && c <= '7';
}

}  // namespace

std::string process_escape_sequences(const std::string& input, bool& stop_output) {
    std::string result;
    result.reserve(input.length());
    stop_output = false;

    for (size_t i = 0; i < input.length(); ++i) {
        if (input[i] != '\\' || i + 1 >= input.length()) {
            result += input[i];
            continue;
        }

        char next = input[i + 1];
        switch (next) {
            case 'a':
                result += '\a';
                ++i;
                break;
            case 'b':
                result += '\b';
                ++i;
                break;
            case 'c':
                stop_output = true;
                return result;
            case 'e':
                result += '\x1b';
                ++i;
                break;
            case 'f':
                result += '\f';
                ++i;
                break;
            case 'n':
                result += '\n';
                ++i;
                break;
            case 'r':
                result += '\r';
                ++i;
                break;
            case 't':
                result += '\t';
                ++i;
                break;
            case 'v':
                result += '\v';
                ++i;
                break;
            case '\\':
                result += '\\';
                ++i;
                break;
            case '0': {
                // \0nnn, up to three octal digits.
                int value = 0;
                size_t j = i + 2;
                while (j < input.length() && j < i + 5 && is_octal_digit(input[j])) {
                    value = value * 8 + (input[j] - '0');
                    ++j;
                }
                result += static_cast<char>(value);
                i = j - 1;
                break;
            }
            default:
                result += input[i];
                break;
        }
    }
    return result;
}

ExecResult echo_command(const std::vector<std::string>& args, BuiltinContext& ctx) {
    bool suppress_newline = false;
    bool interpret_escapes = false;

    size_t start_idx = 1;
    while (start_idx < args.size() && args[start_idx].length() > 1 && args[start_idx][0] == '-') {
        const std::string& flag = args[start_idx];
        bool valid = flag.find_first_not_of("neE", 1) == std::string::npos;
        if (!valid) {
            break;
        }
        for (size_t i = 1; i < flag.length(); ++i) {
            if (flag[i] == 'n') {
                suppress_newline = true;
            } else if (flag[i] == 'e') {
                interpret_escapes = true;
            } else {
                interpret_escapes = false;
            }
        }
        ++start_idx;
    }

    std::string output;
    for (size_t i = start_idx; i < args.size(); ++i) {
        if (i > start_idx) {
            output += ' ';
        }
        if (interpret_escapes) {
            bool stop_output = false;
            output += process_escape_sequences(args[i], stop_output);
            if (stop_output) {
                builtin_write(ctx, output);
                return ExecResult::normal(0);
            }
        } else {
            output += args[i];
        }
    }

    if (!suppress_newline) {
        output += '\n';
    }
    builtin_write(ctx, output);
    return ExecResult::normal(0);
}
