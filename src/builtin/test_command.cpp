#include "test_command.h"

#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

class TestSyntaxError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

bool parse_integer(const std::string& text, long long& value) {
    size_t start = 0;
    size_t end = text.size();
    while (start < end && (text[start] == ' ' || text[start] == '\t')) {
        ++start;
    }
    while (end > start && (text[end - 1] == ' ' || text[end - 1] == '\t')) {
        --end;
    }
    if (start == end) {
        return false;
    }
    std::string trimmed = text.substr(start, end - start);
    errno = 0;
    char* parse_end = nullptr;
    value = std::strtoll(trimmed.c_str(), &parse_end, 10);
    return errno == 0 && parse_end != nullptr && *parse_end == '\0';
}

bool modified_after(const struct stat& a, const struct stat& b) {
    return a.st_mtime > b.st_mtime ||
           (a.st_mtime == b.st_mtime && a.st_mtim.tv_nsec > b.st_mtim.tv_nsec);
}

bool is_unary_op(const std::string& s) {
    return s.length() == 2 && s[0] == '-' &&
           (s == "-z" || s == "-n" || s == "-e" || s == "-f" || s == "-d" || s == "-r" ||
            s == "-w" || s == "-x" || s == "-s" || s == "-L" || s == "-h" || s == "-p" ||
            s == "-b" || s == "-c" || s == "-S" || s == "-u" || s == "-g" || s == "-k" ||
            s == "-O" || s == "-G" || s == "-N" || s == "-t" || s == "-v");
}

bool is_binary_op(const std::string& s) {
    return s == "=" || s == "==" || s == "!=" || s == "<" || s == ">" || s == "-eq" || s == "-ne" ||
           s == "-lt" || s == "-le" || s == "-gt" || s == "-ge" || s == "-ef" || s == "-nt" ||
           s == "-ot";
}

class TestEvaluator {
   public:
    TestEvaluator(const std::vector<std::string>& args, const Environment* env)
        : args_(args), env_(env) {
    }

    bool evaluate() {
        bool result = evaluate_or();
        if (has_more()) {
            throw TestSyntaxError(current() + ": unexpected argument");
        }
        return result;
    }

   private:
    const std::vector<std::string>& args_;
    const Environment* env_;
    size_t pos_ = 0;

    bool has_more() const {
        return pos_ < args_.size();
    }
    const std::string& current() const {
        return args_[pos_];
    }
    size_t remaining() const {
        return args_.size() - pos_;
    }
    const std::string& take() {
        if (!has_more()) {
            throw TestSyntaxError("argument expected");
        }
        return args_[pos_++];
    }

    bool evaluate_or() {
        bool result = evaluate_and();
        while (has_more() && current() == "-o") {
            ++pos_;
            bool rhs = evaluate_and();
            result = result || rhs;
        }
        return result;
    }

    bool evaluate_and() {
        bool result = evaluate_term();
        while (has_more() && current() == "-a") {
            ++pos_;
            bool rhs = evaluate_term();
            result = result && rhs;
        }
        return result;
    }

    bool evaluate_term() {
        if (!has_more()) {
            throw TestSyntaxError("argument expected");
        }

        // "! = x" compares the string "!"; otherwise a leading "!" negates.
        if (current() == "!" && !(remaining() == 3 && is_binary_op(args_[pos_ + 1]))) {
            ++pos_;
            return !evaluate_term();
        }

        if (current() == "(" && !(remaining() >= 3 && is_binary_op(args_[pos_ + 1]))) {
            ++pos_;
            bool result = evaluate_or();
            if (!has_more() || current() != ")") {
                throw TestSyntaxError("`)' expected");
            }
            ++pos_;
            return result;
        }

        if (remaining() >= 3 && is_binary_op(args_[pos_ + 1])) {
            const std::string& left = take();
            const std::string& op = take();
            const std::string& right = take();
            return evaluate_binary(left, op, right);
        }

        if (remaining() >= 2 && is_unary_op(current())) {
            const std::string& op = take();
            const std::string& operand = take();
            return evaluate_unary(op, operand);
        }

        return !take().empty();
    }

    bool evaluate_unary(const std::string& op, const std::string& arg) const {
        struct stat st;
        const char* path = arg.c_str();

        if (op == "-z") {
            return arg.empty();
        }
        if (op == "-n") {
            return !arg.empty();
        }
        if (op == "-v") {
            return env_ != nullptr && env_->is_set(arg);
        }
        if (op == "-e") {
            return access(path, F_OK) == 0;
        }
        if (op == "-r") {
            return access(path, R_OK) == 0;
        }
        if (op == "-w") {
            return access(path, W_OK) == 0;
        }
        if (op == "-x") {
            return access(path, X_OK) == 0;
        }
        if (op == "-L" || op == "-h") {
            return lstat(path, &st) == 0 && S_ISLNK(st.st_mode);
        }
        if (op == "-t") {
            long long fd = 0;
            return parse_integer(arg, fd) && fd >= 0 && isatty(static_cast<int>(fd)) != 0;
        }

        if (stat(path, &st) != 0) {
            return false;
        }
        if (op == "-f") {
            return S_ISREG(st.st_mode);
        }
        if (op == "-d") {
            return S_ISDIR(st.st_mode);
        }
        if (op == "-s") {
            return st.st_size > 0;
        }
        if (op == "-p") {
            return S_ISFIFO(st.st_mode);
        }
        if (op == "-b") {
            return S_ISBLK(st.st_mode);
        }
        if (op == "-c") {
            return S_ISCHR(st.st_mode);
        }
        if (op == "-S") {
            return S_ISSOCK(st.st_mode);
        }
        if (op == "-u") {
            return (st.st_mode & S_ISUID) != 0;
        }
        if (op == "-g") {
            return (st.st_mode & S_ISGID) != 0;
        }
        if (op == "-k") {
            return (st.st_mode & S_ISVTX) != 0;
        }
        if (op == "-O") {
            return st.st_uid == geteuid();
        }
        if (op == "-G") {
            return st.st_gid == getegid();
        }
        if (op == "-N") {
            return st.st_mtime > st.st_atime ||
                   (st.st_mtime == st.st_atime && st.st_mtim.tv_nsec > st.st_atim.tv_nsec);
        }
        return false;
    }

    static bool evaluate_binary(const std::string& left, const std::string& op,
                                const std::string& right) {
        if (op == "=" || op == "==") {
            return left == right;
        }
        if (op == "!=") {
            return left != right;
        }
        if (op == "<") {
            return left < right;
        }
        if (op == ">") {
            return left > right;
        }

        if (op == "-ef" || op == "-nt" || op == "-ot") {
            struct stat st1;
            struct stat st2;
            bool left_ok = stat(left.c_str(), &st1) == 0;
            bool right_ok = stat(right.c_str(), &st2) == 0;
            if (op == "-ef") {
                return left_ok && right_ok && st1.st_dev == st2.st_dev &&
                       st1.st_ino == st2.st_ino;
            }
            if (op == "-nt") {
                return left_ok && (!right_ok || modified_after(st1, st2));
            }
            return right_ok && (!left_ok || modified_after(st2, st1));
        }

        long long left_val = 0;
        long long right_val = 0;
        if (!parse_integer(left, left_val)) {
            throw TestSyntaxError(left + ": integer expression expected");
        }
        if (!parse_integer(right, right_val)) {
            throw TestSyntaxError(right + ": integer expression expected");
        }

        if (op == "-eq") {
            return left_val == right_val;
        }
        if (op == "-ne") {
            return left_val != right_val;
        }
        if (op == "-lt") {
            return left_val < right_val;
        }
        if (op == "-le") {
            return left_val <= right_val;
        }
        if (op == "-gt") {
            return left_val > right_val;
        }
        return left_val >= right_val;
    }
};

int evaluate_with_message(const std::vector<std::string>& args, const Environment* env,
                          std::string& message) {
    if (args.empty()) {
        return 1;
    }
    try {
        TestEvaluator evaluator(args, env);
        return evaluator.evaluate() ? 0 : 1;
    } catch (const TestSyntaxError& e) {
        message = e.what();
        return 2;
    }
}

}  // namespace

int evaluate_test_expression(const std::vector<std::string>& args, const Environment* env) {
    std::string ignored;
    return evaluate_with_message(args, env, ignored);
}

ExecResult test_command(const std::vector<std::string>& args, BuiltinContext& ctx) {
    const std::string& name = args[0];
    std::vector<std::string> operands(args.begin() + 1, args.end());

    if (name == "[") {
        if (operands.empty() || operands.back() != "]") {
            return builtin_error(ctx, ErrorType::SYNTAX_ERROR, "[", "missing `]'", 2);
        }
        operands.pop_back();
    }

    std::string message;
    int status = evaluate_with_message(operands, &ctx.env, message);
    if (status == 2) {
        return builtin_error(ctx, ErrorType::INVALID_ARGUMENT, name, message, 2);
    }
    return ExecResult::normal(status);
}
