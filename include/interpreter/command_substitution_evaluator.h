/*
  command_substitution_evaluator.h

  This file is part of esh, an embeddable shell

  MIT License

  Copyright (c) 2026 Caden Finley

  Permission is hereby granted, free of charge, to any person obtaining a copy
  of this software and associated documentation files (the "Software"), to deal
  in the Software without restriction, including without limitation the rights
  to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
  copies of the Software, and to permit persons to whom the Software is
  furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all
  copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
  IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
  FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
  AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
  LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
  OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
  SOFTWARE.
*/

#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

// Captures command output for $(...), backticks and <(...). Commands run in-process: the
// executor receives a descriptor to use as stdout, and a drainer thread collects whatever is
// written to it into a buffer owned by the single capture call.
class CommandSubstitutionEvaluator {
   public:
    // Runs command text with stdout bound to out_fd and returns its exit status.
    using CommandExecutor = std::function<int(const std::string&, int)>;

    struct CaptureResult {
        std::string output;
        int exit_code = 0;
    };

    explicit CommandSubstitutionEvaluator(CommandExecutor executor);
    ~CommandSubstitutionEvaluator();

    CommandSubstitutionEvaluator(const CommandSubstitutionEvaluator&) = delete;
    CommandSubstitutionEvaluator& operator=(const CommandSubstitutionEvaluator&) = delete;

    // Trailing newlines are stripped from the output.
    CaptureResult capture_command_output(const std::string& command);

    // <(cmd) writes the output of cmd to a temp file; >(cmd) yields a fresh empty temp file.
    // Either way the path is returned and the file lives until this evaluator is destroyed.
    std::string create_process_substitution(const std::string& command, bool is_input);

    void cleanup_temp_files();

    // start_index is the position just after the opening parenthesis.
    static std::optional<size_t> find_matching_paren(const std::string& text, size_t start_index);
    static size_t find_closing_backtick(const std::string& input, size_t start);
    // Resolves \`, \\ and \$ inside backtick command text.
    static std::string unescape_backtick_command(const std::string& content);

   private:
    CommandExecutor command_executor_;
    std::vector<std::string> temp_files_;
};
