/*
  flags.cpp

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

#include "flags.h"

#include <getopt.h>
#include <unistd.h>

#include "debug.h"
#include "error_out.h"
#include "esh.h"

namespace flags {

namespace {

constexpr int kOptVersion = 256;

ParseResult usage_error(const std::string& option, const std::string& message) {
    print_error(ErrorInfo(ErrorType::INVALID_ARGUMENT, option, message,
                          {"Run 'esh --help' for usage"}));
    ParseResult result;
    result.exit_code = 2;
    result.should_exit = true;
    return result;
}

}  // namespace

ParseResult parse_arguments(int argc, char* argv[], ShellOptions& options) {
    ParseResult result;

    static struct option long_options[] = {{"command", required_argument, nullptr, 'c'},
                                           {"help", no_argument, nullptr, 'h'},
                                           {"version", no_argument, nullptr, kOptVersion},
                                           {nullptr, 0, nullptr, 0}};

    // Leading '+' stops at the first operand so script arguments are left alone; leading ':'
    // lets us report bad options ourselves.
    const char* short_options = "+:c:euxvo:h";

    int option_index = 0;
    int c;
    optind = 1;
    opterr = 0;

    while ((c = getopt_long(argc, argv, short_options, long_options, &option_index)) != -1) {
        switch (c) {
            case 'c':
                config::execute_command = true;
                config::cmd_to_execute = optarg;
                break;
            case 'e':
            case 'u':
            case 'x':
            case 'v':
                options.set_short(static_cast<char>(c), true);
                break;
            case 'o':
                if (!options.set_long(optarg, true)) {
                    return usage_error("-o", std::string(optarg) + ": invalid option name");
                }
                break;
            case 'h':
                config::show_help = true;
                break;
            case kOptVersion:
                config::show_version = true;
                break;
            case ':':
                return usage_error(argv[optind - 1], "option requires an argument");
            case '?':
            default: {
                std::string bad = optopt != 0 ? std::string("-") + static_cast<char>(optopt)
                                              : std::string(argv[optind - 1]);
                return usage_error(bad, "invalid option");
            }
        }
    }

    if (optind < argc) {
        result.script_file = argv[optind++];
        while (optind < argc) {
            result.script_args.emplace_back(argv[optind++]);
        }
    }

    debug_msg("parsed arguments: script='%s' args=%zu flags=%s", result.script_file.c_str(),
              result.script_args.size(), options.flags_string().c_str());
    return result;
}

}  // namespace flags
