#include <unistd.h>

#include <string>

#include "debug.h"
#include "error_out.h"
#include "esh.h"
#include "esh_filesystem.h"
#include "flags.h"
#include "shell_script_interpreter.h"
#include "usage.h"

int main(int argc, char* argv[]) {
    ShellScriptInterpreter interpreter;

    flags::ParseResult parsed = flags::parse_arguments(argc, argv, interpreter.options());
    if (parsed.should_exit) {
        return parsed.exit_code;
    }
    if (config::show_help) {
        print_usage();
        return 0;
    }
    if (config::show_version) {
        print_version();
        return 0;
    }

    std::string script;
    if (config::execute_command) {
        script = config::cmd_to_execute;
        interpreter.set_script_name(parsed.script_file.empty() ? std::string(argv[0])
                                                               : parsed.script_file);
    } else if (!parsed.script_file.empty()) {
        auto content = esh_filesystem::read_file_content(parsed.script_file);
        if (content.is_error()) {
            print_error(ErrorInfo(ErrorType::FILE_NOT_FOUND, parsed.script_file, content.error()));
            return 127;
        }
        script = content.value();
        interpreter.set_script_name(parsed.script_file);
    } else {
        auto content = esh_filesystem::read_all(STDIN_FILENO);
        if (content.is_error()) {
            print_error(ErrorInfo(ErrorType::RUNTIME_ERROR, "stdin", content.error()));
            return 1;
        }
        script = content.value();
        interpreter.set_script_name(argv[0] != nullptr ? argv[0] : "esh");
    }
    interpreter.set_positional_parameters(parsed.script_args);

    debug_msg("running %zu byte(s) of script", script.size());
    return interpreter.execute_script(script);
}
