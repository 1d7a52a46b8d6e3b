#include "usage.h"

#include <iostream>

#include "esh.h"

void print_version() {
    std::cout << "esh v" << get_version() << "\n";
}

void print_usage(bool print_version_line) {
    if (print_version_line) {
        print_version();
    }
    std::cout << "Usage: esh [options] [script_file [args...]]\n"
              << "       esh [options] -c command_string [name [args...]]\n"
              << "\n"
              << "Reads commands from standard input when neither -c nor a script is given.\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help                 Display this help message and exit\n"
              << "      --version              Print version information and exit\n"
              << "  -c, --command=COMMAND      Execute the specified command and exit\n"
              << "  -e                         Exit when a command fails (errexit)\n"
              << "  -u                         Treat unset variables as an error (nounset)\n"
              << "  -x                         Trace commands before running them (xtrace)\n"
              << "  -v                         Echo script text as it is read (verbose)\n"
              << "  -o OPTION                  Enable an option by name, e.g. -o globstar\n"
              << "\n"
              << "Examples:\n"
              << "  esh script.sh arg1 arg2    Run script with arguments\n"
              << "  esh -c 'echo hello'        Execute command and exit\n"
              << "  esh -e -o globstar build.sh\n"
              << "\n";
}
