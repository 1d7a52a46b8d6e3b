#include "shell_options.h"

bool ShellOptions::set_short(char flag, bool enabled) {
    switch (flag) {
        case 'e':
            errexit = enabled;
            return true;
        case 'u':
            nounset = enabled;
            return true;
        case 'x':
            xtrace = enabled;
            return true;
        case 'v':
            verbose = enabled;
            return true;
        case 'C':
            noclobber = enabled;
            return true;
        default:
            return false;
    }
}

bool ShellOptions::set_long(const std::string& name, bool enabled) {
    if (name == "errexit") {
        errexit = enabled;
    } else if (name == "nounset") {
        nounset = enabled;
    } else if (name == "xtrace") {
        xtrace = enabled;
    } else if (name == "verbose") {
        verbose = enabled;
    } else if (name == "globstar") {
        globstar = enabled;
    } else if (name == "noclobber") {
        noclobber = enabled;
    } else {
        return false;
    }
    return true;
}

std::string ShellOptions::flags_string() const {
    std::string flags;
    if (errexit) {
        flags += 'e';
    }
    if (nounset) {
        flags += 'u';
    }
    if (verbose) {
        flags += 'v';
    }
    if (xtrace) {
        flags += 'x';
    }
    if (noclobber) {
        flags += 'C';
    }
    return flags;
}

std::vector<std::pair<std::string, bool>> ShellOptions::list() const {
    return {{"errexit", errexit},   {"globstar", globstar}, {"noclobber", noclobber},
            {"nounset", nounset},   {"verbose", verbose},   {"xtrace", xtrace}};
}
