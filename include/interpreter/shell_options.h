#pragma once

#include <string>
#include <utility>
#include <vector>

// Option flags toggled by `set` and by the command line.
struct ShellOptions {
    bool errexit = false;
    bool nounset = false;
    bool xtrace = false;
    bool verbose = false;
    bool globstar = false;
    bool noclobber = false;

    // Single-letter form as in `set -e`. False for an unknown letter.
    bool set_short(char flag, bool enabled);
    // Long form as in `set -o errexit`. False for an unknown name.
    bool set_long(const std::string& name, bool enabled);

    // Letters of the enabled single-letter options, the value of $-.
    std::string flags_string() const;
    std::vector<std::pair<std::string, bool>> list() const;
};
