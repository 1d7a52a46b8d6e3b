#pragma once

#include <string>

const bool PRE_RELEASE = false;
constexpr const char* c_version_base = "1.0.0";

inline std::string get_version() {
    static std::string cached_version =
        std::string(c_version_base) + (PRE_RELEASE ? " (pre-release)" : "");
    return cached_version;
}

// Settings taken from the command line before the session starts.
namespace config {
extern bool execute_command;
extern std::string cmd_to_execute;
extern bool show_version;
extern bool show_help;
}  // namespace config
