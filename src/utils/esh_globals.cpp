#include "esh.h"

namespace config {
bool execute_command = false;
std::string cmd_to_execute;
bool show_version = false;
bool show_help = false;
}  // namespace config
