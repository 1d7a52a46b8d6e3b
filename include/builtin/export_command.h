#pragma once

#include <string>
#include <vector>

#include "builtin.h"

// export [NAME[=VALUE] ...]; with no operands lists exported variables.
ExecResult export_command(const std::vector<std::string>& args, BuiltinContext& ctx);
