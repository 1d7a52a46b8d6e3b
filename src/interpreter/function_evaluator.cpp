#include "function_evaluator.h"

#include <algorithm>

#include "debug.h"

namespace function_evaluator {

bool has_function(const FunctionMap& functions, const std::string& name) {
    return functions.find(name) != functions.end();
}

std::vector<std::string> get_function_names(const FunctionMap& functions) {
    std::vector<std::string> names;
    names.reserve(functions.size());
    for (const auto& entry : functions) {
        names.push_back(entry.first);
    }
    std::sort(names.begin(), names.end());
    return names;
}

FunctionScope::FunctionScope(Environment& env, const std::vector<std::string>& args)
    : env_(env), snapshot_(env.snapshot()) {
    env_.set_positional_parameters(args);
}

FunctionScope::~FunctionScope() {
    std::vector<std::string> stale_positionals;
    for (const auto& entry : env_.get_env_map()) {
        if (Environment::is_positional_name(entry.first) &&
            snapshot_.find(entry.first) == snapshot_.end()) {
            stale_positionals.push_back(entry.first);
        }
    }
    for (const auto& name : stale_positionals) {
        env_.unset(name);
    }

    for (const auto& entry : snapshot_) {
        // $! and $? describe the most recent job and command, wherever they ran.
        if (entry.first == "!" || entry.first == "?") {
            continue;
        }
        auto current = env_.get(entry.first);
        if (!current.has_value() || *current != entry.second ||
            env_.kind_of(entry.first) != VariableKind::SCALAR) {
            env_.set(entry.first, entry.second);
        }
    }
}

ExecResult invoke_function(
    const ast::BlockStatement& body, Environment& env, const std::vector<std::string>& args,
    const std::function<ExecResult(const ast::BlockStatement&)>& execute_block) {
    std::vector<std::string> params;
    if (args.size() > 1) {
        params.assign(args.begin() + 1, args.end());
    }

    debug_msg("calling function %s with %zu argument(s)", args.empty() ? "" : args[0].c_str(),
              params.size());
    FunctionScope scope(env, params);
    return execute_block(body);
}

}  // namespace function_evaluator
