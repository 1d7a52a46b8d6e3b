#include "environment.h"

#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

extern char** environ;

namespace {

bool is_special_name(const std::string& name) {
    return name == "?" || name == "$" || name == "#" || name == "@" || name == "*" ||
           name == "!" || name == "0" || name == "-";
}

std::string join_with_space(const std::vector<std::string>& values) {
    std::string result;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            result += ' ';
        }
        result += values[i];
    }
    return result;
}

}  // namespace

Environment::Environment(bool import_process_env) {
    if (import_process_env && environ != nullptr) {
        for (char** entry = environ; *entry != nullptr; ++entry) {
            std::string pair(*entry);
            size_t eq = pair.find('=');
            if (eq == std::string::npos || eq == 0) {
                continue;
            }
            vars[pair.substr(0, eq)] = pair.substr(eq + 1);
        }
    }
    vars["#"] = "0";
    vars["@"] = "";
    vars["*"] = "";
    vars["?"] = "0";
}

bool Environment::is_valid_identifier(const std::string& name) {
    if (name.empty()) {
        return false;
    }
    if (std::isalpha(static_cast<unsigned char>(name[0])) == 0 && name[0] != '_') {
        return false;
    }
    for (char c : name) {
        if (std::isalnum(static_cast<unsigned char>(c)) == 0 && c != '_') {
            return false;
        }
    }
    return true;
}

bool Environment::is_positional_name(const std::string& name) {
    if (name.empty() || name == "0") {
        return false;
    }
    for (char c : name) {
        if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
            return false;
        }
    }
    return true;
}

std::optional<std::string> Environment::get(const std::string& name) const {
    if (name == "$") {
        return std::to_string(getpid());
    }
    auto it = vars.find(name);
    if (it != vars.end()) {
        return it->second;
    }
    if (name == "!" || name == "-") {
        return std::string();
    }
    return std::nullopt;
}

std::string Environment::get_or_empty(const std::string& name) const {
    auto value = get(name);
    return value.has_value() ? *value : std::string();
}

bool Environment::is_set(const std::string& name) const {
    if (is_special_name(name)) {
        return true;
    }
    if (vars.find(name) != vars.end()) {
        return true;
    }
    return arrays.find(name) != arrays.end() || assoc_arrays.find(name) != assoc_arrays.end();
}

void Environment::set(const std::string& name, const std::string& value) {
    drop_other_kinds(name, VariableKind::SCALAR);
    vars[name] = value;
    if (is_valid_identifier(name)) {
        setenv(name.c_str(), value.c_str(), 1);
    }
}

void Environment::unset(const std::string& name) {
    vars.erase(name);
    arrays.erase(name);
    assoc_arrays.erase(name);
    array_types.erase(name);
    if (is_valid_identifier(name)) {
        unsetenv(name.c_str());
    }
}

VariableKind Environment::kind_of(const std::string& name) const {
    auto it = array_types.find(name);
    if (it == array_types.end()) {
        return VariableKind::SCALAR;
    }
    return it->second;
}

void Environment::drop_other_kinds(const std::string& name, VariableKind keep) {
    if (keep != VariableKind::SCALAR) {
        if (vars.erase(name) > 0 && is_valid_identifier(name)) {
            unsetenv(name.c_str());
        }
    }
    if (keep != VariableKind::ARRAY) {
        arrays.erase(name);
    }
    if (keep != VariableKind::ASSOC) {
        assoc_arrays.erase(name);
    }
    if (keep == VariableKind::SCALAR) {
        array_types.erase(name);
    } else {
        array_types[name] = keep;
    }
}

void Environment::declare_array(const std::string& name) {
    if (kind_of(name) == VariableKind::ARRAY) {
        return;
    }
    drop_other_kinds(name, VariableKind::ARRAY);
    arrays[name];
}

void Environment::declare_assoc(const std::string& name) {
    if (kind_of(name) == VariableKind::ASSOC) {
        return;
    }
    drop_other_kinds(name, VariableKind::ASSOC);
    assoc_arrays[name];
}

void Environment::set_array(const std::string& name, std::vector<std::string> values) {
    drop_other_kinds(name, VariableKind::ARRAY);
    arrays[name] = std::move(values);
}

void Environment::append_array(const std::string& name, const std::vector<std::string>& values) {
    if (kind_of(name) != VariableKind::ARRAY) {
        std::vector<std::string> seed;
        auto scalar = vars.find(name);
        if (scalar != vars.end()) {
            seed.push_back(scalar->second);
        }
        set_array(name, std::move(seed));
    }
    auto& target = arrays[name];
    target.insert(target.end(), values.begin(), values.end());
}

void Environment::set_array_element(const std::string& name, std::size_t index,
                                    const std::string& value) {
    if (index > kMaxArrayIndex) {
        throw std::out_of_range(name + ": array subscript " + std::to_string(index) +
                                " out of range");
    }
    if (kind_of(name) != VariableKind::ARRAY) {
        declare_array(name);
    }
    auto& target = arrays[name];
    if (index >= target.size()) {
        target.resize(index + 1);
    }
    target[index] = value;
}

const std::vector<std::string>* Environment::get_array(const std::string& name) const {
    auto it = arrays.find(name);
    return it == arrays.end() ? nullptr : &it->second;
}

void Environment::set_assoc(const std::string& name, AssocArray values) {
    drop_other_kinds(name, VariableKind::ASSOC);
    assoc_arrays[name] = std::move(values);
}

void Environment::set_assoc_element(const std::string& name, const std::string& key,
                                    const std::string& value) {
    if (kind_of(name) != VariableKind::ASSOC) {
        declare_assoc(name);
    }
    assoc_arrays[name][key] = value;
}

const Environment::AssocArray* Environment::get_assoc(const std::string& name) const {
    auto it = assoc_arrays.find(name);
    return it == assoc_arrays.end() ? nullptr : &it->second;
}

std::vector<std::string> Environment::array_names() const {
    std::vector<std::string> names;
    names.reserve(arrays.size() + assoc_arrays.size());
    for (const auto& entry : arrays) {
        names.push_back(entry.first);
    }
    for (const auto& entry : assoc_arrays) {
        names.push_back(entry.first);
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::vector<std::string> Environment::positional_parameters() const {
    std::vector<std::string> params;
    auto count_it = vars.find("#");
    if (count_it == vars.end()) {
        return params;
    }
    long count = std::strtol(count_it->second.c_str(), nullptr, 10);
    for (long i = 1; i <= count; ++i) {
        auto it = vars.find(std::to_string(i));
        params.push_back(it == vars.end() ? std::string() : it->second);
    }
    return params;
}

void Environment::set_positional_parameters(const std::vector<std::string>& params) {
    for (auto it = vars.begin(); it != vars.end();) {
        if (is_positional_name(it->first)) {
            it = vars.erase(it);
        } else {
            ++it;
        }
    }
    for (size_t i = 0; i < params.size(); ++i) {
        vars[std::to_string(i + 1)] = params[i];
    }
    vars["#"] = std::to_string(params.size());
    vars["@"] = join_with_space(params);
    vars["*"] = vars["@"];
}

bool Environment::shift(std::size_t count) {
    auto params = positional_parameters();
    if (count > params.size()) {
        return false;
    }
    params.erase(params.begin(), params.begin() + static_cast<std::ptrdiff_t>(count));
    set_positional_parameters(params);
    return true;
}

int Environment::last_status() const {
    auto it = vars.find("?");
    if (it == vars.end()) {
        return 0;
    }
    return static_cast<int>(std::strtol(it->second.c_str(), nullptr, 10));
}

void Environment::set_last_status(int status) {
    vars["?"] = std::to_string(status);
}
