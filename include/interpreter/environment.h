#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

enum class VariableKind : std::uint8_t {
    SCALAR,
    ARRAY,
    ASSOC
};

// Variable store owned by one executor. A name holds exactly one kind at a time; declaring a
// kind erases the other kinds stored under that name.
class Environment {
   public:
    using VariableMap = std::unordered_map<std::string, std::string>;
    using ArrayMap = std::unordered_map<std::string, std::vector<std::string>>;
    using AssocArray = std::map<std::string, std::string>;
    using AssocMap = std::unordered_map<std::string, AssocArray>;

    // Seeds from environ unless import_process_env is false; '#' is 0 and '@' is empty.
    explicit Environment(bool import_process_env = true);
    ~Environment() = default;

    Environment(const Environment&) = delete;
    Environment& operator=(const Environment&) = delete;
    Environment(Environment&&) = default;
    Environment& operator=(Environment&&) = default;

    std::optional<std::string> get(const std::string& name) const;
    std::string get_or_empty(const std::string& name) const;
    bool is_set(const std::string& name) const;

    // Also exports through setenv(3) when name is a valid identifier.
    void set(const std::string& name, const std::string& value);
    void unset(const std::string& name);

    const VariableMap& get_env_map() const {
        return vars;
    }
    VariableMap snapshot() const {
        return vars;
    }

    VariableKind kind_of(const std::string& name) const;

    void declare_array(const std::string& name);
    void declare_assoc(const std::string& name);
    void set_array(const std::string& name, std::vector<std::string> values);
    void append_array(const std::string& name, const std::vector<std::string>& values);
    // Indexed arrays are dense; subscripts above this are rejected before storage grows.
    static constexpr std::size_t kMaxArrayIndex = (std::size_t{1} << 20) - 1;

    // Throws std::out_of_range when index exceeds kMaxArrayIndex.
    void set_array_element(const std::string& name, std::size_t index, const std::string& value);
    const std::vector<std::string>* get_array(const std::string& name) const;

    void set_assoc(const std::string& name, AssocArray values);
    void set_assoc_element(const std::string& name, const std::string& key,
                           const std::string& value);
    const AssocArray* get_assoc(const std::string& name) const;
    // Names of indexed and associative arrays, sorted.
    std::vector<std::string> array_names() const;

    std::vector<std::string> positional_parameters() const;
    void set_positional_parameters(const std::vector<std::string>& params);
    // Drops the first count parameters. False when fewer than count are set.
    bool shift(std::size_t count);

    int last_status() const;
    void set_last_status(int status);

    static bool is_valid_identifier(const std::string& name);
    static bool is_positional_name(const std::string& name);

   private:
    VariableMap vars;
    ArrayMap arrays;
    AssocMap assoc_arrays;
    std::unordered_map<std::string, VariableKind> array_types;

    void drop_other_kinds(const std::string& name, VariableKind keep);
};
