#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace envvars {

// The environment variable state of the calling process.
// Variables are stored in a hash table with the variable name as the key.
//
// Initialised using either:
//      - char**: used to capture the environment (typically through the
//      ::environ global variable or envp argument to main)
//      - const state&: by copying.
//
// Making a read only copy of the environment when the application starts
// avoids calls to getenv from worker threads, and lets tests provide an
// environment of their own.
class state {
  public:
    state() = default;
    state(char* env[]);
    state(const state&) = default;

    void set(std::string_view name, std::string_view value);
    void unset(std::string_view name);
    std::optional<std::string> get(std::string_view name) const;

    const std::unordered_map<std::string, std::string>& variables() const;

    // expand variables delimited with '${' and '}', e.g:
    //      "${HOME}/.config/${TOOL}"
    // variables that are not set expand to an empty string.
    std::string expand(std::string_view) const;

  private:
    std::unordered_map<std::string, std::string> variables_;
};

// Environment variable names in the portable character set, i.e.
// [a-zA-Z_][a-zA-Z0-9_]* if strict, otherwise any name without '='.
bool validate_name(std::string_view name, bool strict = true);

} // namespace envvars
