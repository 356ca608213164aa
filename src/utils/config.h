#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace utils {

// Config loader:
// - reads a flat JSON object from a file (see json_min.h)
// - keys are case-insensitive
// - environment variables <PREFIX><KEY> override file values for scalars
//   (an empty prefix disables the override)
class Config {
public:
    explicit Config(std::string env_prefix = "");

    // Load from file. Returns false and fills err if the file can't be
    // opened or isn't valid JSON.
    bool load_file(const std::string& path, std::string* err = nullptr);

    // Load from JSON text
    bool load_text(const std::string& text, std::string* err = nullptr);

    // Get raw string (env override -> file -> default)
    std::string get_string(const std::string& key, const std::string& default_value = "") const;

    std::optional<std::string> get_string_opt(const std::string& key) const;

    // nullopt if missing or not an integer
    std::optional<long long> get_int_opt(const std::string& key) const;
    std::optional<bool> get_bool_opt(const std::string& key) const;

    long long get_int(const std::string& key, long long default_value) const;
    bool get_bool(const std::string& key, bool default_value) const;

    std::optional<std::vector<std::string>> get_list(const std::string& key) const;

    bool has(const std::string& key) const;

    // true if the value came from a JSON string or the environment
    bool is_string(const std::string& key) const;

private:
    std::string env_prefix_;
    std::unordered_map<std::string, std::string> kv_;
    std::unordered_map<std::string, std::vector<std::string>> lists_;
    std::unordered_set<std::string> non_string_;

    static std::string upper_(std::string s);
    std::optional<std::string> getenv_(const std::string& key) const;
};

// Parses "true/false/1/0/yes/no/on/off" (case-insensitive)
std::optional<bool> parse_bool_token(const std::string& token);

} // namespace utils
