#include "config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iterator>

#include "json_min.h"

namespace utils {

Config::Config(std::string env_prefix) : env_prefix_(std::move(env_prefix)) {}

std::string Config::upper_(std::string s) {
    for (char& c : s) c = (char)std::toupper((unsigned char)c);
    return s;
}

std::optional<std::string> Config::getenv_(const std::string& key) const {
    if (env_prefix_.empty()) return std::nullopt;
    std::string name = env_prefix_ + key;
    const char* v = std::getenv(name.c_str());
    if (!v) return std::nullopt;
    return std::string(v);
}

bool Config::load_file(const std::string& path, std::string* err) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        if (err) *err = "cannot open " + path;
        return false;
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        if (err) *err = "cannot read " + path;
        return false;
    }
    return load_text(text, err);
}

bool Config::load_text(const std::string& text, std::string* err) {
    json_min::Object obj;
    json_min::ParseError perr;
    if (!json_min::parse_object(text, obj, &perr)) {
        if (err) *err = "invalid JSON: " + perr.describe();
        return false;
    }

    for (auto& [key, val] : obj.kv) {
        auto k = upper_(key);
        lists_.erase(k);
        kv_[k] = val;
        if (obj.string_keys[key]) non_string_.erase(k);
        else non_string_.insert(k);
    }
    for (auto& [key, items] : obj.lists) {
        auto k = upper_(key);
        kv_.erase(k);
        non_string_.insert(k);
        lists_[k] = items;
    }
    return true;
}

bool Config::has(const std::string& key) const {
    auto k = upper_(key);
    if (getenv_(k).has_value()) return true;
    return kv_.count(k) > 0 || lists_.count(k) > 0;
}

bool Config::is_string(const std::string& key) const {
    auto k = upper_(key);
    if (getenv_(k).has_value()) return true;
    return kv_.count(k) > 0 && non_string_.count(k) == 0;
}

std::optional<std::string> Config::get_string_opt(const std::string& key) const {
    auto k = upper_(key);

    if (auto env = getenv_(k); env.has_value()) {
        return env;
    }
    auto it = kv_.find(k);
    if (it == kv_.end()) return std::nullopt;
    return it->second;
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    auto opt = get_string_opt(key);
    return opt.has_value() ? *opt : default_value;
}

std::optional<long long> Config::get_int_opt(const std::string& key) const {
    auto s = get_string_opt(key);
    if (!s.has_value()) return std::nullopt;
    try {
        std::size_t used = 0;
        long long v = std::stoll(*s, &used);
        if (used != s->size()) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<bool> Config::get_bool_opt(const std::string& key) const {
    auto s = get_string_opt(key);
    if (!s.has_value()) return std::nullopt;
    return parse_bool_token(*s);
}

long long Config::get_int(const std::string& key, long long default_value) const {
    return get_int_opt(key).value_or(default_value);
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    return get_bool_opt(key).value_or(default_value);
}

std::optional<std::vector<std::string>> Config::get_list(const std::string& key) const {
    auto it = lists_.find(upper_(key));
    if (it == lists_.end()) return std::nullopt;
    return it->second;
}

std::optional<bool> parse_bool_token(const std::string& token) {
    std::string v = token;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c){ return (char)std::tolower(c); });

    if (v == "1" || v == "true" || v == "yes" || v == "y" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "n" || v == "off") return false;
    return std::nullopt;
}

} // namespace utils
