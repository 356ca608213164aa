#pragma once

#include <cctype>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace json_min {

// Flat JSON object:
// - scalar values live in kv: strings decoded, numbers/bool/null as raw token
// - arrays of scalars live in lists (same encoding per element)
// - string_keys remembers which kv entries were JSON strings
// Nested objects are not supported.
struct Object {
    std::unordered_map<std::string, std::string> kv;
    std::unordered_map<std::string, std::vector<std::string>> lists;
    std::unordered_map<std::string, bool> string_keys;
};

struct ParseError {
    std::string message;
    std::size_t offset = 0;

    std::string describe() const {
        return message + " at offset " + std::to_string(offset);
    }
};

inline void skip_ws(std::string_view s, size_t& i) {
    while (i < s.size() && std::isspace((unsigned char)s[i])) ++i;
}

inline bool consume(std::string_view s, size_t& i, char ch) {
    skip_ws(s, i);
    if (i < s.size() && s[i] == ch) { ++i; return true; }
    return false;
}

inline void append_utf8_(std::string& out, unsigned cp) {
    if (cp < 0x80) {
        out.push_back((char)cp);
    } else if (cp < 0x800) {
        out.push_back((char)(0xC0 | (cp >> 6)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back((char)(0xE0 | (cp >> 12)));
        out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    } else {
        out.push_back((char)(0xF0 | (cp >> 18)));
        out.push_back((char)(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    }
}

// 4 hex digits at s[i..i+4), advances i
inline std::optional<unsigned> read_hex4_(std::string_view s, size_t& i) {
    if (i + 4 > s.size()) return std::nullopt;
    unsigned v = 0;
    for (int k = 0; k < 4; ++k) {
        char h = s[i++];
        v <<= 4;
        if (h >= '0' && h <= '9') v |= (unsigned)(h - '0');
        else if (h >= 'a' && h <= 'f') v |= (unsigned)(h - 'a' + 10);
        else if (h >= 'A' && h <= 'F') v |= (unsigned)(h - 'A' + 10);
        else return std::nullopt;
    }
    return v;
}

inline std::optional<std::string> parse_string(std::string_view s, size_t& i) {
    skip_ws(s, i);
    if (i >= s.size() || s[i] != '"') return std::nullopt;
    ++i;
    std::string out;
    while (i < s.size()) {
        char c = s[i++];
        if (c == '"') return out;
        if (c != '\\') {
            out.push_back(c);
            continue;
        }
        if (i >= s.size()) return std::nullopt;
        char e = s[i++];
        switch (e) {
            case '"':  out.push_back('"'); break;
            case '\\': out.push_back('\\'); break;
            case '/':  out.push_back('/'); break;
            case 'b':  out.push_back('\b'); break;
            case 'f':  out.push_back('\f'); break;
            case 'n':  out.push_back('\n'); break;
            case 'r':  out.push_back('\r'); break;
            case 't':  out.push_back('\t'); break;
            case 'u': {
                auto hi = read_hex4_(s, i);
                if (!hi.has_value()) return std::nullopt;
                unsigned cp = *hi;
                // lone low surrogate
                if (cp >= 0xDC00 && cp <= 0xDFFF) return std::nullopt;
                if (cp >= 0xD800 && cp <= 0xDBFF) {
                    // high surrogate must be followed by \uDC00-\uDFFF
                    if (i + 2 > s.size() || s[i] != '\\' || s[i + 1] != 'u') return std::nullopt;
                    i += 2;
                    auto lo = read_hex4_(s, i);
                    if (!lo.has_value() || *lo < 0xDC00 || *lo > 0xDFFF) return std::nullopt;
                    cp = 0x10000 + ((cp - 0xD800) << 10) + (*lo - 0xDC00);
                }
                append_utf8_(out, cp);
                break;
            }
            default:
                return std::nullopt;
        }
    }
    return std::nullopt;
}

// number / true / false / null
inline std::optional<std::string> parse_token(std::string_view s, size_t& i) {
    skip_ws(s, i);
    size_t start = i;
    while (i < s.size()) {
        char c = s[i];
        if (std::isspace((unsigned char)c) || c == ',' || c == '}' || c == ']') break;
        ++i;
    }
    if (i == start) return std::nullopt;

    std::string tok(s.substr(start, i - start));
    if (tok == "true" || tok == "false" || tok == "null") return tok;

    // accept JSON number shape only: -?digits(.digits)?([eE][+-]?digits)?
    size_t k = 0;
    if (k < tok.size() && tok[k] == '-') ++k;
    size_t digits = 0;
    while (k < tok.size() && std::isdigit((unsigned char)tok[k])) { ++k; ++digits; }
    if (digits == 0) return std::nullopt;
    if (k < tok.size() && tok[k] == '.') {
        ++k;
        size_t frac = 0;
        while (k < tok.size() && std::isdigit((unsigned char)tok[k])) { ++k; ++frac; }
        if (frac == 0) return std::nullopt;
    }
    if (k < tok.size() && (tok[k] == 'e' || tok[k] == 'E')) {
        ++k;
        if (k < tok.size() && (tok[k] == '+' || tok[k] == '-')) ++k;
        size_t exp = 0;
        while (k < tok.size() && std::isdigit((unsigned char)tok[k])) { ++k; ++exp; }
        if (exp == 0) return std::nullopt;
    }
    if (k != tok.size()) return std::nullopt;
    return tok;
}

// Parses one scalar value. Sets is_string when the value was a JSON string.
inline std::optional<std::string> parse_scalar(std::string_view s, size_t& i, bool& is_string) {
    skip_ws(s, i);
    is_string = (i < s.size() && s[i] == '"');
    if (is_string) return parse_string(s, i);
    return parse_token(s, i);
}

inline bool fail_(ParseError* err, const char* msg, size_t at) {
    if (err) {
        err->message = msg;
        err->offset = at;
    }
    return false;
}

inline bool parse_array(std::string_view s, size_t& i, std::vector<std::string>& out, ParseError* err) {
    if (!consume(s, i, '[')) return fail_(err, "expected [", i);
    if (consume(s, i, ']')) return true;

    while (i < s.size()) {
        skip_ws(s, i);
        if (i < s.size() && (s[i] == '{' || s[i] == '[')) {
            return fail_(err, "nested values are not supported", i);
        }
        bool is_string = false;
        auto v = parse_scalar(s, i, is_string);
        if (!v.has_value()) return fail_(err, "bad array element", i);
        out.push_back(*v);

        if (consume(s, i, ']')) return true;
        if (!consume(s, i, ',')) return fail_(err, "expected , or ]", i);
    }
    return fail_(err, "unexpected end", i);
}

inline bool parse_object(std::string_view s, Object& out, ParseError* err = nullptr) {
    size_t i = 0;
    if (!consume(s, i, '{')) return fail_(err, "expected {", i);

    bool closed = consume(s, i, '}');
    while (!closed) {
        skip_ws(s, i);
        if (i >= s.size()) return fail_(err, "unexpected end", i);

        auto k = parse_string(s, i);
        if (!k.has_value()) return fail_(err, "expected string key", i);
        if (!consume(s, i, ':')) return fail_(err, "expected :", i);

        skip_ws(s, i);
        if (i < s.size() && s[i] == '{') {
            return fail_(err, "nested objects are not supported", i);
        }
        if (i < s.size() && s[i] == '[') {
            std::vector<std::string> items;
            if (!parse_array(s, i, items, err)) return false;
            out.kv.erase(*k);
            out.string_keys.erase(*k);
            out.lists[*k] = std::move(items);
        } else {
            bool is_string = false;
            auto v = parse_scalar(s, i, is_string);
            if (!v.has_value()) return fail_(err, "bad value", i);
            out.lists.erase(*k);
            out.kv[*k] = *v;
            out.string_keys[*k] = is_string;
        }

        if (consume(s, i, '}')) {
            closed = true;
        } else if (!consume(s, i, ',')) {
            return fail_(err, "expected , or }", i);
        }
    }

    skip_ws(s, i);
    if (i != s.size()) return fail_(err, "trailing characters", i);
    return true;
}

} // namespace json_min
