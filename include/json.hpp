#pragma once

#include <string>
#include <string_view>
#include <optional>
#include <functional>
#include <cctype>

namespace json {

// Minimal SAX-style reader for the flat objects returned by the GitHub API
// and registry token endpoints. Nested values are reported raw.
class SAXParser {
public:
    using Callback = std::function<void(std::string_view key, std::string_view value, bool is_string)>;

    // Walks the members of the first top-level object in `input`
    static bool parse_object(std::string_view input, const Callback& cb) {
        auto start = input.find('{');
        if (start == std::string_view::npos) return false;
        auto end = skip_composite(input, start);
        if (end == std::string_view::npos) return false;
        parse_members(input.substr(start + 1, end - start - 2), cb);
        return true;
    }

private:
    // Index one past the bracket closing the one at `pos`, npos if unbalanced
    static size_t skip_composite(std::string_view s, size_t pos) {
        char open = s[pos];
        char close = open == '{' ? '}' : ']';
        int depth = 1;
        size_t p = pos + 1;
        while (p < s.size() && depth > 0) {
            if (s[p] == '"') {
                p = skip_string(s, p);
                if (p == std::string_view::npos) return p;
                continue;
            }
            if (s[p] == open) depth++;
            else if (s[p] == close) depth--;
            p++;
        }
        return depth == 0 ? p : std::string_view::npos;
    }

    // Index one past the closing quote of the string starting at `pos`
    static size_t skip_string(std::string_view s, size_t pos) {
        size_t p = pos + 1;
        while (p < s.size()) {
            if (s[p] == '\\') p += 2;
            else if (s[p] == '"') return p + 1;
            else p++;
        }
        return std::string_view::npos;
    }

    static void parse_members(std::string_view obj, const Callback& cb) {
        size_t p = 0;
        while (p < obj.size()) {
            p = obj.find('"', p);
            if (p == std::string_view::npos) return;
            size_t key_end = skip_string(obj, p);
            if (key_end == std::string_view::npos) return;
            std::string_view key = obj.substr(p + 1, key_end - p - 2);
            p = obj.find(':', key_end);
            if (p == std::string_view::npos) return;
            p++;
            while (p < obj.size() && std::isspace(static_cast<unsigned char>(obj[p]))) p++;
            if (p >= obj.size()) return;

            if (obj[p] == '"') {
                size_t val_end = skip_string(obj, p);
                if (val_end == std::string_view::npos) return;
                cb(key, obj.substr(p + 1, val_end - p - 2), true);
                p = val_end;
            } else if (obj[p] == '{' || obj[p] == '[') {
                size_t val_end = skip_composite(obj, p);
                if (val_end == std::string_view::npos) return;
                cb(key, obj.substr(p, val_end - p), false);
                p = val_end;
            } else {
                size_t val_end = p;
                while (val_end < obj.size() && obj[val_end] != ',' &&
                       !std::isspace(static_cast<unsigned char>(obj[val_end]))) val_end++;
                cb(key, obj.substr(p, val_end - p), false);
                p = val_end;
            }
            p = obj.find(',', p);
            if (p == std::string_view::npos) return;
        }
    }
};

// Resolves \" \\ \/ \n \t; \u escapes are kept verbatim
inline std::string unescape(std::string_view raw) {
    std::string out;
    out.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); ++i) {
        if (raw[i] != '\\' || i + 1 == raw.size()) {
            out += raw[i];
            continue;
        }
        char c = raw[++i];
        switch (c) {
            case 'n': out += '\n'; break;
            case 't': out += '\t'; break;
            case 'r': out += '\r'; break;
            case 'u': out += "\\u"; break;
            default: out += c; break;
        }
    }
    return out;
}

// String member `key` of the top-level object
inline std::optional<std::string> find_string(std::string_view doc, std::string_view key) {
    std::optional<std::string> found;
    SAXParser::parse_object(doc, [&](std::string_view k, std::string_view v, bool is_string) {
        if (!found && is_string && k == key) found = unescape(v);
    });
    return found;
}

} // namespace json
