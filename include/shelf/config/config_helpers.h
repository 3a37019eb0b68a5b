#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace shelf::config {

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

// Quote handling
inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// Tilde expansion
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            if (path.size() == 1)
                return std::filesystem::path(home);
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// Cut a trailing "# comment" that is not inside quotes
inline void strip_inline_comment(std::string& v) {
    char quote = 0;
    for (std::size_t i = 0; i < v.size(); ++i) {
        const char c = v[i];
        if (quote) {
            if (c == quote)
                quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            v.erase(i);
            break;
        }
    }
    rtrim(v);
}

// Accepts "a,b" or ["a", "b"]; empty elements are dropped
std::vector<std::string> parse_list(std::string_view raw);

// --config override, else $XDG_CONFIG_HOME/shelf/config.toml, else ~/.config/shelf/config.toml
std::filesystem::path get_config_path(const std::string& override_path = {});

} // namespace shelf::config
