#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>

namespace wikichunk::config {

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

// Expands "~" and "~/..." against $HOME; "~user" forms and other paths are returned as-is
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (path.empty() || path[0] != '~' || (path.size() > 1 && path[1] != '/')) {
        return path;
    }
    const char* home = std::getenv("HOME");
    if (!home || !*home) {
        return path;
    }
    if (path.size() <= 2) {
        return std::filesystem::path(home);
    }
    return std::filesystem::path(home) / path.substr(2);
}

// Parse a value from a TOML config file. Accepts both "[section] key = v" and
// "section.key = v". Returns nullopt when the file or key is missing.
std::optional<std::string> parse_config_value(const std::filesystem::path& config_path,
                                              const std::string& section,
                                              const std::string& key);

// $WIKICHUNK_CONFIG, else $XDG_CONFIG_HOME/wikichunk/config.toml, else
// ~/.config/wikichunk/config.toml. A non-empty override wins over all of them.
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace wikichunk::config
