#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <string>

namespace relsync::config {

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
            return std::filesystem::path(home) / (path.size() > 2 ? path.substr(2) : "");
        }
    }
    return path;
}

/**
 * Read every key of one [section] of a TOML-style file. Supports the subset relsync writes:
 * `key = value` lines, quoted or bare values, `#` comments outside quotes, and dotted keys
 * (`section.key = value`) anywhere in the file. A missing or unreadable file yields an empty map.
 */
std::map<std::string, std::string> parse_config_section(const std::filesystem::path& config_path,
                                                         const std::string& section);

/// $XDG_CONFIG_HOME/relsync/config.toml, falling back to ~/.config/relsync/config.toml.
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace relsync::config
