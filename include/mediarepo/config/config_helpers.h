#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <istream>
#include <map>
#include <string>
#include <string_view>

namespace mediarepo::config {

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

// Tilde expansion ("~" and "~/...")
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~' && (path.size() == 1 || path[1] == '/')) {
        const char* home = std::getenv("HOME");
        if (home) {
            return path.size() <= 2 ? std::filesystem::path(home)
                                    : std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

/// section name -> (key -> unquoted value); keys before any header live in section ""
using ConfigSections = std::map<std::string, std::map<std::string, std::string>>;

// Parse a TOML subset: [section] headers, key = value pairs, '#' comments
ConfigSections parse_config_sections(std::istream& in);

// Config file location: override_path, else $MEDIAREPO_CONFIG, else <config dir>/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

/// Returns the user config directory
/// $XDG_CONFIG_HOME/mediarepo or ~/.config/mediarepo
std::filesystem::path get_config_dir();

/// Returns the user data directory (database, default storage)
/// $XDG_DATA_HOME/mediarepo or ~/.local/share/mediarepo
std::filesystem::path get_data_dir();

} // namespace mediarepo::config
