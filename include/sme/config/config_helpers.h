#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace sme::config {

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
            if (path.size() <= 2) {
                return std::filesystem::path(home);
            }
            return std::filesystem::path(home) / path.substr(2);
        }
    }
    return path;
}

// Flat view of a TOML-subset file: "section.key" -> raw (still quoted) value.
// Section headers may be bare ([ingest]) or quoted ([model."BAAI/bge-base"]); quotes are
// stripped from the header so the key becomes model.BAAI/bge-base.<key>.
using ConfigValues = std::map<std::string, std::string>;

// Parse every key of a TOML-subset config file. Missing file yields an empty map.
ConfigValues parse_config_file(const std::filesystem::path& config_path);

// Parse the same format from an in-memory document
ConfigValues parse_config_text(std::string_view text);

// Parse a comma- or TOML-array-separated list. Accepts forms like "a,b" or ["a", "b"].
std::vector<std::string> parse_string_list(const std::string& raw);

// Strict numeric/boolean conversions; false when the text is not a well-formed value
bool parse_size(const std::string& raw, size_t& out);
bool parse_double(const std::string& raw, double& out);
bool parse_bool(const std::string& raw, bool& out);

// Get standard config path
std::filesystem::path get_config_path(const std::string& override_path = "");

/// Returns the user config directory
/// Unix: $XDG_CONFIG_HOME/sme or ~/.config/sme
std::filesystem::path get_config_dir();

} // namespace sme::config
