#include <sme/config/config_helpers.h>

#include <charconv>
#include <fstream>
#include <sstream>

namespace sme::config {

namespace {

// Strip a trailing '#' comment that is not inside a quoted string
std::string strip_inline_comment(const std::string& v) {
    char quote = 0;
    for (size_t i = 0; i < v.size(); ++i) {
        char c = v[i];
        if (quote) {
            if (c == quote) {
                quote = 0;
            }
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            return v.substr(0, i);
        }
    }
    return v;
}

std::string normalize_section(std::string header) {
    trim(header);
    std::string out;
    out.reserve(header.size());
    for (char c : header) {
        if (c != '"' && c != '\'') {
            out.push_back(c);
        }
    }
    return out;
}

} // namespace

ConfigValues parse_config_text(std::string_view text) {
    ConfigValues values;
    std::istringstream in{std::string(text)};
    std::string line;
    std::string currentSection;

    while (std::getline(in, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Section headers [section]
        if (line[0] == '[') {
            size_t end = line.rfind(']');
            if (end != std::string::npos && end > 0) {
                currentSection = normalize_section(line.substr(1, end - 1));
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        std::string k = line.substr(0, eq);
        std::string v = strip_inline_comment(line.substr(eq + 1));
        trim(k);
        trim(v);
        if (k.empty()) {
            continue;
        }

        values[currentSection.empty() ? k : currentSection + "." + k] = v;
    }

    return values;
}

ConfigValues parse_config_file(const std::filesystem::path& config_path) {
    std::ifstream file(config_path);
    if (!file) {
        return {};
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return parse_config_text(buffer.str());
}

std::vector<std::string> parse_string_list(const std::string& raw) {
    std::string s = raw;
    trim(s);
    if (s.size() >= 2 && s.front() == '[' && s.back() == ']') {
        s = s.substr(1, s.size() - 2);
    }

    std::vector<std::string> out;
    std::string current;
    char quote = 0;
    auto flush = [&]() {
        std::string item = unquote(current);
        if (!item.empty()) {
            out.push_back(std::move(item));
        }
        current.clear();
    };

    for (char c : s) {
        if (quote) {
            if (c == quote) {
                quote = 0;
            }
            current.push_back(c);
        } else if (c == '"' || c == '\'') {
            quote = c;
            current.push_back(c);
        } else if (c == ',') {
            flush();
        } else {
            current.push_back(c);
        }
    }
    flush();
    return out;
}

bool parse_size(const std::string& raw, size_t& out) {
    std::string s = unquote(raw);
    if (s.empty()) {
        return false;
    }
    size_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr != s.data() + s.size()) {
        return false;
    }
    out = value;
    return true;
}

bool parse_double(const std::string& raw, double& out) {
    std::string s = unquote(raw);
    if (s.empty()) {
        return false;
    }
    try {
        size_t consumed = 0;
        double value = std::stod(s, &consumed);
        if (consumed != s.size()) {
            return false;
        }
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parse_bool(const std::string& raw, bool& out) {
    std::string s = unquote(raw);
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "true" || s == "1" || s == "yes" || s == "on") {
        out = true;
        return true;
    }
    if (s == "false" || s == "0" || s == "no" || s == "off") {
        out = false;
        return true;
    }
    return false;
}

std::filesystem::path get_config_dir() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    if (xdgConfigHome && *xdgConfigHome) {
        return std::filesystem::path(xdgConfigHome) / "sme";
    }
    if (homeEnv && *homeEnv) {
        return std::filesystem::path(homeEnv) / ".config" / "sme";
    }
    return std::filesystem::path("~/.config") / "sme";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* env = std::getenv("SME_CONFIG"); env && *env) {
        return expand_tilde(env);
    }
    return get_config_dir() / "config.toml";
}

} // namespace sme::config
