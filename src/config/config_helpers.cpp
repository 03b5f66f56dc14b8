#include <spindle/config/config_helpers.h>

#include <cctype>
#include <cstdlib>
#include <fstream>

namespace spindle::config {

namespace fs = std::filesystem;

namespace {

std::string_view stripSpace(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
    return s;
}

// Cuts the line at the first '#' outside a quoted value
std::string_view dropComment(std::string_view line) {
    char open = '\0';
    for (std::size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (open != '\0') {
            if (c == open)
                open = '\0';
        } else if (c == '"' || c == '\'') {
            open = c;
        } else if (c == '#') {
            return line.substr(0, i);
        }
    }
    return line;
}

std::string_view dropQuotes(std::string_view value) {
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
        value.back() == value.front())
        return value.substr(1, value.size() - 2);
    return value;
}

const char* nonEmptyEnv(const char* name) {
    const char* v = std::getenv(name);
    return (v != nullptr && *v != '\0') ? v : nullptr;
}

} // namespace

fs::path expand_tilde(const std::string& path) {
    const bool tilde = path == "~" || path.rfind("~/", 0) == 0;
    const char* home = std::getenv("HOME");
    if (!tilde || home == nullptr)
        return path;
    fs::path expanded(home);
    if (path.size() > 2)
        expanded /= path.substr(2);
    return expanded;
}

bool parse_bool(std::string_view text, bool& out) {
    std::string v;
    for (char c : text)
        v += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    for (const char* yes : {"true", "yes", "on", "1"}) {
        if (v == yes) {
            out = true;
            return true;
        }
    }
    for (const char* no : {"false", "no", "off", "0"}) {
        if (v == no) {
            out = false;
            return true;
        }
    }
    return false;
}

std::map<std::string, std::string> parse_simple_toml_flat(const fs::path& path) {
    std::map<std::string, std::string> values;
    std::ifstream in(path);
    if (!in)
        return values;

    std::string section;
    std::string raw;
    while (std::getline(in, raw)) {
        const auto line = stripSpace(dropComment(raw));
        if (line.empty())
            continue;

        if (line.front() == '[') {
            if (const auto close = line.find(']'); close != std::string_view::npos)
                section = std::string(stripSpace(line.substr(1, close - 1)));
            continue;
        }

        const auto eq = line.find('=');
        if (eq == std::string_view::npos)
            continue;
        const auto key = stripSpace(line.substr(0, eq));
        if (key.empty())
            continue;
        const auto value = dropQuotes(stripSpace(line.substr(eq + 1)));

        std::string flatKey = section.empty() ? std::string(key) : section + "." + std::string(key);
        values[std::move(flatKey)] = std::string(value);
    }
    return values;
}

std::string parse_config_value(const fs::path& config_path, const std::string& section,
                               const std::string& key) {
    const auto values = parse_simple_toml_flat(config_path);
    const auto it = values.find(section.empty() ? key : section + "." + key);
    return it == values.end() ? std::string() : it->second;
}

fs::path get_config_path(const std::string& override_path) {
    if (!override_path.empty())
        return expand_tilde(override_path);
    if (const char* env = nonEmptyEnv("SPINDLE_CONFIG"))
        return expand_tilde(env);
    if (const char* xdg = nonEmptyEnv("XDG_CONFIG_HOME"))
        return fs::path(xdg) / "spindle" / "config.toml";
    if (const char* home = nonEmptyEnv("HOME"))
        return fs::path(home) / ".config" / "spindle" / "config.toml";
    return fs::path(".config") / "spindle" / "config.toml";
}

} // namespace spindle::config
