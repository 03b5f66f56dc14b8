#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <string_view>

namespace spindle::config {

// "~" and "~/x" resolve against $HOME; anything else is returned unchanged
std::filesystem::path expand_tilde(const std::string& path);

// true/false, yes/no, on/off, 1/0 in any case; returns false on anything else
bool parse_bool(std::string_view text, bool& out);

/**
 * Reads the subset of TOML the config file uses into "section.key" -> value.
 * Understands [section] headers, key = value, single or double quoted values
 * and # comments outside quotes. A missing or unreadable file yields an empty
 * map; lines that are not assignments are skipped.
 */
std::map<std::string, std::string> parse_simple_toml_flat(const std::filesystem::path& path);

// One value from the file, "" when the key or the file is absent
std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key);

// override > $SPINDLE_CONFIG > $XDG_CONFIG_HOME/spindle/config.toml > ~/.config/spindle/config.toml
std::filesystem::path get_config_path(const std::string& override_path = "");

} // namespace spindle::config
