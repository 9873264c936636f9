#pragma once
#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpconf {

/// Where the registry lives and how collaborators are reached.
struct Settings {
    std::filesystem::path registry_path;
    std::filesystem::path backup_dir;
    std::string host_app = "claude-desktop";
    std::vector<std::filesystem::path> host_install_dirs;
    std::optional<std::filesystem::path> host_log;
    std::string package_manager = "npm";
    std::chrono::milliseconds install_timeout{std::chrono::minutes(5)};
    std::chrono::milliseconds lock_timeout{std::chrono::seconds(5)};
    std::string probe_url = "http://anthropic.com";
};

/// Values given on the command line; they take precedence over everything.
struct SettingsOverrides {
    std::optional<std::filesystem::path> settings_file;
    std::optional<std::filesystem::path> registry_path;
    std::optional<std::filesystem::path> backup_dir;
};

using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

/// Reads the real process environment; empty values count as unset.
EnvLookup process_environment();

/// $XDG_CONFIG_HOME/mcpconf/config.toml, or ~/.config/mcpconf/config.toml.
std::filesystem::path default_settings_path(const EnvLookup& env);

Settings default_settings(const EnvLookup& env);

/// Flat "key = value" lines under "[section]" headers, returned as
/// "section.key" → value. Comments start with '#'; values may be quoted.
std::map<std::string, std::string> parse_settings_text(std::string_view text);

/// "~" in path values expands against env's HOME.
/// Throws std::invalid_argument on malformed numbers.
void apply_settings_values(Settings& settings, const std::map<std::string, std::string>& values,
                           const EnvLookup& env);

/// Defaults, then the settings file, then MCPCONF_* environment variables,
/// then overrides. Throws std::invalid_argument for a bad settings file.
Settings resolve_settings(const SettingsOverrides& overrides, const EnvLookup& env);

} // namespace mcpconf
