#include "mcpconf/settings.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <spdlog/spdlog.h>

namespace mcpconf {

namespace fs = std::filesystem;

namespace {

void trim(std::string& s) {
    const char* ws = " \t\r\n";
    auto first = s.find_first_not_of(ws);
    if (first == std::string::npos) {
        s.clear();
        return;
    }
    s = s.substr(first, s.find_last_not_of(ws) - first + 1);
}

std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && (val.front() == '"' || val.front() == '\'') && val.back() == val.front()) {
        return val.substr(1, val.size() - 2);
    }
    // Unquoted values may carry an inline comment
    auto comment = val.find('#');
    if (comment != std::string::npos) {
        val = val.substr(0, comment);
        trim(val);
    }
    return val;
}

fs::path home_dir(const EnvLookup& env) {
    if (auto home = env("HOME")) return fs::path(*home);
    return fs::path(".");
}

fs::path expand_tilde(const std::string& value, const EnvLookup& env) {
    if (value == "~") return home_dir(env);
    if (value.rfind("~/", 0) == 0) return home_dir(env) / value.substr(2);
    return fs::path(value);
}

std::vector<fs::path> split_paths(const std::string& value, const EnvLookup& env) {
    std::vector<fs::path> out;
    std::istringstream in(value);
    std::string part;
    while (std::getline(in, part, ':')) {
        trim(part);
        if (!part.empty()) out.push_back(expand_tilde(part, env));
    }
    return out;
}

long long parse_number(const std::string& key, const std::string& value) {
    try {
        size_t used = 0;
        long long n = std::stoll(value, &used);
        if (used != value.size() || n < 0) throw std::invalid_argument(value);
        return n;
    } catch (const std::logic_error&) {
        throw std::invalid_argument("Invalid number for '" + key + "': " + value);
    }
}

} // anonymous namespace

EnvLookup process_environment() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (!value || !*value) return std::nullopt;
        return std::string(value);
    };
}

fs::path default_settings_path(const EnvLookup& env) {
    if (auto xdg = env("XDG_CONFIG_HOME")) return fs::path(*xdg) / "mcpconf" / "config.toml";
    return home_dir(env) / ".config" / "mcpconf" / "config.toml";
}

Settings default_settings(const EnvLookup& env) {
    Settings s;
    fs::path config_home = env("XDG_CONFIG_HOME") ? fs::path(*env("XDG_CONFIG_HOME"))
                                                  : home_dir(env) / ".config";
    fs::path data_home = env("XDG_DATA_HOME") ? fs::path(*env("XDG_DATA_HOME"))
                                              : home_dir(env) / ".local" / "share";
    s.registry_path = config_home / "Claude" / "claude_desktop_config.json";
    s.backup_dir = data_home / "mcpconf" / "backups";
    s.host_install_dirs = {"/opt", "/usr/lib", "/usr/share", home_dir(env) / "Applications"};
    return s;
}

std::map<std::string, std::string> parse_settings_text(std::string_view text) {
    std::map<std::string, std::string> values;
    std::istringstream in{std::string(text)};
    std::string line;
    std::string section;

    while (std::getline(in, line)) {
        trim(line);
        if (line.empty() || line[0] == '#') continue;

        if (line.front() == '[') {
            if (line.size() >= 2 && line.back() == ']') {
                section = line.substr(1, line.size() - 2);
                trim(section);
            }
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = line.substr(0, eq);
        trim(key);
        if (key.empty()) continue;

        // Support both "paths.registry" and "[paths] registry"
        if (key.find('.') == std::string::npos && !section.empty()) {
            key = section + "." + key;
        }
        values[key] = unquote(line.substr(eq + 1));
    }
    return values;
}

void apply_settings_values(Settings& s, const std::map<std::string, std::string>& values,
                           const EnvLookup& env) {
    for (const auto& [key, value] : values) {
        if (key == "paths.registry") {
            s.registry_path = expand_tilde(value, env);
        } else if (key == "paths.backups") {
            s.backup_dir = expand_tilde(value, env);
        } else if (key == "paths.host_log") {
            s.host_log = expand_tilde(value, env);
        } else if (key == "host.app") {
            s.host_app = value;
        } else if (key == "host.install_dirs") {
            s.host_install_dirs = split_paths(value, env);
        } else if (key == "install.package_manager") {
            s.package_manager = value;
        } else if (key == "install.timeout_seconds") {
            s.install_timeout = std::chrono::seconds(parse_number(key, value));
        } else if (key == "lock.timeout_ms") {
            s.lock_timeout = std::chrono::milliseconds(parse_number(key, value));
        } else if (key == "probe.url") {
            s.probe_url = value;
        } else {
            spdlog::warn("Ignoring unknown setting '{}'", key);
        }
    }
}

Settings resolve_settings(const SettingsOverrides& overrides, const EnvLookup& env) {
    Settings s = default_settings(env);

    fs::path file = overrides.settings_file ? *overrides.settings_file
                  : env("MCPCONF_SETTINGS") ? fs::path(*env("MCPCONF_SETTINGS"))
                                            : default_settings_path(env);
    std::error_code ec;
    if (fs::exists(file, ec)) {
        std::ifstream in(file);
        if (!in) throw std::invalid_argument("Cannot read settings file '" + file.string() + "'");
        std::ostringstream oss;
        oss << in.rdbuf();
        spdlog::debug("Reading settings from {}", file.string());
        apply_settings_values(s, parse_settings_text(oss.str()), env);
    } else if (overrides.settings_file) {
        throw std::invalid_argument("Settings file not found: " + file.string());
    }

    if (auto v = env("MCPCONF_REGISTRY")) s.registry_path = *v;
    if (auto v = env("MCPCONF_BACKUP_DIR")) s.backup_dir = *v;
    if (auto v = env("MCPCONF_HOST_APP")) s.host_app = *v;
    if (auto v = env("MCPCONF_PACKAGE_MANAGER")) s.package_manager = *v;

    if (overrides.registry_path) s.registry_path = *overrides.registry_path;
    if (overrides.backup_dir) s.backup_dir = *overrides.backup_dir;
    return s;
}

} // namespace mcpconf
