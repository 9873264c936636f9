#include "mcpconf/diagnostics.hpp"
#include "mcpconf/backup_store.hpp"
#include "mcpconf/error.hpp"
#include "mcpconf/registry.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <deque>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <spdlog/spdlog.h>

namespace mcpconf {

namespace fs = std::filesystem;

namespace {

std::string iso_now() {
    std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

bool contains_error(const std::string& line) {
    std::string lower(line.size(), '\0');
    std::transform(line.begin(), line.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower.find("error") != std::string::npos;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

std::string format_bytes(std::uintmax_t bytes) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2)
        << static_cast<double>(bytes) / (1024.0 * 1024.0 * 1024.0) << " GB";
    return oss.str();
}

} // anonymous namespace

Diagnostics::Diagnostics() = default;

Diagnostics::Diagnostics(Options opts) : opts_(std::move(opts)) {
}

Report Diagnostics::build_report(const fs::path& registry_path, const fs::path& backup_dir,
                                 const ProbeResults& probes) const {
    Report report;
    report.generated_at = iso_now();
    report.registry_path = registry_path;
    report.backup_dir = backup_dir;
    report.probes = probes;

    std::error_code ec;
    report.registry_exists = fs::exists(registry_path, ec);
    if (report.registry_exists) {
        try {
            report.servers = Registry::load(registry_path).servers();
        } catch (const ConfigError& e) {
            report.registry_error = e.what();
        }
    }

    BackupStore::Options backup_opts;
    backup_opts.directory = backup_dir;
    BackupStore backups(backup_opts);
    auto snapshots = backups.list_snapshots();
    report.snapshot_count = snapshots.size();
    if (!snapshots.empty()) report.latest_snapshot = snapshots.back().timestamp;

    if (opts_.host_log) {
        report.host_log = opts_.host_log;
        std::ifstream log(*opts_.host_log);
        if (log) {
            report.host_log_found = true;
            std::deque<std::string> last;
            std::string line;
            while (std::getline(log, line)) {
                if (!contains_error(line)) continue;
                last.push_back(line);
                if (last.size() > opts_.log_error_lines) last.pop_front();
            }
            report.recent_errors.assign(last.begin(), last.end());
        }
    }

    // Space of the filesystem holding the registry, or its nearest existing parent.
    fs::path probe_dir = registry_path.has_parent_path() ? registry_path.parent_path() : fs::path(".");
    while (!probe_dir.empty() && !fs::exists(probe_dir, ec) && probe_dir != probe_dir.parent_path()) {
        probe_dir = probe_dir.parent_path();
    }
    auto space = fs::space(probe_dir.empty() ? fs::path(".") : probe_dir, ec);
    if (!ec) report.free_space_bytes = space.available;

    if (report.registry_error) {
        report.recommendations.push_back("Fix or restore the registry: mcpconf restore latest");
    }
    if (report.probes.host_running == ProbeResult::No) {
        report.recommendations.push_back("Start the host application: mcpconf launch");
    }
    if (report.probes.network && !report.probes.network->reachable) {
        report.recommendations.push_back("Check internet connectivity; packages cannot be fetched offline");
    }
    report.recommendations.push_back("Reset to a minimal registry: mcpconf clean");
    report.recommendations.push_back("Restart the host application after registry changes");
    report.recommendations.push_back("Reinstall problematic servers: mcpconf install <name>");

    spdlog::debug("Built report: {} server(s), {} snapshot(s)", report.servers.size(),
                  report.snapshot_count);
    return report;
}

std::string render_text(const Report& r) {
    std::ostringstream out;
    out << "# MCP Server Diagnostic Report\n";
    out << "Generated on " << r.generated_at << "\n\n";

    out << "## Host Application Status\n";
    out << "Installed: " << to_string(r.probes.host_installed) << "\n";
    out << "Running: " << to_string(r.probes.host_running) << "\n\n";

    out << "## Configuration\n";
    if (!r.registry_exists) {
        out << "Configuration file NOT found at " << r.registry_path.string() << "\n";
    } else if (r.registry_error) {
        out << "Configuration file at " << r.registry_path.string() << " is unreadable: "
            << *r.registry_error << "\n";
    } else {
        out << "Configuration file exists at " << r.registry_path.string() << "\n";
        out << "### Configured MCP Servers (" << r.server_count() << "):\n";
        if (r.servers.empty()) {
            out << "No MCP servers configured\n";
        } else {
            out << "| Server Name | Command | Arguments |\n";
            out << "|-------------|---------|-----------|\n";
            for (const auto& s : r.servers) {
                out << "| " << s.name << " | " << s.command << " | "
                    << (s.args.empty() ? "N/A" : join(s.args, " ")) << " |\n";
            }
        }
    }
    out << "\n";

    out << "## Backups\n";
    out << "Directory: " << r.backup_dir.string() << "\n";
    out << "Snapshots: " << r.snapshot_count << "\n";
    out << "Most recent: " << r.latest_snapshot.value_or("none") << "\n\n";

    if (r.host_log) {
        out << "## Recent Errors in Host Logs\n";
        if (!r.host_log_found) {
            out << "Log file NOT found at " << r.host_log->string() << "\n";
        } else if (r.recent_errors.empty()) {
            out << "No errors found in logs\n";
        } else {
            for (const auto& line : r.recent_errors) out << line << "\n";
        }
        out << "\n";
    }

    out << "## Internet Connectivity\n";
    if (!r.probes.network) {
        out << "Not checked\n";
    } else {
        out << (r.probes.network->reachable ? "Reachable" : "Unreachable");
        if (r.probes.network->latency_ms) {
            out << " (" << std::fixed << std::setprecision(1) << *r.probes.network->latency_ms << " ms)";
        }
        out << "\n" << r.probes.network->detail << "\n";
    }
    out << "\n";

    out << "## Disk Space\n";
    out << "Available: " << (r.free_space_bytes ? format_bytes(*r.free_space_bytes) : "unknown") << "\n\n";

    out << "## Recommendations\n";
    for (size_t i = 0; i < r.recommendations.size(); ++i) {
        out << (i + 1) << ". " << r.recommendations[i] << "\n";
    }
    return out.str();
}

void to_json(Json& j, const Report& r) {
    Json servers = Json::object();
    for (const auto& s : r.servers) {
        Json body;
        to_json(body, s);
        servers[s.name] = std::move(body);
    }

    j = Json::object();
    j["generatedAt"] = r.generated_at;
    j["registry"] = {{"path", r.registry_path.string()},
                     {"exists", r.registry_exists},
                     {"serverCount", r.server_count()},
                     {"servers", std::move(servers)}};
    if (r.registry_error) j["registry"]["error"] = *r.registry_error;

    j["backups"] = {{"directory", r.backup_dir.string()}, {"count", r.snapshot_count}};
    j["backups"]["latest"] = r.latest_snapshot ? Json(*r.latest_snapshot) : Json(nullptr);

    j["probes"] = r.probes;

    if (r.host_log) {
        j["hostLog"] = {{"path", r.host_log->string()},
                        {"found", r.host_log_found},
                        {"recentErrors", r.recent_errors}};
    }
    j["freeSpaceBytes"] = r.free_space_bytes ? Json(*r.free_space_bytes) : Json(nullptr);
    j["recommendations"] = r.recommendations;
}

} // namespace mcpconf
