#include "mcpconf/probes.hpp"
#include "mcpconf/process.hpp"
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>
#include <httplib.h>
#include <spdlog/spdlog.h>

namespace mcpconf {

namespace fs = std::filesystem;

const char* to_string(ProbeResult r) {
    switch (r) {
        case ProbeResult::Yes:     return "yes";
        case ProbeResult::No:      return "no";
        case ProbeResult::Unknown: return "unknown";
    }
    return "unknown";
}

ProbeResult first_conclusive(const std::vector<ProbeStrategy>& strategies) {
    for (const auto& strategy : strategies) {
        ProbeResult r = strategy();
        if (r != ProbeResult::Unknown) return r;
    }
    return ProbeResult::Unknown;
}

// ---------- Strategies ----------

namespace probes {

ProbeResult find_in_path(const std::string& name, const std::string& path_env) {
    if (path_env.empty() || name.empty()) return ProbeResult::Unknown;

    std::istringstream dirs(path_env);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        fs::path candidate = fs::path(dir.empty() ? "." : dir) / name;
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec) && ::access(candidate.c_str(), X_OK) == 0) {
            spdlog::debug("Found {} at {}", name, candidate.string());
            return ProbeResult::Yes;
        }
    }
    return ProbeResult::Unknown;
}

ProbeResult find_in_dirs(const std::string& name, const std::vector<fs::path>& dirs) {
    if (dirs.empty()) return ProbeResult::Unknown;
    for (const auto& dir : dirs) {
        std::error_code ec;
        if (fs::exists(dir / name, ec)) {
            spdlog::debug("Found {} in {}", name, dir.string());
            return ProbeResult::Yes;
        }
    }
    return ProbeResult::No;
}

ProbeResult scan_processes(const std::string& name, const fs::path& proc_root) {
    std::error_code ec;
    fs::directory_iterator it(proc_root, ec);
    if (ec) return ProbeResult::Unknown;

    // The kernel truncates comm to 15 characters.
    const std::string wanted = name.substr(0, 15);
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) return ProbeResult::Unknown;
        const std::string pid = it->path().filename().string();
        if (pid.empty() || !std::all_of(pid.begin(), pid.end(),
                                        [](unsigned char c) { return std::isdigit(c); })) {
            continue;
        }
        std::ifstream comm(it->path() / "comm");
        std::string line;
        if (comm && std::getline(comm, line) && line == wanted) {
            return ProbeResult::Yes;
        }
    }
    return ProbeResult::No;
}

} // namespace probes

// ---------- StrategyHostAppProbes ----------

StrategyHostAppProbes::StrategyHostAppProbes(Options opts) : opts_(std::move(opts)) {
    const std::string name = opts_.app_name;
    const auto dirs = opts_.install_dirs;
    const auto proc_root = opts_.proc_root;

    installed_.push_back([name]() {
        const char* path = std::getenv("PATH");
        return probes::find_in_path(name, path ? path : "");
    });
    installed_.push_back([name, dirs]() { return probes::find_in_dirs(name, dirs); });
    running_.push_back([name, proc_root]() { return probes::scan_processes(name, proc_root); });
}

void StrategyHostAppProbes::add_installed_strategy(ProbeStrategy s) {
    installed_.push_back(std::move(s));
}

void StrategyHostAppProbes::add_running_strategy(ProbeStrategy s) {
    running_.push_back(std::move(s));
}

ProbeResult StrategyHostAppProbes::is_installed() {
    return first_conclusive(installed_);
}

ProbeResult StrategyHostAppProbes::is_running() {
    return first_conclusive(running_);
}

bool StrategyHostAppProbes::launch() {
    spdlog::info("Starting {}", opts_.app_name);
    return spawn_detached(opts_.app_name, {});
}

// ---------- HttpNetworkProbe ----------

HttpNetworkProbe::HttpNetworkProbe(Options opts) : opts_(std::move(opts)) {
}

NetworkStatus HttpNetworkProbe::check() {
    NetworkStatus status;

    // Split "scheme://host[:port]/path" into base and path.
    std::string base = opts_.url;
    std::string path = "/";
    auto scheme_end = base.find("://");
    auto path_start = base.find('/', scheme_end == std::string::npos ? 0 : scheme_end + 3);
    if (path_start != std::string::npos) {
        path = base.substr(path_start);
        base = base.substr(0, path_start);
    }

    httplib::Client client(base);
    client.set_connection_timeout(opts_.timeout);
    client.set_read_timeout(opts_.timeout);

    auto start = std::chrono::steady_clock::now();
    auto res = client.Head(path.c_str());
    auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start);

    if (res) {
        status.reachable = true;
        status.latency_ms = elapsed.count();
        status.detail = opts_.url + " answered HTTP " + std::to_string(res->status);
    } else {
        status.detail = "Cannot reach " + opts_.url + ": " + httplib::to_string(res.error());
    }
    spdlog::debug("Network probe: {}", status.detail);
    return status;
}

// ---------- Collected results ----------

ProbeResults collect_probes(IHostAppProbes& host, INetworkProbe* network) {
    ProbeResults results;
    results.host_installed = host.is_installed();
    results.host_running = host.is_running();
    if (network) results.network = network->check();
    return results;
}

void to_json(Json& j, const NetworkStatus& s) {
    j = {{"reachable", s.reachable}, {"detail", s.detail}};
    if (s.latency_ms) j["latencyMs"] = *s.latency_ms;
}

void to_json(Json& j, const ProbeResults& p) {
    j = {{"hostInstalled", to_string(p.host_installed)},
         {"hostRunning", to_string(p.host_running)}};
    if (p.network) j["network"] = *p.network;
}

} // namespace mcpconf
