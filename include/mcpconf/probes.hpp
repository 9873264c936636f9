#pragma once
#include "types.hpp"
#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace mcpconf {

enum class ProbeResult {
    Yes,
    No,
    Unknown
};

const char* to_string(ProbeResult r);

using ProbeStrategy = std::function<ProbeResult()>;

/// The first strategy with a conclusive (non-Unknown) answer wins.
ProbeResult first_conclusive(const std::vector<ProbeStrategy>& strategies);

// ---------- Host application ----------

class IHostAppProbes {
public:
    virtual ~IHostAppProbes() = default;

    virtual ProbeResult is_installed() = 0;
    virtual ProbeResult is_running() = 0;
    virtual bool launch() = 0;
};

/// Host application probes built from ordered strategy lists.
class StrategyHostAppProbes : public IHostAppProbes {
public:
    struct Options {
        std::string app_name = "claude-desktop";
        std::vector<std::filesystem::path> install_dirs;
        std::filesystem::path proc_root = "/proc";
    };

    /// Installs the default strategies: PATH lookup then install_dirs for
    /// is_installed, a process table scan for is_running.
    explicit StrategyHostAppProbes(Options opts);

    void add_installed_strategy(ProbeStrategy s);
    void add_running_strategy(ProbeStrategy s);

    ProbeResult is_installed() override;
    ProbeResult is_running() override;
    bool launch() override;

    [[nodiscard]] const Options& options() const { return opts_; }

private:
    Options opts_;
    std::vector<ProbeStrategy> installed_;
    std::vector<ProbeStrategy> running_;
};

namespace probes {

/// Yes if an executable named name is on path_env; Unknown otherwise, since
/// an application may be installed outside PATH.
ProbeResult find_in_path(const std::string& name, const std::string& path_env);

/// Yes if name exists in one of dirs; No if not; Unknown if dirs is empty.
ProbeResult find_in_dirs(const std::string& name, const std::vector<std::filesystem::path>& dirs);

/// Scans <proc_root>/<pid>/comm. Unknown if proc_root cannot be read.
ProbeResult scan_processes(const std::string& name, const std::filesystem::path& proc_root);

} // namespace probes

// ---------- Network ----------

struct NetworkStatus {
    bool reachable = false;
    std::optional<double> latency_ms;
    std::string detail;
};

class INetworkProbe {
public:
    virtual ~INetworkProbe() = default;
    virtual NetworkStatus check() = 0;
};

/// HEAD request against a URL; any HTTP response counts as reachable.
class HttpNetworkProbe : public INetworkProbe {
public:
    struct Options {
        std::string url = "http://anthropic.com";
        std::chrono::milliseconds timeout{3000};
    };

    explicit HttpNetworkProbe(Options opts);

    NetworkStatus check() override;

private:
    Options opts_;
};

// ---------- Collected results ----------

/// Probe values as handed to Diagnostics, reported verbatim.
struct ProbeResults {
    ProbeResult host_installed = ProbeResult::Unknown;
    ProbeResult host_running = ProbeResult::Unknown;
    std::optional<NetworkStatus> network;
};

ProbeResults collect_probes(IHostAppProbes& host, INetworkProbe* network);

void to_json(Json& j, const NetworkStatus& s);
void to_json(Json& j, const ProbeResults& p);

} // namespace mcpconf
