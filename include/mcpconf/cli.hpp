#pragma once
#include "installer.hpp"
#include "probes.hpp"
#include "settings.hpp"
#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace mcpconf {

/// Command-line front end. Each run() is one independent invocation:
/// settings are resolved, one command executes, and an exit code from
/// mcpconf::exit_code is returned.
class Cli {
public:
    /// Factories for the external collaborators, replaceable in tests.
    struct Collaborators {
        EnvLookup env;
        std::function<std::unique_ptr<IPackageInstaller>(const Settings&)> package_installer;
        std::function<std::unique_ptr<IHostAppProbes>(const Settings&)> host_probes;
        std::function<std::unique_ptr<INetworkProbe>(const Settings&)> network_probe;
    };

    /// npm, the PATH/proc host probes and the HTTP network probe.
    static Collaborators system_collaborators();

    Cli(Collaborators collaborators, std::ostream& out, std::ostream& err);

    /// args excludes the program name.
    int run(const std::vector<std::string>& args);

    /// The minimal registry written by "clean".
    static std::vector<ServerEntry> clean_servers();

private:
    int report(const OperationResult& result);

    Collaborators collab_;
    std::ostream& out_;
    std::ostream& err_;
};

} // namespace mcpconf
