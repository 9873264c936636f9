#pragma once
#include "types.hpp"
#include "mutation_engine.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace mcpconf {

struct InstallOutcome {
    bool ok = false;
    std::string detail;
};

/// The environment's package manager, as seen by the installer.
class IPackageInstaller {
public:
    virtual ~IPackageInstaller() = default;

    /// May take arbitrarily long; implementations bound it with a timeout.
    virtual InstallOutcome install(const std::string& package) = 0;
};

/// Runs "<program> <install_args...> <package>", e.g. "npm install -g pkg".
class CommandPackageInstaller : public IPackageInstaller {
public:
    struct Options {
        std::string program = "npm";
        std::vector<std::string> install_args{"install", "-g"};
        std::chrono::milliseconds timeout{std::chrono::minutes(5)};
    };

    explicit CommandPackageInstaller(Options opts);

    InstallOutcome install(const std::string& package) override;

private:
    Options opts_;
};

/// Installs a package, then registers the server that launches it.
class Installer {
public:
    static constexpr const char* DEFAULT_LAUNCH_COMMAND = "npx";

    Installer(IPackageInstaller& packages, MutationEngine& engine);

    /// PackageInstallFailed leaves the registry untouched. A registration
    /// failure after a successful install is RegisteredAfterInstallFailed,
    /// with the underlying kind in OperationResult::cause.
    [[nodiscard]] OperationResult install_server(const std::string& name,
                                                 const std::string& package,
                                                 const std::string& launch_command,
                                                 const std::vector<std::string>& launch_args);

    /// "@modelcontextprotocol/server-<name>"
    static std::string default_package(const std::string& name);

    /// {"-y", package}, for launching through npx.
    static std::vector<std::string> default_launch_args(const std::string& package);

private:
    IPackageInstaller& packages_;
    MutationEngine& engine_;
};

} // namespace mcpconf
