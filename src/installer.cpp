#include "mcpconf/installer.hpp"
#include "mcpconf/error.hpp"
#include "mcpconf/process.hpp"
#include <spdlog/spdlog.h>

namespace mcpconf {

namespace {

// Keep failure details readable when a package manager is chatty.
std::string tail(const std::string& text, size_t max_chars = 2000) {
    if (text.size() <= max_chars) return text;
    return "..." + text.substr(text.size() - max_chars);
}

} // anonymous namespace

// ---------- CommandPackageInstaller ----------

CommandPackageInstaller::CommandPackageInstaller(Options opts) : opts_(std::move(opts)) {
}

InstallOutcome CommandPackageInstaller::install(const std::string& package) {
    std::vector<std::string> args = opts_.install_args;
    args.push_back(package);

    spdlog::info("Installing {} with {}", package, opts_.program);
    ProcessResult proc = run_process(opts_.program, args, opts_.timeout);

    InstallOutcome outcome;
    if (!proc.started) {
        outcome.detail = proc.output;
    } else if (proc.timed_out) {
        outcome.detail = "'" + opts_.program + "' did not finish within "
                         + std::to_string(opts_.timeout.count()) + " ms";
    } else if (proc.exit_code != 0) {
        outcome.detail = "'" + opts_.program + "' exited with code "
                         + std::to_string(proc.exit_code) + ": " + tail(proc.output);
    } else {
        outcome.ok = true;
        outcome.detail = "Installed " + package;
    }
    return outcome;
}

// ---------- Installer ----------

Installer::Installer(IPackageInstaller& packages, MutationEngine& engine)
    : packages_(packages), engine_(engine) {
}

std::string Installer::default_package(const std::string& name) {
    return "@modelcontextprotocol/server-" + name;
}

std::vector<std::string> Installer::default_launch_args(const std::string& package) {
    return {"-y", package};
}

OperationResult Installer::install_server(const std::string& name, const std::string& package,
                                          const std::string& launch_command,
                                          const std::vector<std::string>& launch_args) {
    ServerEntry entry;
    entry.name = name;
    entry.command = launch_command;
    entry.args = launch_args;
    try {
        validate(entry);
    } catch (const InvalidEntryError& e) {
        return OperationResult::failure(ErrorKind::InvalidEntry, Step::Validate, e.what());
    }
    if (package.empty()) {
        return OperationResult::failure(ErrorKind::InvalidEntry, Step::Validate,
                                        "Package identifier must not be empty");
    }

    InstallOutcome installed = packages_.install(package);
    if (!installed.ok) {
        spdlog::error("Installing {} failed: {}", package, installed.detail);
        return OperationResult::failure(ErrorKind::PackageInstallFailed, Step::Install,
                                        "Installing " + package + " failed: " + installed.detail);
    }

    OperationResult registered = engine_.add_server(entry);
    if (!registered) {
        spdlog::error("{} is installed but '{}' was not registered", package, name);
        OperationResult r = OperationResult::failure(
            ErrorKind::RegisteredAfterInstallFailed, registered.step,
            package + " is installed but registering '" + name + "' failed at "
                + to_string(registered.step) + ": " + registered.detail);
        r.cause = registered.kind;
        r.snapshot = registered.snapshot;
        return r;
    }

    registered.detail = "Installed " + package + " and registered '" + name + "'";
    return registered;
}

} // namespace mcpconf
