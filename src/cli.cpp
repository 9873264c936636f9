#include "mcpconf/cli.hpp"
#include "mcpconf/atomic_file.hpp"
#include "mcpconf/diagnostics.hpp"
#include "mcpconf/error.hpp"
#include "mcpconf/logging.hpp"
#include "mcpconf/mutation_engine.hpp"
#include "mcpconf/registry.hpp"
#include "mcpconf/version.hpp"
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <system_error>

namespace mcpconf {

namespace fs = std::filesystem;

namespace {

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

MutationEngine::Options engine_options(const Settings& s) {
    MutationEngine::Options opts;
    opts.registry_path = s.registry_path;
    opts.backup_dir = s.backup_dir;
    opts.lock_timeout = s.lock_timeout;
    return opts;
}

BackupStore::Options backup_options(const Settings& s) {
    BackupStore::Options opts;
    opts.directory = s.backup_dir;
    return opts;
}

// Report output substitutes U+FFFD for bytes that are not valid UTF-8.
std::string render_json(const Json& j) {
    return j.dump(2, ' ', false, Json::error_handler_t::replace) + "\n";
}

ServerEntry npx_entry(const std::string& name) {
    ServerEntry e;
    e.name = name;
    e.command = Installer::DEFAULT_LAUNCH_COMMAND;
    e.args = Installer::default_launch_args(Installer::default_package(name));
    return e;
}

} // anonymous namespace

Cli::Collaborators Cli::system_collaborators() {
    Collaborators c;
    c.env = process_environment();
    c.package_installer = [](const Settings& s) -> std::unique_ptr<IPackageInstaller> {
        CommandPackageInstaller::Options opts;
        opts.program = s.package_manager;
        opts.timeout = s.install_timeout;
        return std::make_unique<CommandPackageInstaller>(opts);
    };
    c.host_probes = [](const Settings& s) -> std::unique_ptr<IHostAppProbes> {
        StrategyHostAppProbes::Options opts;
        opts.app_name = s.host_app;
        opts.install_dirs = s.host_install_dirs;
        return std::make_unique<StrategyHostAppProbes>(opts);
    };
    c.network_probe = [](const Settings& s) -> std::unique_ptr<INetworkProbe> {
        HttpNetworkProbe::Options opts;
        opts.url = s.probe_url;
        return std::make_unique<HttpNetworkProbe>(opts);
    };
    return c;
}

Cli::Cli(Collaborators collaborators, std::ostream& out, std::ostream& err)
    : collab_(std::move(collaborators)), out_(out), err_(err) {
}

std::vector<ServerEntry> Cli::clean_servers() {
    return {npx_entry("sequential-thinking"), npx_entry("web-fetch")};
}

int Cli::report(const OperationResult& result) {
    if (result.ok) {
        out_ << result.detail << "\n";
        if (result.snapshot) out_ << "Backup: " << result.snapshot->path.string() << "\n";
        return exit_code::Success;
    }
    err_ << "error: " << to_string(result.kind) << " during " << to_string(result.step) << ": "
         << result.detail << "\n";
    if (result.cause) err_ << "cause: " << to_string(*result.cause) << "\n";
    if (result.snapshot) err_ << "Backup: " << result.snapshot->path.string() << "\n";
    return exit_code_for(result.kind);
}

int Cli::run(const std::vector<std::string>& args) {
    CLI::App app{"Manage the MCP server registry of a desktop host application", "mcpconf"};
    app.set_version_flag("--version", std::string(LIBRARY_VERSION));
    app.require_subcommand(1);

    std::string config_path, backup_dir, settings_file;
    int verbosity = 0;
    auto* config_opt = app.add_option("--config", config_path, "Registry file to operate on");
    auto* backup_opt = app.add_option("--backup-dir", backup_dir, "Directory holding snapshots");
    auto* settings_opt = app.add_option("--settings", settings_file, "Settings file (config.toml)");
    app.add_flag("-v,--verbose", verbosity, "Increase log verbosity (repeatable)");

    // install
    std::string name, package, command;
    std::vector<std::string> arg_list, env_list;
    auto* install_cmd = app.add_subcommand("install", "Install a server package and register it");
    install_cmd->add_option("name", name, "Server name")->required();
    install_cmd->add_option("package", package, "Package to install (default @modelcontextprotocol/server-<name>)");
    auto* install_command_opt = install_cmd->add_option("--command", command, "Launch command (default npx)");
    install_cmd->add_option("--arg", arg_list, "Launch argument (repeatable)");

    // add
    auto* add_cmd = app.add_subcommand("add", "Register a server without installing anything");
    add_cmd->add_option("name", name, "Server name")->required();
    add_cmd->add_option("--command", command, "Launch command")->required();
    add_cmd->add_option("--arg", arg_list, "Launch argument (repeatable)");
    add_cmd->add_option("--env", env_list, "Environment variable KEY=VALUE (repeatable)");

    auto* remove_cmd = app.add_subcommand("remove", "Remove a server from the registry");
    remove_cmd->add_option("name", name, "Server name")->required();

    bool json_output = false;
    auto* list_cmd = app.add_subcommand("list", "List registered servers");
    list_cmd->add_flag("--json", json_output, "Output in JSON format");

    auto* show_cmd = app.add_subcommand("show", "Show one server entry");
    show_cmd->add_option("name", name, "Server name")->required();

    auto* reset_cmd = app.add_subcommand("reset", "Remove every server");
    auto* clean_cmd = app.add_subcommand("clean", "Replace the registry with a minimal known-good set");

    std::string snapshot_ref;
    auto* restore_cmd = app.add_subcommand("restore", "Restore the registry from a snapshot");
    restore_cmd->add_option("snapshot", snapshot_ref, "Snapshot file, name, timestamp or 'latest'")
        ->required();

    auto* backups_cmd = app.add_subcommand("backups", "List snapshots, oldest first");
    backups_cmd->add_flag("--json", json_output, "Output in JSON format");

    std::string output_file;
    bool offline = false;
    auto* diagnose_cmd = app.add_subcommand("diagnose", "Print a diagnostic report");
    diagnose_cmd->add_flag("--json", json_output, "Output in JSON format");
    diagnose_cmd->add_option("--output", output_file, "Write the report to FILE");
    diagnose_cmd->add_flag("--offline", offline, "Skip the network probe");

    auto* launch_cmd = app.add_subcommand("launch", "Start the host application if it is not running");

    std::vector<std::string> argv_storage;
    argv_storage.reserve(args.size() + 1);
    argv_storage.push_back("mcpconf");
    argv_storage.insert(argv_storage.end(), args.begin(), args.end());
    std::vector<const char*> argv;
    for (const auto& a : argv_storage) argv.push_back(a.c_str());

    try {
        app.parse(static_cast<int>(argv.size()), argv.data());
    } catch (const CLI::ParseError& e) {
        int code = app.exit(e, out_, err_);
        return code == 0 ? exit_code::Success : exit_code::Usage;
    }

    init_logging(verbosity, collab_.env("MCPCONF_LOG_LEVEL"));

    Settings settings;
    try {
        SettingsOverrides overrides;
        if (settings_opt->count()) overrides.settings_file = fs::path(settings_file);
        if (config_opt->count()) overrides.registry_path = fs::path(config_path);
        if (backup_opt->count()) overrides.backup_dir = fs::path(backup_dir);
        settings = resolve_settings(overrides, collab_.env);
    } catch (const std::invalid_argument& e) {
        err_ << "error: " << e.what() << "\n";
        return exit_code::Usage;
    }
    spdlog::debug("Registry: {}", settings.registry_path.string());
    spdlog::debug("Backups: {}", settings.backup_dir.string());

    try {
        if (*install_cmd) {
            MutationEngine engine(engine_options(settings));
            auto packages = collab_.package_installer(settings);
            Installer installer(*packages, engine);
            std::string pkg = package.empty() ? Installer::default_package(name) : package;
            std::string launch = install_command_opt->count() ? command : Installer::DEFAULT_LAUNCH_COMMAND;
            std::vector<std::string> launch_args = arg_list;
            if (!install_command_opt->count() && arg_list.empty()) {
                launch_args = Installer::default_launch_args(pkg);
            }
            return report(installer.install_server(name, pkg, launch, launch_args));
        }

        if (*add_cmd) {
            ServerEntry entry;
            entry.name = name;
            entry.command = command;
            entry.args = arg_list;
            for (const auto& kv : env_list) {
                auto eq = kv.find('=');
                if (eq == std::string::npos || eq == 0) {
                    err_ << "error: --env expects KEY=VALUE, got '" << kv << "'\n";
                    return exit_code::Usage;
                }
                entry.env[kv.substr(0, eq)] = kv.substr(eq + 1);
            }
            MutationEngine engine(engine_options(settings));
            return report(engine.add_server(entry));
        }

        if (*remove_cmd) {
            MutationEngine engine(engine_options(settings));
            return report(engine.remove_server(name));
        }

        if (*reset_cmd) {
            MutationEngine engine(engine_options(settings));
            return report(engine.reset_all());
        }

        if (*clean_cmd) {
            MutationEngine engine(engine_options(settings));
            return report(engine.replace_all(clean_servers()));
        }

        if (*restore_cmd) {
            MutationEngine engine(engine_options(settings));
            std::error_code ec;
            Snapshot snap;
            if (fs::is_regular_file(snapshot_ref, ec)) {
                snap.path = snapshot_ref;
                snap.timestamp = snap.path.stem().string();
                snap.size = fs::file_size(snap.path, ec);
            } else {
                snap = engine.backups().find(snapshot_ref);
            }
            return report(engine.restore_snapshot(snap));
        }

        if (*list_cmd) {
            Registry registry = Registry::load(settings.registry_path);
            if (json_output) {
                Json servers = Json::object();
                for (const auto& s : registry.servers()) {
                    Json body;
                    to_json(body, s);
                    servers[s.name] = std::move(body);
                }
                out_ << render_json(servers);
            } else if (registry.empty()) {
                out_ << "No MCP servers configured\n";
            } else {
                out_ << "| Server Name | Command | Arguments |\n";
                out_ << "|-------------|---------|-----------|\n";
                for (const auto& s : registry.servers()) {
                    out_ << "| " << s.name << " | " << s.command << " | "
                         << (s.args.empty() ? "N/A" : join(s.args, " ")) << " |\n";
                }
            }
            return exit_code::Success;
        }

        if (*show_cmd) {
            Registry registry = Registry::load(settings.registry_path);
            const ServerEntry* entry = registry.find(name);
            if (!entry) {
                err_ << "error: no server named '" << name << "'\n";
                return exit_code::Failure;
            }
            Json body;
            to_json(body, *entry);
            Json doc = Json::object();
            doc[entry->name] = std::move(body);
            out_ << render_json(doc);
            return exit_code::Success;
        }

        if (*backups_cmd) {
            BackupStore store(backup_options(settings));
            auto snapshots = store.list_snapshots();
            if (json_output) {
                Json arr = Json::array();
                for (const auto& s : snapshots) {
                    Json j;
                    to_json(j, s);
                    arr.push_back(std::move(j));
                }
                out_ << render_json(arr);
            } else if (snapshots.empty()) {
                out_ << "No snapshots in " << settings.backup_dir.string() << "\n";
            } else {
                for (const auto& s : snapshots) {
                    out_ << s.timestamp << "  " << s.size << "  " << s.path.string() << "\n";
                }
            }
            return exit_code::Success;
        }

        if (*diagnose_cmd) {
            auto host = collab_.host_probes(settings);
            std::unique_ptr<INetworkProbe> network;
            if (!offline) network = collab_.network_probe(settings);
            ProbeResults probes = collect_probes(*host, network.get());

            Diagnostics::Options opts;
            opts.host_log = settings.host_log;
            Report rep = Diagnostics(opts).build_report(settings.registry_path, settings.backup_dir, probes);

            std::string text;
            if (json_output) {
                Json j;
                to_json(j, rep);
                text = render_json(j);
            } else {
                text = render_text(rep);
            }

            if (output_file.empty()) {
                out_ << text;
            } else {
                AtomicFile::write_file(output_file, text);
                out_ << "Diagnostic report saved to " << output_file << "\n";
            }
            return exit_code::Success;
        }

        if (*launch_cmd) {
            auto host = collab_.host_probes(settings);
            if (host->is_running() == ProbeResult::Yes) {
                out_ << settings.host_app << " is already running\n";
                return exit_code::Success;
            }
            if (!host->launch()) {
                err_ << "error: failed to launch " << settings.host_app << "\n";
                return exit_code::LaunchFailed;
            }
            out_ << "Launched " << settings.host_app << "\n";
            return exit_code::Success;
        }
    } catch (const ConfigError& e) {
        spdlog::debug("{} failed: {}", to_string(e.kind), e.what());
        err_ << "error: " << to_string(e.kind) << ": " << e.what() << "\n";
        return exit_code_for(e.kind);
    }

    return exit_code::Usage;
}

} // namespace mcpconf
