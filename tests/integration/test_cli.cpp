#include <gtest/gtest.h>
#include "mcpconf/cli.hpp"
#include "mcpconf/error.hpp"
#include "mcpconf/registry.hpp"
#include "test_support.hpp"
#include <sstream>

using namespace mcpconf;
using mcpconf::testing::TempDir;
using mcpconf::testing::read_file;
using mcpconf::testing::write_file;
using mcpconf::testing::count_files;

namespace {

struct FakeWorld {
    bool install_ok = true;
    std::vector<std::string> installed;
    ProbeResult running = ProbeResult::No;
    bool launch_ok = true;
    int launches = 0;
};

class FakePackages : public IPackageInstaller {
public:
    explicit FakePackages(FakeWorld& w) : world_(w) {}
    InstallOutcome install(const std::string& package) override {
        world_.installed.push_back(package);
        return {world_.install_ok, world_.install_ok ? "ok" : "install exploded"};
    }

private:
    FakeWorld& world_;
};

class FakeHost : public IHostAppProbes {
public:
    explicit FakeHost(FakeWorld& w) : world_(w) {}
    ProbeResult is_installed() override { return ProbeResult::Yes; }
    ProbeResult is_running() override { return world_.running; }
    bool launch() override {
        ++world_.launches;
        return world_.launch_ok;
    }

private:
    FakeWorld& world_;
};

class FakeNetwork : public INetworkProbe {
public:
    NetworkStatus check() override { return {true, 3.0, "fake network"}; }
};

/// Runs the command-line front end against a temporary registry.
class CliHarness {
public:
    CliHarness() {
        collab_.env = [this](const std::string& name) -> std::optional<std::string> {
            if (name == "HOME") return dir.path().string();
            return std::nullopt;
        };
        collab_.package_installer = [this](const Settings&) {
            return std::unique_ptr<IPackageInstaller>(new FakePackages(world));
        };
        collab_.host_probes = [this](const Settings&) {
            return std::unique_ptr<IHostAppProbes>(new FakeHost(world));
        };
        collab_.network_probe = [](const Settings&) {
            return std::unique_ptr<INetworkProbe>(new FakeNetwork());
        };
    }

    int run(std::vector<std::string> args) {
        out.str("");
        err.str("");
        std::vector<std::string> full{"--config", config().string(), "--backup-dir", backups().string()};
        full.insert(full.end(), args.begin(), args.end());
        Cli cli(collab_, out, err);
        return cli.run(full);
    }

    std::filesystem::path config() const { return dir / "claude_desktop_config.json"; }
    std::filesystem::path backups() const { return dir / "backups"; }

    TempDir dir;
    FakeWorld world;
    std::ostringstream out;
    std::ostringstream err;

private:
    Cli::Collaborators collab_;
};

} // anonymous namespace

// ---- install ----

TEST(Cli, InstallWithDefaults) {
    CliHarness h;
    ASSERT_EQ(h.run({"install", "brave-search"}), exit_code::Success) << h.err.str();
    EXPECT_EQ(h.world.installed, std::vector<std::string>{"@modelcontextprotocol/server-brave-search"});

    auto reg = Registry::load(h.config());
    const auto* e = reg.find("brave-search");
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(e->command, "npx");
    EXPECT_EQ(e->args, (std::vector<std::string>{"-y", "@modelcontextprotocol/server-brave-search"}));
}

TEST(Cli, InstallWithExplicitLaunch) {
    CliHarness h;
    ASSERT_EQ(h.run({"install", "local", "my-pkg", "--command", "node", "--arg", "server.js"}),
              exit_code::Success) << h.err.str();
    EXPECT_EQ(h.world.installed, std::vector<std::string>{"my-pkg"});
    const auto* e = Registry::load(h.config()).find("local");
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(e->command, "node");
    EXPECT_EQ(e->args, std::vector<std::string>{"server.js"});
}

TEST(Cli, InstallFailureExitCode) {
    CliHarness h;
    h.world.install_ok = false;
    EXPECT_EQ(h.run({"install", "x"}), exit_code::PackageInstallFailed);
    EXPECT_NE(h.err.str().find("install exploded"), std::string::npos);
    EXPECT_FALSE(std::filesystem::exists(h.config()));
}

TEST(Cli, InstallOntoCorruptRegistry) {
    CliHarness h;
    write_file(h.config(), "{ nope");
    EXPECT_EQ(h.run({"install", "x"}), exit_code::RegisteredAfterInstallFailed);
    EXPECT_EQ(read_file(h.config()), "{ nope");
}

// ---- add / remove / show / list ----

TEST(Cli, AddWithEnvThenShow) {
    CliHarness h;
    ASSERT_EQ(h.run({"add", "weather", "--command", "node", "--arg", "w.js", "--env", "API_KEY=a=b"}),
              exit_code::Success) << h.err.str();

    ASSERT_EQ(h.run({"show", "weather"}), exit_code::Success);
    auto doc = Json::parse(h.out.str());
    EXPECT_EQ(doc["weather"]["command"], "node");
    EXPECT_EQ(doc["weather"]["env"]["API_KEY"], "a=b");
}

TEST(Cli, AddRejectsMalformedEnv) {
    CliHarness h;
    EXPECT_EQ(h.run({"add", "x", "--command", "c", "--env", "NOVALUE"}), exit_code::Usage);
    EXPECT_FALSE(std::filesystem::exists(h.config()));
}

TEST(Cli, AddRequiresCommand) {
    CliHarness h;
    EXPECT_EQ(h.run({"add", "x"}), exit_code::Usage);
}

TEST(Cli, ShowUnknownServer) {
    CliHarness h;
    EXPECT_EQ(h.run({"show", "ghost"}), exit_code::Failure);
}

TEST(Cli, ListTableAndJson) {
    CliHarness h;
    ASSERT_EQ(h.run({"list"}), exit_code::Success);
    EXPECT_NE(h.out.str().find("No MCP servers configured"), std::string::npos);

    ASSERT_EQ(h.run({"add", "a", "--command", "run-a"}), exit_code::Success);
    ASSERT_EQ(h.run({"add", "b", "--command", "run-b", "--arg", "x", "--arg", "y"}), exit_code::Success);

    ASSERT_EQ(h.run({"list"}), exit_code::Success);
    EXPECT_NE(h.out.str().find("| a | run-a | N/A |"), std::string::npos);
    EXPECT_NE(h.out.str().find("| b | run-b | x y |"), std::string::npos);

    ASSERT_EQ(h.run({"list", "--json"}), exit_code::Success);
    auto doc = Json::parse(h.out.str());
    EXPECT_EQ(doc.size(), 2u);
    EXPECT_EQ(doc["b"]["args"][1], "y");
}

TEST(Cli, ListCorruptRegistry) {
    CliHarness h;
    write_file(h.config(), "not json");
    EXPECT_EQ(h.run({"list"}), exit_code::CorruptConfig);
}

TEST(Cli, RemoveBacksUp) {
    CliHarness h;
    ASSERT_EQ(h.run({"add", "a", "--command", "x"}), exit_code::Success);
    ASSERT_EQ(h.run({"remove", "a"}), exit_code::Success);
    EXPECT_TRUE(Registry::load(h.config()).empty());
    EXPECT_EQ(count_files(h.backups()), 1u);
    EXPECT_NE(h.out.str().find("Backup: "), std::string::npos);
}

// ---- reset / clean / backups / restore ----

TEST(Cli, ResetThenRestoreLatest) {
    CliHarness h;
    ASSERT_EQ(h.run({"add", "a", "--command", "x"}), exit_code::Success);
    ASSERT_EQ(h.run({"add", "b", "--command", "y"}), exit_code::Success);
    std::string before = read_file(h.config());

    ASSERT_EQ(h.run({"reset"}), exit_code::Success);
    EXPECT_TRUE(Registry::load(h.config()).empty());

    ASSERT_EQ(h.run({"restore", "latest"}), exit_code::Success) << h.err.str();
    EXPECT_EQ(read_file(h.config()), before);
}

TEST(Cli, RestoreByTimestampAndPath) {
    CliHarness h;
    ASSERT_EQ(h.run({"add", "a", "--command", "x"}), exit_code::Success);
    ASSERT_EQ(h.run({"reset"}), exit_code::Success);

    ASSERT_EQ(h.run({"backups", "--json"}), exit_code::Success);
    auto listed = Json::parse(h.out.str());
    ASSERT_EQ(listed.size(), 1u);
    auto ts = listed[0]["timestamp"].get<std::string>();
    auto path = listed[0]["path"].get<std::string>();

    ASSERT_EQ(h.run({"restore", ts}), exit_code::Success) << h.err.str();
    EXPECT_TRUE(Registry::load(h.config()).contains("a"));

    ASSERT_EQ(h.run({"reset"}), exit_code::Success);
    ASSERT_EQ(h.run({"restore", path}), exit_code::Success) << h.err.str();
    EXPECT_TRUE(Registry::load(h.config()).contains("a"));
}

TEST(Cli, RestoreUnknownSnapshot) {
    CliHarness h;
    EXPECT_EQ(h.run({"restore", "19990101-000000"}), exit_code::SnapshotNotFound);
    EXPECT_EQ(h.run({"restore", "latest"}), exit_code::SnapshotNotFound);
}

TEST(Cli, CleanWritesMinimalSet) {
    CliHarness h;
    write_file(h.config(), R"({"theme":"dark","mcpServers":{"broken":{"command":"zz"}}})");
    ASSERT_EQ(h.run({"clean"}), exit_code::Success) << h.err.str();

    auto reg = Registry::load(h.config());
    ASSERT_EQ(reg.size(), 2u);
    EXPECT_EQ(reg.servers()[0].name, "sequential-thinking");
    EXPECT_EQ(reg.servers()[1].name, "web-fetch");
    EXPECT_EQ(reg.servers()[1].args,
              (std::vector<std::string>{"-y", "@modelcontextprotocol/server-web-fetch"}));
    EXPECT_EQ(reg.extras()["theme"], "dark");
    EXPECT_EQ(count_files(h.backups()), 1u);
}

TEST(Cli, BackupsTextListing) {
    CliHarness h;
    ASSERT_EQ(h.run({"backups"}), exit_code::Success);
    EXPECT_NE(h.out.str().find("No snapshots"), std::string::npos);
}

// ---- diagnose / launch ----

TEST(Cli, DiagnoseText) {
    CliHarness h;
    ASSERT_EQ(h.run({"add", "a", "--command", "x"}), exit_code::Success);
    ASSERT_EQ(h.run({"diagnose"}), exit_code::Success);
    EXPECT_NE(h.out.str().find("# MCP Server Diagnostic Report"), std::string::npos);
    EXPECT_NE(h.out.str().find("| a | x | N/A |"), std::string::npos);
    EXPECT_NE(h.out.str().find("fake network"), std::string::npos);
}

TEST(Cli, DiagnoseJsonToFileOffline) {
    CliHarness h;
    auto report = h.dir / "report.json";
    ASSERT_EQ(h.run({"diagnose", "--json", "--offline", "--output", report.string()}), exit_code::Success);
    auto doc = Json::parse(read_file(report));
    EXPECT_EQ(doc["registry"]["exists"], false);
    EXPECT_EQ(doc["probes"]["hostInstalled"], "yes");
    EXPECT_FALSE(doc["probes"].contains("network"));
}

TEST(Cli, DiagnoseJsonReplacesInvalidUtf8FromHostLog) {
    CliHarness h;
    auto log = h.dir / "host.log";
    write_file(log, "INFO started\nERROR caf\xe9 failed\n");
    write_file(h.dir / "s.toml", "[paths]\nhost_log = " + log.string() + "\n");

    ASSERT_EQ(h.run({"--settings", (h.dir / "s.toml").string(), "diagnose", "--json", "--offline"}),
              exit_code::Success);
    auto doc = Json::parse(h.out.str());
    ASSERT_EQ(doc["hostLog"]["recentErrors"].size(), 1u);
    EXPECT_EQ(doc["hostLog"]["recentErrors"][0].get<std::string>(), "ERROR caf\xef\xbf\xbd failed");
}

TEST(Cli, LaunchStartsHostWhenNotRunning) {
    CliHarness h;
    EXPECT_EQ(h.run({"launch"}), exit_code::Success);
    EXPECT_EQ(h.world.launches, 1);

    h.world.running = ProbeResult::Yes;
    EXPECT_EQ(h.run({"launch"}), exit_code::Success);
    EXPECT_EQ(h.world.launches, 1);
}

TEST(Cli, LaunchFailure) {
    CliHarness h;
    h.world.launch_ok = false;
    EXPECT_EQ(h.run({"launch"}), exit_code::LaunchFailed);
}

// ---- usage ----

TEST(Cli, UsageErrors) {
    CliHarness h;
    EXPECT_EQ(h.run({}), exit_code::Usage);
    EXPECT_EQ(h.run({"frobnicate"}), exit_code::Usage);
    EXPECT_EQ(h.run({"remove"}), exit_code::Usage);
}

TEST(Cli, HelpIsSuccess) {
    CliHarness h;
    EXPECT_EQ(h.run({"--help"}), exit_code::Success);
    EXPECT_NE(h.out.str().find("install"), std::string::npos);
}

TEST(Cli, MissingSettingsFileIsUsageError) {
    CliHarness h;
    EXPECT_EQ(h.run({"--settings", (h.dir / "nope.toml").string(), "list"}), exit_code::Usage);
}

TEST(Cli, SettingsFileSuppliesLockTimeout) {
    CliHarness h;
    write_file(h.dir / "s.toml", "[lock]\ntimeout_ms = 50\n");
    FileLock held(h.config(), std::chrono::milliseconds(100));
    EXPECT_EQ(h.run({"--settings", (h.dir / "s.toml").string(), "add", "a", "--command", "x"}),
              exit_code::LockTimeout);
}
