#include <gtest/gtest.h>
#include "mcpconf/installer.hpp"
#include "mcpconf/error.hpp"
#include "test_support.hpp"
#include <chrono>

using namespace mcpconf;
using mcpconf::testing::TempDir;
using mcpconf::testing::read_file;
using mcpconf::testing::write_file;
using namespace std::chrono_literals;

namespace {

class FakePackageInstaller : public IPackageInstaller {
public:
    explicit FakePackageInstaller(bool succeed) : succeed_(succeed) {}

    InstallOutcome install(const std::string& package) override {
        requested.push_back(package);
        return {succeed_, succeed_ ? "ok" : "E404 not found"};
    }

    std::vector<std::string> requested;

private:
    bool succeed_;
};

MutationEngine::Options engine_options(const TempDir& dir) {
    MutationEngine::Options opts;
    opts.registry_path = dir / "config.json";
    opts.backup_dir = dir / "backups";
    opts.lock_timeout = 100ms;
    return opts;
}

const char* kOneServer = R"({"mcpServers":{"a":{"command":"run-a"}}})";

} // anonymous namespace

// ---- Defaults ----

TEST(Installer, DefaultPackageAndArgs) {
    EXPECT_EQ(Installer::default_package("brave-search"), "@modelcontextprotocol/server-brave-search");
    EXPECT_EQ(Installer::default_launch_args("pkg"), (std::vector<std::string>{"-y", "pkg"}));
    EXPECT_STREQ(Installer::DEFAULT_LAUNCH_COMMAND, "npx");
}

// ---- install_server ----

TEST(Installer, InstallsThenRegisters) {
    TempDir dir;
    write_file(dir / "config.json", kOneServer);
    FakePackageInstaller packages(true);
    MutationEngine engine(engine_options(dir));
    Installer installer(packages, engine);

    auto result = installer.install_server("web-fetch", "pkg-web-fetch", "npx", {"-y", "pkg-web-fetch"});
    ASSERT_TRUE(result) << result.detail;
    EXPECT_EQ(packages.requested, std::vector<std::string>{"pkg-web-fetch"});
    EXPECT_TRUE(result.snapshot.has_value());

    auto reg = Registry::load(dir / "config.json");
    ASSERT_EQ(reg.size(), 2u);
    const auto* e = reg.find("web-fetch");
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(e->command, "npx");
    EXPECT_EQ(e->args, (std::vector<std::string>{"-y", "pkg-web-fetch"}));
}

TEST(Installer, PackageFailureLeavesRegistryUnchanged) {
    TempDir dir;
    write_file(dir / "config.json", kOneServer);
    FakePackageInstaller packages(false);
    MutationEngine engine(engine_options(dir));
    Installer installer(packages, engine);

    auto result = installer.install_server("web-fetch", "pkg", "npx", {"-y", "pkg"});
    EXPECT_FALSE(result);
    EXPECT_EQ(result.kind, ErrorKind::PackageInstallFailed);
    EXPECT_EQ(result.step, Step::Install);
    EXPECT_NE(result.detail.find("E404"), std::string::npos);
    EXPECT_EQ(read_file(dir / "config.json"), kOneServer);
    EXPECT_EQ(Registry::load(dir / "config.json").size(), 1u);
    EXPECT_EQ(mcpconf::testing::count_files(dir / "backups"), 0u);
}

TEST(Installer, InvalidEntryNeverInstalls) {
    TempDir dir;
    FakePackageInstaller packages(true);
    MutationEngine engine(engine_options(dir));
    Installer installer(packages, engine);

    auto result = installer.install_server("", "pkg", "npx", {});
    EXPECT_EQ(result.kind, ErrorKind::InvalidEntry);
    EXPECT_TRUE(packages.requested.empty());

    result = installer.install_server("x", "", "npx", {});
    EXPECT_EQ(result.kind, ErrorKind::InvalidEntry);
    EXPECT_TRUE(packages.requested.empty());
}

TEST(Installer, InvalidUtf8ArgumentNeverInstalls) {
    TempDir dir;
    write_file(dir / "config.json", kOneServer);
    FakePackageInstaller packages(true);
    MutationEngine engine(engine_options(dir));
    Installer installer(packages, engine);

    OperationResult result;
    ASSERT_NO_THROW(result = installer.install_server("srv", "pkg", "npx", {"-y", "caf\xe9"}));
    EXPECT_EQ(result.kind, ErrorKind::InvalidEntry);
    EXPECT_EQ(result.step, Step::Validate);
    EXPECT_TRUE(packages.requested.empty());
    EXPECT_EQ(read_file(dir / "config.json"), kOneServer);
}

TEST(Installer, RegistrationFailureAfterInstall) {
    TempDir dir;
    write_file(dir / "config.json", "{ corrupt");
    FakePackageInstaller packages(true);
    MutationEngine engine(engine_options(dir));
    Installer installer(packages, engine);

    auto result = installer.install_server("web-fetch", "pkg", "npx", {"-y", "pkg"});
    EXPECT_FALSE(result);
    EXPECT_EQ(result.kind, ErrorKind::RegisteredAfterInstallFailed);
    ASSERT_TRUE(result.cause.has_value());
    EXPECT_EQ(*result.cause, ErrorKind::CorruptConfig);
    EXPECT_EQ(result.step, Step::Load);
    EXPECT_EQ(packages.requested.size(), 1u);
    EXPECT_EQ(read_file(dir / "config.json"), "{ corrupt");
}

// ---- CommandPackageInstaller ----

TEST(CommandPackageInstaller, SuccessfulCommand) {
    CommandPackageInstaller::Options opts;
    opts.program = "true";
    opts.install_args = {};
    opts.timeout = 5s;
    CommandPackageInstaller installer(opts);
    auto outcome = installer.install("anything");
    EXPECT_TRUE(outcome.ok) << outcome.detail;
}

TEST(CommandPackageInstaller, FailingCommandReportsExitCode) {
    CommandPackageInstaller::Options opts;
    opts.program = "sh";
    opts.install_args = {"-c", "echo registry unreachable >&2; exit 3", "sh"};
    opts.timeout = 5s;
    CommandPackageInstaller installer(opts);
    auto outcome = installer.install("pkg");
    EXPECT_FALSE(outcome.ok);
    EXPECT_NE(outcome.detail.find("code 3"), std::string::npos);
    EXPECT_NE(outcome.detail.find("registry unreachable"), std::string::npos);
}

TEST(CommandPackageInstaller, MissingProgram) {
    CommandPackageInstaller::Options opts;
    opts.program = "mcpconf-no-such-package-manager";
    CommandPackageInstaller installer(opts);
    auto outcome = installer.install("pkg");
    EXPECT_FALSE(outcome.ok);
    EXPECT_NE(outcome.detail.find("Cannot execute"), std::string::npos);
}

TEST(CommandPackageInstaller, TimeoutIsAFailure) {
    CommandPackageInstaller::Options opts;
    opts.program = "sleep";
    opts.install_args = {};
    opts.timeout = 200ms;
    CommandPackageInstaller installer(opts);

    auto start = std::chrono::steady_clock::now();
    auto outcome = installer.install("10");
    EXPECT_FALSE(outcome.ok);
    EXPECT_NE(outcome.detail.find("did not finish"), std::string::npos);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
}

TEST(CommandPackageInstaller, TimeoutThroughInstallerIsPackageInstallFailed) {
    TempDir dir;
    CommandPackageInstaller::Options opts;
    opts.program = "sleep";
    opts.install_args = {};
    opts.timeout = 100ms;
    CommandPackageInstaller packages(opts);
    MutationEngine engine(engine_options(dir));
    Installer installer(packages, engine);

    auto result = installer.install_server("slow", "10", "npx", {});
    EXPECT_EQ(result.kind, ErrorKind::PackageInstallFailed);
    EXPECT_FALSE(std::filesystem::exists(dir / "config.json"));
}
