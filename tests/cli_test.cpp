#include "cli/cli.hpp"
#include "core/errors.hpp"
#include "fake_command_runner.hpp"

#include <gtest/gtest.h>

using namespace fcsandbox;
using fcsandbox::test::FakeCommandRunner;
using fcsandbox::test::TempDir;
using fcsandbox::test::boot_config_json;
using fcsandbox::test::write_text;

namespace {

using Script = std::function<void(FakeCommandRunner&)>;

CLI::RunnerFactory fake_factory(Script script = {}) {
    return [script](const RunnerOptions& options) {
        auto runner = std::make_unique<FakeCommandRunner>(options.dry_run);
        if (script) {
            script(*runner);
        }
        return std::unique_ptr<CommandRunner>(std::move(runner));
    };
}

int run_cli(CLI& cli, std::vector<std::string> args) {
    args.insert(args.begin(), "fc-sandbox");
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    return cli.run(static_cast<int>(argv.size()), argv.data());
}

const FakeCommandRunner& fake(const CLI& cli) {
    return dynamic_cast<const FakeCommandRunner&>(*cli.runner());
}

}  // namespace

TEST(CliParse, Defaults) {
    auto invocation = CLI::parse({"status"});
    EXPECT_EQ(invocation.command, "status");
    EXPECT_TRUE(invocation.args.empty());
    EXPECT_EQ(invocation.config.network.device, "tap0");
    EXPECT_TRUE(invocation.config.detached);
    EXPECT_FALSE(invocation.config.dry_run);
}

TEST(CliParse, OptionsAnywhere) {
    auto invocation = CLI::parse({"--socket", "/run/a.sock", "restore", "--device=tap3",
                                  "20250101-000000", "-n", "--verbose", "--foreground"});
    EXPECT_EQ(invocation.command, "restore");
    ASSERT_EQ(invocation.args.size(), 1u);
    EXPECT_EQ(invocation.args[0], "20250101-000000");
    EXPECT_EQ(invocation.config.api_socket, "/run/a.sock");
    EXPECT_EQ(invocation.config.network.device, "tap3");
    EXPECT_TRUE(invocation.config.dry_run);
    EXPECT_TRUE(invocation.config.verbose);
    EXPECT_FALSE(invocation.config.detached);
}

TEST(CliParse, AllNetworkOptions) {
    auto invocation = CLI::parse({"net-up", "--host-ip", "10.0.0.1/30", "--guest-ip", "10.0.0.2",
                                  "--uplink", "wlan0", "--config-file", "fc.json",
                                  "--snapshots-dir", "/var/snaps"});
    EXPECT_EQ(invocation.config.network.host_cidr, "10.0.0.1/30");
    EXPECT_EQ(invocation.config.network.guest_ip, "10.0.0.2");
    EXPECT_EQ(invocation.config.network.uplink, std::optional<std::string>("wlan0"));
    EXPECT_EQ(invocation.config.boot_config, "fc.json");
    EXPECT_EQ(invocation.config.snapshots_dir, "/var/snaps");
}

TEST(CliParse, FlagsOverrideConfigFile) {
    TempDir dir;
    auto path = dir.path() / "sandbox.json";
    write_text(path, R"({"device": "tap7", "guest_ip": "192.168.7.2", "detached": true})");

    auto invocation = CLI::parse({"--device", "tap9", "--foreground", "-n",
                                  "--config", path.string(), "status"});
    EXPECT_EQ(invocation.config.network.device, "tap9");
    EXPECT_EQ(invocation.config.network.guest_ip, "192.168.7.2");
    EXPECT_FALSE(invocation.config.detached);
    EXPECT_TRUE(invocation.config.dry_run);
}

TEST(CliParse, UsageErrors) {
    EXPECT_THROW(CLI::parse({}), UsageError);
    EXPECT_THROW(CLI::parse({"reboot"}), UsageError);
    EXPECT_THROW(CLI::parse({"status", "--bogus"}), UsageError);
    EXPECT_THROW(CLI::parse({"status", "-x"}), UsageError);
    EXPECT_THROW(CLI::parse({"status", "--socket"}), UsageError);
    EXPECT_THROW(CLI::parse({"status", "--dry-run=1"}), UsageError);
    EXPECT_THROW(CLI::parse({"restore"}), UsageError);
    EXPECT_THROW(CLI::parse({"restore", "a", "b"}), UsageError);
    EXPECT_THROW(CLI::parse({"setup", "now"}), UsageError);
}

TEST(CliParse, HelpAliases) {
    EXPECT_EQ(CLI::parse({"--help"}).command, "help");
    EXPECT_EQ(CLI::parse({"-h"}).command, "help");
}

TEST(CliParse, HelpFlagWinsOverCommand) {
    auto invocation = CLI::parse({"restore", "-h"});
    EXPECT_EQ(invocation.command, "help");
    EXPECT_TRUE(invocation.args.empty());
    EXPECT_EQ(CLI::parse({"--help", "restore", "a", "b"}).command, "help");
    EXPECT_EQ(CLI::parse({"setup", "--help", "--bogus"}).command, "help");
}

TEST(CliParse, MissingConfigFile) {
    EXPECT_THROW(CLI::parse({"status", "--config", "/nonexistent/sandbox.json"}), ConfigurationError);
}

TEST(CliRun, ExitCodes) {
    CLI cli(fake_factory());

    ::testing::internal::CaptureStdout();
    EXPECT_EQ(run_cli(cli, {"help"}), 0);
    EXPECT_NE(::testing::internal::GetCapturedStdout().find("restore <id>"), std::string::npos);

    ::testing::internal::CaptureStderr();
    EXPECT_EQ(run_cli(cli, {"frobnicate"}), 2);
    EXPECT_EQ(run_cli(cli, {}), 2);
    EXPECT_EQ(run_cli(cli, {"status", "--config", "/nonexistent/sandbox.json"}), 1);
    EXPECT_EQ(run_cli(cli, {"status", "--guest-ip", "192.168.1.1"}), 1);
    std::string err = ::testing::internal::GetCapturedStderr();
    EXPECT_NE(err.find("Unknown command: frobnicate"), std::string::npos);
    EXPECT_NE(err.find("Guest IP must differ"), std::string::npos);
}

TEST(CliRun, HelpAfterCommandDoesNotRunIt) {
    CLI cli(fake_factory());

    ::testing::internal::CaptureStdout();
    EXPECT_EQ(run_cli(cli, {"restore", "--help"}), 0);
    std::string out = ::testing::internal::GetCapturedStdout();

    EXPECT_NE(out.find("restore <id>"), std::string::npos);
    EXPECT_EQ(cli.runner(), nullptr);
}

TEST(CliRun, DryRunSetupMutatesNothing) {
    TempDir dir;
    auto boot = dir.path() / "vm-config.json";
    write_text(boot, boot_config_json("vmlinux.bin", "rootfs.ext4"));
    CLI cli(fake_factory([](FakeCommandRunner& runner) {
        runner.respond("ip route show default", 0, "default via 10.0.0.1 dev eth0\n");
    }));

    ::testing::internal::CaptureStdout();
    int rc = run_cli(cli, {"--dry-run", "--boot-config", boot.string(),
                           "--socket", (dir.path() / "fc.socket").string(), "setup"});
    std::string out = ::testing::internal::GetCapturedStdout();

    EXPECT_EQ(rc, 0);
    const auto& runner = fake(cli);
    EXPECT_TRUE(runner.dry_run());
    EXPECT_EQ(runner.recorded(), runner.mutations());
    EXPECT_TRUE(runner.files().empty());
    EXPECT_NE(out.find("Dry run: " + std::to_string(runner.recorded().size())), std::string::npos);
}

TEST(CliRun, SnapshotWithoutVmFails) {
    TempDir dir;
    CLI cli(fake_factory());

    ::testing::internal::CaptureStderr();
    int rc = run_cli(cli, {"snapshot", "--snapshots-dir", (dir.path() / "snapshots").string()});
    std::string err = ::testing::internal::GetCapturedStderr();

    EXPECT_EQ(rc, 1);
    EXPECT_NE(err.find("Nothing to snapshot"), std::string::npos);
    EXPECT_TRUE(fake(cli).mutations().empty());
}

TEST(CliRun, RestoreUnknownSnapshotListsAvailable) {
    TempDir dir;
    auto snap = dir.path() / "snapshots" / "20250101-000000";
    write_text(snap / "vm-config.json", boot_config_json("vmlinux.bin", "rootfs.ext4"));
    write_text(snap / "memory", "");
    write_text(snap / "mem_dump", "");
    write_text(snap / "rootfs.ext4", "");
    CLI cli(fake_factory());

    ::testing::internal::CaptureStderr();
    int rc = run_cli(cli, {"-n", "--snapshots-dir", (dir.path() / "snapshots").string(),
                           "restore", "missing"});
    std::string err = ::testing::internal::GetCapturedStderr();

    EXPECT_EQ(rc, 1);
    EXPECT_NE(err.find("20250101-000000"), std::string::npos);
    EXPECT_TRUE(fake(cli).calls().empty());
}

TEST(CliRun, StatusAndSnapshots) {
    TempDir dir;
    std::filesystem::create_directories(dir.path() / "snapshots" / "20250101-000000");
    CLI cli(fake_factory([](FakeCommandRunner& runner) {
        runner.respond("pgrep -f", 0, "4242\n");
    }));

    ::testing::internal::CaptureStdout();
    EXPECT_EQ(run_cli(cli, {"status"}), 0);
    EXPECT_EQ(run_cli(cli, {"snapshots", "--snapshots-dir", (dir.path() / "snapshots").string()}), 0);
    std::string out = ::testing::internal::GetCapturedStdout();

    EXPECT_NE(out.find("4242"), std::string::npos);
    EXPECT_NE(out.find("  20250101-000000"), std::string::npos);
}

TEST(CliRun, ListVms) {
    CLI cli(fake_factory([](FakeCommandRunner& runner) {
        runner.respond("pgrep -a -x firecracker", 0,
                       "4242 firecracker --api-sock /tmp/a.sock --config-file vm.json\n");
    }));

    ::testing::internal::CaptureStdout();
    EXPECT_EQ(run_cli(cli, {"list-vms"}), 0);
    std::string out = ::testing::internal::GetCapturedStdout();

    EXPECT_NE(out.find("/tmp/a.sock"), std::string::npos);
    EXPECT_NE(out.find("vm.json"), std::string::npos);
}

TEST(CliRun, ControlPlaneFailureReportsPausedVm) {
    TempDir dir;
    write_text(dir.path() / "vmlinux.bin", "k");
    write_text(dir.path() / "rootfs.ext4", "r");
    auto boot = dir.path() / "vm-config.json";
    write_text(boot, boot_config_json((dir.path() / "vmlinux.bin").string(),
                                      (dir.path() / "rootfs.ext4").string()));
    CLI cli(fake_factory([](FakeCommandRunner& runner) {
        runner.respond("pgrep -f", 0, "4242\n");
        runner.respond("Resumed", 22, "{\"fault_message\":\"busy\"}");
    }));

    ::testing::internal::CaptureStdout();
    ::testing::internal::CaptureStderr();
    int rc = run_cli(cli, {"snapshot", "--boot-config", boot.string(),
                           "--snapshots-dir", (dir.path() / "snapshots").string()});
    std::string out = ::testing::internal::GetCapturedStdout();
    std::string err = ::testing::internal::GetCapturedStderr();

    EXPECT_EQ(rc, 1);
    EXPECT_NE(err.find("[resume]"), std::string::npos);
    EXPECT_NE(out.find("PAUSED"), std::string::npos);
}
