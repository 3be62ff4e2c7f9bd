#include "vm/vm_supervisor.hpp"
#include "core/errors.hpp"
#include "fake_command_runner.hpp"

#include <gtest/gtest.h>

using namespace fcsandbox;
using fcsandbox::test::FakeCommandRunner;
using fcsandbox::test::TempDir;
using fcsandbox::test::boot_config_json;
using fcsandbox::test::write_text;

namespace {

class VmSupervisorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.api_socket = dir_.path() / "firecracker.socket";
        config_.boot_config = dir_.path() / "vm-config.json";
        config_.console_log = dir_.path() / "console.log";
        config_.console_socket = dir_.path() / "console.sock";
        config_.poll_interval = std::chrono::milliseconds(1);
        config_.startup_timeout = std::chrono::milliseconds(1000);
        config_.stop_grace = std::chrono::milliseconds(1000);
        write_text(config_.boot_config, boot_config_json("vmlinux.bin", "rootfs.ext4"));
    }

    std::string socket() const { return config_.api_socket.string(); }

    TempDir dir_;
    SandboxConfig config_;
    FakeCommandRunner runner_;
};

}  // namespace

TEST(VmSupervisor, ProcessPattern) {
    EXPECT_EQ(VmProcessSupervisor::process_pattern("firecracker", "/tmp/firecracker.socket"),
              "^[^ ]*[f]irecracker --api-sock /tmp/firecracker\\.socket( |$)");
    EXPECT_EQ(VmProcessSupervisor::process_pattern("/opt/fc/firecracker", "/run/a.sock"),
              "^[^ ]*[f]irecracker --api-sock /run/a\\.sock( |$)");
}

TEST(VmSupervisor, ParsePids) {
    auto pids = VmProcessSupervisor::parse_pids("4242\n 4243 \n\nnot-a-pid\n");
    ASSERT_EQ(pids.size(), 2u);
    EXPECT_EQ(pids[0], 4242);
    EXPECT_EQ(pids[1], 4243);
    EXPECT_TRUE(VmProcessSupervisor::parse_pids("").empty());
}

TEST(VmSupervisor, ParseInstances) {
    auto instances = VmProcessSupervisor::parse_instances(
        "4242 firecracker --api-sock /tmp/a.sock --config-file vm.json\n"
        "4243 /usr/bin/firecracker --api-sock /tmp/b.sock\n");
    ASSERT_EQ(instances.size(), 2u);
    EXPECT_EQ(instances[0].pid, 4242);
    EXPECT_EQ(instances[0].api_socket, "/tmp/a.sock");
    EXPECT_EQ(instances[0].config_file, "vm.json");
    EXPECT_EQ(instances[1].api_socket, "/tmp/b.sock");
    EXPECT_EQ(instances[1].config_file, "");
    EXPECT_EQ(instances[1].command_line, "/usr/bin/firecracker --api-sock /tmp/b.sock");
}

TEST(VmSupervisor, SessionListed) {
    std::string output =
        "There is a screen on:\n"
        "\t12345.firecracker\t(Detached)\n"
        "1 Socket in /run/screen/S-root.\n";
    EXPECT_TRUE(VmProcessSupervisor::session_listed(output, "firecracker"));
    EXPECT_FALSE(VmProcessSupervisor::session_listed(output, "fire"));
    EXPECT_FALSE(VmProcessSupervisor::session_listed("No Sockets found in /run/screen/S-root.\n",
                                                     "firecracker"));
}

TEST_F(VmSupervisorTest, DetachedStartWaitsForProcess) {
    runner_.respond_sequence("pgrep -f", {{1, "", false}, {1, "", false}, {0, "4242\n", false}});
    VmProcessSupervisor supervisor(runner_, config_);

    auto handle = supervisor.start(config_.boot_config, config_.api_socket, true);

    ASSERT_TRUE(handle.pid.has_value());
    EXPECT_EQ(*handle.pid, 4242);
    EXPECT_FALSE(handle.already_running);
    EXPECT_EQ(handle.session, std::optional<std::string>("firecracker"));
    std::vector<std::string> expected = {
        "rm -f " + config_.console_log.string(),
        "screen -dmS firecracker -L -Logfile " + config_.console_log.string() +
            " firecracker --api-sock " + socket() +
            " --config-file " + config_.boot_config.string(),
    };
    EXPECT_EQ(runner_.mutations(), expected);
}

TEST_F(VmSupervisorTest, DetachedStartTimeoutCarriesConsoleLog) {
    config_.startup_timeout = std::chrono::milliseconds(20);
    write_text(config_.console_log, "Kernel panic - not syncing: VFS: Unable to mount root fs\n");
    VmProcessSupervisor supervisor(runner_, config_);

    try {
        supervisor.start(config_.boot_config, config_.api_socket, true);
        FAIL() << "expected ProcessStartFailure";
    } catch (const ProcessStartFailure& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ProcessStart);
        EXPECT_NE(e.output().find("Kernel panic"), std::string::npos);
    }
    EXPECT_TRUE(runner_.called("screen -S firecracker -X quit"));
}

TEST_F(VmSupervisorTest, StartLeavesRunningVmAlone) {
    runner_.respond("pgrep -f", 0, "77\n");
    VmProcessSupervisor supervisor(runner_, config_);

    auto handle = supervisor.start(config_.boot_config, config_.api_socket, true);
    EXPECT_TRUE(handle.already_running);
    EXPECT_EQ(handle.pid, std::optional<int>(77));
    EXPECT_TRUE(runner_.mutations().empty());
}

TEST_F(VmSupervisorTest, MissingBootConfigFailsBeforeSpawning) {
    VmProcessSupervisor supervisor(runner_, config_);

    EXPECT_THROW(supervisor.start(dir_.path() / "missing.json", config_.api_socket, true),
                 ConfigurationError);
    EXPECT_TRUE(runner_.mutations().empty());
}

TEST_F(VmSupervisorTest, ResumeModeOmitsConfigFile) {
    runner_.respond_sequence("pgrep -f", {{1, "", false}, {0, "4242\n", false}});
    VmProcessSupervisor supervisor(runner_, config_);

    supervisor.start(dir_.path() / "not-read.json", config_.api_socket, true, StartMode::Resume);
    EXPECT_TRUE(runner_.called("firecracker --api-sock " + socket()));
    EXPECT_FALSE(runner_.called("--config-file"));
}

TEST_F(VmSupervisorTest, ForegroundFailureIsProcessStartFailure) {
    runner_.respond("firecracker --api-sock", 1);
    VmProcessSupervisor supervisor(runner_, config_);

    EXPECT_THROW(supervisor.start(config_.boot_config, config_.api_socket, false),
                 ProcessStartFailure);
    EXPECT_FALSE(runner_.called("screen -dmS"));
}

TEST_F(VmSupervisorTest, DryRunSkipsStartupPolling) {
    FakeCommandRunner runner(true);
    VmProcessSupervisor supervisor(runner, config_);

    auto handle = supervisor.start(config_.boot_config, config_.api_socket, true);
    EXPECT_FALSE(handle.pid.has_value());
    EXPECT_EQ(runner.count("pgrep -f"), 1);
    EXPECT_EQ(runner.recorded().size(), 2u);
}

TEST_F(VmSupervisorTest, StopTerminatesGracefully) {
    runner_.respond_sequence("pgrep -f", {{0, "4242\n", false}, {1, "", false}});
    VmProcessSupervisor supervisor(runner_, config_);

    supervisor.stop();

    EXPECT_TRUE(runner_.called("kill -TERM 4242"));
    EXPECT_FALSE(runner_.called("kill -KILL"));
    EXPECT_FALSE(runner_.called("pkill"));
    EXPECT_TRUE(runner_.called("rm -f " + socket()));
}

TEST_F(VmSupervisorTest, StopEscalatesToKill) {
    config_.stop_grace = std::chrono::milliseconds(10);
    runner_.respond("pgrep -f", 0, "4242\n");
    VmProcessSupervisor supervisor(runner_, config_);

    supervisor.stop();

    int term = runner_.index_of("kill -TERM 4242");
    int kill = runner_.index_of("kill -KILL 4242");
    ASSERT_GE(term, 0);
    EXPECT_GT(kill, term);
    EXPECT_TRUE(runner_.called("pkill -KILL -f"));
}

TEST_F(VmSupervisorTest, DryRunStopTracesOnlyTerm) {
    FakeCommandRunner runner(true);
    runner.respond("pgrep -f", 0, "4242\n");
    VmProcessSupervisor supervisor(runner, config_);

    supervisor.stop();

    EXPECT_TRUE(runner.called("kill -TERM 4242"));
    EXPECT_FALSE(runner.called("kill -KILL"));
    EXPECT_FALSE(runner.called("pkill"));
    EXPECT_EQ(runner.recorded(), runner.mutations());
}

TEST_F(VmSupervisorTest, StopWithNothingRunning) {
    write_text(config_.console_socket, "");
    runner_.respond("screen -ls", 1,
                    "There is a screen on:\n\t999.firecracker\t(Detached)\n");
    VmProcessSupervisor supervisor(runner_, config_);

    EXPECT_NO_THROW(supervisor.stop());

    EXPECT_FALSE(runner_.called("kill"));
    EXPECT_TRUE(runner_.called("screen -S firecracker -X quit"));
    EXPECT_TRUE(runner_.called("rm -f " + socket()));
    EXPECT_TRUE(runner_.called("rm -f " + config_.console_socket.string()));
}

TEST_F(VmSupervisorTest, Status) {
    runner_.respond("pgrep -f", 0, "4242\n");
    runner_.respond("screen -ls", 1, "\t999.firecracker\t(Detached)\n");
    VmProcessSupervisor supervisor(runner_, config_);

    auto status = supervisor.status();
    EXPECT_TRUE(status.running);
    EXPECT_EQ(status.pid(), std::optional<int>(4242));
    EXPECT_TRUE(status.session_active);
    EXPECT_FALSE(status.socket_present);
    EXPECT_TRUE(runner_.mutations().empty());
}

TEST_F(VmSupervisorTest, ListInstances) {
    runner_.respond("pgrep -a -x firecracker", 0,
                    "4242 firecracker --api-sock /tmp/a.sock --config-file vm.json\n");
    VmProcessSupervisor supervisor(runner_, config_);

    auto instances = supervisor.list_instances();
    ASSERT_EQ(instances.size(), 1u);
    EXPECT_EQ(instances[0].api_socket, "/tmp/a.sock");
}

TEST_F(VmSupervisorTest, AttachWithoutVm) {
    VmProcessSupervisor supervisor(runner_, config_);
    EXPECT_THROW(supervisor.attach(), VmNotRunningError);
}

TEST_F(VmSupervisorTest, AttachReportsEveryAttempt) {
    runner_.respond("pgrep -f", 0, "4242\n");
    runner_.respond("ps -o tty= -p 4242", 0, "?\n");
    VmProcessSupervisor supervisor(runner_, config_);

    try {
        supervisor.attach();
        FAIL() << "expected SandboxError";
    } catch (const SandboxError& e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find("screen session 'firecracker': not found"), std::string::npos);
        EXPECT_NE(msg.find("controlling tty: process 4242 has none"), std::string::npos);
        EXPECT_NE(msg.find("console socket"), std::string::npos);
    }
    EXPECT_TRUE(runner_.mutations().empty());
}
