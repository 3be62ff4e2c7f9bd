#pragma once

#include "core/config.hpp"
#include "runner/command_runner.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fcsandbox {

/**
 * StartMode - How the hypervisor is launched
 */
enum class StartMode {
    Boot,    // boot from a config file
    Resume   // API socket only; state is loaded from a snapshot afterwards
};

/**
 * VmProcessHandle - A spawned (or already running) hypervisor process
 */
struct VmProcessHandle {
    std::optional<int> pid;                       // unknown in dry-run / foreground
    std::filesystem::path boot_config;
    std::optional<std::filesystem::path> log_file;
    std::optional<std::string> session;           // detached screen session
    bool already_running = false;
};

/**
 * VmStatus - Probed state of the sandbox VM
 */
struct VmStatus {
    bool running = false;
    std::vector<int> pids;
    bool session_active = false;
    bool socket_present = false;

    std::optional<int> pid() const {
        if (pids.empty()) return std::nullopt;
        return pids.front();
    }
};

/**
 * VmInstance - A hypervisor process found on the host
 */
struct VmInstance {
    int pid = 0;
    std::string api_socket;
    std::string config_file;
    std::string command_line;
};

/**
 * VmProcessSupervisor - Spawns, finds, stops and attaches to the
 * hypervisor process bound to the sandbox's API socket
 *
 * Nothing is cached between invocations; every query probes the host.
 */
class VmProcessSupervisor {
public:
    /**
     * Constructor
     * @param runner Command runner for all host interaction
     * @param config Invocation config (binary, session, log, timeouts)
     */
    VmProcessSupervisor(CommandRunner& runner, const SandboxConfig& config);

    /**
     * Start the hypervisor
     *
     * Foreground mode blocks until the VM exits. Detached mode runs it in
     * a screen session with the console logged to a file and polls until
     * the process appears or the startup timeout passes. When a VM is
     * already running on the socket nothing new is spawned.
     *
     * @param boot_config Boot configuration (ignored in Resume mode)
     * @param socket API socket path
     * @param detached Run in the background
     * @param mode Boot or Resume
     * @return Handle of the running process
     * @throws ConfigurationError if the boot config is missing or invalid
     * @throws ProcessStartFailure if the process exits non-zero (foreground)
     *         or never appears (detached), with the captured console output
     */
    VmProcessHandle start(const std::filesystem::path& boot_config,
                          const std::filesystem::path& socket,
                          bool detached,
                          StartMode mode = StartMode::Boot);

    /**
     * Terminate the hypervisor (SIGTERM, then SIGKILL after the grace
     * period) and remove its socket files
     *
     * A no-op when nothing is running.
     */
    void stop();

    /**
     * Probe whether the VM is running
     */
    VmStatus status();

    /**
     * List every hypervisor process on the host
     */
    std::vector<VmInstance> list_instances();

    /**
     * Reconnect the terminal to the VM console
     *
     * Tries the screen session, then the process's controlling tty, then
     * the console socket.
     *
     * @throws VmNotRunningError if no VM is running
     * @throws SandboxError listing every attempt if none succeeds
     */
    void attach();

    /**
     * Pids of hypervisor processes bound to the configured socket
     */
    std::vector<int> find_pids();

    /**
     * pgrep -f pattern matching the hypervisor bound to a socket
     *
     * The first character is bracketed so the pattern never matches the
     * shell running pgrep, and it is anchored so the screen wrapper whose
     * command line embeds the hypervisor command does not match either.
     */
    static std::string process_pattern(const std::string& binary,
                                       const std::filesystem::path& socket);

    /// Parse pgrep output into pids
    static std::vector<int> parse_pids(const std::string& output);

    /// Parse `pgrep -a` output into instances
    static std::vector<VmInstance> parse_instances(const std::string& output);

    /// Check `screen -ls` output for a session name
    static bool session_listed(const std::string& output, const std::string& session);

private:
    bool session_exists();
    std::string read_console_log() const;
    std::vector<std::filesystem::path> auxiliary_sockets() const;
    std::string binary_name() const;
    void wait_for_exit(const std::vector<int>& pids);

    CommandRunner& runner_;
    const SandboxConfig& config_;
};

} // namespace fcsandbox
