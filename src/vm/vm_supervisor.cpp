#include "vm/vm_supervisor.hpp"
#include "core/errors.hpp"
#include "resources/control_socket.hpp"
#include "utils/exec.hpp"
#include "vm/boot_config.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <sstream>
#include <thread>

namespace fcsandbox {

namespace fs = std::filesystem;
using utils::shell_quote;

namespace {

std::string regex_escape(const std::string& s) {
    std::string escaped;
    for (char c : s) {
        if (std::string(".^$|()[]{}*+?\\").find(c) != std::string::npos) {
            escaped += '\\';
        }
        escaped += c;
    }
    return escaped;
}

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::string seconds_string(std::chrono::milliseconds ms) {
    std::ostringstream ss;
    ss << (static_cast<double>(ms.count()) / 1000.0) << "s";
    return ss.str();
}

}  // anonymous namespace

VmProcessSupervisor::VmProcessSupervisor(CommandRunner& runner, const SandboxConfig& config)
    : runner_(runner), config_(config) {}

std::string VmProcessSupervisor::binary_name() const {
    return fs::path(config_.firecracker_bin).filename().string();
}

std::string VmProcessSupervisor::process_pattern(const std::string& binary,
                                                 const fs::path& socket) {
    std::string name = fs::path(binary).filename().string();
    std::string head = name.empty() ? "" : "[" + regex_escape(name.substr(0, 1)) + "]";
    std::string tail = name.size() > 1 ? regex_escape(name.substr(1)) : "";
    return "^[^ ]*" + head + tail + " --api-sock " + regex_escape(socket.string()) + "( |$)";
}

std::vector<int> VmProcessSupervisor::parse_pids(const std::string& output) {
    std::vector<int> pids;
    std::istringstream ss(output);
    std::string line;
    while (std::getline(ss, line)) {
        line = trim(line);
        if (line.empty() || line.find_first_not_of("0123456789") != std::string::npos) {
            continue;
        }
        pids.push_back(std::stoi(line));
    }
    return pids;
}

std::vector<VmInstance> VmProcessSupervisor::parse_instances(const std::string& output) {
    std::vector<VmInstance> instances;
    std::istringstream ss(output);
    std::string line;
    while (std::getline(ss, line)) {
        std::istringstream line_ss(line);
        std::string pid_str;
        line_ss >> pid_str;
        if (pid_str.empty() || pid_str.find_first_not_of("0123456789") != std::string::npos) {
            continue;
        }

        VmInstance instance;
        instance.pid = std::stoi(pid_str);
        std::getline(line_ss, instance.command_line);
        instance.command_line = trim(instance.command_line);

        std::istringstream args(instance.command_line);
        std::string arg;
        while (args >> arg) {
            if (arg == "--api-sock") {
                args >> instance.api_socket;
            } else if (arg == "--config-file") {
                args >> instance.config_file;
            }
        }
        instances.push_back(instance);
    }
    return instances;
}

bool VmProcessSupervisor::session_listed(const std::string& output, const std::string& session) {
    // Entries look like "\t12345.name\t(Detached)"
    std::istringstream ss(output);
    std::string line;
    while (std::getline(ss, line)) {
        std::istringstream line_ss(line);
        std::string entry;
        line_ss >> entry;
        auto dot = entry.find('.');
        if (dot != std::string::npos && entry.substr(dot + 1) == session) {
            return true;
        }
    }
    return false;
}

std::vector<int> VmProcessSupervisor::find_pids() {
    auto result = runner_.query("pgrep -f " +
                                shell_quote(process_pattern(config_.firecracker_bin, config_.api_socket)));
    if (!result.succeeded()) {
        return {};
    }
    return parse_pids(result.output);
}

bool VmProcessSupervisor::session_exists() {
    // screen -ls exits non-zero even when it lists sessions
    auto result = runner_.query("screen -ls " + shell_quote(config_.session_name));
    return session_listed(result.output, config_.session_name);
}

std::string VmProcessSupervisor::read_console_log() const {
    std::ifstream f(config_.console_log);
    if (!f) {
        return "";
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

std::vector<fs::path> VmProcessSupervisor::auxiliary_sockets() const {
    std::vector<fs::path> sockets = {config_.console_socket};
    if (fs::exists(config_.boot_config)) {
        try {
            auto boot = BootConfig::load(config_.boot_config);
            if (boot.vsock_uds_path) {
                sockets.emplace_back(*boot.vsock_uds_path);
            }
        } catch (const ConfigurationError& e) {
            spdlog::debug("Not reading vsock path: {}", e.what());
        }
    }
    return sockets;
}

VmProcessHandle VmProcessSupervisor::start(const fs::path& boot_config,
                                           const fs::path& socket,
                                           bool detached,
                                           StartMode mode) {
    VmProcessHandle handle;
    handle.boot_config = boot_config;

    auto running = find_pids();
    if (!running.empty()) {
        spdlog::warn("Firecracker is already running on {} (pid {})", socket.string(), running.front());
        handle.pid = running.front();
        handle.already_running = true;
        return handle;
    }

    std::string command = shell_quote(config_.firecracker_bin) + " --api-sock " +
                          shell_quote(socket.string());
    if (mode == StartMode::Boot) {
        auto boot = BootConfig::load(boot_config);
        if (!boot.binds_device(config_.network.device)) {
            spdlog::warn("{} does not bind a network interface to {}",
                         boot_config.string(), config_.network.device);
        }
        command += " --config-file " + shell_quote(boot_config.string());
    }

    if (!detached) {
        spdlog::info("Launching Firecracker in the foreground");
        int code = runner_.run_interactive(command);
        if (code != 0) {
            throw ProcessStartFailure("Firecracker exited with code " + std::to_string(code), "");
        }
        return handle;
    }

    const std::string log = shell_quote(config_.console_log.string());
    const std::string session = shell_quote(config_.session_name);

    runner_.run("rm -f " + log, true);
    auto spawn = runner_.run("screen -dmS " + session + " -L -Logfile " + log + " " + command);
    handle.session = config_.session_name;
    handle.log_file = config_.console_log;
    if (spawn.simulated) {
        spdlog::info("[dry-run] Skipping startup confirmation");
        return handle;
    }

    auto deadline = std::chrono::steady_clock::now() + config_.startup_timeout;
    while (true) {
        std::this_thread::sleep_for(config_.poll_interval);
        auto pids = find_pids();
        if (!pids.empty()) {
            handle.pid = pids.front();
            spdlog::info("Firecracker running with pid {}", pids.front());
            return handle;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            break;
        }
    }

    std::string output = read_console_log();
    runner_.run("screen -S " + session + " -X quit", true);
    throw ProcessStartFailure("Firecracker did not start within " +
                              seconds_string(config_.startup_timeout) +
                              " (console log: " + config_.console_log.string() + ")",
                              output);
}

void VmProcessSupervisor::wait_for_exit(const std::vector<int>& pids) {
    auto deadline = std::chrono::steady_clock::now() + config_.stop_grace;
    while (std::chrono::steady_clock::now() < deadline) {
        auto remaining = find_pids();
        bool any_left = std::any_of(pids.begin(), pids.end(), [&](int pid) {
            return std::find(remaining.begin(), remaining.end(), pid) != remaining.end();
        });
        if (!any_left) {
            return;
        }
        std::this_thread::sleep_for(config_.poll_interval);
    }
}

void VmProcessSupervisor::stop() {
    auto pids = find_pids();
    if (pids.empty()) {
        spdlog::info("No Firecracker process running on {}", config_.api_socket.string());
    } else {
        for (int pid : pids) {
            spdlog::info("Stopping Firecracker process {}", pid);
            runner_.run("kill -TERM " + std::to_string(pid), true);
        }

        // Nothing was signalled in dry-run, so there is nothing to escalate
        if (!runner_.dry_run()) {
            wait_for_exit(pids);

            for (int pid : find_pids()) {
                if (std::find(pids.begin(), pids.end(), pid) == pids.end()) {
                    continue;
                }
                spdlog::warn("Process {} ignored SIGTERM, killing", pid);
                runner_.run("kill -KILL " + std::to_string(pid), true);
            }

            // Anything still bound to the socket, e.g. spawned meanwhile
            if (!find_pids().empty()) {
                runner_.run("pkill -KILL -f " +
                            shell_quote(process_pattern(config_.firecracker_bin, config_.api_socket)),
                            true);
            }
        }
    }

    if (session_exists()) {
        runner_.run("screen -S " + shell_quote(config_.session_name) + " -X quit", true);
    }

    runner_.run("rm -f " + shell_quote(config_.api_socket.string()), true);
    for (const auto& path : auxiliary_sockets()) {
        if (ControlSocketResource::exists(path)) {
            runner_.run("rm -f " + shell_quote(path.string()), true);
        }
    }
}

VmStatus VmProcessSupervisor::status() {
    VmStatus status;
    status.pids = find_pids();
    status.running = !status.pids.empty();
    status.session_active = session_exists();
    status.socket_present = ControlSocketResource::exists(config_.api_socket);
    return status;
}

std::vector<VmInstance> VmProcessSupervisor::list_instances() {
    auto result = runner_.query("pgrep -a -x " + shell_quote(binary_name()));
    if (!result.succeeded()) {
        return {};
    }
    return parse_instances(result.output);
}

void VmProcessSupervisor::attach() {
    auto pids = find_pids();
    bool session = session_exists();
    if (pids.empty() && !session) {
        throw VmNotRunningError("Firecracker is not running on " + config_.api_socket.string() +
                                ". Start the VM first.");
    }

    std::vector<std::string> attempts;
    bool have_screen = utils::which("screen").has_value();

    // (a) detached screen session
    if (!session) {
        attempts.push_back("screen session '" + config_.session_name + "': not found");
    } else if (!have_screen) {
        attempts.push_back("screen session '" + config_.session_name + "': screen not installed");
    } else {
        spdlog::info("Attaching to screen session '{}' (detach with Ctrl-a d)", config_.session_name);
        int code = runner_.run_interactive("screen -r " + shell_quote(config_.session_name));
        if (code == 0) {
            return;
        }
        attempts.push_back("screen session '" + config_.session_name + "': exit code " +
                           std::to_string(code));
    }

    // (b) controlling terminal of the process
    if (pids.empty()) {
        attempts.push_back("controlling tty: no process");
    } else {
        auto tty = runner_.query("ps -o tty= -p " + std::to_string(pids.front()));
        std::string name = trim(tty.output);
        if (!tty.succeeded() || name.empty() || name == "?") {
            attempts.push_back("controlling tty: process " + std::to_string(pids.front()) +
                               " has none");
        } else if (!have_screen) {
            attempts.push_back("controlling tty /dev/" + name + ": screen not installed");
        } else {
            std::string device = "/dev/" + name;
            spdlog::info("Attaching to {}", device);
            int code = runner_.run_interactive("screen " + shell_quote(device) + " 115200");
            if (code == 0) {
                return;
            }
            attempts.push_back("controlling tty " + device + ": exit code " + std::to_string(code));
        }
    }

    // (c) console socket
    const auto& console = config_.console_socket;
    if (!ControlSocketResource::exists(console)) {
        attempts.push_back("console socket " + console.string() + ": not found");
    } else if (!utils::which("socat")) {
        attempts.push_back("console socket " + console.string() + ": socat not installed");
    } else {
        spdlog::info("Attaching to console socket {}", console.string());
        int code = runner_.run_interactive("socat -,raw,echo=0 " +
                                           shell_quote("UNIX-CONNECT:" + console.string()));
        if (code == 0) {
            return;
        }
        attempts.push_back("console socket " + console.string() + ": exit code " +
                           std::to_string(code));
    }

    std::string msg = "Could not attach to the VM console. Tried:";
    for (const auto& attempt : attempts) {
        msg += "\n  - " + attempt;
    }
    throw SandboxError(ErrorKind::Command, msg);
}

} // namespace fcsandbox
