#include "cli/cli.hpp"
#include "core/errors.hpp"

#include <spdlog/spdlog.h>

#include <iomanip>
#include <iostream>
#include <optional>
#include <set>
#include <unistd.h>
#include <utility>

namespace fcsandbox {

// ANSI color codes
namespace colors {
    const char* RED = "\033[0;31m";
    const char* GREEN = "\033[0;32m";
    const char* YELLOW = "\033[1;33m";
    const char* BLUE = "\033[0;34m";
    const char* RESET = "\033[0m";
}

namespace {

const std::set<std::string> kValueOptions = {
    "--config", "--socket", "--device", "--host-ip", "--guest-ip", "--uplink",
    "--boot-config", "--config-file", "--snapshots-dir"
};

const std::set<std::string> kCommands = {
    "activate", "deactivate", "net-up", "net-down", "start", "stop", "login",
    "setup", "teardown", "restore", "snapshot", "snapshots", "list-vms",
    "net-info", "status", "help"
};

void apply_option(SandboxConfig& config, const std::string& name, const std::string& value) {
    if (name == "--socket") {
        config.api_socket = value;
    } else if (name == "--device") {
        config.network.device = value;
    } else if (name == "--host-ip") {
        config.network.host_cidr = value;
    } else if (name == "--guest-ip") {
        config.network.guest_ip = value;
    } else if (name == "--uplink") {
        config.network.uplink = value;
    } else if (name == "--boot-config" || name == "--config-file") {
        config.boot_config = value;
    } else if (name == "--snapshots-dir") {
        config.snapshots_dir = value;
    }
}

const char* yes_no(bool value) {
    return value ? "yes" : "no";
}

}  // anonymous namespace

CLI::CLI(RunnerFactory runner_factory)
    : runner_factory_(std::move(runner_factory)) {
    // Disable colors if not a TTY
    use_colors_ = isatty(STDOUT_FILENO) != 0;
}

void CLI::info(const std::string& msg) const {
    if (use_colors_) {
        std::cout << colors::BLUE << "[INFO]" << colors::RESET << " " << msg << std::endl;
    } else {
        std::cout << "[INFO] " << msg << std::endl;
    }
}

void CLI::success(const std::string& msg) const {
    if (use_colors_) {
        std::cout << colors::GREEN << "[OK]" << colors::RESET << " " << msg << std::endl;
    } else {
        std::cout << "[OK] " << msg << std::endl;
    }
}

void CLI::warn(const std::string& msg) const {
    if (use_colors_) {
        std::cout << colors::YELLOW << "[WARN]" << colors::RESET << " " << msg << std::endl;
    } else {
        std::cout << "[WARN] " << msg << std::endl;
    }
}

void CLI::error(const std::string& msg) const {
    if (use_colors_) {
        std::cerr << colors::RED << "[ERROR]" << colors::RESET << " " << msg << std::endl;
    } else {
        std::cerr << "[ERROR] " << msg << std::endl;
    }
}

bool CLI::check_root() const {
    if (geteuid() != 0) {
        error("This command must be run as root (or with --dry-run)");
        return false;
    }
    return true;
}

void CLI::configure_logging(bool verbose) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
}

bool CLI::requires_root(const std::string& command) {
    return command == "net-up" || command == "net-down" || command == "setup" ||
           command == "teardown" || command == "restore";
}

Invocation CLI::parse(const std::vector<std::string>& args) {
    Invocation invocation;
    std::vector<std::pair<std::string, std::string>> options;
    std::vector<std::string> positional;
    std::optional<std::string> config_file;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];

        if (arg == "--") {
            positional.insert(positional.end(), args.begin() + i + 1, args.end());
            break;
        }
        if (arg == "-h" || arg == "--help") {
            Invocation help;
            help.command = "help";
            return help;
        }
        if (arg == "-n") {
            invocation.config.dry_run = true;
            continue;
        }
        if (arg == "-v") {
            invocation.config.verbose = true;
            continue;
        }
        if (arg.rfind("--", 0) != 0) {
            if (arg.size() > 1 && arg[0] == '-') {
                throw UsageError("Unknown option: " + arg);
            }
            positional.push_back(arg);
            continue;
        }

        std::string name = arg;
        std::optional<std::string> value;
        auto eq = arg.find('=');
        if (eq != std::string::npos) {
            name = arg.substr(0, eq);
            value = arg.substr(eq + 1);
        }

        if (kValueOptions.count(name)) {
            if (!value) {
                if (i + 1 >= args.size()) {
                    throw UsageError("Option " + name + " requires a value");
                }
                value = args[++i];
            }
            if (name == "--config") {
                config_file = *value;
            } else {
                options.emplace_back(name, *value);
            }
            continue;
        }

        if (value) {
            throw UsageError("Option " + name + " takes no value");
        }
        if (name == "--dry-run") {
            invocation.config.dry_run = true;
        } else if (name == "--verbose") {
            invocation.config.verbose = true;
        } else if (name == "--foreground") {
            invocation.config.detached = false;
        } else {
            throw UsageError("Unknown option: " + name);
        }
    }

    if (positional.empty()) {
        throw UsageError("No command given");
    }
    invocation.command = positional.front();
    invocation.args.assign(positional.begin() + 1, positional.end());

    if (!kCommands.count(invocation.command)) {
        throw UsageError("Unknown command: " + invocation.command);
    }
    if (invocation.command == "restore") {
        if (invocation.args.size() != 1) {
            throw UsageError("Usage: fc-sandbox restore <snapshot-id>");
        }
    } else if (invocation.command != "help" && !invocation.args.empty()) {
        throw UsageError("Command '" + invocation.command + "' takes no arguments");
    }

    // Flags parsed so far must survive the file, which only sets the
    // remaining fields
    if (config_file) {
        SandboxConfig from_file;
        from_file.dry_run = invocation.config.dry_run;
        from_file.verbose = invocation.config.verbose;
        bool foreground = !invocation.config.detached;
        apply_config_file(*config_file, from_file);
        if (foreground) {
            from_file.detached = false;
        }
        invocation.config = from_file;
    }
    for (const auto& [name, value] : options) {
        apply_option(invocation.config, name, value);
    }

    return invocation;
}

int CLI::run(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; i++) {
        args.push_back(argv[i]);
    }

    Invocation invocation;
    try {
        invocation = parse(args);
    } catch (const UsageError& e) {
        error(std::string(e.what()) + ". Use 'fc-sandbox help' for usage.");
        return 2;
    } catch (const ConfigurationError& e) {
        error(e.what());
        return 1;
    }

    configure_logging(invocation.config.verbose);

    try {
        return dispatch(invocation);
    } catch (const ProcessStartFailure& e) {
        error(e.what());
        if (!e.output().empty()) {
            std::cerr << "--- console output ---" << std::endl
                      << e.output() << std::endl
                      << "----------------------" << std::endl;
        }
    } catch (const ControlPlaneFailure& e) {
        error("[" + e.step() + "] " + e.what());
        if (e.vm_paused()) {
            warn("The VM is PAUSED. Resume it with: curl --unix-socket " +
                 invocation.config.api_socket.string() +
                 " -X PATCH http://localhost/vm -d '{\"state\":\"Resumed\"}'");
        }
    } catch (const SandboxError& e) {
        error(e.what());
        spdlog::debug("Failure kind: {}", error_kind_to_string(e.kind()));
    }
    return 1;
}

int CLI::dispatch(const Invocation& invocation) {
    const std::string& cmd = invocation.command;
    if (cmd == "help") {
        return cmd_help();
    }

    const SandboxConfig& config = invocation.config;
    if (requires_root(cmd) && !config.dry_run && !check_root()) {
        return 1;
    }

    runner_ = runner_factory_(RunnerOptions{config.dry_run, config.verbose});
    LifecycleOrchestrator sandbox(*runner_, config);

    int rc = 0;
    if (cmd == "activate") {
        rc = cmd_activate(sandbox);
    } else if (cmd == "deactivate") {
        rc = cmd_deactivate(sandbox);
    } else if (cmd == "net-up") {
        rc = cmd_net_up(sandbox);
    } else if (cmd == "net-down") {
        rc = cmd_net_down(sandbox);
    } else if (cmd == "start") {
        rc = cmd_start(sandbox);
    } else if (cmd == "stop") {
        rc = cmd_stop(sandbox);
    } else if (cmd == "login") {
        rc = cmd_login(sandbox);
    } else if (cmd == "setup") {
        rc = cmd_setup(sandbox);
    } else if (cmd == "teardown") {
        rc = cmd_teardown(sandbox);
    } else if (cmd == "restore") {
        rc = cmd_restore(sandbox, invocation.args.front());
    } else if (cmd == "snapshot") {
        rc = cmd_snapshot(sandbox);
    } else if (cmd == "snapshots") {
        rc = cmd_snapshots(sandbox);
    } else if (cmd == "list-vms") {
        rc = cmd_list_vms(sandbox);
    } else if (cmd == "net-info") {
        rc = cmd_net_info(sandbox);
    } else if (cmd == "status") {
        rc = cmd_status(sandbox);
    }

    if (runner_->dry_run()) {
        info("Dry run: " + std::to_string(runner_->recorded().size()) +
             " command(s) recorded, nothing was changed");
    }
    return rc;
}

void CLI::report_started(const VmProcessHandle& handle) {
    if (handle.already_running) {
        warn("Firecracker already running (pid " + std::to_string(*handle.pid) + ")");
        return;
    }
    if (!handle.session) {
        info("Firecracker exited");
        return;
    }
    if (handle.pid) {
        success("Firecracker started (pid " + std::to_string(*handle.pid) + ")");
    } else {
        info("Firecracker would start in screen session '" + *handle.session + "'");
    }
    info("Console log: " + handle.log_file->string());
    info("Attach with 'fc-sandbox login' (detach with Ctrl-A D)");
}

int CLI::cmd_activate(LifecycleOrchestrator& sandbox) {
    sandbox.activate();
    success("Firecracker API socket ready at " + sandbox.config().api_socket.string());
    return 0;
}

int CLI::cmd_deactivate(LifecycleOrchestrator& sandbox) {
    sandbox.deactivate();
    success("Firecracker API socket removed");
    return 0;
}

int CLI::cmd_net_up(LifecycleOrchestrator& sandbox) {
    const auto& net = sandbox.config().network;
    info("Setting up " + net.device + " (" + net.host_cidr + ")");
    auto state = sandbox.net_up();
    success("Network ready: " + net.device + " -> " + net.guest_ip +
            ", NAT via " + state.uplink);
    return 0;
}

int CLI::cmd_net_down(LifecycleOrchestrator& sandbox) {
    info("Removing " + sandbox.config().network.device + " and its firewall rules");
    sandbox.net_down();
    success("Network removed");
    return 0;
}

int CLI::cmd_start(LifecycleOrchestrator& sandbox) {
    info("Starting Firecracker with " + sandbox.config().boot_config.string());
    report_started(sandbox.start());
    return 0;
}

int CLI::cmd_stop(LifecycleOrchestrator& sandbox) {
    sandbox.stop();
    success("Firecracker stopped");
    return 0;
}

int CLI::cmd_login(LifecycleOrchestrator& sandbox) {
    sandbox.attach();
    return 0;
}

int CLI::cmd_setup(LifecycleOrchestrator& sandbox) {
    info("Setting up sandbox");
    report_started(sandbox.setup());
    const auto& net = sandbox.config().network;
    success("Sandbox is up. Guest address " + net.guest_ip + " via " + net.device);
    return 0;
}

int CLI::cmd_teardown(LifecycleOrchestrator& sandbox) {
    info("Tearing down sandbox");
    sandbox.teardown();
    success("Sandbox torn down");
    return 0;
}

int CLI::cmd_restore(LifecycleOrchestrator& sandbox, const std::string& id) {
    auto handle = sandbox.restore(id);
    std::string pid = handle.pid ? " (pid " + std::to_string(*handle.pid) + ")" : "";
    success("Restored snapshot " + id + pid);
    return 0;
}

int CLI::cmd_snapshot(LifecycleOrchestrator& sandbox) {
    auto record = sandbox.snapshot();
    success("Snapshot " + record.id + " written to " + record.directory.string());
    info("Restore with: fc-sandbox restore " + record.id);
    return 0;
}

int CLI::cmd_snapshots(LifecycleOrchestrator& sandbox) {
    info("Snapshots in " + sandbox.config().snapshots_dir.string() + ":");
    auto ids = sandbox.list_snapshots();
    if (ids.empty()) {
        std::cout << "  (no snapshots)" << std::endl;
    }
    for (const auto& id : ids) {
        std::cout << "  " << id << std::endl;
    }
    return 0;
}

int CLI::cmd_list_vms(LifecycleOrchestrator& sandbox) {
    auto instances = sandbox.list_vms();
    if (instances.empty()) {
        info("No Firecracker processes running");
        return 0;
    }

    std::cout << std::left
              << std::setw(10) << "PID"
              << std::setw(36) << "API SOCKET"
              << "CONFIG" << std::endl;
    std::cout << std::left
              << std::setw(10) << "---"
              << std::setw(36) << "----------"
              << "------" << std::endl;
    for (const auto& vm : instances) {
        std::cout << std::left
                  << std::setw(10) << vm.pid
                  << std::setw(36) << (vm.api_socket.empty() ? "-" : vm.api_socket)
                  << (vm.config_file.empty() ? "-" : vm.config_file)
                  << std::endl;
    }
    return 0;
}

int CLI::cmd_net_info(LifecycleOrchestrator& sandbox) {
    const auto& net = sandbox.config().network;
    auto net_info = sandbox.net_info();

    info("Device " + net.device + ":");
    if (net_info.device_present) {
        std::cout << net_info.device_details;
        if (!net_info.device_details.empty() && net_info.device_details.back() != '\n') {
            std::cout << std::endl;
        }
    } else {
        std::cout << "  (not present)" << std::endl;
    }

    std::cout << std::endl;
    info(std::string("IP forwarding: ") + (net_info.ip_forwarding ? "enabled" : "disabled"));

    std::cout << std::endl;
    info("NAT rules (" + net.nat_chain + "):");
    if (net_info.nat_rules.empty()) {
        std::cout << "  (none)" << std::endl;
    }
    for (const auto& rule : net_info.nat_rules) {
        std::cout << "  " << rule << std::endl;
    }

    std::cout << std::endl;
    info("Forward rules (" + net.forward_chain + "):");
    if (net_info.forward_rules.empty()) {
        std::cout << "  (none)" << std::endl;
    }
    for (const auto& rule : net_info.forward_rules) {
        std::cout << "  " << rule << std::endl;
    }
    return 0;
}

int CLI::cmd_status(LifecycleOrchestrator& sandbox) {
    const auto& config = sandbox.config();
    auto status = sandbox.status();

    std::cout << std::left
              << std::setw(16) << "RUNNING" << yes_no(status.running) << std::endl
              << std::setw(16) << "PID"
              << (status.pid() ? std::to_string(*status.pid()) : "-") << std::endl
              << std::setw(16) << "SCREEN SESSION"
              << (status.session_active ? config.session_name : "-") << std::endl
              << std::setw(16) << "API SOCKET"
              << config.api_socket.string()
              << (status.socket_present ? "" : " (missing)") << std::endl
              << std::setw(16) << "BOOT CONFIG" << config.boot_config.string() << std::endl;
    return 0;
}

int CLI::cmd_help() {
    std::cout << R"(fc-sandbox - Manage a Firecracker microVM sandbox

USAGE:
  fc-sandbox [options] <command> [arguments]

COMMANDS:
  setup                 Network up, API socket, start the VM
  teardown              Stop the VM, remove the network and API socket
  restore <id>          Replace the running VM with a snapshot
  snapshot              Pause, snapshot and resume the running VM
  snapshots             List snapshots
  activate              Create the API socket
  deactivate            Remove the API socket
  net-up                Create the tap device and NAT rules
  net-down              Remove the tap device and NAT rules
  start                 Start the VM
  stop                  Stop the VM
  login                 Attach to the VM console
  status                Show whether the VM is running
  list-vms              List every Firecracker process on the host
  net-info              Show the device, forwarding and firewall state
  help                  Show this help

OPTIONS:
  --config <file>       JSON file with defaults for the options below
  --socket <path>       API socket (default /tmp/firecracker.socket)
  --device <name>       Tap device (default tap0)
  --host-ip <cidr>      Host address (default 192.168.1.1/24)
  --guest-ip <ip>       Guest address (default 192.168.1.2)
  --uplink <iface>      Uplink interface (default: from the default route)
  --boot-config <file>  Firecracker config (default vm-config.json)
                        (alias --config-file)
  --snapshots-dir <dir> Snapshot directory (default snapshots)
  --foreground          Run the VM in this terminal instead of screen
  -n, --dry-run         Print the commands instead of running them
  -v, --verbose         Echo every command

EXAMPLES:
  # Bring everything up and attach to the console
  sudo fc-sandbox setup
  sudo fc-sandbox login

  # Checkpoint and roll back
  sudo fc-sandbox snapshot
  sudo fc-sandbox restore 20250101-120000

  # See what teardown would do
  fc-sandbox --dry-run teardown

EXIT CODES:
  0 success, 1 failure, 2 usage error
)";
    return 0;
}

} // namespace fcsandbox
