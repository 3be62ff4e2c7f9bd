#pragma once

#include "core/config.hpp"
#include "core/orchestrator.hpp"
#include "runner/command_runner.hpp"

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace fcsandbox {

/// Malformed command line (exit code 2)
class UsageError : public std::invalid_argument {
public:
    explicit UsageError(const std::string& msg) : std::invalid_argument(msg) {}
};

/**
 * Invocation - Parsed command line
 */
struct Invocation {
    SandboxConfig config;
    std::string command;
    std::vector<std::string> args;
};

/**
 * CLI - Command line interface for fc-sandbox
 *
 * fc-sandbox [global options] <command> [args]
 */
class CLI {
public:
    using RunnerFactory = std::function<std::unique_ptr<CommandRunner>(const RunnerOptions&)>;

    /**
     * Constructor
     * @param runner_factory Builds the command runner once the global
     *        options are known
     */
    explicit CLI(RunnerFactory runner_factory = CommandRunner::create_default);

    ~CLI() = default;

    /**
     * Run the CLI with command line arguments
     * @param argc Argument count
     * @param argv Argument vector
     * @return Exit code (0 success, 1 failure, 2 usage error)
     */
    int run(int argc, char* argv[]);

    /**
     * Parse arguments (without the program name)
     *
     * Options may appear anywhere and take either `--opt value` or
     * `--opt=value`. The --config file is applied before the other flags
     * so flags always win.
     *
     * @throws UsageError on unknown options, missing values or a wrong
     *         argument count
     * @throws ConfigurationError if the config file cannot be read
     */
    static Invocation parse(const std::vector<std::string>& args);

    /**
     * Runner used by the last run() call
     */
    const CommandRunner* runner() const { return runner_.get(); }

private:
    // Command implementations
    int cmd_activate(LifecycleOrchestrator& sandbox);
    int cmd_deactivate(LifecycleOrchestrator& sandbox);
    int cmd_net_up(LifecycleOrchestrator& sandbox);
    int cmd_net_down(LifecycleOrchestrator& sandbox);
    int cmd_start(LifecycleOrchestrator& sandbox);
    int cmd_stop(LifecycleOrchestrator& sandbox);
    int cmd_login(LifecycleOrchestrator& sandbox);
    int cmd_setup(LifecycleOrchestrator& sandbox);
    int cmd_teardown(LifecycleOrchestrator& sandbox);
    int cmd_restore(LifecycleOrchestrator& sandbox, const std::string& id);
    int cmd_snapshot(LifecycleOrchestrator& sandbox);
    int cmd_snapshots(LifecycleOrchestrator& sandbox);
    int cmd_list_vms(LifecycleOrchestrator& sandbox);
    int cmd_net_info(LifecycleOrchestrator& sandbox);
    int cmd_status(LifecycleOrchestrator& sandbox);
    int cmd_help();

    int dispatch(const Invocation& invocation);
    void report_started(const VmProcessHandle& handle);

    // Output helpers
    void info(const std::string& msg) const;
    void success(const std::string& msg) const;
    void warn(const std::string& msg) const;
    void error(const std::string& msg) const;

    // Check if running as root
    bool check_root() const;

    static void configure_logging(bool verbose);
    static bool requires_root(const std::string& command);

    RunnerFactory runner_factory_;
    std::unique_ptr<CommandRunner> runner_;
    bool use_colors_ = true;
};

} // namespace fcsandbox
