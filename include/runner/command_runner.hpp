#pragma once

#include <memory>
#include <string>
#include <vector>

namespace fcsandbox {

/**
 * CommandResult - Outcome of one host command
 */
struct CommandResult {
    int exit_code = 0;
    std::string output;       // combined stdout/stderr
    bool simulated = false;   // recorded in dry-run, never executed

    bool succeeded() const { return exit_code == 0; }
};

/**
 * RunnerOptions - Invocation-wide execution flags
 */
struct RunnerOptions {
    bool dry_run = false;
    bool verbose = false;
};

/**
 * CommandRunner - Abstract interface for host command execution
 *
 * Every component performs its OS interaction through this interface so
 * dry-run and verbose behave the same everywhere.
 */
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    /**
     * Run a command that changes host state
     *
     * In dry-run mode the command is only recorded and reported as a
     * simulated success.
     *
     * @param command Shell command line
     * @param allow_failure Treat a non-zero exit as expected (e.g. removing
     *        something that is already gone); the result is returned
     *        instead of raised
     * @return CommandResult
     * @throws CommandError on non-zero exit when allow_failure is false
     */
    virtual CommandResult run(const std::string& command, bool allow_failure = false) = 0;

    /**
     * Run a read-only probe
     *
     * Probes mutate nothing, so they execute in dry-run mode as well.
     * A non-zero exit is returned, never raised.
     *
     * @param command Shell command line
     * @return CommandResult
     */
    virtual CommandResult query(const std::string& command) = 0;

    /**
     * Run a command in the foreground, attached to the caller's terminal
     * @param command Shell command line
     * @return Exit code (0 in dry-run)
     */
    virtual int run_interactive(const std::string& command) = 0;

    /**
     * Create or replace a regular file
     * @param path File path
     * @param content File content
     * @throws CommandError if the file cannot be written
     */
    virtual void write_file(const std::string& path, const std::string& content) = 0;

    /**
     * Check whether mutations are only being recorded
     */
    virtual bool dry_run() const = 0;

    /**
     * Commands recorded so far in dry-run mode
     */
    virtual const std::vector<std::string>& recorded() const = 0;

    /**
     * Factory method to create the default (shell) runner
     */
    static std::unique_ptr<CommandRunner> create_default(const RunnerOptions& options);
};

} // namespace fcsandbox
