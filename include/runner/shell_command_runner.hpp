#pragma once

#include "command_runner.hpp"

namespace fcsandbox {

/**
 * ShellCommandRunner - CommandRunner backed by /bin/sh
 */
class ShellCommandRunner : public CommandRunner {
public:
    explicit ShellCommandRunner(const RunnerOptions& options = RunnerOptions{});

    CommandResult run(const std::string& command, bool allow_failure = false) override;
    CommandResult query(const std::string& command) override;
    int run_interactive(const std::string& command) override;
    void write_file(const std::string& path, const std::string& content) override;
    bool dry_run() const override;
    const std::vector<std::string>& recorded() const override;

private:
    /**
     * Record a command in dry-run mode
     * @return true if the command must not be executed
     */
    bool record(const std::string& command);

    RunnerOptions options_;
    std::vector<std::string> recorded_;
};

} // namespace fcsandbox
