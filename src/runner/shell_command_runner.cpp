#include "runner/shell_command_runner.hpp"
#include "core/errors.hpp"
#include "utils/exec.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <fstream>

namespace fcsandbox {

std::unique_ptr<CommandRunner> CommandRunner::create_default(const RunnerOptions& options) {
    return std::make_unique<ShellCommandRunner>(options);
}

ShellCommandRunner::ShellCommandRunner(const RunnerOptions& options)
    : options_(options) {}

bool ShellCommandRunner::record(const std::string& command) {
    if (!options_.dry_run) {
        if (options_.verbose) {
            spdlog::info("+ {}", command);
        }
        return false;
    }
    recorded_.push_back(command);
    spdlog::info("[dry-run] {}", command);
    return true;
}

CommandResult ShellCommandRunner::run(const std::string& command, bool allow_failure) {
    CommandResult result;
    if (record(command)) {
        result.simulated = true;
        return result;
    }

    auto exec_result = utils::exec_shell(command);
    result.exit_code = exec_result.exit_code;
    result.output = exec_result.output;

    if (!result.succeeded()) {
        if (!allow_failure) {
            throw CommandError(command, result.exit_code, result.output);
        }
        spdlog::debug("Tolerated failure (exit {}): {}", result.exit_code, command);
        if (!result.output.empty()) {
            spdlog::debug("  {}", result.output);
        }
    }
    return result;
}

CommandResult ShellCommandRunner::query(const std::string& command) {
    if (options_.verbose) {
        spdlog::debug("? {}", command);
    }

    auto exec_result = utils::exec_shell(command);
    CommandResult result;
    result.exit_code = exec_result.exit_code;
    result.output = exec_result.output;
    return result;
}

int ShellCommandRunner::run_interactive(const std::string& command) {
    if (record(command)) {
        return 0;
    }
    return utils::exec_interactive(command);
}

void ShellCommandRunner::write_file(const std::string& path, const std::string& content) {
    if (record("write " + path + " (" + std::to_string(content.size()) + " bytes)")) {
        return;
    }

    // Write to temp file first, then rename for atomicity
    std::string temp_path = path + ".tmp";
    std::ofstream file(temp_path, std::ios::trunc);
    if (!file) {
        throw CommandError("write " + path, -1, "cannot open " + temp_path);
    }
    file << content;
    file.close();
    if (!file) {
        std::remove(temp_path.c_str());
        throw CommandError("write " + path, -1, "write to " + temp_path + " failed");
    }

    if (std::rename(temp_path.c_str(), path.c_str()) != 0) {
        std::remove(temp_path.c_str());
        throw CommandError("write " + path, -1, "rename from " + temp_path + " failed");
    }
}

bool ShellCommandRunner::dry_run() const {
    return options_.dry_run;
}

const std::vector<std::string>& ShellCommandRunner::recorded() const {
    return recorded_;
}

} // namespace fcsandbox
