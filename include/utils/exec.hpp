#pragma once

#include <string>
#include <optional>

namespace fcsandbox {
namespace utils {

/**
 * ExecResult - Result of executing a shell command
 */
struct ExecResult {
    int exit_code;
    std::string output;  // stdout and stderr interleaved
};

/**
 * Execute a command line with /bin/sh and capture combined output
 * @param command Shell command line
 * @return ExecResult with exit code (-1 if the shell could not be run
 *         or was killed by a signal) and output
 */
ExecResult exec_shell(const std::string& command);

/**
 * Execute a command line with /bin/sh, sharing the caller's terminal
 * @param command Shell command line
 * @return Exit code, -1 if the shell could not be run
 */
int exec_interactive(const std::string& command);

/**
 * Quote a single argument for safe interpolation into a shell command
 * @param arg Raw argument
 * @return Argument wrapped in single quotes when needed
 */
std::string shell_quote(const std::string& arg);

/**
 * Find a command in PATH
 * @param command Command name
 * @return Full path if found
 */
std::optional<std::string> which(const std::string& command);

} // namespace utils
} // namespace fcsandbox
