#pragma once

#include <stdexcept>
#include <string>

namespace fcsandbox {

/// Category of a sandbox failure
enum class ErrorKind {
    Configuration,     // bad flags/config, no uplink, missing snapshot
    ProcessStart,      // hypervisor did not come up
    ControlPlane,      // a pause/snapshot/resume/load request failed
    VmNotRunning,      // operation needs a running VM
    Command            // a non-tolerated host command failed
};

/// Get error kind as string
std::string error_kind_to_string(ErrorKind kind);

/// Base exception for fc-sandbox errors
class SandboxError : public std::runtime_error {
public:
    SandboxError(ErrorKind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class ConfigurationError : public SandboxError {
public:
    explicit ConfigurationError(const std::string& msg)
        : SandboxError(ErrorKind::Configuration, msg) {}
};

/// The hypervisor failed to start; carries its captured console output
class ProcessStartFailure : public SandboxError {
public:
    ProcessStartFailure(const std::string& msg, std::string output)
        : SandboxError(ErrorKind::ProcessStart, msg), output_(std::move(output)) {}

    const std::string& output() const { return output_; }

private:
    std::string output_;
};

/// A control-plane step failed; records whether the VM was left paused
class ControlPlaneFailure : public SandboxError {
public:
    ControlPlaneFailure(const std::string& step, const std::string& msg, bool vm_paused)
        : SandboxError(ErrorKind::ControlPlane, msg), step_(step), vm_paused_(vm_paused) {}

    const std::string& step() const { return step_; }
    bool vm_paused() const { return vm_paused_; }

private:
    std::string step_;
    bool vm_paused_;
};

class VmNotRunningError : public SandboxError {
public:
    explicit VmNotRunningError(const std::string& msg)
        : SandboxError(ErrorKind::VmNotRunning, msg) {}
};

/// A host command exited non-zero where failure was not tolerated
class CommandError : public SandboxError {
public:
    CommandError(const std::string& command, int exit_code, const std::string& output)
        : SandboxError(ErrorKind::Command,
                       "Command failed (exit " + std::to_string(exit_code) + "): " + command +
                       (output.empty() ? "" : "\n" + output)),
          command_(command), exit_code_(exit_code) {}

    const std::string& command() const { return command_; }
    int exit_code() const { return exit_code_; }

private:
    std::string command_;
    int exit_code_;
};

} // namespace fcsandbox
