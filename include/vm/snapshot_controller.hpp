#pragma once

#include "core/config.hpp"
#include "runner/command_runner.hpp"
#include "vm/control_plane_client.hpp"
#include "vm/vm_supervisor.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace fcsandbox {

/**
 * SnapshotPhase - Where the VM is in a snapshot cycle
 */
enum class SnapshotPhase {
    Running,
    Paused,
    SnapshotWritten,
    Resumed
};

/// Get phase name as string
std::string phase_to_string(SnapshotPhase phase);

/**
 * SnapshotRecord - One snapshot directory
 */
struct SnapshotRecord {
    std::string id;
    std::filesystem::path directory;
    std::filesystem::path memory_file;    // "memory", guest memory image
    std::filesystem::path state_file;     // "mem_dump", hypervisor state
    std::filesystem::path boot_config;    // "vm-config.json"
    std::filesystem::path metadata_file;  // "metadata.txt"
    std::optional<std::filesystem::path> rootfs;
    std::string root_drive_id;
    std::optional<std::filesystem::path> kernel;
    std::optional<int> source_pid;
};

/**
 * SnapshotController - Pause / snapshot / resume cycle of a running VM and
 * the snapshot directory it produces
 *
 * Talks to the VM only through the control socket. The supervisor is
 * consulted solely to check that a VM is running.
 */
class SnapshotController {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    /**
     * Constructor
     * @param runner Command runner
     * @param supervisor Used to check that a VM is running
     * @param config Invocation config (socket, boot config, snapshots dir)
     * @param clock Time source for snapshot identifiers
     */
    SnapshotController(CommandRunner& runner,
                       VmProcessSupervisor& supervisor,
                       const SandboxConfig& config,
                       Clock clock = std::chrono::system_clock::now);

    /**
     * Take a snapshot of the running VM
     *
     * Pauses the VM, writes memory and state files into a new timestamped
     * directory, resumes the VM, then copies the boot config, rootfs and
     * kernel alongside and writes metadata.txt. A failed snapshot request
     * still attempts the resume.
     *
     * @return The new snapshot
     * @throws VmNotRunningError if no VM is running
     * @throws ConfigurationError if the boot config or its images are missing
     * @throws ControlPlaneFailure naming the failed step and pause state
     */
    SnapshotRecord snapshot();

    /**
     * Snapshot identifiers in the snapshot directory, oldest first
     */
    std::vector<std::string> list() const;

    /**
     * Find a snapshot and check it holds everything a restore needs
     * @param id Snapshot identifier
     * @return Snapshot record
     * @throws ConfigurationError naming the missing piece (memory, state,
     *         boot config or rootfs copy) and listing the available
     *         identifiers
     */
    SnapshotRecord locate(const std::string& id) const;

    /**
     * Load a snapshot into a freshly started (resume mode) hypervisor,
     * switch its root drive to the snapshot's rootfs copy and resume it
     * @throws ControlPlaneFailure naming the failed step and pause state
     */
    void load(const SnapshotRecord& record);

    /**
     * Phase reached by the last snapshot cycle
     */
    SnapshotPhase phase() const { return phase_; }

    /// Identifier for a creation time, "YYYYMMDD-HHMMSS" in UTC
    static std::string format_id(std::chrono::system_clock::time_point time);

private:
    void advance(SnapshotPhase phase);
    std::string next_id() const;
    std::string available_list() const;
    static std::string iso_time(std::chrono::system_clock::time_point time);

    CommandRunner& runner_;
    VmProcessSupervisor& supervisor_;
    const SandboxConfig& config_;
    ControlPlaneClient client_;
    Clock clock_;
    SnapshotPhase phase_ = SnapshotPhase::Running;
};

} // namespace fcsandbox
