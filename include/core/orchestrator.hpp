#pragma once

#include "core/config.hpp"
#include "resources/control_socket.hpp"
#include "resources/network_resource.hpp"
#include "runner/command_runner.hpp"
#include "vm/snapshot_controller.hpp"
#include "vm/vm_supervisor.hpp"

#include <string>
#include <vector>

namespace fcsandbox {

/**
 * LifecycleOrchestrator - Named lifecycle commands over the sandbox
 * resources, each with a fixed ordering
 *
 *   setup    = network up -> socket activate -> VM start
 *   teardown = VM stop -> network down -> socket deactivate
 *   restore  = locate snapshot -> VM stop -> network down -> network up
 *              -> socket activate -> VM start (resume) -> snapshot load
 *
 * Every step is idempotent, so each command can be re-run after a
 * partial failure and converges to the same end state.
 */
class LifecycleOrchestrator {
public:
    /**
     * Constructor
     * @param runner Command runner shared by all resources
     * @param config Invocation config, must outlive the orchestrator
     * @param clock Time source for snapshot identifiers
     * @throws ConfigurationError if the config is invalid
     */
    LifecycleOrchestrator(CommandRunner& runner,
                          const SandboxConfig& config,
                          SnapshotController::Clock clock = std::chrono::system_clock::now);

    /**
     * Bring the whole sandbox up
     *
     * When a VM already runs on the socket the network is still converged
     * but the socket and process are left alone.
     *
     * @return Handle of the VM process
     */
    VmProcessHandle setup();

    /**
     * Stop the VM and remove the network and socket
     *
     * Safe when nothing was ever set up.
     */
    void teardown();

    /**
     * Replace the running sandbox with one resumed from a snapshot
     * @param id Snapshot identifier
     * @return Handle of the resumed VM process
     * @throws ConfigurationError before touching anything if the snapshot
     *         is missing or incomplete
     */
    VmProcessHandle restore(const std::string& id);

    // Single-resource commands
    NetworkState net_up();
    void net_down();
    void activate();
    void deactivate();

    /**
     * Start the VM, activating the socket first if it is missing
     */
    VmProcessHandle start();
    void stop();
    VmStatus status();
    void attach();
    std::vector<VmInstance> list_vms();
    NetworkInfo net_info();
    SnapshotRecord snapshot();
    std::vector<std::string> list_snapshots() const;

    const SandboxConfig& config() const { return config_; }

private:
    const SandboxConfig& config_;
    NetworkResource network_;
    ControlSocketResource socket_;
    VmProcessSupervisor supervisor_;
    SnapshotController snapshots_;
};

} // namespace fcsandbox
