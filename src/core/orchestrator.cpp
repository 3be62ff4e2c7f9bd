#include "core/orchestrator.hpp"
#include "vm/boot_config.hpp"

#include <spdlog/spdlog.h>

namespace fcsandbox {

LifecycleOrchestrator::LifecycleOrchestrator(CommandRunner& runner,
                                             const SandboxConfig& config,
                                             SnapshotController::Clock clock)
    : config_(config),
      network_(runner),
      socket_(runner),
      supervisor_(runner, config),
      snapshots_(runner, supervisor_, config, std::move(clock)) {
    validate(config_);
}

VmProcessHandle LifecycleOrchestrator::setup() {
    // A broken boot config must fail before anything on the host changes
    BootConfig::load(config_.boot_config);

    network_.bring_up(config_.network);

    auto running = supervisor_.find_pids();
    if (!running.empty()) {
        spdlog::info("Firecracker already running (pid {}), leaving socket and process alone",
                     running.front());
        VmProcessHandle handle;
        handle.pid = running.front();
        handle.boot_config = config_.boot_config;
        handle.already_running = true;
        return handle;
    }

    socket_.activate(config_.api_socket);
    return supervisor_.start(config_.boot_config, config_.api_socket, config_.detached);
}

void LifecycleOrchestrator::teardown() {
    supervisor_.stop();
    network_.tear_down(config_.network);
    socket_.deactivate(config_.api_socket);
}

VmProcessHandle LifecycleOrchestrator::restore(const std::string& id) {
    auto record = snapshots_.locate(id);
    spdlog::info("Restoring snapshot {} from {}", record.id, record.directory.string());

    supervisor_.stop();
    network_.tear_down(config_.network);
    network_.bring_up(config_.network);
    socket_.activate(config_.api_socket);

    auto handle = supervisor_.start(record.boot_config, config_.api_socket, true, StartMode::Resume);
    snapshots_.load(record);
    return handle;
}

NetworkState LifecycleOrchestrator::net_up() {
    return network_.bring_up(config_.network);
}

void LifecycleOrchestrator::net_down() {
    network_.tear_down(config_.network);
}

void LifecycleOrchestrator::activate() {
    socket_.activate(config_.api_socket);
}

void LifecycleOrchestrator::deactivate() {
    socket_.deactivate(config_.api_socket);
}

VmProcessHandle LifecycleOrchestrator::start() {
    if (!ControlSocketResource::exists(config_.api_socket) && supervisor_.find_pids().empty()) {
        spdlog::warn("Firecracker API socket not found. Activating...");
        socket_.activate(config_.api_socket);
    }
    return supervisor_.start(config_.boot_config, config_.api_socket, config_.detached);
}

void LifecycleOrchestrator::stop() {
    supervisor_.stop();
}

VmStatus LifecycleOrchestrator::status() {
    return supervisor_.status();
}

void LifecycleOrchestrator::attach() {
    supervisor_.attach();
}

std::vector<VmInstance> LifecycleOrchestrator::list_vms() {
    return supervisor_.list_instances();
}

NetworkInfo LifecycleOrchestrator::net_info() {
    return network_.info(config_.network);
}

SnapshotRecord LifecycleOrchestrator::snapshot() {
    return snapshots_.snapshot();
}

std::vector<std::string> LifecycleOrchestrator::list_snapshots() const {
    return snapshots_.list();
}

} // namespace fcsandbox
