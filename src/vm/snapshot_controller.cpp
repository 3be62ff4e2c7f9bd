#include "vm/snapshot_controller.hpp"
#include "core/errors.hpp"
#include "utils/exec.hpp"
#include "vm/boot_config.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace fcsandbox {

namespace fs = std::filesystem;
using utils::shell_quote;

namespace {

const char* kMemoryFile = "memory";
const char* kStateFile = "mem_dump";
const char* kBootConfigFile = "vm-config.json";
const char* kMetadataFile = "metadata.txt";

std::tm utc(std::chrono::system_clock::time_point time) {
    std::time_t t = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
    gmtime_r(&t, &tm);
    return tm;
}

std::string first_line(const std::string& s) {
    auto end = s.find('\n');
    return end == std::string::npos ? s : s.substr(0, end);
}

}  // anonymous namespace

std::string phase_to_string(SnapshotPhase phase) {
    switch (phase) {
        case SnapshotPhase::Running: return "running";
        case SnapshotPhase::Paused: return "paused";
        case SnapshotPhase::SnapshotWritten: return "snapshot-written";
        case SnapshotPhase::Resumed: return "resumed";
    }
    return "unknown";
}

SnapshotController::SnapshotController(CommandRunner& runner,
                                       VmProcessSupervisor& supervisor,
                                       const SandboxConfig& config,
                                       Clock clock)
    : runner_(runner),
      supervisor_(supervisor),
      config_(config),
      client_(runner, config.api_socket),
      clock_(std::move(clock)) {}

void SnapshotController::advance(SnapshotPhase phase) {
    spdlog::debug("Snapshot phase: {} -> {}", phase_to_string(phase_), phase_to_string(phase));
    phase_ = phase;
}

std::string SnapshotController::format_id(std::chrono::system_clock::time_point time) {
    std::tm tm = utc(time);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y%m%d-%H%M%S");
    return ss.str();
}

std::string SnapshotController::iso_time(std::chrono::system_clock::time_point time) {
    std::tm tm = utc(time);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

std::string SnapshotController::next_id() const {
    std::string base = format_id(clock_());
    std::string id = base;
    for (int n = 1; fs::exists(config_.snapshots_dir / id); n++) {
        id = base + "-" + std::to_string(n);
    }
    return id;
}

std::vector<std::string> SnapshotController::list() const {
    std::vector<std::string> ids;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(config_.snapshots_dir, ec)) {
        if (entry.is_directory()) {
            ids.push_back(entry.path().filename().string());
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::string SnapshotController::available_list() const {
    auto ids = list();
    if (ids.empty()) {
        return "Available snapshots: (none)";
    }
    std::string msg = "Available snapshots:";
    for (const auto& id : ids) {
        msg += "\n  " + id;
    }
    return msg;
}

SnapshotRecord SnapshotController::locate(const std::string& id) const {
    if (id.empty() || id.find('/') != std::string::npos || id == "." || id == "..") {
        throw ConfigurationError("Invalid snapshot identifier '" + id + "'\n" + available_list());
    }

    SnapshotRecord record;
    record.id = id;
    record.directory = config_.snapshots_dir / id;
    record.memory_file = record.directory / kMemoryFile;
    record.state_file = record.directory / kStateFile;
    record.boot_config = record.directory / kBootConfigFile;
    record.metadata_file = record.directory / kMetadataFile;

    if (!fs::is_directory(record.directory)) {
        throw ConfigurationError("Snapshot '" + id + "' not found in " +
                                 config_.snapshots_dir.string() + "\n" + available_list());
    }

    std::vector<std::string> missing;
    for (const auto& path : {record.boot_config, record.memory_file, record.state_file}) {
        if (!fs::exists(path)) {
            missing.push_back(path.filename().string());
        }
    }
    if (!missing.empty()) {
        std::string names;
        for (const auto& name : missing) {
            names += (names.empty() ? "" : ", ") + name;
        }
        throw ConfigurationError("Snapshot '" + id + "' is incomplete, missing: " + names +
                                 "\n" + available_list());
    }

    auto boot = BootConfig::load(record.boot_config);
    if (!fs::exists(boot.rootfs_path)) {
        throw ConfigurationError("Snapshot '" + id + "' is incomplete, missing: " +
                                 fs::path(boot.rootfs_path).filename().string() +
                                 "\n" + available_list());
    }
    if (boot.root_drive_id.empty()) {
        throw ConfigurationError("Snapshot '" + id + "': root drive in " +
                                 record.boot_config.string() + " has no drive_id");
    }
    record.rootfs = boot.rootfs_path;
    record.kernel = boot.kernel_image_path;
    record.root_drive_id = boot.root_drive_id;
    return record;
}

SnapshotRecord SnapshotController::snapshot() {
    phase_ = SnapshotPhase::Running;

    auto status = supervisor_.status();
    if (!status.running) {
        throw VmNotRunningError("Nothing to snapshot: no Firecracker VM running on " +
                                config_.api_socket.string());
    }

    // Everything that can be checked up front is, so the VM is never paused
    // for a snapshot that cannot complete
    auto boot = BootConfig::load(config_.boot_config);
    for (const auto& image : {boot.rootfs_path, boot.kernel_image_path}) {
        if (!fs::exists(image)) {
            throw ConfigurationError("Image " + image + " referenced by " +
                                     config_.boot_config.string() + " not found");
        }
    }

    SnapshotRecord record;
    record.id = next_id();
    record.directory = config_.snapshots_dir / record.id;
    record.memory_file = record.directory / kMemoryFile;
    record.state_file = record.directory / kStateFile;
    record.boot_config = record.directory / kBootConfigFile;
    record.metadata_file = record.directory / kMetadataFile;
    record.source_pid = status.pid();

    runner_.run("mkdir -p " + shell_quote(record.directory.string()));

    spdlog::info("Pausing VM");
    auto paused = client_.pause();
    if (!paused.ok) {
        runner_.run("rmdir " + shell_quote(record.directory.string()), true);
        throw ControlPlaneFailure("pause",
                                  "Pause request failed, VM is still running: " +
                                  first_line(paused.body),
                                  false);
    }
    advance(SnapshotPhase::Paused);

    spdlog::info("Writing snapshot to {}", record.directory.string());
    auto created = client_.create_snapshot(fs::absolute(record.memory_file),
                                          fs::absolute(record.state_file));
    if (!created.ok) {
        auto resumed = client_.resume();
        // A partial memory or state file would list as an unrestorable id
        runner_.run("rm -rf " + shell_quote(record.directory.string()), true);
        if (resumed.ok) {
            advance(SnapshotPhase::Resumed);
            throw ControlPlaneFailure("snapshot-create",
                                      "Snapshot request failed: " + first_line(created.body) +
                                      " (VM was resumed)",
                                      false);
        }
        throw ControlPlaneFailure("snapshot-create",
                                  "Snapshot request failed: " + first_line(created.body) +
                                  "; resume also failed: " + first_line(resumed.body) +
                                  " (VM is left PAUSED)",
                                  true);
    }
    advance(SnapshotPhase::SnapshotWritten);

    spdlog::info("Resuming VM");
    auto resumed = client_.resume();
    if (!resumed.ok) {
        throw ControlPlaneFailure("resume",
                                  "Snapshot written to " + record.directory.string() +
                                  " but resume failed: " + first_line(resumed.body) +
                                  " (VM is left PAUSED)",
                                  true);
    }
    advance(SnapshotPhase::Resumed);

    // The copied config points at the copied images so the directory is
    // self-contained
    fs::path rootfs_copy = fs::absolute(record.directory / fs::path(boot.rootfs_path).filename());
    fs::path kernel_copy = fs::absolute(record.directory / fs::path(boot.kernel_image_path).filename());
    runner_.run("cp --sparse=always " + shell_quote(boot.rootfs_path) + " " +
                shell_quote(rootfs_copy.string()));
    runner_.run("cp " + shell_quote(boot.kernel_image_path) + " " +
                shell_quote(kernel_copy.string()));
    record.rootfs = rootfs_copy;
    record.kernel = kernel_copy;

    runner_.write_file(record.boot_config.string(),
                       boot.relocated(kernel_copy.string(), rootfs_copy.string()).dump(2) + "\n");

    std::ostringstream metadata;
    metadata << "id: " << record.id << "\n"
             << "created: " << iso_time(clock_()) << "\n"
             << "source_pid: "
             << (record.source_pid ? std::to_string(*record.source_pid) : "unknown") << "\n"
             << "boot_config: " << fs::absolute(config_.boot_config).string() << "\n"
             << "api_socket: " << config_.api_socket.string() << "\n"
             << "rootfs: " << rootfs_copy.filename().string() << "\n"
             << "kernel: " << kernel_copy.filename().string() << "\n";
    runner_.write_file(record.metadata_file.string(), metadata.str());

    return record;
}

void SnapshotController::load(const SnapshotRecord& record) {
    spdlog::info("Loading snapshot {}", record.id);
    auto loaded = client_.load_snapshot(fs::absolute(record.memory_file),
                                        fs::absolute(record.state_file));
    if (!loaded.ok) {
        throw ControlPlaneFailure("snapshot-load",
                                  "Loading snapshot '" + record.id + "' failed: " +
                                  first_line(loaded.body),
                                  false);
    }

    // The guest memory expects the disk as it was when the snapshot was taken
    if (record.rootfs) {
        auto rootfs = fs::absolute(*record.rootfs);
        spdlog::info("Attaching root drive {} from {}", record.root_drive_id, rootfs.string());
        auto patched = client_.update_drive(record.root_drive_id, rootfs);
        if (!patched.ok) {
            throw ControlPlaneFailure("drive-update",
                                      "Switching root drive to " + rootfs.string() + " failed: " +
                                      first_line(patched.body) + " (VM is left PAUSED)",
                                      true);
        }
    }

    spdlog::info("Resuming VM");
    auto resumed = client_.resume();
    if (!resumed.ok) {
        throw ControlPlaneFailure("resume",
                                  "Snapshot '" + record.id + "' loaded but resume failed: " +
                                  first_line(resumed.body) + " (VM is left PAUSED)",
                                  true);
    }
}

} // namespace fcsandbox
