#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace fcsandbox {

/// Host-side network identity of one sandbox
struct NetworkConfig {
    std::string device = "tap0";
    std::string host_cidr = "192.168.1.1/24";
    std::string guest_ip = "192.168.1.2";
    std::string nat_chain = "FIRECRACKER-NAT";
    std::string forward_chain = "FIRECRACKER-FORWARD";
    std::optional<std::string> uplink;  // resolved from the default route when unset
};

/// Configuration for one invocation. Built once, never mutated afterwards.
struct SandboxConfig {
    NetworkConfig network;

    std::filesystem::path api_socket = "/tmp/firecracker.socket";
    std::filesystem::path boot_config = "vm-config.json";
    std::filesystem::path snapshots_dir = "snapshots";

    std::string firecracker_bin = "firecracker";
    std::string session_name = "firecracker";
    std::filesystem::path console_log = "/tmp/firecracker-console.log";
    std::filesystem::path console_socket = "/tmp/firecracker-console.sock";

    bool detached = true;
    std::chrono::milliseconds startup_timeout{5000};
    std::chrono::milliseconds poll_interval{500};
    std::chrono::milliseconds stop_grace{3000};

    bool dry_run = false;
    bool verbose = false;
};

/**
 * Apply the keys of a JSON config file on top of a config
 *
 * Recognised keys: device, host_ip, guest_ip, uplink, nat_chain,
 * forward_chain, socket, boot_config, snapshots_dir, firecracker_bin,
 * session_name, console_log, console_socket, detached,
 * startup_timeout_ms, poll_interval_ms, stop_grace_ms.
 *
 * @param path JSON file
 * @param config Config to update
 * @throws ConfigurationError if the file is missing, not JSON, or holds
 *         a value of the wrong type
 */
void apply_config_file(const std::filesystem::path& path, SandboxConfig& config);

/**
 * Validate a network config
 * @throws ConfigurationError naming the offending field
 */
void validate(const NetworkConfig& network);

/**
 * Validate a full config
 * @throws ConfigurationError naming the offending field
 */
void validate(const SandboxConfig& config);

/// Host address of a CIDR ("192.168.1.1/24" -> "192.168.1.1")
std::string cidr_address(const std::string& cidr);

} // namespace fcsandbox
