#pragma once

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fcsandbox {

/// One entry of "network-interfaces"
struct NetworkInterfaceBinding {
    std::string iface_id;
    std::string host_dev_name;
    std::string guest_mac;
};

/**
 * BootConfig - Read-only view of a Firecracker boot configuration file
 */
struct BootConfig {
    std::filesystem::path source;
    nlohmann::json document;

    std::string kernel_image_path;
    std::string boot_args;
    std::string rootfs_path;
    std::string root_drive_id;
    int vcpu_count = 0;
    int mem_size_mib = 0;
    std::vector<NetworkInterfaceBinding> network_interfaces;
    std::optional<std::string> vsock_uds_path;

    /**
     * Load and validate a boot configuration
     * @param path JSON file
     * @return Parsed config
     * @throws ConfigurationError if the file is missing, not JSON, or lacks
     *         a kernel image or root drive
     */
    static BootConfig load(const std::filesystem::path& path);

    /**
     * Parse a boot configuration document
     * @throws ConfigurationError as load()
     */
    static BootConfig parse(const std::string& text,
                            const std::filesystem::path& source = {});

    /**
     * Copy of the document with kernel and root drive paths replaced
     * @param kernel_path New kernel image path
     * @param rootfs_path New root drive path
     */
    nlohmann::json relocated(const std::string& kernel_path,
                             const std::string& rootfs_path) const;

    /**
     * Check whether a network interface is bound to a host device
     */
    bool binds_device(const std::string& device) const;
};

} // namespace fcsandbox
