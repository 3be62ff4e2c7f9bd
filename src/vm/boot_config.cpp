#include "vm/boot_config.hpp"
#include "core/errors.hpp"

#include <fstream>
#include <sstream>

namespace fcsandbox {

using json = nlohmann::json;

BootConfig BootConfig::load(const std::filesystem::path& path) {
    std::ifstream f(path);
    if (!f) {
        throw ConfigurationError("Config file " + path.string() + " not found");
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    return parse(ss.str(), path);
}

BootConfig BootConfig::parse(const std::string& text, const std::filesystem::path& source) {
    const std::string name = source.empty() ? std::string("boot config") : source.string();

    BootConfig config;
    config.source = source;

    try {
        config.document = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ConfigurationError("Invalid JSON in config file " + name + ": " + e.what());
    }

    const json& doc = config.document;
    try {
        if (!doc.is_object() || !doc.contains("boot-source")) {
            throw ConfigurationError(name + " has no \"boot-source\" section");
        }
        const json& boot = doc.at("boot-source");
        config.kernel_image_path = boot.at("kernel_image_path").get<std::string>();
        config.boot_args = boot.value("boot_args", "");

        for (const auto& drive : doc.value("drives", json::array())) {
            if (drive.value("is_root_device", false)) {
                config.rootfs_path = drive.at("path_on_host").get<std::string>();
                config.root_drive_id = drive.value("drive_id", "");
                break;
            }
        }
        if (config.rootfs_path.empty()) {
            throw ConfigurationError(name + " defines no root drive");
        }

        if (doc.contains("machine-config")) {
            const json& machine = doc.at("machine-config");
            config.vcpu_count = machine.value("vcpu_count", 0);
            config.mem_size_mib = machine.value("mem_size_mib", 0);
        }

        for (const auto& iface : doc.value("network-interfaces", json::array())) {
            config.network_interfaces.push_back({
                .iface_id = iface.value("iface_id", ""),
                .host_dev_name = iface.value("host_dev_name", ""),
                .guest_mac = iface.value("guest_mac", "")
            });
        }

        if (doc.contains("vsock") && doc.at("vsock").contains("uds_path")) {
            config.vsock_uds_path = doc.at("vsock").at("uds_path").get<std::string>();
        }
    } catch (const json::exception& e) {
        throw ConfigurationError("Malformed config file " + name + ": " + e.what());
    }

    return config;
}

json BootConfig::relocated(const std::string& kernel_path,
                           const std::string& rootfs_path) const {
    json copy = document;
    copy["boot-source"]["kernel_image_path"] = kernel_path;
    for (auto& drive : copy["drives"]) {
        if (drive.value("is_root_device", false)) {
            drive["path_on_host"] = rootfs_path;
        }
    }
    return copy;
}

bool BootConfig::binds_device(const std::string& device) const {
    for (const auto& iface : network_interfaces) {
        if (iface.host_dev_name == device) {
            return true;
        }
    }
    return false;
}

} // namespace fcsandbox
