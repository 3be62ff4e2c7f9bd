#include "core/config.hpp"
#include "core/errors.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <vector>

namespace fcsandbox {

using json = nlohmann::json;

namespace {

bool parse_octet(const std::string& s) {
    if (s.empty() || s.size() > 3) return false;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    return std::stoi(s) <= 255;
}

bool is_ipv4(const std::string& ip) {
    std::vector<std::string> parts;
    std::istringstream ss(ip);
    std::string part;
    while (std::getline(ss, part, '.')) {
        parts.push_back(part);
    }
    if (parts.size() != 4 || ip.back() == '.') return false;
    for (const auto& p : parts) {
        if (!parse_octet(p)) return false;
    }
    return true;
}

template <typename T>
void read_key(const json& j, const std::string& key, T& out) {
    if (j.contains(key)) {
        out = j.at(key).get<T>();
    }
}

void read_millis(const json& j, const std::string& key, std::chrono::milliseconds& out) {
    if (j.contains(key)) {
        out = std::chrono::milliseconds(j.at(key).get<long>());
    }
}

}  // anonymous namespace

void apply_config_file(const std::filesystem::path& path, SandboxConfig& config) {
    std::ifstream f(path);
    if (!f) {
        throw ConfigurationError("Config file " + path.string() + " not found");
    }

    try {
        json j = json::parse(f);
        if (!j.is_object()) {
            throw ConfigurationError("Config file " + path.string() + " must hold a JSON object");
        }

        read_key(j, "device", config.network.device);
        read_key(j, "host_ip", config.network.host_cidr);
        read_key(j, "guest_ip", config.network.guest_ip);
        read_key(j, "nat_chain", config.network.nat_chain);
        read_key(j, "forward_chain", config.network.forward_chain);
        if (j.contains("uplink")) {
            config.network.uplink = j.at("uplink").get<std::string>();
        }

        if (j.contains("socket")) {
            config.api_socket = j.at("socket").get<std::string>();
        }
        if (j.contains("boot_config")) {
            config.boot_config = j.at("boot_config").get<std::string>();
        }
        if (j.contains("snapshots_dir")) {
            config.snapshots_dir = j.at("snapshots_dir").get<std::string>();
        }
        if (j.contains("console_log")) {
            config.console_log = j.at("console_log").get<std::string>();
        }
        if (j.contains("console_socket")) {
            config.console_socket = j.at("console_socket").get<std::string>();
        }
        read_key(j, "firecracker_bin", config.firecracker_bin);
        read_key(j, "session_name", config.session_name);
        read_key(j, "detached", config.detached);

        read_millis(j, "startup_timeout_ms", config.startup_timeout);
        read_millis(j, "poll_interval_ms", config.poll_interval);
        read_millis(j, "stop_grace_ms", config.stop_grace);
    } catch (const json::exception& e) {
        throw ConfigurationError("Invalid config file " + path.string() + ": " + e.what());
    }
}

std::string cidr_address(const std::string& cidr) {
    return cidr.substr(0, cidr.find('/'));
}

void validate(const NetworkConfig& network) {
    const auto& dev = network.device;
    if (dev.empty() || dev.size() > 15) {
        throw ConfigurationError("Device name '" + dev + "' must be 1-15 characters");
    }
    for (char c : dev) {
        if (c == '/' || c == ' ' || c == '\t' || c == ':') {
            throw ConfigurationError("Device name '" + dev + "' contains an invalid character");
        }
    }

    size_t slash = network.host_cidr.find('/');
    if (slash == std::string::npos || !is_ipv4(network.host_cidr.substr(0, slash))) {
        throw ConfigurationError("Host IP '" + network.host_cidr + "' must be of the form a.b.c.d/len");
    }
    std::string prefix = network.host_cidr.substr(slash + 1);
    bool prefix_ok = !prefix.empty() && prefix.size() <= 2 &&
                     prefix.find_first_not_of("0123456789") == std::string::npos &&
                     std::stoi(prefix) <= 32;
    if (!prefix_ok) {
        throw ConfigurationError("Host IP '" + network.host_cidr + "' has an invalid prefix length");
    }

    if (!is_ipv4(network.guest_ip)) {
        throw ConfigurationError("Guest IP '" + network.guest_ip + "' is not a valid IPv4 address");
    }
    if (network.guest_ip == cidr_address(network.host_cidr)) {
        throw ConfigurationError("Guest IP must differ from host IP " + network.guest_ip);
    }

    if (network.nat_chain.empty() || network.forward_chain.empty()) {
        throw ConfigurationError("Firewall chain names must not be empty");
    }
    if (network.uplink && network.uplink->empty()) {
        throw ConfigurationError("Uplink interface override must not be empty");
    }
}

void validate(const SandboxConfig& config) {
    validate(config.network);

    if (config.api_socket.empty()) {
        throw ConfigurationError("Socket path must not be empty");
    }
    if (config.firecracker_bin.empty()) {
        throw ConfigurationError("Hypervisor binary must not be empty");
    }
    if (config.session_name.empty()) {
        throw ConfigurationError("Session name must not be empty");
    }
    if (config.poll_interval.count() < 0 || config.startup_timeout.count() < 0 ||
        config.stop_grace.count() < 0) {
        throw ConfigurationError("Timeouts must not be negative");
    }
}

} // namespace fcsandbox
