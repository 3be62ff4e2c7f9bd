#include "resources/network_resource.hpp"
#include "core/errors.hpp"
#include "utils/exec.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <sstream>

namespace fcsandbox {

using utils::shell_quote;

namespace {

// Bounds the cleanup of rules duplicated by older, non-idempotent setups
constexpr int kMaxDuplicateRules = 16;

std::vector<std::string> split_lines(const std::string& output) {
    std::vector<std::string> lines;
    std::istringstream ss(output);
    std::string line;
    while (std::getline(ss, line)) {
        if (!line.empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

}  // anonymous namespace

NetworkResource::NetworkResource(CommandRunner& runner)
    : runner_(runner) {}

std::string NetworkResource::iptables(const std::string& table) {
    return table.empty() ? "iptables" : "iptables -t " + table;
}

void NetworkResource::ensure_rule(const std::string& table, const std::string& rule) {
    auto check = runner_.query(iptables(table) + " -C " + rule);
    if (check.succeeded()) {
        spdlog::debug("Rule already present: {}", rule);
        return;
    }
    best_effort(iptables(table) + " -A " + rule);
}

void NetworkResource::best_effort(const std::string& command) {
    auto result = runner_.run(command, true);
    if (!result.succeeded()) {
        spdlog::warn("Step failed, continuing: {}", command);
    }
}

void NetworkResource::delete_rule(const std::string& table, const std::string& rule) {
    for (int i = 0; i < kMaxDuplicateRules; i++) {
        auto result = runner_.run(iptables(table) + " -D " + rule, true);
        if (!result.succeeded() || result.simulated) {
            break;
        }
    }
}

std::optional<std::string> NetworkResource::parse_default_route(const std::string& output) {
    for (const auto& line : split_lines(output)) {
        std::istringstream ss(line);
        std::vector<std::string> tokens;
        std::string token;
        while (ss >> token) {
            tokens.push_back(token);
        }
        if (tokens.empty() || tokens[0] != "default") {
            continue;
        }
        auto dev = std::find(tokens.begin(), tokens.end(), "dev");
        if (dev != tokens.end() && dev + 1 != tokens.end()) {
            return *(dev + 1);
        }
    }
    return std::nullopt;
}

std::vector<std::string> NetworkResource::parse_masquerade_uplinks(const std::string& output,
                                                                   const std::string& chain) {
    std::vector<std::string> uplinks;
    for (const auto& line : split_lines(output)) {
        std::istringstream ss(line);
        std::vector<std::string> tokens;
        std::string token;
        while (ss >> token) {
            tokens.push_back(token);
        }
        if (tokens.size() < 2 || tokens[0] != "-A" || tokens[1] != chain) {
            continue;
        }
        if (std::find(tokens.begin(), tokens.end(), "MASQUERADE") == tokens.end()) {
            continue;
        }
        auto out = std::find(tokens.begin(), tokens.end(), "-o");
        if (out != tokens.end() && out + 1 != tokens.end()) {
            uplinks.push_back(*(out + 1));
        }
    }
    return uplinks;
}

std::string NetworkResource::resolve_uplink(const NetworkConfig& config) {
    if (config.uplink) {
        return *config.uplink;
    }

    auto routes = runner_.query("ip route show default");
    auto uplink = routes.succeeded() ? parse_default_route(routes.output) : std::nullopt;
    if (!uplink) {
        throw ConfigurationError(
            "Could not determine the default route interface; cannot build the NAT rule "
            "(pass --uplink <iface> to set it explicitly)");
    }
    return *uplink;
}

std::vector<std::string> NetworkResource::probe_nat_uplinks(const NetworkConfig& config) {
    auto listing = runner_.query("iptables -t nat -S " + shell_quote(config.nat_chain));
    if (!listing.succeeded()) {
        return {};
    }
    return parse_masquerade_uplinks(listing.output, config.nat_chain);
}

NetworkState NetworkResource::bring_up(const NetworkConfig& config) {
    const std::string dev = shell_quote(config.device);
    const std::string nat = shell_quote(config.nat_chain);
    const std::string fwd = shell_quote(config.forward_chain);

    spdlog::info("Bringing up {} ({})", config.device, config.host_cidr);

    // Device creation and address assignment fail when already done
    runner_.run("ip tuntap add dev " + dev + " mode tap", true);
    best_effort("ip link set dev " + dev + " up");
    runner_.run("ip addr add " + shell_quote(config.host_cidr) + " dev " + dev, true);

    best_effort("sysctl -w net.ipv4.ip_forward=1");

    NetworkState state;
    state.uplink = resolve_uplink(config);
    spdlog::info("Using {} as uplink interface", state.uplink);

    runner_.run(iptables("nat") + " -N " + nat, true);
    for (const auto& stale : probe_nat_uplinks(config)) {
        if (stale != state.uplink) {
            spdlog::warn("Removing stale masquerade rule on {}", stale);
            delete_rule("nat", nat + " -o " + shell_quote(stale) + " -j MASQUERADE");
        }
    }
    ensure_rule("nat", nat + " -o " + shell_quote(state.uplink) + " -j MASQUERADE");
    ensure_rule("nat", "POSTROUTING -j " + nat);

    runner_.run(iptables("") + " -N " + fwd, true);
    ensure_rule("", fwd + " -i " + dev + " -j ACCEPT");
    ensure_rule("", fwd + " -o " + dev + " -j ACCEPT");
    ensure_rule("", "FORWARD -j " + fwd);

    return state;
}

void NetworkResource::tear_down(const NetworkConfig& config) {
    const std::string dev = shell_quote(config.device);
    const std::string nat = shell_quote(config.nat_chain);
    const std::string fwd = shell_quote(config.forward_chain);

    spdlog::info("Tearing down {}", config.device);

    // Find the uplink bring_up used so exactly that rule is removed
    auto uplinks = probe_nat_uplinks(config);

    delete_rule("", "FORWARD -j " + fwd);
    delete_rule("", fwd + " -o " + dev + " -j ACCEPT");
    delete_rule("", fwd + " -i " + dev + " -j ACCEPT");
    runner_.run(iptables("") + " -F " + fwd, true);
    runner_.run(iptables("") + " -X " + fwd, true);

    delete_rule("nat", "POSTROUTING -j " + nat);
    for (const auto& uplink : uplinks) {
        delete_rule("nat", nat + " -o " + shell_quote(uplink) + " -j MASQUERADE");
    }
    runner_.run(iptables("nat") + " -F " + nat, true);
    runner_.run(iptables("nat") + " -X " + nat, true);

    // IP forwarding is host-global and stays enabled
    runner_.run("ip addr del " + shell_quote(config.host_cidr) + " dev " + dev, true);
    runner_.run("ip link set dev " + dev + " down", true);
    runner_.run("ip link delete dev " + dev, true);
}

NetworkInfo NetworkResource::info(const NetworkConfig& config) {
    NetworkInfo info;

    auto link = runner_.query("ip addr show dev " + shell_quote(config.device));
    info.device_present = link.succeeded();
    info.device_details = link.succeeded() ? link.output : "";

    auto forwarding = runner_.query("sysctl -n net.ipv4.ip_forward");
    info.ip_forwarding = forwarding.succeeded() && forwarding.output.find('1') != std::string::npos;

    auto nat = runner_.query("iptables -t nat -S " + shell_quote(config.nat_chain));
    if (nat.succeeded()) {
        info.nat_rules = split_lines(nat.output);
        info.nat_uplinks = parse_masquerade_uplinks(nat.output, config.nat_chain);
    }

    auto fwd = runner_.query("iptables -S " + shell_quote(config.forward_chain));
    if (fwd.succeeded()) {
        info.forward_rules = split_lines(fwd.output);
    }

    return info;
}

} // namespace fcsandbox
