#pragma once

#include "core/config.hpp"
#include "runner/command_runner.hpp"

#include <optional>
#include <string>
#include <vector>

namespace fcsandbox {

/**
 * NetworkState - What bring_up resolved on the host
 */
struct NetworkState {
    std::string uplink;
};

/**
 * NetworkInfo - Read-only snapshot of the sandbox network (net-info)
 */
struct NetworkInfo {
    bool device_present = false;
    std::string device_details;
    bool ip_forwarding = false;
    std::vector<std::string> nat_rules;
    std::vector<std::string> forward_rules;
    std::vector<std::string> nat_uplinks;   // interfaces the NAT chain masquerades on
};

/**
 * NetworkResource - tap device, host address, IP forwarding and the
 * dedicated NAT / FORWARD chains of one sandbox
 *
 * Every step of bring_up and tear_down is individually idempotent. The
 * only fatal condition is an unresolvable uplink interface.
 */
class NetworkResource {
public:
    explicit NetworkResource(CommandRunner& runner);

    /**
     * Create the device and firewall plumbing
     * @param config Network config
     * @return Resolved state (uplink interface)
     * @throws ConfigurationError if no uplink interface can be resolved
     */
    NetworkState bring_up(const NetworkConfig& config);

    /**
     * Remove everything bring_up created, in reverse order
     *
     * Safe on a partially configured or already clean host.
     *
     * @param config Network config
     */
    void tear_down(const NetworkConfig& config);

    /**
     * Inspect the current network state without changing it
     */
    NetworkInfo info(const NetworkConfig& config);

    /**
     * Resolve the interface carrying the default route
     * @throws ConfigurationError if there is no default route
     */
    std::string resolve_uplink(const NetworkConfig& config);

    /**
     * Extract the interface from `ip route show default` output
     * @return Interface name if a default route is present
     */
    static std::optional<std::string> parse_default_route(const std::string& output);

    /**
     * Extract the `-o <iface>` of every MASQUERADE rule in `iptables -S` output
     */
    static std::vector<std::string> parse_masquerade_uplinks(const std::string& output,
                                                             const std::string& chain);

private:
    /**
     * Append a rule unless `iptables -C` finds it already present
     * @param table "nat" or "" for filter
     * @param rule Rule spec starting with the chain name
     */
    void ensure_rule(const std::string& table, const std::string& rule);

    /**
     * Run a step whose failure is reported but not fatal
     */
    void best_effort(const std::string& command);

    /**
     * Delete every copy of a rule, tolerating absence
     */
    void delete_rule(const std::string& table, const std::string& rule);

    std::vector<std::string> probe_nat_uplinks(const NetworkConfig& config);

    static std::string iptables(const std::string& table);

    CommandRunner& runner_;
};

} // namespace fcsandbox
