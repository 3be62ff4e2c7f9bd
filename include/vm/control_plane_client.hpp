#pragma once

#include "runner/command_runner.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>

namespace fcsandbox {

/**
 * ControlPlaneResponse - Outcome of one API request
 */
struct ControlPlaneResponse {
    bool ok = false;
    std::string body;   // response body or curl diagnostics
};

/**
 * ControlPlaneClient - Firecracker HTTP API over the unix control socket
 *
 * Requests are issued with curl through the CommandRunner so they show
 * up in the dry-run trace like every other host interaction.
 */
class ControlPlaneClient {
public:
    ControlPlaneClient(CommandRunner& runner, std::filesystem::path socket);

    /// PATCH /vm {"state": "Paused"}
    ControlPlaneResponse pause();

    /// PATCH /vm {"state": "Resumed"}
    ControlPlaneResponse resume();

    /// PUT /snapshot/create
    ControlPlaneResponse create_snapshot(const std::filesystem::path& mem_file,
                                         const std::filesystem::path& snapshot_file);

    /// PUT /snapshot/load, the loaded VM stays paused
    ControlPlaneResponse load_snapshot(const std::filesystem::path& mem_file,
                                       const std::filesystem::path& snapshot_file);

    /// PATCH /drives/<id>, point a drive at another backing file
    ControlPlaneResponse update_drive(const std::string& drive_id,
                                      const std::filesystem::path& path_on_host);

    /**
     * Build the curl command line for a request
     * @param socket API socket
     * @param method HTTP method
     * @param path Request path (e.g. "/vm")
     * @param body JSON body
     */
    static std::string build_request_command(const std::filesystem::path& socket,
                                             const std::string& method,
                                             const std::string& path,
                                             const nlohmann::json& body);

private:
    ControlPlaneResponse send(const std::string& method,
                              const std::string& path,
                              const nlohmann::json& body);

    CommandRunner& runner_;
    std::filesystem::path socket_;
};

} // namespace fcsandbox
