#include "vm/control_plane_client.hpp"
#include "utils/exec.hpp"

#include <spdlog/spdlog.h>

namespace fcsandbox {

using json = nlohmann::json;
using utils::shell_quote;

ControlPlaneClient::ControlPlaneClient(CommandRunner& runner, std::filesystem::path socket)
    : runner_(runner), socket_(std::move(socket)) {}

std::string ControlPlaneClient::build_request_command(const std::filesystem::path& socket,
                                                      const std::string& method,
                                                      const std::string& path,
                                                      const json& body) {
    return "curl --unix-socket " + shell_quote(socket.string()) +
           " -sS --fail-with-body -X " + method +
           " " + shell_quote("http://localhost" + path) +
           " -H " + shell_quote("Accept: application/json") +
           " -H " + shell_quote("Content-Type: application/json") +
           " -d " + shell_quote(body.dump());
}

ControlPlaneResponse ControlPlaneClient::send(const std::string& method,
                                              const std::string& path,
                                              const json& body) {
    spdlog::debug("{} {} {}", method, path, body.dump());

    auto result = runner_.run(build_request_command(socket_, method, path, body), true);

    ControlPlaneResponse response;
    response.ok = result.succeeded();
    response.body = result.output;
    return response;
}

ControlPlaneResponse ControlPlaneClient::pause() {
    return send("PATCH", "/vm", {{"state", "Paused"}});
}

ControlPlaneResponse ControlPlaneClient::resume() {
    return send("PATCH", "/vm", {{"state", "Resumed"}});
}

ControlPlaneResponse ControlPlaneClient::create_snapshot(const std::filesystem::path& mem_file,
                                                         const std::filesystem::path& snapshot_file) {
    return send("PUT", "/snapshot/create", {
        {"mem_file_path", mem_file.string()},
        {"snapshot_path", snapshot_file.string()}
    });
}

ControlPlaneResponse ControlPlaneClient::load_snapshot(const std::filesystem::path& mem_file,
                                                       const std::filesystem::path& snapshot_file) {
    return send("PUT", "/snapshot/load", {
        {"snapshot_path", snapshot_file.string()},
        {"mem_backend", {
            {"backend_path", mem_file.string()},
            {"backend_type", "File"}
        }},
        {"resume_vm", false}
    });
}

ControlPlaneResponse ControlPlaneClient::update_drive(const std::string& drive_id,
                                                      const std::filesystem::path& path_on_host) {
    return send("PATCH", "/drives/" + drive_id, {
        {"drive_id", drive_id},
        {"path_on_host", path_on_host.string()}
    });
}

} // namespace fcsandbox
