#include "resources/control_socket.hpp"
#include "utils/exec.hpp"

#include <spdlog/spdlog.h>

namespace fcsandbox {

namespace fs = std::filesystem;

ControlSocketResource::ControlSocketResource(CommandRunner& runner)
    : runner_(runner) {}

bool ControlSocketResource::exists(const fs::path& path) {
    std::error_code ec;
    auto status = fs::symlink_status(path, ec);
    return !ec && fs::exists(status);
}

void ControlSocketResource::activate(const fs::path& path) {
    const std::string quoted = utils::shell_quote(path.string());

    if (exists(path)) {
        spdlog::info("Removing stale endpoint {}", path.string());
    }
    runner_.run("rm -f " + quoted);
    runner_.run("mkfifo " + quoted);
    runner_.run("chmod 660 " + quoted);

    spdlog::info("Control socket activated at {}", path.string());
}

void ControlSocketResource::deactivate(const fs::path& path) {
    // rm -f already succeeds when the file is absent
    runner_.run("rm -f " + utils::shell_quote(path.string()), true);
    spdlog::info("Control socket {} removed", path.string());
}

} // namespace fcsandbox
