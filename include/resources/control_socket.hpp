#pragma once

#include "runner/command_runner.hpp"

#include <filesystem>

namespace fcsandbox {

/**
 * ControlSocketResource - Filesystem endpoint of the hypervisor API
 *
 * The orchestrator guarantees activate() is never called while a VM
 * holds the path: the socket is created before the process starts and
 * removed only after it has stopped.
 */
class ControlSocketResource {
public:
    explicit ControlSocketResource(CommandRunner& runner);

    /**
     * Replace any stale endpoint with a fresh one restricted to owner/group
     * @param path Endpoint path
     */
    void activate(const std::filesystem::path& path);

    /**
     * Remove the endpoint, tolerating absence
     * @param path Endpoint path
     */
    void deactivate(const std::filesystem::path& path);

    /**
     * Check whether anything exists at the endpoint path
     */
    static bool exists(const std::filesystem::path& path);

private:
    CommandRunner& runner_;
};

} // namespace fcsandbox
