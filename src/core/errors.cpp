#include "core/errors.hpp"

namespace fcsandbox {

std::string error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Configuration: return "configuration";
        case ErrorKind::ProcessStart: return "process-start";
        case ErrorKind::ControlPlane: return "control-plane";
        case ErrorKind::VmNotRunning: return "vm-not-running";
        case ErrorKind::Command: return "command";
    }
    return "unknown";
}

} // namespace fcsandbox
