#include "utils/exec.hpp"
#include <array>
#include <cerrno>
#include <cstdlib>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

namespace fcsandbox {
namespace utils {

namespace {

int wait_for(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return -1;
        }
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    return -1;
}

}  // anonymous namespace

ExecResult exec_shell(const std::string& command) {
    ExecResult result;
    result.exit_code = -1;

    // stdout and stderr share one pipe so the output keeps its ordering
    int out_pipe[2];
    if (pipe(out_pipe) < 0) {
        result.output = "Failed to create pipe";
        return result;
    }

    pid_t pid = fork();
    if (pid < 0) {
        result.output = "Fork failed";
        close(out_pipe[0]);
        close(out_pipe[1]);
        return result;
    }

    if (pid == 0) {
        // Child process
        close(out_pipe[0]);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(out_pipe[1], STDERR_FILENO);
        close(out_pipe[1]);

        execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
        _exit(127);  // exec failed
    }

    // Parent process
    close(out_pipe[1]);

    std::array<char, 4096> buffer;
    ssize_t bytes_read;
    while (true) {
        bytes_read = read(out_pipe[0], buffer.data(), buffer.size());
        if (bytes_read > 0) {
            result.output.append(buffer.data(), bytes_read);
        } else if (bytes_read < 0 && errno == EINTR) {
            continue;
        } else {
            break;
        }
    }
    close(out_pipe[0]);

    result.exit_code = wait_for(pid);
    return result;
}

int exec_interactive(const std::string& command) {
    pid_t pid = fork();
    if (pid < 0) {
        return -1;
    }

    if (pid == 0) {
        execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }

    return wait_for(pid);
}

std::string shell_quote(const std::string& arg) {
    if (arg.empty()) {
        return "''";
    }

    bool safe = true;
    for (char c : arg) {
        bool plain = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                     (c >= '0' && c <= '9') || c == '/' || c == '.' ||
                     c == '-' || c == '_' || c == ':' || c == '=' ||
                     c == ',' || c == '@' || c == '+' || c == '%';
        if (!plain) {
            safe = false;
            break;
        }
    }
    if (safe) {
        return arg;
    }

    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::optional<std::string> which(const std::string& command) {
    // Check if command is already an absolute path
    if (!command.empty() && command[0] == '/') {
        if (access(command.c_str(), X_OK) == 0) {
            return command;
        }
        return std::nullopt;
    }

    // Search in PATH
    const char* path_env = getenv("PATH");
    if (!path_env) {
        path_env = "/usr/bin:/bin";
    }

    std::string path_str(path_env);
    std::istringstream path_stream(path_str);
    std::string dir;

    while (std::getline(path_stream, dir, ':')) {
        std::string full_path = dir + "/" + command;
        if (access(full_path.c_str(), X_OK) == 0) {
            return full_path;
        }
    }

    return std::nullopt;
}

} // namespace utils
} // namespace fcsandbox
