#include "infrastructure/network/ProcessRunner.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <sstream>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace netsentry::infra {

std::optional<std::string> ProcessRunner::findExecutable(const std::string& name) {
    if (name.empty()) {
        return std::nullopt;
    }
    if (name.find('/') != std::string::npos) {
        return access(name.c_str(), X_OK) == 0 ? std::optional<std::string>(name) : std::nullopt;
    }

    const char* path = std::getenv("PATH");
    std::istringstream dirs(path ? path : "/usr/local/bin:/usr/bin:/bin");
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) {
            continue;
        }
        std::string candidate = dir + "/" + name;
        if (access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return std::nullopt;
}

ProcessResult ProcessRunner::run(const std::string& executable,
                                 const std::vector<std::string>& args,
                                 std::chrono::milliseconds timeout) {
    ProcessResult result;

    auto binary = findExecutable(executable);
    if (!binary) {
        result.errorMessage = executable + " not found";
        return result;
    }

    int pipeFds[2];
    if (pipe2(pipeFds, O_CLOEXEC) != 0) {
        result.errorMessage = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }

    pid_t pid = fork();
    if (pid == -1) {
        close(pipeFds[0]);
        close(pipeFds[1]);
        result.errorMessage = std::string("fork failed: ") + std::strerror(errno);
        return result;
    }

    if (pid == 0) {
        dup2(pipeFds[1], STDOUT_FILENO);
        close(pipeFds[0]);
        close(pipeFds[1]);
        int devNull = open("/dev/null", O_WRONLY);
        if (devNull >= 0) {
            dup2(devNull, STDERR_FILENO);
            close(devNull);
        }

        std::vector<char*> argv;
        argv.push_back(const_cast<char*>(binary->c_str()));
        for (const auto& arg : args) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);

        execv(binary->c_str(), argv.data());
        _exit(127);
    }

    close(pipeFds[1]);
    result.started = true;

    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::array<char, 4096> buffer{};
    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            result.timedOut = true;
            break;
        }

        struct pollfd pfd {};
        pfd.fd = pipeFds[0];
        pfd.events = POLLIN;
        int ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            result.errorMessage = std::string("poll failed: ") + std::strerror(errno);
            break;
        }
        if (ready == 0) {
            continue;
        }

        ssize_t n = read(pipeFds[0], buffer.data(), buffer.size());
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            break;
        }
        result.output.append(buffer.data(), static_cast<size_t>(n));
    }
    close(pipeFds[0]);

    if (result.timedOut || !result.errorMessage.empty()) {
        kill(pid, SIGKILL);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            result.errorMessage = std::string("waitpid failed: ") + std::strerror(errno);
            return result;
        }
    }

    if (result.timedOut) {
        result.errorMessage = executable + " timed out after " +
                              std::to_string(timeout.count()) + " ms";
        spdlog::warn("{}", result.errorMessage);
        return result;
    }

    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
        if (result.exitCode == 127) {
            result.started = false;
            result.errorMessage = executable + " could not be executed";
        }
    }
    return result;
}

} // namespace netsentry::infra
