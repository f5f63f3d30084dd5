#include "cli/ProcessRunner.hpp"
#include "logging/LogRegistry.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fmt/core.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace lv::cli;
using namespace lv::logging;

namespace {

void closeFd(int& fd) {
    if (fd >= 0) close(fd);
    fd = -1;
}

// Reads both pipes until EOF; polling avoids a deadlock when the child fills one of them
void drain(int& outFd, int& errFd, std::string& out, std::string& err) {
    char buf[4096];
    while (outFd >= 0 || errFd >= 0) {
        pollfd fds[2] = {{outFd, POLLIN, 0}, {errFd, POLLIN, 0}};
        if (poll(fds, 2, -1) < 0) {
            if (errno == EINTR) continue;
            break;
        }

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            const ssize_t n = read(fds[i].fd, buf, sizeof(buf));
            if (n > 0) (i == 0 ? out : err).append(buf, static_cast<size_t>(n));
            else if (n == 0 || errno != EINTR) closeFd(i == 0 ? outFd : errFd);
        }
    }
}

}

CommandResult ProcessRunner::run(const std::vector<std::string>& argv) {
    if (argv.empty()) return {-1, "", "No command given"};

    // Built before fork; the child of a multithreaded process may only make async-signal-safe calls
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    // Close-on-exec so a child started concurrently on another thread never holds these write ends
    int outPipe[2], errPipe[2];
    if (pipe2(outPipe, O_CLOEXEC) == -1) return {-1, "", fmt::format("Failed to create pipe: {}", std::strerror(errno))};
    if (pipe2(errPipe, O_CLOEXEC) == -1) {
        close(outPipe[0]);
        close(outPipe[1]);
        return {-1, "", fmt::format("Failed to create pipe: {}", std::strerror(errno))};
    }

    const pid_t pid = fork();
    if (pid < 0) {
        for (const int fd : {outPipe[0], outPipe[1], errPipe[0], errPipe[1]}) close(fd);
        return {-1, "", fmt::format("Failed to fork '{}': {}", argv[0], std::strerror(errno))};
    }

    if (pid == 0) {
        // Child: stdin from /dev/null so az never blocks on a prompt. dup2 clears close-on-exec.
        dup2(outPipe[1], STDOUT_FILENO);
        dup2(errPipe[1], STDERR_FILENO);
        close(outPipe[0]);
        close(outPipe[1]);
        close(errPipe[0]);
        close(errPipe[1]);
        if (const int devNull = open("/dev/null", O_RDONLY); devNull >= 0) {
            dup2(devNull, STDIN_FILENO);
            close(devNull);
        }

        execvp(args[0], args.data());
        static constexpr char msg[] = "exec failed\n";
        [[maybe_unused]] const auto written = write(STDERR_FILENO, msg, sizeof(msg) - 1);
        _exit(127);
    }

    close(outPipe[1]);
    close(errPipe[1]);

    CommandResult result;
    int outFd = outPipe[0], errFd = errPipe[0];
    drain(outFd, errFd, result.out, result.err);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            result.exitCode = -1;
            result.err += fmt::format("waitpid failed: {}", std::strerror(errno));
            return result;
        }
    }

    result.exitCode = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    LogRegistry::cli()->debug("[ProcessRunner] {} {} exited with {}", argv[0], argv.size() > 1 ? argv[1] : "",
                              result.exitCode);
    return result;
}
