/**
 * @file ProcessRunner.cpp
 * @brief fork/exec helper with output capture and deadline
 */

#include "ProcessRunner.h"
#include "LogLevel.h"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <sstream>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

// Exit status the child uses when execvp() fails (same as the shell)
constexpr int EXEC_FAILED_STATUS = 127;

// Polling interval while waiting for a child that already closed its output
constexpr int REAP_POLL_MS = 10;

int decodeStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

void reapChild(pid_t pid, int& exitCode) {
    int status = 0;
    pid_t r;
    do {
        r = waitpid(pid, &status, 0);
    } while (r == -1 && errno == EINTR);

    exitCode = r == -1 ? -1 : decodeStatus(status);
}

// false if the deadline passed with the child still running
bool reapChildBefore(pid_t pid, std::chrono::steady_clock::time_point deadline, int& exitCode) {
    while (true) {
        int status = 0;
        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid) {
            exitCode = decodeStatus(status);
            return true;
        }
        if (r == -1 && errno != EINTR) {
            exitCode = -1;
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(REAP_POLL_MS));
    }
}

} // namespace

ProcessResult ProcessRunner::run(const std::vector<std::string>& args, unsigned int timeoutMs) {
    ProcessResult result;

    if (args.empty() || args[0].empty()) {
        LOG_ERROR("[Process] Empty command line");
        return result;
    }

    LOG_DEBUG("[Process] " << formatCommand(args));

    // Build the argv array before fork: nothing but async-signal-safe calls
    // are allowed in the child of a multi-threaded process
    std::vector<char*> c_args;
    c_args.reserve(args.size() + 1);
    for (const auto& arg : args) {
        c_args.push_back(const_cast<char*>(arg.c_str()));
    }
    c_args.push_back(nullptr);

    int pipefd[2];
    if (pipe2(pipefd, O_CLOEXEC) == -1) {
        LOG_ERROR("[Process] Failed to create pipe: " << strerror(errno));
        return result;
    }

    pid_t pid = fork();

    if (pid == -1) {
        LOG_ERROR("[Process] Failed to fork: " << strerror(errno));
        close(pipefd[0]);
        close(pipefd[1]);
        return result;
    }

    if (pid == 0) {
        // Child: stdout and stderr into the pipe, stdin from /dev/null
        if (dup2(pipefd[1], STDOUT_FILENO) == -1 || dup2(pipefd[1], STDERR_FILENO) == -1) {
            _exit(EXEC_FAILED_STATUS);
        }
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }

        execvp(c_args[0], c_args.data());
        _exit(EXEC_FAILED_STATUS);
    }

    // Parent process
    close(pipefd[1]);
    int fd = pipefd[0];

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    char buf[4096];

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            result.timedOut = true;
            break;
        }

        struct pollfd pfd = {fd, POLLIN, 0};
        int ready = poll(&pfd, 1, static_cast<int>(remaining));
        if (ready == -1) {
            if (errno == EINTR) continue;
            LOG_ERROR("[Process] poll failed: " << strerror(errno));
            break;
        }
        if (ready == 0) {
            result.timedOut = true;
            break;
        }

        ssize_t n = read(fd, buf, sizeof(buf));
        if (n == -1 && errno == EINTR) continue;
        if (n <= 0) break;  // EOF: child closed its end

        if (result.output.size() < MAX_OUTPUT_BYTES) {
            result.output.append(buf, static_cast<size_t>(n));
        }
    }

    close(fd);

    // Output closed does not mean exited
    if (!result.timedOut && !reapChildBefore(pid, deadline, result.exitCode)) {
        result.timedOut = true;
    }

    if (result.timedOut) {
        LOG_WARN("[Process] " << args[0] << " timed out after " << timeoutMs << "ms, killing PID " << pid);
        kill(pid, SIGKILL);
        reapChild(pid, result.exitCode);
    }

    if (!result.timedOut && result.exitCode == EXEC_FAILED_STATUS) {
        LOG_ERROR("[Process] Failed to execute " << args[0]);
        return result;
    }

    result.started = true;
    LOG_DEBUG("[Process] " << args[0] << " exited with " << result.exitCode
              << (result.timedOut ? " (timeout)" : ""));
    return result;
}

std::string ProcessRunner::formatCommand(const std::vector<std::string>& args) {
    std::ostringstream oss;
    for (size_t i = 0; i < args.size(); i++) {
        if (i > 0) oss << ' ';
        oss << args[i];
    }
    return oss.str();
}
