/**
 * @file ProcessRunner.h
 * @brief Run an external program and capture its output
 *
 * fork/exec with stdout and stderr redirected into a pipe. The parent reads
 * with poll() against a deadline and kills the child on timeout.
 */

#ifndef REPLAY2PLAYER_PROCESS_RUNNER_H
#define REPLAY2PLAYER_PROCESS_RUNNER_H

#include <string>
#include <vector>

struct ProcessResult {
    bool started = false;       // fork/exec succeeded
    bool timedOut = false;
    int exitCode = -1;          // valid if started && !timedOut
    std::string output;         // stdout + stderr

    bool succeeded() const { return started && !timedOut && exitCode == 0; }
};

class ProcessRunner {
public:
    static constexpr size_t MAX_OUTPUT_BYTES = 1 << 20;

    /**
     * @brief Run args[0] with args, wait at most timeoutMs
     *
     * Never throws. A program that cannot be executed reports
     * started=false (exit status 127 from the child).
     */
    static ProcessResult run(const std::vector<std::string>& args, unsigned int timeoutMs);

    static std::string formatCommand(const std::vector<std::string>& args);
};

#endif // REPLAY2PLAYER_PROCESS_RUNNER_H
