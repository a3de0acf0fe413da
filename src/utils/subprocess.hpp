#pragma once

#include <string>
#include <vector>
#include <optional>

#include <sys/types.h>

namespace dlnacast {

struct ProcessOutput {
    int exitCode = -1;
    std::string standardOutput;
};

/**
 * @brief Child process started with fork/execvp and piped stdout/stderr
 *
 * stdin is attached to /dev/null. The destructor kills a child that is still
 * running and reaps it.
 */
class Subprocess {
public:
    Subprocess() = default;
    ~Subprocess();

    Subprocess(const Subprocess&) = delete;
    Subprocess& operator=(const Subprocess&) = delete;

    // false when the pipes cannot be created, fork fails or exec fails
    bool spawn(const std::vector<std::string>& argv, bool pipeStdout = true, bool pipeStderr = true);

    pid_t pid() const { return pid_; }
    int stdoutFd() const { return stdoutFd_; }
    int stderrFd() const { return stderrFd_; }

    // Reaps the child when it has exited
    bool isAlive();
    std::optional<int> exitCode() const { return exitCode_; }

    // SIGTERM, wait up to graceSeconds, then SIGKILL; returns true when the child is gone
    bool terminate(double graceSeconds);

    void closePipes();

    // Runs to completion capturing stdout; stderr is discarded. nullopt on
    // spawn failure or timeout (the child is killed).
    static std::optional<ProcessOutput> run(const std::vector<std::string>& argv, double timeoutSeconds);

    // For processes that are not our children (e.g. recorded in a PID file)
    static bool processExists(pid_t pid);
    static bool terminatePid(pid_t pid, double graceSeconds);

private:
    void waitForExit(bool blocking);

    pid_t pid_ = -1;
    int stdoutFd_ = -1;
    int stderrFd_ = -1;
    std::optional<int> exitCode_;
};

} // namespace dlnacast
