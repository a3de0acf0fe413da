#include "subprocess.hpp"
#include "logger.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace dlnacast {

namespace {

using SteadyClock = std::chrono::steady_clock;

constexpr auto POLL_INTERVAL = std::chrono::milliseconds(50);

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

SteadyClock::time_point deadlineAfter(double seconds) {
    return SteadyClock::now() +
           std::chrono::duration_cast<SteadyClock::duration>(std::chrono::duration<double>(seconds));
}

} // namespace

Subprocess::~Subprocess() {
    if (pid_ > 0 && !exitCode_) {
        ::kill(pid_, SIGKILL);
        waitForExit(true);
    }
    closePipes();
}

bool Subprocess::spawn(const std::vector<std::string>& argv, bool pipeStdout, bool pipeStderr) {
    if (argv.empty()) {
        Logger::error("Subprocess: Empty command line");
        return false;
    }

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    int execPipe[2] = {-1, -1};

    auto closeAll = [&]() {
        closeFd(outPipe[0]); closeFd(outPipe[1]);
        closeFd(errPipe[0]); closeFd(errPipe[1]);
        closeFd(execPipe[0]); closeFd(execPipe[1]);
    };

    if ((pipeStdout && ::pipe(outPipe) < 0) ||
        (pipeStderr && ::pipe(errPipe) < 0) ||
        ::pipe2(execPipe, O_CLOEXEC) < 0) {
        Logger::error("Subprocess: Failed to create pipe: {}", std::strerror(errno));
        closeAll();
        return false;
    }

    // argv must be prepared before fork; the child only calls async-signal-safe functions
    std::vector<char*> cArgs;
    cArgs.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        cArgs.push_back(const_cast<char*>(arg.c_str()));
    }
    cArgs.push_back(nullptr);

    pid_t child = ::fork();
    if (child < 0) {
        Logger::error("Subprocess: Failed to fork: {}", std::strerror(errno));
        closeAll();
        return false;
    }

    if (child == 0) {
        int devNull = ::open("/dev/null", O_RDWR);
        if (devNull >= 0) {
            ::dup2(devNull, STDIN_FILENO);
        }
        ::dup2(pipeStdout ? outPipe[1] : devNull, STDOUT_FILENO);
        ::dup2(pipeStderr ? errPipe[1] : devNull, STDERR_FILENO);
        if (outPipe[0] >= 0) ::close(outPipe[0]);
        if (outPipe[1] >= 0) ::close(outPipe[1]);
        if (errPipe[0] >= 0) ::close(errPipe[0]);
        if (errPipe[1] >= 0) ::close(errPipe[1]);
        ::close(execPipe[0]);
        if (devNull > STDERR_FILENO) ::close(devNull);

        ::execvp(cArgs[0], cArgs.data());

        int error = errno;
        ssize_t ignored = ::write(execPipe[1], &error, sizeof(error));
        (void)ignored;
        ::_exit(127);
    }

    closeFd(outPipe[1]);
    closeFd(errPipe[1]);
    closeFd(execPipe[1]);

    // EOF means exec succeeded and the close-on-exec end went away
    int execError = 0;
    ssize_t n;
    do {
        n = ::read(execPipe[0], &execError, sizeof(execError));
    } while (n < 0 && errno == EINTR);
    closeFd(execPipe[0]);

    if (n == static_cast<ssize_t>(sizeof(execError))) {
        Logger::error("Subprocess: Failed to execute {}: {}", argv[0], std::strerror(execError));
        int status = 0;
        ::waitpid(child, &status, 0);
        closeFd(outPipe[0]);
        closeFd(errPipe[0]);
        return false;
    }

    pid_ = child;
    stdoutFd_ = outPipe[0];
    stderrFd_ = errPipe[0];
    exitCode_.reset();
    Logger::debug("Subprocess: Started {} (PID: {})", argv[0], pid_);
    return true;
}

void Subprocess::waitForExit(bool blocking) {
    if (pid_ <= 0 || exitCode_) {
        return;
    }

    int status = 0;
    pid_t result;
    do {
        result = ::waitpid(pid_, &status, blocking ? 0 : WNOHANG);
    } while (result < 0 && errno == EINTR);

    if (result == pid_) {
        if (WIFEXITED(status)) {
            exitCode_ = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exitCode_ = 128 + WTERMSIG(status);
        } else {
            exitCode_ = -1;
        }
    } else if (result < 0) {
        // Already reaped elsewhere
        exitCode_ = -1;
    }
}

bool Subprocess::isAlive() {
    if (pid_ <= 0) {
        return false;
    }
    waitForExit(false);
    return !exitCode_.has_value();
}

bool Subprocess::terminate(double graceSeconds) {
    if (!isAlive()) {
        return true;
    }

    ::kill(pid_, SIGTERM);
    const auto deadline = deadlineAfter(graceSeconds);
    while (SteadyClock::now() < deadline) {
        if (!isAlive()) {
            return true;
        }
        std::this_thread::sleep_for(POLL_INTERVAL);
    }

    if (!isAlive()) {
        return true;
    }

    Logger::warning("Subprocess: PID {} did not exit within {}s, killing", pid_, graceSeconds);
    ::kill(pid_, SIGKILL);
    waitForExit(true);
    return true;
}

void Subprocess::closePipes() {
    closeFd(stdoutFd_);
    closeFd(stderrFd_);
}

std::optional<ProcessOutput> Subprocess::run(const std::vector<std::string>& argv, double timeoutSeconds) {
    Subprocess process;
    if (!process.spawn(argv, true, false)) {
        return std::nullopt;
    }

    const auto deadline = deadlineAfter(timeoutSeconds);
    ProcessOutput output;
    char buffer[4096];

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - SteadyClock::now());
        if (remaining.count() <= 0) {
            Logger::warning("Subprocess: {} timed out after {}s", argv[0], timeoutSeconds);
            process.terminate(0.0);
            return std::nullopt;
        }

        struct pollfd pfd;
        pfd.fd = process.stdoutFd();
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            Logger::error("Subprocess: poll failed: {}", std::strerror(errno));
            process.terminate(0.0);
            return std::nullopt;
        }
        if (ready == 0) {
            continue;
        }

        ssize_t n = ::read(process.stdoutFd(), buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (n == 0) {
            break;
        }
        output.standardOutput.append(buffer, static_cast<size_t>(n));
    }

    // stdout closed; give the process until the deadline to exit
    while (process.isAlive()) {
        if (SteadyClock::now() >= deadline) {
            Logger::warning("Subprocess: {} did not exit after closing its output", argv[0]);
            process.terminate(0.0);
            return std::nullopt;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    output.exitCode = process.exitCode().value_or(-1);
    return output;
}

bool Subprocess::processExists(pid_t pid) {
    if (pid <= 0) {
        return false;
    }
    return ::kill(pid, 0) == 0 || errno == EPERM;
}

bool Subprocess::terminatePid(pid_t pid, double graceSeconds) {
    if (!processExists(pid)) {
        return true;
    }

    if (::kill(pid, SIGTERM) != 0) {
        Logger::warning("Subprocess: Cannot signal PID {}: {}", pid, std::strerror(errno));
        return !processExists(pid);
    }

    const auto deadline = deadlineAfter(graceSeconds);
    while (SteadyClock::now() < deadline) {
        if (!processExists(pid)) {
            return true;
        }
        std::this_thread::sleep_for(POLL_INTERVAL);
    }

    Logger::warning("Subprocess: PID {} ignored SIGTERM, killing", pid);
    ::kill(pid, SIGKILL);

    const auto killDeadline = deadlineAfter(1.0);
    while (SteadyClock::now() < killDeadline) {
        if (!processExists(pid)) {
            return true;
        }
        std::this_thread::sleep_for(POLL_INTERVAL);
    }
    return !processExists(pid);
}

} // namespace dlnacast
