#include "common/command_runner.hpp"
#include "common/logger.hpp"
#include <cerrno>
#include <climits>
#include <cstring>
#include <csignal>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

void closeFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

bool makePipe(int fds[2]) {
    if (pipe(fds) != 0) {
        return false;
    }
    fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return true;
}

// Drains whatever is readable on fd into out. Returns false on EOF.
bool drain(int fd, std::string& out) {
    char buffer[4096];
    ssize_t n = read(fd, buffer, sizeof(buffer));
    if (n > 0) {
        out.append(buffer, static_cast<size_t>(n));
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
        return true;
    }
    return false;
}

int pollTimeout(std::chrono::milliseconds remaining) {
    return remaining.count() > INT_MAX ? INT_MAX : static_cast<int>(remaining.count());
}

enum class WaitOutcome { Exited, Killed, Lost };

// Reaps pid, killing it once the deadline passes
WaitOutcome waitUntil(pid_t pid, std::chrono::steady_clock::time_point deadline, int& status) {
    bool killed = false;
    for (;;) {
        pid_t waited = waitpid(pid, &status, killed ? 0 : WNOHANG);
        if (waited == pid) {
            return killed ? WaitOutcome::Killed : WaitOutcome::Exited;
        }
        if (waited < 0) {
            if (errno == EINTR) {
                continue;
            }
            return WaitOutcome::Lost;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            kill(pid, SIGKILL);
            killed = true;
            continue;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

}  // namespace

std::string CommandResult::describeFailure() const {
    if (!launched) {
        return errorOutput.empty() ? "command could not be started" : errorOutput;
    }
    if (timedOut) {
        return "command timed out";
    }
    std::string detail = errorOutput.empty() ? output : errorOutput;
    while (!detail.empty() && (detail.back() == '\n' || detail.back() == '\r')) {
        detail.pop_back();
    }
    return "exit code " + std::to_string(exitCode) + (detail.empty() ? "" : ": " + detail);
}

std::string joinCommand(const std::vector<std::string>& args) {
    std::string joined;
    for (const auto& arg : args) {
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += arg;
    }
    return joined;
}

CommandResult ProcessRunner::run(const std::vector<std::string>& args,
                                 std::chrono::milliseconds timeout) {
    CommandResult result;
    if (args.empty()) {
        result.errorOutput = "empty command";
        return result;
    }

    Logger::debug("Running: " + joinCommand(args));

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    int execPipe[2] = {-1, -1};
    if (!makePipe(outPipe) || !makePipe(errPipe) || !makePipe(execPipe)) {
        result.errorOutput = std::string("pipe failed: ") + strerror(errno);
        closeFd(outPipe[0]); closeFd(outPipe[1]);
        closeFd(errPipe[0]); closeFd(errPipe[1]);
        closeFd(execPipe[0]); closeFd(execPipe[1]);
        return result;
    }

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        result.errorOutput = std::string("fork failed: ") + strerror(errno);
        closeFd(outPipe[0]); closeFd(outPipe[1]);
        closeFd(errPipe[0]); closeFd(errPipe[1]);
        closeFd(execPipe[0]); closeFd(execPipe[1]);
        return result;
    }

    if (pid == 0) {
        // child: Ctrl-C cancels the run between items, it must not kill
        // the tool mid-transfer. SIG_IGN survives execvp.
        signal(SIGINT, SIG_IGN);
        int devNull = open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            dup2(devNull, STDIN_FILENO);
            close(devNull);
        }
        dup2(outPipe[1], STDOUT_FILENO);
        dup2(errPipe[1], STDERR_FILENO);
        execvp(argv[0], argv.data());
        int err = errno;
        ssize_t ignored = write(execPipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    closeFd(outPipe[1]);
    closeFd(errPipe[1]);
    closeFd(execPipe[1]);

    // The exec pipe is close-on-exec: EOF means execvp succeeded
    int execErrno = 0;
    ssize_t n;
    do {
        n = read(execPipe[0], &execErrno, sizeof(execErrno));
    } while (n < 0 && errno == EINTR);
    closeFd(execPipe[0]);

    if (n == static_cast<ssize_t>(sizeof(execErrno))) {
        waitpid(pid, nullptr, 0);
        closeFd(outPipe[0]);
        closeFd(errPipe[0]);
        result.errorOutput = args[0] + ": " + strerror(execErrno);
        return result;
    }
    result.launched = true;

    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (outPipe[0] >= 0 || errPipe[0] >= 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            break;
        }

        struct pollfd fds[2];
        nfds_t count = 0;
        if (outPipe[0] >= 0) {
            fds[count].fd = outPipe[0];
            fds[count].events = POLLIN;
            fds[count].revents = 0;
            ++count;
        }
        if (errPipe[0] >= 0) {
            fds[count].fd = errPipe[0];
            fds[count].events = POLLIN;
            fds[count].revents = 0;
            ++count;
        }

        int ready = poll(fds, count, pollTimeout(remaining));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            result.errorOutput = std::string("poll failed: ") + strerror(errno);
            kill(pid, SIGKILL);
            break;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) {
                continue;
            }
            int& fd = (fds[i].fd == outPipe[0]) ? outPipe[0] : errPipe[0];
            std::string& sink = (&fd == &outPipe[0]) ? result.output : result.errorOutput;
            if (!drain(fd, sink)) {
                closeFd(fd);
            }
        }
    }

    closeFd(outPipe[0]);
    closeFd(errPipe[0]);

    // The pipes can close long before the process exits (daemonizing tools,
    // a wedged umount), so the deadline still applies here
    int status = 0;
    WaitOutcome waited = waitUntil(pid, deadline, status);
    if (waited == WaitOutcome::Killed) {
        result.timedOut = true;
        result.exitCode = 128 + SIGKILL;
    } else if (waited == WaitOutcome::Exited) {
        if (WIFEXITED(status)) {
            result.exitCode = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            result.exitCode = 128 + WTERMSIG(status);
        }
    }

    if (result.timedOut) {
        Logger::warning("Command timed out after " + std::to_string(timeout.count()) +
                        " ms: " + joinCommand(args));
    }
    return result;
}
