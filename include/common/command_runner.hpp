#pragma once

#include <chrono>
#include <string>
#include <vector>

struct CommandResult {
    bool launched = false;   // false when the executable could not be started
    bool timedOut = false;
    int exitCode = -1;
    std::string output;
    std::string errorOutput;

    bool succeeded() const { return launched && !timedOut && exitCode == 0; }
    std::string describeFailure() const;
};

// Blocking command execution with a per-call deadline. The adapters reach all
// device tooling (ifuse, ideviceinfo, adb, umount) through this interface.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    virtual CommandResult run(const std::vector<std::string>& args,
                              std::chrono::milliseconds timeout) = 0;
};

// fork/execvp implementation. The child's stdin is /dev/null, it ignores
// SIGINT, and it is killed with SIGKILL once the deadline passes, even after
// it has closed its output.
class ProcessRunner : public CommandRunner {
public:
    ProcessRunner() = default;
    ~ProcessRunner() override = default;

    CommandResult run(const std::vector<std::string>& args,
                      std::chrono::milliseconds timeout) override;
};

std::string joinCommand(const std::vector<std::string>& args);
