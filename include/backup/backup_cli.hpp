#pragma once

#include "backup/backup_config.hpp"
#include "backup/backup_job.hpp"
#include "common/command_runner.hpp"
#include <iosfwd>
#include <memory>
#include <string>

struct CliOptions {
    enum class DeleteMode {
        Ask,
        Always,
        Never
    };

    BackupConfig config;
    std::string configPath;
    std::string reportPath;
    bool assumeYes = false;
    bool verbose = false;
    DeleteMode deleteMode = DeleteMode::Ask;
    bool showHelp = false;
    bool showVersion = false;
};

// Command-line front end: option parsing, prompts and progress rendering.
// All text output goes through the streams given at construction; device
// tooling is reached through runner (a ProcessRunner when null).
class BackupCLI {
public:
    BackupCLI(std::istream& in, std::ostream& out, std::shared_ptr<CommandRunner> runner = nullptr);
    ~BackupCLI();

    int run(int argc, char* argv[]);
    void printUsage() const;

    // Applies the config file named by --config (if any), then the flags.
    static bool parseArguments(int argc, char* argv[], CliOptions& options, std::string& error);

    static std::string formatGigabytes(uint64_t bytes);
    static std::string formatMegabytes(double bytes);
    static std::string formatOutcome(const TransferOutcome& outcome);
    static std::string expandPath(const std::string& path);

private:
    bool promptYesNo(const std::string& question);
    std::string promptLine(const std::string& question);
    bool completeInteractiveOptions(CliOptions& options);
    BackupHooks makeHooks(const CliOptions& options);
    void printPreflight(const PreflightResult& preflight) const;
    void printVerification(const VerificationResult& verification) const;
    void printSummary(const BackupJob& job) const;
    int exitCodeFor(const BackupJob& job) const;

    std::istream& in_;
    std::ostream& out_;
    std::shared_ptr<CommandRunner> runner_;
};
