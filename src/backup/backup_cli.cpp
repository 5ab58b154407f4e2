#include "backup/backup_cli.hpp"
#include "backup/run_report.hpp"
#include "backup/catalog_builder.hpp"
#include "backup/transport_adapter_factory.hpp"
#include "main/backup_main.hpp"
#include "common/logger.hpp"
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <algorithm>
#include <cctype>

namespace {

std::atomic<Job*> g_activeJob{nullptr};

void handleInterrupt(int) {
    Job* job = g_activeJob.load();
    if (job) {
        job->cancel();
    }
    // A second Ctrl-C terminates immediately
    std::signal(SIGINT, SIG_DFL);
}

// Installs the SIGINT handler for the lifetime of one job
class InterruptGuard {
public:
    explicit InterruptGuard(Job& job) {
        g_activeJob.store(&job);
        previous_ = std::signal(SIGINT, handleInterrupt);
    }
    ~InterruptGuard() {
        std::signal(SIGINT, previous_ == SIG_ERR ? SIG_DFL : previous_);
        g_activeJob.store(nullptr);
    }

    InterruptGuard(const InterruptGuard&) = delete;
    InterruptGuard& operator=(const InterruptGuard&) = delete;

private:
    void (*previous_)(int) = SIG_DFL;
};

bool parseSeconds(const std::string& text, std::chrono::seconds& out) {
    try {
        size_t consumed = 0;
        long long value = std::stoll(text, &consumed);
        if (consumed != text.size() || value <= 0 || value > kMaxTimeoutSeconds) {
            return false;
        }
        out = std::chrono::seconds(value);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

}  // namespace

BackupCLI::BackupCLI(std::istream& in, std::ostream& out, std::shared_ptr<CommandRunner> runner)
    : in_(in)
    , out_(out)
    , runner_(runner) {
}

BackupCLI::~BackupCLI() {
}

void BackupCLI::printUsage() const {
    printBackupUsage(out_);
}

bool BackupCLI::parseArguments(int argc, char* argv[], CliOptions& options, std::string& error) {
    // The config file is the base layer, so find it before applying flags
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            options.configPath = argv[i + 1];
        }
    }
    if (!options.configPath.empty() && !loadBackupConfig(options.configPath, options.config, error)) {
        return false;
    }

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        auto needValue = [&](std::string& value) {
            if (i + 1 >= argc) {
                error = "Missing value for " + arg;
                return false;
            }
            value = argv[++i];
            return true;
        };

        std::string value;
        if (arg == "-h" || arg == "--help") {
            options.showHelp = true;
        } else if (arg == "-v" || arg == "--version") {
            options.showVersion = true;
        } else if (arg == "-c" || arg == "--config") {
            if (!needValue(value)) return false;
        } else if (arg == "-d" || arg == "--dest") {
            if (!needValue(value)) return false;
            options.config.destinationRoot = value;
        } else if (arg == "--device") {
            if (!needValue(value)) return false;
            if (normalizeDeviceType(value).empty()) {
                error = "Invalid device type: " + value + " (expected iphone, pixel or android)";
                return false;
            }
            options.config.deviceType = value;
        } else if (arg == "-r" || arg == "--report") {
            if (!needValue(value)) return false;
            options.reportPath = value;
        } else if (arg == "--serial") {
            if (!needValue(value)) return false;
            options.config.adbSerial = value;
        } else if (arg == "--mount-point") {
            if (!needValue(value)) return false;
            options.config.mountPoint = value;
        } else if (arg == "--transfer-timeout") {
            if (!needValue(value)) return false;
            if (!parseSeconds(value, options.config.transferTimeout)) {
                error = "Invalid transfer timeout: " + value;
                return false;
            }
        } else if (arg == "--log") {
            if (!needValue(value)) return false;
            options.config.logPath = value;
        } else if (arg == "--log-level") {
            if (!needValue(value)) return false;
            LogLevel level;
            if (!Logger::parseLevel(value, level)) {
                error = "Invalid log level: " + value;
                return false;
            }
            options.config.logLevel = value;
        } else if (arg == "--checksum") {
            options.config.verifyChecksums = true;
        } else if (arg == "--no-date-dir") {
            options.config.useDateSubdirectory = false;
        } else if (arg == "-y" || arg == "--yes") {
            options.assumeYes = true;
        } else if (arg == "--delete") {
            options.deleteMode = CliOptions::DeleteMode::Always;
        } else if (arg == "--keep") {
            options.deleteMode = CliOptions::DeleteMode::Never;
        } else if (arg == "--verbose") {
            options.verbose = true;
        } else {
            error = "Unknown option: " + arg;
            return false;
        }
    }
    return true;
}

std::string BackupCLI::expandPath(const std::string& path) {
    std::string expanded = path;
    if (!expanded.empty() && expanded[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home && (expanded.size() == 1 || expanded[1] == '/')) {
            expanded = std::string(home) + expanded.substr(1);
        }
    }

    std::error_code ec;
    std::filesystem::path absolute = std::filesystem::absolute(expanded, ec);
    return ec ? expanded : absolute.lexically_normal().string();
}

std::string BackupCLI::formatGigabytes(uint64_t bytes) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2)
       << static_cast<double>(bytes) / (1024.0 * 1024.0 * 1024.0) << " GB";
    return ss.str();
}

std::string BackupCLI::formatMegabytes(double bytes) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << bytes / (1024.0 * 1024.0);
    return ss.str();
}

std::string BackupCLI::formatOutcome(const TransferOutcome& outcome) {
    std::ostringstream ss;
    std::ostringstream progress;
    progress << "(" << outcome.index << "/" << outcome.total << ", "
             << std::fixed << std::setprecision(2) << outcome.percent() << "%)";

    switch (outcome.state) {
        case TransferState::Skipped:
            ss << "Skipped (already copied): " << outcome.candidate.fileName << " " << progress.str();
            break;
        case TransferState::Copied:
            ss << "Copied: " << outcome.candidate.fileName << " " << progress.str()
               << " | Size: " << formatMegabytes(static_cast<double>(outcome.candidate.sizeBytes)) << " MB"
               << " | Speed: " << formatMegabytes(outcome.bytesPerSecond) << " MB/s";
            break;
        case TransferState::Failed:
            ss << "Error copying " << outcome.candidate.fileName << " " << progress.str()
               << ": " << outcome.error;
            break;
    }
    return ss.str();
}

std::string BackupCLI::promptLine(const std::string& question) {
    out_ << question << std::flush;
    std::string line;
    if (!std::getline(in_, line)) {
        out_ << "\n";
        return "";
    }
    size_t begin = line.find_first_not_of(" \t\r");
    size_t end = line.find_last_not_of(" \t\r");
    return begin == std::string::npos ? "" : line.substr(begin, end - begin + 1);
}

bool BackupCLI::promptYesNo(const std::string& question) {
    std::string answer = promptLine(question + " (Y/N): ");
    return answer == "Y" || answer == "y";
}

bool BackupCLI::completeInteractiveOptions(CliOptions& options) {
    if (options.config.destinationRoot.empty()) {
        options.config.destinationRoot = promptLine("Enter destination directory (required): ");
        if (options.config.destinationRoot.empty()) {
            out_ << "Destination directory is required. Exiting.\n";
            return false;
        }
    }
    options.config.destinationRoot = expandPath(options.config.destinationRoot);

    if (options.config.deviceType.empty()) {
        out_ << "Select device type:\n"
             << "  1. iPhone\n"
             << "  2. Pixel/Android\n";
        std::string choice = promptLine("Enter 1 or 2: ");
        if (choice == "1") {
            options.config.deviceType = "iphone";
        } else if (choice == "2") {
            options.config.deviceType = "android";
        } else {
            out_ << "Invalid device type selection. Exiting.\n";
            return false;
        }
    }
    options.config.deviceType = normalizeDeviceType(options.config.deviceType);
    if (options.config.deviceType.empty()) {
        out_ << "Invalid device type in configuration. Exiting.\n";
        return false;
    }
    return true;
}

void BackupCLI::printPreflight(const PreflightResult& preflight) const {
    out_ << "\nSpace Check:\n";
    out_ << "   Required: " << formatGigabytes(preflight.requiredBytes) << "\n";
    if (!preflight.measured) {
        out_ << "   Could not check drive space, assuming sufficient.\n";
        return;
    }
    out_ << "   Available: " << formatGigabytes(preflight.availableBytes) << "\n";
    if (preflight.sufficient) {
        out_ << "   Sufficient space available.\n";
    } else {
        out_ << "   Insufficient space! Short by " << formatGigabytes(preflight.shortageBytes()) << "\n";
    }
}

void BackupCLI::printVerification(const VerificationResult& verification) const {
    out_ << "\n" << verification.verified.size() << " file(s) verified.\n";
    if (!verification.failed.empty()) {
        out_ << "Some files failed to verify:\n";
        for (const auto& failure : verification.failed) {
            out_ << " - " << failure.fileName << " (" << failure.reason << ")\n";
        }
    }
}

BackupHooks BackupCLI::makeHooks(const CliOptions& options) {
    BackupHooks hooks;

    hooks.confirmStart = [this, &options]() {
        return options.assumeYes || promptYesNo("Do you want to commence copying files?");
    };

    hooks.onCatalog = [this](const Catalog& catalog) {
        if (!catalog.empty()) {
            out_ << "\nFound " << catalog.size() << " supported file(s) ("
                 << formatGigabytes(totalCatalogBytes(catalog)) << ")\n";
        }
    };

    hooks.onPreflight = [this](const PreflightResult& preflight) {
        printPreflight(preflight);
    };

    hooks.continueDespiteShortage = [this, &options](const PreflightResult&) {
        return options.assumeYes ||
               promptYesNo("\nInsufficient space on destination drive. Do you still want to continue?");
    };

    hooks.onOutcome = [this, &options](size_t index, size_t total, const TransferOutcome& outcome) {
        if (index == 1) {
            out_ << "\nStarting to copy " << total << " file(s) to "
                 << resolveDestination(options.config) << "...\n";
        }
        out_ << formatOutcome(outcome) << "\n" << std::flush;
    };

    // Size checks are instant, digests are not
    if (options.config.verifyChecksums) {
        hooks.onVerifyProgress = [this](size_t checked, size_t total) {
            out_ << "Verified checksum " << checked << "/" << total << "\n" << std::flush;
        };
    }

    hooks.onVerified = [this](const VerificationResult& verification) {
        printVerification(verification);
    };

    hooks.confirmDeletion = [this, &options](const VerificationResult& verification) {
        switch (options.deleteMode) {
            case CliOptions::DeleteMode::Always:
                return true;
            case CliOptions::DeleteMode::Never:
                out_ << "Skipped deletion.\n";
                return false;
            case CliOptions::DeleteMode::Ask:
                break;
        }
        bool confirmed = promptYesNo("\nDelete " + std::to_string(verification.verified.size()) +
                                     " successfully copied file(s) from the device?");
        if (!confirmed) {
            out_ << "Skipped deletion.\n";
        } else {
            out_ << "Deleting files...\n";
        }
        return confirmed;
    };

    hooks.onDeletion = [this](size_t, size_t, const DeletionOutcome& outcome) {
        if (outcome.deleted) {
            out_ << "Deleted: " << outcome.candidate.fileName << "\n" << std::flush;
        } else {
            out_ << "Error deleting " << outcome.candidate.fileName << ": " << outcome.error << "\n";
        }
    };

    return hooks;
}

void BackupCLI::printSummary(const BackupJob& job) const {
    const BackupRunResult& result = job.getResult();

    size_t copied = 0, skipped = 0, failed = 0;
    for (const auto& outcome : result.outcomes) {
        switch (outcome.state) {
            case TransferState::Copied:  ++copied;  break;
            case TransferState::Skipped: ++skipped; break;
            case TransferState::Failed:  ++failed;  break;
        }
    }

    if (job.isFailed()) {
        out_ << "Error: " << job.getError() << "\n";
        return;
    }
    if (job.isCancelled() && result.outcomes.empty()) {
        out_ << job.getStatus() << ".\n";
        return;
    }
    if (result.catalog.empty()) {
        out_ << "No supported files found.\n";
        return;
    }

    out_ << "\nSummary: " << copied << " copied, " << skipped << " skipped, " << failed << " failed";
    if (result.verificationRan) {
        out_ << "; " << result.verification.verified.size() << " verified, "
             << result.verification.failed.size() << " failed verification";
    }
    if (result.deletionRan) {
        out_ << "; " << result.deletion.deletedCount() << " deleted";
    }
    out_ << "\n";
    if (job.isCancelled()) {
        out_ << job.getStatus() << ".\n";
    } else {
        out_ << "\nDone.\n";
    }
}

int BackupCLI::exitCodeFor(const BackupJob& job) const {
    const BackupRunResult& result = job.getResult();
    if (job.isFailed()) {
        return 1;
    }
    if (job.isCancelled()) {
        return job.isCancelRequested() ? 130 : 0;
    }
    if (!result.verification.failed.empty() || result.deletion.failedCount() > 0) {
        return 1;
    }
    return 0;
}

int BackupCLI::run(int argc, char* argv[]) {
    CliOptions options;
    std::string error;
    if (!parseArguments(argc, argv, options, error)) {
        std::cerr << "Error: " << error << std::endl;
        printUsage();
        return 2;
    }

    if (options.showHelp) {
        printUsage();
        return 0;
    }
    if (options.showVersion) {
        out_ << "phonevault version " << PHONEVAULT_VERSION << "\n";
        return 0;
    }

    LogLevel level = LogLevel::INFO;
    if (!Logger::parseLevel(options.config.logLevel, level)) {
        out_ << "Error: Invalid log level: " << options.config.logLevel << "\n";
        return 2;
    }
    if (!Logger::isInitialized() && !Logger::initialize(options.config.logPath, level)) {
        std::cerr << "Warning: logging to " << options.config.logPath << " is disabled" << std::endl;
    }
    Logger::setConsoleLevel(options.verbose ? LogLevel::INFO : LogLevel::WARNING);

    if (!completeInteractiveOptions(options)) {
        return 2;
    }

    std::shared_ptr<TransportAdapter> adapter;
    try {
        adapter = createTransportAdapter(options.config, runner_);
    } catch (const std::exception& e) {
        out_ << "Error: " << e.what() << "\n";
        return 2;
    }

    BackupJob job(adapter, options.config);
    job.setHooks(makeHooks(options));
    job.setStatusCallback([](const std::string& status) {
        Logger::debug("Status: " + status);
    });

    {
        InterruptGuard guard(job);
        job.run();
    }

    printSummary(job);

    if (!options.reportPath.empty() && !writeRunReport(expandPath(options.reportPath), job)) {
        out_ << "Warning: failed to write report to " << options.reportPath << "\n";
    }

    return exitCodeFor(job);
}
