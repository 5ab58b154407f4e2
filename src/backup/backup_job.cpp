#include "backup/backup_job.hpp"
#include "backup/backup_verifier.hpp"
#include "backup/device_session.hpp"
#include "common/logger.hpp"
#include <filesystem>
#include <system_error>

BackupJob::BackupJob(std::shared_ptr<TransportAdapter> adapter,
                     const BackupConfig& config,
                     SpacePreflight preflight)
    : adapter_(adapter)
    , config_(config)
    , preflight_(preflight) {
    setId(generateId());
    setStatus("pending");
}

BackupJob::~BackupJob() = default;

bool BackupJob::run() {
    if (getState() != State::PENDING) {
        setError("Cannot run job in current state");
        return false;
    }

    setState(State::RUNNING);
    try {
        return executeRun();
    } catch (const std::exception& e) {
        // The device session has already been released during unwinding
        fail(std::string("Backup failed: ") + e.what());
        return false;
    }
}

bool BackupJob::executeRun() {
    if (!validateBackupConfig()) {
        return false;
    }

    result_ = BackupRunResult();
    result_.deviceName = adapter_->deviceName();
    result_.destination = resolveDestination(config_);
    if (!createDestinationDirectory()) {
        return false;
    }

    setStatus("Checking device tooling");
    if (!adapter_->checkTooling()) {
        fail(adapter_->getLastError());
        return false;
    }

    setStatus("Looking for " + result_.deviceName);
    if (!adapter_->isReachable()) {
        fail(adapter_->getLastError().empty() ? result_.deviceName + " not found" : adapter_->getLastError());
        return false;
    }

    DeviceSession session(*adapter_);
    setStatus("Connected to " + result_.deviceName);

    if (hooks_.confirmStart && !hooks_.confirmStart()) {
        finishCancelled("Operation cancelled by user");
        return false;
    }

    setStatus("Scanning device for media");
    result_.catalog = adapter_->listCandidates();
    if (hooks_.onCatalog) {
        hooks_.onCatalog(result_.catalog);
    }
    if (result_.catalog.empty()) {
        Logger::warning("No supported files found on " + result_.deviceName);
        setStatus("No supported files found");
        setState(State::COMPLETED);
        return true;
    }

    result_.preflight = preflight_.check(result_.catalog, result_.destination);
    if (hooks_.onPreflight) {
        hooks_.onPreflight(result_.preflight);
    }
    if (!result_.preflight.sufficient) {
        bool proceed = hooks_.continueDespiteShortage && hooks_.continueDespiteShortage(result_.preflight);
        if (!proceed) {
            finishCancelled("Operation cancelled: insufficient space");
            return false;
        }
        Logger::warning("Continuing despite insufficient space");
    }

    transferPhase(*adapter_);
    verificationPhase(*adapter_);

    if (isCancelRequested()) {
        // A cancelled run verifies what it has but never deletes
        session.release();
        finishCancelled("Backup cancelled");
        return false;
    }

    deletionPhase(*adapter_);
    session.release();

    setStatus("Done");
    setState(State::COMPLETED);
    return true;
}

void BackupJob::transferPhase(TransportAdapter& adapter) {
    setStatus("Copying " + std::to_string(result_.catalog.size()) + " file(s) to " + result_.destination);

    TransferEngine engine(adapter, result_.destination);
    std::vector<TransferOutcome> outcomes;
    engine.setOutcomeCallback([this, &outcomes](size_t index, size_t total, const TransferOutcome& outcome) {
        outcomes.push_back(outcome);
        if (hooks_.onOutcome) {
            hooks_.onOutcome(index, total, outcome);
        }
    });

    // An interrupted pass must still fall through to verification
    try {
        engine.run(result_.catalog, &cancelFlag());
    } catch (const std::exception& e) {
        result_.transferInterrupted = true;
        result_.interruptReason = e.what();
        Logger::error("Transfer was interrupted: " + std::string(e.what()));
    }
    result_.outcomes = outcomes;
}

void BackupJob::verificationPhase(TransportAdapter& adapter) {
    setStatus("Verifying copied files");

    BackupVerifier verifier(result_.destination);
    if (config_.verifyChecksums) {
        verifier.enableChecksums(&adapter);
    }
    verifier.setProgressCallback(hooks_.onVerifyProgress);
    result_.verification = verifier.verify(result_.catalog);
    result_.verificationRan = true;

    if (hooks_.onVerified) {
        hooks_.onVerified(result_.verification);
    }
}

void BackupJob::deletionPhase(TransportAdapter& adapter) {
    if (result_.verification.verified.empty()) {
        return;
    }

    if (!hooks_.confirmDeletion || !hooks_.confirmDeletion(result_.verification)) {
        Logger::info("Skipped deletion");
        return;
    }

    setStatus("Deleting verified files from " + result_.deviceName);
    DeletionGate gate(adapter);
    if (hooks_.onDeletion) {
        gate.setDeletionCallback(hooks_.onDeletion);
    }
    result_.deletion = gate.run(result_.verification, &cancelFlag());
    result_.deletionRan = true;
}

bool BackupJob::validateBackupConfig() {
    if (config_.destinationRoot.empty()) {
        fail("Destination directory is required");
        return false;
    }
    if (!adapter_) {
        fail("No transport adapter available");
        return false;
    }
    return true;
}

bool BackupJob::createDestinationDirectory() {
    std::error_code ec;
    std::filesystem::create_directories(result_.destination, ec);
    if (ec) {
        fail("Failed to create destination directory " + result_.destination + ": " + ec.message());
        return false;
    }
    return true;
}

void BackupJob::fail(const std::string& error) {
    Logger::error(error);
    setError(error);
    setStatus("failed");
    setState(State::FAILED);
}

void BackupJob::finishCancelled(const std::string& status) {
    Logger::info(status);
    setStatus(status);
    setState(State::CANCELLED);
}
