#pragma once

#include "common/job.hpp"
#include "common/backup_status.hpp"
#include "backup/backup_config.hpp"
#include "backup/transport_adapter.hpp"
#include "backup/space_preflight.hpp"
#include "backup/transfer_engine.hpp"
#include "backup/deletion_gate.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>

// Decisions and progress reporting delegated to the caller. Unset decision
// hooks answer "no", except confirmStart which defaults to proceeding.
struct BackupHooks {
    std::function<bool()> confirmStart;
    std::function<void(const Catalog&)> onCatalog;
    std::function<void(const PreflightResult&)> onPreflight;
    std::function<bool(const PreflightResult&)> continueDespiteShortage;
    OutcomeCallback onOutcome;
    std::function<void(size_t checked, size_t total)> onVerifyProgress;
    std::function<void(const VerificationResult&)> onVerified;
    std::function<bool(const VerificationResult&)> confirmDeletion;
    DeletionCallback onDeletion;
};

struct BackupRunResult {
    std::string deviceName;
    std::string destination;
    Catalog catalog;
    PreflightResult preflight;
    std::vector<TransferOutcome> outcomes;
    bool transferInterrupted = false;
    std::string interruptReason;
    bool verificationRan = false;
    VerificationResult verification;
    bool deletionRan = false;
    DeletionReport deletion;
};

// One backup run: enumerate, preflight, transfer, verify, then optionally
// delete verified originals. Runs synchronously on the calling thread.
class BackupJob : public Job {
public:
    BackupJob(std::shared_ptr<TransportAdapter> adapter,
              const BackupConfig& config,
              SpacePreflight preflight = SpacePreflight());
    ~BackupJob() override;

    void setHooks(const BackupHooks& hooks) { hooks_ = hooks; }

    // Returns true when the run reached COMPLETED
    bool run() override;

    const BackupRunResult& getResult() const { return result_; }
    BackupConfig getConfig() const { return config_; }

private:
    bool executeRun();
    bool validateBackupConfig();
    bool createDestinationDirectory();
    void transferPhase(TransportAdapter& adapter);
    void verificationPhase(TransportAdapter& adapter);
    void deletionPhase(TransportAdapter& adapter);
    void fail(const std::string& error);
    void finishCancelled(const std::string& status);

    std::shared_ptr<TransportAdapter> adapter_;
    BackupConfig config_;
    SpacePreflight preflight_;
    BackupHooks hooks_;
    BackupRunResult result_;
};
