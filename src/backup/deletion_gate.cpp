#include "backup/deletion_gate.hpp"
#include "common/logger.hpp"

DeletionGate::DeletionGate(TransportAdapter& adapter)
    : adapter_(adapter) {
}

DeletionReport DeletionGate::run(const VerificationResult& verification,
                                 const std::atomic<bool>* cancelFlag) {
    DeletionReport report;
    const size_t total = verification.verified.size();
    Logger::info("Deleting " + std::to_string(total) + " verified file(s) from " + adapter_.deviceName());

    for (size_t i = 0; i < total; ++i) {
        if (cancelFlag && cancelFlag->load()) {
            Logger::warning("Deletion cancelled after " + std::to_string(i) + " of " +
                            std::to_string(total) + " file(s)");
            break;
        }

        const MediaCandidate& candidate = verification.verified[i];
        DeletionOutcome outcome;
        outcome.candidate = candidate;

        adapter_.clearLastError();
        if (adapter_.remove(candidate)) {
            outcome.deleted = true;
            Logger::info("Deleted " + candidate.sourceRef);
        } else {
            outcome.error = adapter_.getLastError().empty() ? "remove failed" : adapter_.getLastError();
            Logger::error("Error deleting " + candidate.fileName + ": " + outcome.error);
        }

        report.outcomes.push_back(outcome);
        if (deletionCallback_) {
            deletionCallback_(i + 1, total, outcome);
        }
    }

    Logger::info(std::to_string(report.deletedCount()) + " file(s) deleted, " +
                 std::to_string(report.failedCount()) + " failed");
    return report;
}
