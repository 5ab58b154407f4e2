#include "backup/run_report.hpp"
#include "common/logger.hpp"
#include <chrono>
#include <fstream>

using json = nlohmann::json;

namespace {

json candidateToJson(const MediaCandidate& candidate) {
    return {
        {"source", candidate.sourceRef},
        {"file_name", candidate.fileName},
        {"size_bytes", candidate.sizeBytes}
    };
}

}  // namespace

json runReportToJson(const BackupJob& job) {
    const BackupRunResult& result = job.getResult();

    json report;
    report["job_id"] = job.getId();
    report["state"] = Job::stateToString(job.getState());
    report["status"] = job.getStatus();
    if (!job.getError().empty()) {
        report["error"] = job.getError();
    }
    report["timestamp"] = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    report["device"] = result.deviceName;
    report["destination"] = result.destination;
    report["catalog_size"] = result.catalog.size();

    report["preflight"] = {
        {"measured", result.preflight.measured},
        {"sufficient", result.preflight.sufficient},
        {"required_bytes", result.preflight.requiredBytes},
        {"available_bytes", result.preflight.availableBytes},
        {"shortage_bytes", result.preflight.shortageBytes()}
    };

    json outcomes = json::array();
    for (const auto& outcome : result.outcomes) {
        json entry = candidateToJson(outcome.candidate);
        entry["index"] = outcome.index;
        entry["state"] = transferStateToString(outcome.state);
        if (outcome.state == TransferState::Copied) {
            entry["elapsed_seconds"] = outcome.elapsedSeconds;
            entry["bytes_per_second"] = outcome.bytesPerSecond;
        } else if (outcome.state == TransferState::Failed) {
            entry["error"] = outcome.error;
        }
        outcomes.push_back(entry);
    }
    report["transfers"] = outcomes;
    if (result.transferInterrupted) {
        report["transfer_interrupted"] = result.interruptReason;
    }

    if (result.verificationRan) {
        json verified = json::array();
        for (const auto& candidate : result.verification.verified) {
            verified.push_back(candidate.sourceRef);
        }
        json failed = json::array();
        for (const auto& failure : result.verification.failed) {
            failed.push_back({{"file_name", failure.fileName}, {"reason", failure.reason}});
        }
        report["verified"] = verified;
        report["failed"] = failed;
    }

    if (result.deletionRan) {
        json deletions = json::array();
        for (const auto& outcome : result.deletion.outcomes) {
            json entry = {{"source", outcome.candidate.sourceRef}, {"deleted", outcome.deleted}};
            if (!outcome.deleted) {
                entry["error"] = outcome.error;
            }
            deletions.push_back(entry);
        }
        report["deletions"] = deletions;
    }
    return report;
}

bool writeRunReport(const std::string& path, const BackupJob& job) {
    try {
        std::ofstream file(path);
        if (!file.is_open()) {
            Logger::error("Failed to open report file for writing: " + path);
            return false;
        }
        file << runReportToJson(job).dump(4);
        Logger::info("Wrote run report to " + path);
        return true;
    } catch (const std::exception& e) {
        Logger::error("Failed to write run report: " + std::string(e.what()));
        return false;
    }
}
