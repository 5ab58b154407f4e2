#include "backup/backup_verifier.hpp"
#include "common/checksum.hpp"
#include "common/logger.hpp"
#include <filesystem>
#include <map>
#include <optional>
#include <system_error>

BackupVerifier::BackupVerifier(const std::string& destinationRoot)
    : destinationRoot_(destinationRoot) {
}

BackupVerifier::~BackupVerifier() = default;

void BackupVerifier::enableChecksums(TransportAdapter* adapter) {
    digestSource_ = adapter;
}

void BackupVerifier::setProgressCallback(ProgressCallback callback) {
    progressCallback_ = callback;
}

VerificationResult BackupVerifier::verify(const Catalog& catalog) {
    VerificationResult result;
    Logger::info("Verifying " + std::to_string(catalog.size()) + " file(s) in " + destinationRoot_ +
                 (checksumsEnabled() ? " (size and SHA-256)" : " (size)"));

    // Same-named candidates share one destination file, so none of them
    // can be shown to have its own copy
    std::map<std::string, size_t> nameCounts;
    for (const auto& candidate : catalog) {
        ++nameCounts[candidate.fileName];
    }

    size_t checked = 0;
    for (const auto& candidate : catalog) {
        std::string reason;
        if (nameCounts[candidate.fileName] > 1) {
            reason = "duplicate file name in catalog";
            Logger::warning("Verification failed for " + candidate.sourceRef + ": " + reason);
            result.failed.push_back(VerificationFailure{candidate.fileName, reason});
        } else if (verifyOne(candidate, reason)) {
            result.verified.push_back(candidate);
        } else {
            Logger::warning("Verification failed for " + candidate.fileName + ": " + reason);
            result.failed.push_back(VerificationFailure{candidate.fileName, reason});
        }

        ++checked;
        if (progressCallback_) {
            progressCallback_(checked, catalog.size());
        }
    }

    Logger::info(std::to_string(result.verified.size()) + " file(s) verified, " +
                 std::to_string(result.failed.size()) + " failed");
    return result;
}

bool BackupVerifier::verifyOne(const MediaCandidate& candidate, std::string& reason) {
    std::filesystem::path destPath = std::filesystem::path(destinationRoot_) / candidate.fileName;

    std::error_code ec;
    if (!std::filesystem::is_regular_file(destPath, ec)) {
        reason = "missing at destination";
        return false;
    }

    uint64_t size = std::filesystem::file_size(destPath, ec);
    if (ec) {
        reason = "cannot read destination size: " + ec.message();
        return false;
    }
    if (size != candidate.sizeBytes) {
        reason = "size mismatch (expected " + std::to_string(candidate.sizeBytes) +
                 ", found " + std::to_string(size) + ")";
        return false;
    }

    if (!digestSource_) {
        return true;
    }

    std::optional<std::string> sourceDigest = digestSource_->sourceDigest(candidate);
    if (!sourceDigest) {
        reason = "source checksum unavailable: " + digestSource_->getLastError();
        return false;
    }

    try {
        std::string destDigest = sha256File(destPath.string());
        if (destDigest != *sourceDigest) {
            reason = "checksum mismatch";
            return false;
        }
    } catch (const std::exception& e) {
        reason = std::string("cannot hash destination: ") + e.what();
        return false;
    }
    return true;
}
