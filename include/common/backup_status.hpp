#pragma once

#include <cstdint>
#include <string>
#include <vector>

// One media item discovered on the device.
struct MediaCandidate {
    std::string sourceRef;   // Adapter-specific locator (mounted path or remote path)
    std::string fileName;    // Destination key, base name only
    uint64_t sizeBytes = 0;  // Size at enumeration time
};

// Candidates sorted by fileName ascending. Built once per run.
using Catalog = std::vector<MediaCandidate>;

// Raw (locator, name, size) triple as reported by a transport before filtering.
struct RawListing {
    std::string sourceRef;
    std::string fileName;
    uint64_t sizeBytes = 0;
};

enum class TransferState {
    Skipped,
    Copied,
    Failed
};

struct TransferOutcome {
    MediaCandidate candidate;
    TransferState state = TransferState::Failed;
    size_t index = 0;               // 1-based position in the catalog
    size_t total = 0;
    double elapsedSeconds = 0.0;    // Copied only
    double bytesPerSecond = 0.0;    // Copied only, zero when elapsed is zero
    std::string error;              // Failed only

    double percent() const {
        return total == 0 ? 0.0 : (static_cast<double>(index) * 100.0) / static_cast<double>(total);
    }
};

struct VerificationFailure {
    std::string fileName;
    std::string reason;
};

// Partition of the catalog. Only verified candidates may be deleted from the device.
struct VerificationResult {
    std::vector<MediaCandidate> verified;
    std::vector<VerificationFailure> failed;
};

struct DeletionOutcome {
    MediaCandidate candidate;
    bool deleted = false;
    std::string error;
};

struct DeletionReport {
    std::vector<DeletionOutcome> outcomes;
    size_t deletedCount() const;
    size_t failedCount() const;
};

std::string transferStateToString(TransferState state);
