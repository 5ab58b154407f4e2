#pragma once

#include "backup/transport_adapter.hpp"
#include "common/backup_status.hpp"
#include <string>
#include <functional>

// Checks every catalog entry against the destination directory after the
// transfer pass, whether or not that pass completed. By default a candidate is
// verified iff destinationRoot/fileName exists with exactly sizeBytes bytes. A
// truncated or corrupted file with a matching length passes this check; turn on
// checksum mode to also compare SHA-256 digests of source and copy. Candidates
// sharing a fileName never verify.
class BackupVerifier {
public:
    using ProgressCallback = std::function<void(size_t checked, size_t total)>;

    explicit BackupVerifier(const std::string& destinationRoot);
    ~BackupVerifier();

    // Digest comparison needs an established adapter for sourceDigest()
    void enableChecksums(TransportAdapter* adapter);
    bool checksumsEnabled() const { return digestSource_ != nullptr; }

    void setProgressCallback(ProgressCallback callback);

    VerificationResult verify(const Catalog& catalog);

private:
    bool verifyOne(const MediaCandidate& candidate, std::string& reason);

    std::string destinationRoot_;
    TransportAdapter* digestSource_{nullptr};
    ProgressCallback progressCallback_;
};
