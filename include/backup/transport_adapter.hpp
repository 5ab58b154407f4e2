#pragma once

#include "common/backup_status.hpp"
#include <optional>
#include <string>

// Device-kind specific access to media on a phone. The adapter owns its device
// handle (mount point, selected device serial) between establish() and
// teardown(); every other device operation requires an established handle.
//
// Fatal conditions (missing tooling, unreachable device, failed establish) are
// reported through the bool returns plus getLastError(). Per-item failures in
// listCandidates(), fetch() and remove() never abort the caller's loop.
class TransportAdapter {
public:
    virtual ~TransportAdapter() = default;

    // Human readable device kind, e.g. "iPhone"
    virtual std::string deviceName() const = 0;

    // Connection management
    virtual bool checkTooling() = 0;
    virtual bool isReachable() = 0;
    virtual bool establish() = 0;
    virtual void teardown() = 0;
    virtual bool isEstablished() const = 0;

    // Recursive scan of the device media directory. Items whose size cannot
    // be read are logged and left out.
    virtual Catalog listCandidates() = 0;

    // Copies the candidate to destPath, replacing any existing file.
    virtual bool fetch(const MediaCandidate& candidate, const std::string& destPath) = 0;

    // Destructive. Only the deletion gate calls this, with verified candidates.
    virtual bool remove(const MediaCandidate& candidate) = 0;

    // Lowercase hex SHA-256 of the source item, if the transport can produce one
    virtual std::optional<std::string> sourceDigest(const MediaCandidate& candidate) = 0;

    // Error handling
    virtual std::string getLastError() const = 0;
    virtual void clearLastError() = 0;
};
