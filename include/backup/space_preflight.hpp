#pragma once

#include "common/backup_status.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

struct PreflightResult {
    bool sufficient = true;
    bool measured = false;        // false when free space could not be read
    uint64_t requiredBytes = 0;
    uint64_t availableBytes = 0;

    // Magnitude of the gap: shortage when insufficient, surplus otherwise
    uint64_t shortageBytes() const { return sufficient ? 0 : requiredBytes - availableBytes; }
    uint64_t surplusBytes() const { return sufficient && measured ? availableBytes - requiredBytes : 0; }
};

// Advisory only: the caller decides whether to continue after a shortfall.
class SpacePreflight {
public:
    // Returns free bytes, or nullopt when the volume cannot be queried
    using FreeSpaceProbe = std::function<std::optional<uint64_t>(const std::string& path)>;

    SpacePreflight();
    explicit SpacePreflight(FreeSpaceProbe probe);

    PreflightResult check(const Catalog& catalog, const std::string& destination) const;

    static std::optional<uint64_t> filesystemFreeSpace(const std::string& path);

private:
    FreeSpaceProbe probe_;
};
