#pragma once

#include <string>
#include <chrono>

// Configuration for one backup run
struct BackupConfig {
    std::string destinationRoot;   // Directory receiving the media files
    std::string deviceType;        // "iphone" or "android" ("pixel" is accepted as android)
    bool useDateSubdirectory{true};  // Append YYYY-MM-DD below destinationRoot
    bool verifyChecksums{false};   // Compare SHA-256 digests in addition to sizes

    // Mounted filesystem (iPhone) settings
    std::string mountPoint;        // Empty means /tmp/phonevault_mount_<pid>
    std::string mountedMediaDir{"DCIM"};

    // Remote shell (Android) settings
    std::string adbSerial;         // Empty means first device in "device" state
    std::string remoteMediaDir{"/sdcard/DCIM"};

    // Per-call timeouts at the adapter boundary
    std::chrono::seconds controlTimeout{5};
    std::chrono::seconds commandTimeout{10};  // mount, unmount, delete
    std::chrono::seconds listTimeout{30};
    std::chrono::seconds transferTimeout{300};

    std::string logPath{"/tmp/phonevault.log"};
    std::string logLevel{"info"};
};

// Upper bound for any configured timeout
constexpr long long kMaxTimeoutSeconds = 7 * 24 * 60 * 60;

// Overlays values from a JSON file onto config. Unknown keys are ignored.
bool loadBackupConfig(const std::string& path, BackupConfig& config, std::string& error);

// "pixel" -> "android", lowercase. Returns empty for unknown types.
std::string normalizeDeviceType(const std::string& deviceType);

// destinationRoot, or destinationRoot/YYYY-MM-DD when useDateSubdirectory is set
std::string resolveDestination(const BackupConfig& config);
