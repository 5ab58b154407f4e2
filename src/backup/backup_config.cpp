#include "backup/backup_config.hpp"
#include "common/logger.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <fstream>

using json = nlohmann::json;

namespace {

bool readSeconds(const json& j, const char* key, std::chrono::seconds& out, std::string& error) {
    if (!j.contains(key)) {
        return true;
    }
    if (!j[key].is_number_integer() || j[key].get<long long>() <= 0 ||
        j[key].get<long long>() > kMaxTimeoutSeconds) {
        error = std::string("'") + key + "' must be a positive integer (seconds) of at most " +
                std::to_string(kMaxTimeoutSeconds);
        return false;
    }
    out = std::chrono::seconds(j[key].get<long long>());
    return true;
}

bool readString(const json& j, const char* key, std::string& out, std::string& error) {
    if (!j.contains(key)) {
        return true;
    }
    if (!j[key].is_string()) {
        error = std::string("'") + key + "' must be a string";
        return false;
    }
    out = j[key].get<std::string>();
    return true;
}

bool readBool(const json& j, const char* key, bool& out, std::string& error) {
    if (!j.contains(key)) {
        return true;
    }
    if (!j[key].is_boolean()) {
        error = std::string("'") + key + "' must be a boolean";
        return false;
    }
    out = j[key].get<bool>();
    return true;
}

}  // namespace

bool loadBackupConfig(const std::string& path, BackupConfig& config, std::string& error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        error = "Failed to open config file: " + path;
        return false;
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        error = "Failed to parse config file " + path + ": " + e.what();
        return false;
    }

    if (!j.is_object()) {
        error = "Config file must contain a JSON object: " + path;
        return false;
    }

    BackupConfig loaded = config;
    if (!readString(j, "destination", loaded.destinationRoot, error) ||
        !readString(j, "device", loaded.deviceType, error) ||
        !readBool(j, "date_subdirectory", loaded.useDateSubdirectory, error) ||
        !readBool(j, "verify_checksums", loaded.verifyChecksums, error) ||
        !readString(j, "mount_point", loaded.mountPoint, error) ||
        !readString(j, "mounted_media_dir", loaded.mountedMediaDir, error) ||
        !readString(j, "adb_serial", loaded.adbSerial, error) ||
        !readString(j, "remote_media_dir", loaded.remoteMediaDir, error) ||
        !readSeconds(j, "control_timeout", loaded.controlTimeout, error) ||
        !readSeconds(j, "command_timeout", loaded.commandTimeout, error) ||
        !readSeconds(j, "list_timeout", loaded.listTimeout, error) ||
        !readSeconds(j, "transfer_timeout", loaded.transferTimeout, error) ||
        !readString(j, "log_path", loaded.logPath, error) ||
        !readString(j, "log_level", loaded.logLevel, error)) {
        error = path + ": " + error;
        return false;
    }

    config = loaded;
    Logger::debug("Loaded configuration from " + path);
    return true;
}

std::string normalizeDeviceType(const std::string& deviceType) {
    std::string lower = deviceType;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "iphone") {
        return "iphone";
    }
    if (lower == "android" || lower == "pixel") {
        return "android";
    }
    return "";
}

std::string resolveDestination(const BackupConfig& config) {
    if (!config.useDateSubdirectory) {
        return config.destinationRoot;
    }

    std::time_t now = std::time(nullptr);
    char today[16];
    std::strftime(today, sizeof(today), "%Y-%m-%d", std::localtime(&now));
    return (std::filesystem::path(config.destinationRoot) / today).string();
}
