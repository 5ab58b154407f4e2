#include "backup/android/remote_shell_adapter.hpp"
#include "backup/catalog_builder.hpp"
#include "common/checksum.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace {

std::string trim(const std::string& value) {
    const char* whitespace = " \t\r\n";
    size_t begin = value.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = value.find_last_not_of(whitespace);
    return value.substr(begin, end - begin + 1);
}

std::string baseName(const std::string& remotePath) {
    size_t slash = remotePath.find_last_of('/');
    return slash == std::string::npos ? remotePath : remotePath.substr(slash + 1);
}

}  // namespace

RemoteShellAdapter::RemoteShellAdapter(std::shared_ptr<CommandRunner> runner, const BackupConfig& config)
    : runner_(runner)
    , config_(config) {
}

RemoteShellAdapter::~RemoteShellAdapter() {
    teardown();
}

std::vector<std::string> RemoteShellAdapter::parseDeviceList(const std::string& output) {
    std::vector<std::string> serials;
    std::istringstream lines(output);
    std::string line;
    bool header = true;
    while (std::getline(lines, line)) {
        line = trim(line);
        if (header) {
            // "List of devices attached"
            header = false;
            continue;
        }
        if (line.empty() || line[0] == '*') {
            continue;
        }
        std::istringstream fields(line);
        std::string serial, state;
        fields >> serial >> state;
        if (!serial.empty() && state == "device") {
            serials.push_back(serial);
        }
    }
    return serials;
}

std::string RemoteShellAdapter::shellQuote(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::vector<std::string> RemoteShellAdapter::adbArgs(std::vector<std::string> args) const {
    std::vector<std::string> full = {"adb"};
    if (!serial_.empty()) {
        full.push_back("-s");
        full.push_back(serial_);
    }
    full.insert(full.end(), args.begin(), args.end());
    return full;
}

bool RemoteShellAdapter::checkTooling() {
    CommandResult result = runner_->run({"adb", "version"}, config_.controlTimeout);
    if (!result.succeeded()) {
        lastError_ = "adb not found. Install Android Platform Tools (" + result.describeFailure() + ")";
        Logger::error(lastError_);
        return false;
    }
    return true;
}

std::vector<std::string> RemoteShellAdapter::connectedDevices() {
    CommandResult result = runner_->run({"adb", "devices"}, config_.controlTimeout);
    if (!result.succeeded()) {
        lastError_ = "adb devices failed: " + result.describeFailure();
        return {};
    }
    return parseDeviceList(result.output);
}

bool RemoteShellAdapter::isReachable() {
    std::vector<std::string> devices = connectedDevices();
    if (devices.empty()) {
        if (lastError_.empty()) {
            lastError_ = "Android device not found";
        }
        return false;
    }
    if (!config_.adbSerial.empty() &&
        std::find(devices.begin(), devices.end(), config_.adbSerial) == devices.end()) {
        lastError_ = "Android device " + config_.adbSerial + " not found";
        return false;
    }
    return true;
}

bool RemoteShellAdapter::establish() {
    if (isEstablished()) {
        return true;
    }

    std::vector<std::string> devices = connectedDevices();
    if (devices.empty()) {
        lastError_ = "No Android device in 'device' state";
        Logger::error(lastError_);
        return false;
    }

    if (config_.adbSerial.empty()) {
        if (devices.size() > 1) {
            Logger::warning("Multiple Android devices connected, using " + devices.front());
        }
        serial_ = devices.front();
    } else if (std::find(devices.begin(), devices.end(), config_.adbSerial) != devices.end()) {
        serial_ = config_.adbSerial;
    } else {
        lastError_ = "Android device " + config_.adbSerial + " is not connected";
        Logger::error(lastError_);
        return false;
    }

    Logger::info("Using Android device " + serial_);
    return true;
}

void RemoteShellAdapter::teardown() {
    if (!serial_.empty()) {
        Logger::info("Released Android device " + serial_);
        serial_.clear();
    }
}

bool RemoteShellAdapter::requireEstablished() {
    if (!isEstablished()) {
        lastError_ = "No Android device selected";
        return false;
    }
    return true;
}

Catalog RemoteShellAdapter::listCandidates() {
    if (!requireEstablished()) {
        Logger::error(lastError_);
        return {};
    }

    CommandResult found = runner_->run(
        adbArgs({"shell", "find " + shellQuote(config_.remoteMediaDir) + " -type f"}),
        config_.listTimeout);
    if (!found.succeeded()) {
        Logger::warning("Could not access " + config_.remoteMediaDir + ": " + found.describeFailure());
        return {};
    }

    std::vector<RawListing> listing;
    std::istringstream lines(found.output);
    std::string line;
    while (std::getline(lines, line)) {
        std::string remotePath = trim(line);
        if (remotePath.empty()) {
            continue;
        }

        std::string fileName = baseName(remotePath);
        if (!isSupportedMediaFile(fileName)) {
            continue;
        }

        CommandResult stat = runner_->run(
            adbArgs({"shell", "stat -c %s " + shellQuote(remotePath)}),
            config_.controlTimeout);
        if (!stat.succeeded()) {
            Logger::warning("Could not access " + fileName + ": " + stat.describeFailure());
            continue;
        }

        try {
            std::string sizeText = trim(stat.output);
            size_t consumed = 0;
            unsigned long long size = std::stoull(sizeText, &consumed);
            if (consumed != sizeText.size()) {
                throw std::invalid_argument(sizeText);
            }
            listing.push_back(RawListing{remotePath, fileName, static_cast<uint64_t>(size)});
        } catch (const std::exception&) {
            Logger::warning("Could not read size of " + fileName + ": unexpected output '" +
                            trim(stat.output) + "'");
        }
    }

    Catalog catalog = buildCatalog(listing);
    Logger::info("Found " + std::to_string(catalog.size()) + " media file(s) under " + config_.remoteMediaDir);
    return catalog;
}

bool RemoteShellAdapter::fetch(const MediaCandidate& candidate, const std::string& destPath) {
    if (!requireEstablished()) {
        return false;
    }

    // adb pull replaces an existing destination file
    CommandResult result = runner_->run(adbArgs({"pull", candidate.sourceRef, destPath}),
                                        config_.transferTimeout);
    if (!result.succeeded()) {
        lastError_ = "adb pull failed for " + candidate.fileName + ": " + result.describeFailure();
        return false;
    }
    return true;
}

bool RemoteShellAdapter::remove(const MediaCandidate& candidate) {
    if (!requireEstablished()) {
        return false;
    }

    CommandResult result = runner_->run(adbArgs({"shell", "rm " + shellQuote(candidate.sourceRef)}),
                                        config_.commandTimeout);
    if (!result.succeeded()) {
        lastError_ = "Failed to delete " + candidate.fileName + ": " + result.describeFailure();
        return false;
    }
    return true;
}

std::optional<std::string> RemoteShellAdapter::sourceDigest(const MediaCandidate& candidate) {
    if (!requireEstablished()) {
        return std::nullopt;
    }

    CommandResult result = runner_->run(adbArgs({"shell", "sha256sum " + shellQuote(candidate.sourceRef)}),
                                        config_.transferTimeout);
    if (!result.succeeded()) {
        lastError_ = "sha256sum failed for " + candidate.fileName + ": " + result.describeFailure();
        return std::nullopt;
    }

    std::istringstream fields(result.output);
    std::string digest;
    fields >> digest;
    std::transform(digest.begin(), digest.end(), digest.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (!isSha256Hex(digest)) {
        lastError_ = "Unexpected sha256sum output for " + candidate.fileName;
        return std::nullopt;
    }
    return digest;
}
