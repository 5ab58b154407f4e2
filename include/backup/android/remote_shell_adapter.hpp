#pragma once

#include "backup/transport_adapter.hpp"
#include "backup/backup_config.hpp"
#include "common/command_runner.hpp"
#include <memory>
#include <string>
#include <vector>

// Android access through adb. Every operation is a request/response command
// against the device selected by establish().
class RemoteShellAdapter : public TransportAdapter {
public:
    RemoteShellAdapter(std::shared_ptr<CommandRunner> runner, const BackupConfig& config);
    ~RemoteShellAdapter() override;

    std::string deviceName() const override { return "Android"; }

    bool checkTooling() override;
    bool isReachable() override;
    bool establish() override;
    void teardown() override;
    bool isEstablished() const override { return !serial_.empty(); }

    Catalog listCandidates() override;
    bool fetch(const MediaCandidate& candidate, const std::string& destPath) override;
    bool remove(const MediaCandidate& candidate) override;
    std::optional<std::string> sourceDigest(const MediaCandidate& candidate) override;

    std::string getLastError() const override { return lastError_; }
    void clearLastError() override { lastError_.clear(); }

    const std::string& getSerial() const { return serial_; }

    // Serials of devices in "device" state from `adb devices` output
    static std::vector<std::string> parseDeviceList(const std::string& output);
    // Single-quotes a path for the device shell
    static std::string shellQuote(const std::string& value);

private:
    bool requireEstablished();
    std::vector<std::string> adbArgs(std::vector<std::string> args) const;
    std::vector<std::string> connectedDevices();

    std::shared_ptr<CommandRunner> runner_;
    BackupConfig config_;
    std::string serial_;
    std::string lastError_;
};
