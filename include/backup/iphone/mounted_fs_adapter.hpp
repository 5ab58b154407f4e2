#pragma once

#include "backup/transport_adapter.hpp"
#include "backup/backup_config.hpp"
#include "common/command_runner.hpp"
#include <memory>
#include <string>

// iPhone access through libimobiledevice: the device filesystem is mounted
// with ifuse and then handled as a normal directory tree.
class MountedFsAdapter : public TransportAdapter {
public:
    MountedFsAdapter(std::shared_ptr<CommandRunner> runner, const BackupConfig& config);
    ~MountedFsAdapter() override;

    std::string deviceName() const override { return "iPhone"; }

    bool checkTooling() override;
    bool isReachable() override;
    bool establish() override;
    void teardown() override;
    bool isEstablished() const override { return mounted_; }

    Catalog listCandidates() override;
    bool fetch(const MediaCandidate& candidate, const std::string& destPath) override;
    bool remove(const MediaCandidate& candidate) override;
    std::optional<std::string> sourceDigest(const MediaCandidate& candidate) override;

    std::string getLastError() const override { return lastError_; }
    void clearLastError() override { lastError_.clear(); }

    const std::string& getMountPoint() const { return mountPoint_; }

private:
    bool requireMounted();

    std::shared_ptr<CommandRunner> runner_;
    BackupConfig config_;
    std::string mountPoint_;
    bool mounted_{false};
    bool createdMountPoint_{false};
    std::string lastError_;
};
