#include "backup/iphone/mounted_fs_adapter.hpp"
#include "backup/catalog_builder.hpp"
#include "common/checksum.hpp"
#include "common/logger.hpp"
#include <filesystem>
#include <system_error>
#include <vector>
#include <unistd.h>

namespace fs = std::filesystem;

MountedFsAdapter::MountedFsAdapter(std::shared_ptr<CommandRunner> runner, const BackupConfig& config)
    : runner_(runner)
    , config_(config) {
    mountPoint_ = config_.mountPoint.empty()
        ? "/tmp/phonevault_mount_" + std::to_string(getpid())
        : config_.mountPoint;
}

MountedFsAdapter::~MountedFsAdapter() {
    teardown();
}

bool MountedFsAdapter::checkTooling() {
    // Exit codes vary between releases; only the ability to launch matters
    for (const char* tool : {"ideviceinfo", "ifuse"}) {
        CommandResult result = runner_->run({tool, "--help"}, config_.controlTimeout);
        if (!result.launched) {
            lastError_ = std::string(tool) + " not found. Install libimobiledevice and ifuse";
            Logger::error(lastError_);
            return false;
        }
    }
    return true;
}

bool MountedFsAdapter::isReachable() {
    CommandResult result = runner_->run({"ideviceinfo", "-s"}, config_.controlTimeout);
    if (!result.succeeded()) {
        lastError_ = "iPhone not found: " + result.describeFailure();
        return false;
    }
    return true;
}

bool MountedFsAdapter::establish() {
    if (mounted_) {
        return true;
    }

    std::error_code ec;
    if (!fs::exists(mountPoint_, ec)) {
        if (!fs::create_directories(mountPoint_, ec)) {
            lastError_ = "Failed to create mount point " + mountPoint_ + ": " + ec.message();
            Logger::error(lastError_);
            return false;
        }
        createdMountPoint_ = true;
    }

    CommandResult result = runner_->run({"ifuse", mountPoint_}, config_.commandTimeout);
    if (!result.succeeded()) {
        lastError_ = "Failed to mount iPhone: " + result.describeFailure();
        Logger::error(lastError_);
        if (createdMountPoint_) {
            fs::remove(mountPoint_, ec);
            createdMountPoint_ = false;
        }
        return false;
    }

    mounted_ = true;
    Logger::info("Mounted iPhone at " + mountPoint_);
    return true;
}

void MountedFsAdapter::teardown() {
    if (!mounted_) {
        return;
    }
    mounted_ = false;

    CommandResult result = runner_->run({"umount", mountPoint_}, config_.commandTimeout);
    if (!result.succeeded()) {
        Logger::warning("Error unmounting " + mountPoint_ + ": " + result.describeFailure());
    } else {
        Logger::info("Unmounted iPhone from " + mountPoint_);
    }

    if (createdMountPoint_) {
        std::error_code ec;
        if (!fs::remove(mountPoint_, ec) && ec) {
            Logger::warning("Could not remove mount point " + mountPoint_ + ": " + ec.message());
        }
        createdMountPoint_ = false;
    }
}

bool MountedFsAdapter::requireMounted() {
    if (!mounted_) {
        lastError_ = "iPhone is not mounted";
        return false;
    }
    return true;
}

Catalog MountedFsAdapter::listCandidates() {
    if (!requireMounted()) {
        Logger::error(lastError_);
        return {};
    }

    fs::path mediaDir = fs::path(mountPoint_) / config_.mountedMediaDir;
    std::error_code ec;
    if (!fs::is_directory(mediaDir, ec)) {
        Logger::warning("Media folder not found at " + mediaDir.string());
        return {};
    }

    std::vector<RawListing> listing;
    fs::recursive_directory_iterator it(mediaDir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        Logger::warning("Could not scan " + mediaDir.string() + ": " + ec.message());
        return {};
    }

    const fs::recursive_directory_iterator end;
    while (it != end) {
        std::error_code entryEc;
        std::string fileName = it->path().filename().string();
        if (it->is_regular_file(entryEc) && isSupportedMediaFile(fileName)) {
            uint64_t size = fs::file_size(it->path(), entryEc);
            if (entryEc) {
                Logger::warning("Could not access " + fileName + ": " + entryEc.message());
            } else {
                listing.push_back(RawListing{it->path().string(), fileName, size});
            }
        }

        it.increment(ec);
        if (ec) {
            // The iterator cannot advance past this point
            Logger::warning("Scan of " + mediaDir.string() + " stopped early: " + ec.message());
            break;
        }
    }

    Catalog catalog = buildCatalog(listing);
    Logger::info("Found " + std::to_string(catalog.size()) + " media file(s) under " + mediaDir.string());
    return catalog;
}

bool MountedFsAdapter::fetch(const MediaCandidate& candidate, const std::string& destPath) {
    if (!requireMounted()) {
        return false;
    }

    std::error_code ec;
    fs::copy_file(candidate.sourceRef, destPath, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        lastError_ = "Failed to copy " + candidate.fileName + ": " + ec.message();
        return false;
    }
    return true;
}

bool MountedFsAdapter::remove(const MediaCandidate& candidate) {
    if (!requireMounted()) {
        return false;
    }

    std::error_code ec;
    if (!fs::remove(candidate.sourceRef, ec)) {
        lastError_ = "Failed to delete " + candidate.fileName + ": " +
                     (ec ? ec.message() : std::string("file not found"));
        return false;
    }
    return true;
}

std::optional<std::string> MountedFsAdapter::sourceDigest(const MediaCandidate& candidate) {
    if (!requireMounted()) {
        return std::nullopt;
    }

    try {
        return sha256File(candidate.sourceRef);
    } catch (const std::exception& e) {
        lastError_ = e.what();
        return std::nullopt;
    }
}
