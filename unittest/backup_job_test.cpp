#include <gtest/gtest.h>
#include "backup/backup_job.hpp"
#include "backup/backup_cli.hpp"
#include "backup/run_report.hpp"
#include "common/logger.hpp"
#include "test_support.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

SpacePreflight fixedSpace(uint64_t available) {
    return SpacePreflight([available](const std::string&) { return std::optional<uint64_t>(available); });
}

BackupHooks acceptEverything() {
    BackupHooks hooks;
    hooks.confirmStart = []() { return true; };
    hooks.continueDespiteShortage = [](const PreflightResult&) { return true; };
    hooks.confirmDeletion = [](const VerificationResult&) { return true; };
    return hooks;
}

}  // namespace

class BackupJobTest : public ::testing::Test {
protected:
    void SetUp() override {
        adapter_ = std::make_shared<FakeTransportAdapter>();
        adapter_->catalog = {makeCandidate("a.jpg", 10), makeCandidate("b.mov", 20), makeCandidate("c.png", 30)};
        config_.destinationRoot = dest_.path();
        config_.useDateSubdirectory = false;
    }

    TempDir dest_;
    BackupConfig config_;
    std::shared_ptr<FakeTransportAdapter> adapter_;
};

TEST_F(BackupJobTest, FullRunCopiesVerifiesAndDeletes) {
    BackupJob job(adapter_, config_, fixedSpace(1 << 20));
    job.setHooks(acceptEverything());

    EXPECT_TRUE(job.run());
    EXPECT_TRUE(job.isCompleted());

    const BackupRunResult& result = job.getResult();
    EXPECT_EQ(result.deviceName, "Fake");
    EXPECT_EQ(result.destination, dest_.path());
    EXPECT_EQ(result.outcomes.size(), 3u);
    EXPECT_TRUE(result.verificationRan);
    EXPECT_EQ(result.verification.verified.size(), 3u);
    EXPECT_TRUE(result.deletionRan);
    EXPECT_EQ(result.deletion.deletedCount(), 3u);
    EXPECT_EQ(adapter_->removed.size(), 3u);
    EXPECT_EQ(adapter_->establishCount, 1);
    EXPECT_EQ(adapter_->teardownCount, 1);
}

TEST_F(BackupJobTest, DateSubdirectoryIsCreated) {
    config_.useDateSubdirectory = true;
    BackupJob job(adapter_, config_, fixedSpace(1 << 20));
    job.setHooks(acceptEverything());

    ASSERT_TRUE(job.run());
    EXPECT_NE(job.getResult().destination, dest_.path());
    EXPECT_TRUE(fs::is_directory(job.getResult().destination));
    EXPECT_TRUE(fs::exists(fs::path(job.getResult().destination) / "a.jpg"));
}

TEST_F(BackupJobTest, VerificationProgressReachesHooks) {
    std::vector<size_t> checked;
    BackupHooks hooks = acceptEverything();
    hooks.onVerifyProgress = [&checked](size_t done, size_t total) {
        EXPECT_EQ(total, 3u);
        checked.push_back(done);
    };
    BackupJob job(adapter_, config_, fixedSpace(1 << 20));
    job.setHooks(hooks);

    EXPECT_TRUE(job.run());
    EXPECT_EQ(checked, std::vector<size_t>({1, 2, 3}));
}

TEST_F(BackupJobTest, DeclinedDeletionLeavesDeviceUntouched) {
    BackupHooks hooks = acceptEverything();
    hooks.confirmDeletion = [](const VerificationResult&) { return false; };
    BackupJob job(adapter_, config_, fixedSpace(1 << 20));
    job.setHooks(hooks);

    EXPECT_TRUE(job.run());
    EXPECT_FALSE(job.getResult().deletionRan);
    EXPECT_TRUE(adapter_->removed.empty());
}

TEST_F(BackupJobTest, UnsetDeletionHookNeverDeletes) {
    BackupJob job(adapter_, config_, fixedSpace(1 << 20));
    EXPECT_TRUE(job.run());
    EXPECT_TRUE(adapter_->removed.empty());
}

TEST_F(BackupJobTest, OnlyVerifiedFilesAreDeleted) {
    adapter_->failingFetches = {"b.mov"};
    adapter_->writtenSizes["c.png"] = 29;

    VerificationResult seen;
    BackupHooks hooks = acceptEverything();
    hooks.onVerified = [&seen](const VerificationResult& verification) { seen = verification; };
    BackupJob job(adapter_, config_, fixedSpace(1 << 20));
    job.setHooks(hooks);

    EXPECT_TRUE(job.run());
    ASSERT_EQ(seen.verified.size(), 1u);
    EXPECT_EQ(seen.failed.size(), 2u);
    EXPECT_EQ(adapter_->removed, std::vector<std::string>({"/device/DCIM/a.jpg"}));
}

TEST_F(BackupJobTest, ShortageDeclinedStopsBeforeTransfer) {
    BackupHooks hooks = acceptEverything();
    PreflightResult seen;
    hooks.continueDespiteShortage = [&seen](const PreflightResult& preflight) {
        seen = preflight;
        return false;
    };
    BackupJob job(adapter_, config_, fixedSpace(40));
    job.setHooks(hooks);

    EXPECT_FALSE(job.run());
    EXPECT_TRUE(job.isCancelled());
    EXPECT_FALSE(seen.sufficient);
    EXPECT_EQ(seen.shortageBytes(), 20u);
    EXPECT_TRUE(adapter_->fetched.empty());
    EXPECT_EQ(adapter_->teardownCount, 1);
}

TEST_F(BackupJobTest, ShortageAcceptedStillTransfers) {
    BackupJob job(adapter_, config_, fixedSpace(40));
    job.setHooks(acceptEverything());

    EXPECT_TRUE(job.run());
    EXPECT_FALSE(job.getResult().preflight.sufficient);
    EXPECT_EQ(adapter_->fetched.size(), 3u);
}

TEST_F(BackupJobTest, DeclinedStartDoesNothing) {
    BackupHooks hooks = acceptEverything();
    hooks.confirmStart = []() { return false; };
    BackupJob job(adapter_, config_, fixedSpace(1 << 20));
    job.setHooks(hooks);

    EXPECT_FALSE(job.run());
    EXPECT_TRUE(job.isCancelled());
    EXPECT_TRUE(job.getResult().catalog.empty());
    EXPECT_TRUE(adapter_->fetched.empty());
    EXPECT_EQ(adapter_->teardownCount, 1);
}

TEST_F(BackupJobTest, EmptyCatalogCompletes) {
    adapter_->catalog.clear();
    BackupJob job(adapter_, config_, fixedSpace(1 << 20));
    job.setHooks(acceptEverything());

    EXPECT_TRUE(job.run());
    EXPECT_EQ(job.getStatus(), "No supported files found");
    EXPECT_FALSE(job.getResult().verificationRan);
    EXPECT_EQ(adapter_->teardownCount, 1);
}

TEST_F(BackupJobTest, MissingToolingFailsBeforeConnecting) {
    adapter_->toolingAvailable = false;
    BackupJob job(adapter_, config_, fixedSpace(1 << 20));

    EXPECT_FALSE(job.run());
    EXPECT_TRUE(job.isFailed());
    EXPECT_EQ(job.getError(), "fake tool not found");
    EXPECT_EQ(adapter_->establishCount, 0);
}

TEST_F(BackupJobTest, UnreachableDeviceFails) {
    adapter_->reachable = false;
    BackupJob job(adapter_, config_, fixedSpace(1 << 20));

    EXPECT_FALSE(job.run());
    EXPECT_TRUE(job.isFailed());
    EXPECT_EQ(job.getError(), "Fake device not found");
}

TEST_F(BackupJobTest, EstablishFailureFails) {
    adapter_->establishSucceeds = false;
    BackupJob job(adapter_, config_, fixedSpace(1 << 20));

    EXPECT_FALSE(job.run());
    EXPECT_TRUE(job.isFailed());
    EXPECT_NE(job.getError().find("mount failed"), std::string::npos);
    EXPECT_EQ(adapter_->teardownCount, 0);
}

TEST_F(BackupJobTest, ExceptionDuringListingStillTearsDown) {
    adapter_->throwOnList = true;
    BackupJob job(adapter_, config_, fixedSpace(1 << 20));
    job.setHooks(acceptEverything());

    EXPECT_FALSE(job.run());
    EXPECT_TRUE(job.isFailed());
    EXPECT_NE(job.getError().find("device disconnected"), std::string::npos);
    EXPECT_EQ(adapter_->teardownCount, 1);
}

TEST_F(BackupJobTest, ThrowingFetchDoesNotStopTheRun) {
    adapter_->throwOnFetch = "b.mov";
    BackupJob job(adapter_, config_, fixedSpace(1 << 20));
    job.setHooks(acceptEverything());

    EXPECT_TRUE(job.run());
    const BackupRunResult& result = job.getResult();
    EXPECT_FALSE(result.transferInterrupted);
    ASSERT_EQ(result.outcomes.size(), 3u);
    EXPECT_EQ(result.outcomes[1].state, TransferState::Failed);
    EXPECT_EQ(result.outcomes[1].error, "transport lost");
    EXPECT_EQ(result.outcomes[2].state, TransferState::Copied);
    EXPECT_EQ(result.verification.verified.size(), 2u);
    EXPECT_EQ(adapter_->removed,
              std::vector<std::string>({"/device/DCIM/a.jpg", "/device/DCIM/c.png"}));
}

TEST_F(BackupJobTest, InterruptedTransferStillVerifies) {
    BackupHooks hooks = acceptEverything();
    hooks.onOutcome = [](size_t index, size_t, const TransferOutcome&) {
        if (index == 1) {
            throw std::runtime_error("progress sink closed");
        }
    };
    BackupJob job(adapter_, config_, fixedSpace(1 << 20));
    job.setHooks(hooks);

    EXPECT_TRUE(job.run());
    const BackupRunResult& result = job.getResult();
    EXPECT_TRUE(result.transferInterrupted);
    EXPECT_EQ(result.interruptReason, "progress sink closed");
    EXPECT_EQ(result.outcomes.size(), 1u);
    ASSERT_TRUE(result.verificationRan);
    EXPECT_EQ(result.verification.verified.size(), 1u);
    EXPECT_EQ(result.verification.failed.size(), 2u);
    EXPECT_EQ(adapter_->removed, std::vector<std::string>({"/device/DCIM/a.jpg"}));
}

TEST_F(BackupJobTest, CancelledRunVerifiesButNeverDeletes) {
    BackupJob job(adapter_, config_, fixedSpace(1 << 20));
    adapter_->onFetch = [&job](const MediaCandidate& candidate) {
        if (candidate.fileName == "a.jpg") {
            job.cancel();
        }
    };
    job.setHooks(acceptEverything());

    EXPECT_FALSE(job.run());
    EXPECT_TRUE(job.isCancelled());
    EXPECT_TRUE(job.getResult().verificationRan);
    EXPECT_EQ(job.getResult().verification.verified.size(), 1u);
    EXPECT_FALSE(job.getResult().deletionRan);
    EXPECT_TRUE(adapter_->removed.empty());
    EXPECT_EQ(adapter_->teardownCount, 1);
}

TEST_F(BackupJobTest, SecondRunSkipsCopiedFiles) {
    {
        BackupJob first(adapter_, config_, fixedSpace(1 << 20));
        ASSERT_TRUE(first.run());
    }
    adapter_->fetched.clear();

    BackupJob second(adapter_, config_, fixedSpace(1 << 20));
    ASSERT_TRUE(second.run());
    for (const auto& outcome : second.getResult().outcomes) {
        EXPECT_EQ(outcome.state, TransferState::Skipped);
    }
    EXPECT_TRUE(adapter_->fetched.empty());
}

TEST_F(BackupJobTest, RunOnlyOnce) {
    BackupJob job(adapter_, config_, fixedSpace(1 << 20));
    EXPECT_TRUE(job.run());
    EXPECT_FALSE(job.run());
}

TEST_F(BackupJobTest, MissingDestinationFails) {
    config_.destinationRoot.clear();
    BackupJob job(adapter_, config_, fixedSpace(1 << 20));
    EXPECT_FALSE(job.run());
    EXPECT_TRUE(job.isFailed());
    EXPECT_EQ(adapter_->establishCount, 0);
}

TEST_F(BackupJobTest, RunReportDescribesTheRun) {
    adapter_->failingFetches = {"b.mov"};
    BackupJob job(adapter_, config_, fixedSpace(1 << 20));
    job.setHooks(acceptEverything());
    ASSERT_TRUE(job.run());

    nlohmann::json report = runReportToJson(job);
    EXPECT_EQ(report["state"], "completed");
    EXPECT_EQ(report["device"], "Fake");
    EXPECT_EQ(report["catalog_size"], 3);
    ASSERT_EQ(report["transfers"].size(), 3u);
    EXPECT_EQ(report["transfers"][1]["state"], "failed");
    EXPECT_EQ(report["transfers"][1]["error"], "fetch failed for b.mov");
    EXPECT_EQ(report["verified"].size(), 2u);
    EXPECT_EQ(report["failed"][0]["file_name"], "b.mov");
    EXPECT_EQ(report["deletions"].size(), 2u);
    EXPECT_TRUE(report["preflight"]["sufficient"].get<bool>());

    std::string path = dest_.file("report.json");
    ASSERT_TRUE(writeRunReport(path, job));
    std::ifstream in(path);
    nlohmann::json reread = nlohmann::json::parse(in);
    EXPECT_EQ(reread["job_id"], job.getId());
}

class BackupCLITest : public ::testing::Test {
protected:
    void SetUp() override {
        runner_ = std::make_shared<FakeCommandRunner>();
        device_.addFile("/sdcard/DCIM/Camera/b.mp4", 2048);
        device_.addFile("/sdcard/DCIM/Camera/a.jpg", 1024);
        device_.addFile("/sdcard/DCIM/Camera/notes.txt", 12);
        runner_->setHandler(device_.handler());
    }

    void TearDown() override {
        Logger::shutdown();
    }

    int runCli(std::vector<std::string> args, const std::string& input = "") {
        args.insert(args.begin(), "phonevault");
        args.push_back("--log");
        args.push_back(logDir_.file("phonevault.log"));
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(&arg[0]);
        }
        argv.push_back(nullptr);

        std::istringstream in(input);
        out_.str("");
        BackupCLI cli(in, out_, runner_);
        return cli.run(static_cast<int>(args.size()), argv.data());
    }

    TempDir dest_;
    TempDir logDir_;
    FakeAdbDevice device_;
    std::shared_ptr<FakeCommandRunner> runner_;
    std::ostringstream out_;
};

TEST_F(BackupCLITest, NonInteractiveRunCopiesAndDeletes) {
    int rc = runCli({"--dest", dest_.path(), "--device", "pixel", "--no-date-dir", "--yes", "--delete"});
    EXPECT_EQ(rc, 0) << out_.str();
    EXPECT_TRUE(TransferEngine::matchesSize(dest_.file("a.jpg"), 1024));
    EXPECT_TRUE(TransferEngine::matchesSize(dest_.file("b.mp4"), 2048));
    EXPECT_FALSE(fs::exists(dest_.file("notes.txt")));
    EXPECT_EQ(device_.removed().size(), 2u);
    EXPECT_TRUE(device_.hasFile("/sdcard/DCIM/Camera/notes.txt"));

    std::string output = out_.str();
    EXPECT_NE(output.find("Copied: a.jpg (1/2, 50.00%) | Size: 0.00 MB | Speed:"), std::string::npos);
    EXPECT_NE(output.find("Copied: b.mp4 (2/2, 100.00%)"), std::string::npos);
    EXPECT_NE(output.find("2 file(s) verified."), std::string::npos);
    EXPECT_NE(output.find("Deleted: a.jpg"), std::string::npos);
}

TEST_F(BackupCLITest, InteractivePromptsAndDeclinedDeletion) {
    std::string input = dest_.path() + "\n2\nY\nN\n";
    int rc = runCli({"--no-date-dir"}, input);
    EXPECT_EQ(rc, 0) << out_.str();

    std::string output = out_.str();
    EXPECT_NE(output.find("1. iPhone"), std::string::npos);
    EXPECT_NE(output.find("Do you want to commence copying files? (Y/N)"), std::string::npos);
    EXPECT_NE(output.find("Skipped deletion."), std::string::npos);
    EXPECT_TRUE(device_.removed().empty());
    EXPECT_TRUE(fs::exists(dest_.file("a.jpg")));
}

TEST_F(BackupCLITest, ClosedInputDeclinesEverything) {
    int rc = runCli({"--dest", dest_.path(), "--device", "android", "--no-date-dir"});
    EXPECT_EQ(rc, 0);
    EXPECT_TRUE(device_.removed().empty());
    EXPECT_FALSE(fs::exists(dest_.file("a.jpg")));
}

TEST_F(BackupCLITest, RerunReportsSkippedFiles) {
    ASSERT_EQ(runCli({"--dest", dest_.path(), "--device", "pixel", "--no-date-dir", "--yes", "--keep"}), 0);
    ASSERT_EQ(runCli({"--dest", dest_.path(), "--device", "pixel", "--no-date-dir", "--yes", "--keep"}), 0);
    EXPECT_NE(out_.str().find("Skipped (already copied): a.jpg (1/2, 50.00%)"), std::string::npos);
    EXPECT_EQ(runner_->countStartingWith("adb -s SERIAL1 pull"), 2u);
}

TEST_F(BackupCLITest, MissingDeviceExitsWithError) {
    device_.setAttached(false);
    int rc = runCli({"--dest", dest_.path(), "--device", "pixel", "--yes"});
    EXPECT_EQ(rc, 1);
    EXPECT_NE(out_.str().find("Error: Android device not found"), std::string::npos);
}

TEST_F(BackupCLITest, WritesReport) {
    std::string reportPath = dest_.file("report.json");
    ASSERT_EQ(runCli({"--dest", dest_.path(), "--device", "pixel", "--no-date-dir", "--yes", "--keep",
                      "--report", reportPath}), 0);
    std::ifstream in(reportPath);
    ASSERT_TRUE(in.is_open());
    nlohmann::json report = nlohmann::json::parse(in);
    EXPECT_EQ(report["device"], "Android");
    EXPECT_EQ(report["transfers"].size(), 2u);
}

TEST_F(BackupCLITest, HelpAndUsageErrors) {
    EXPECT_EQ(runCli({"--help"}), 0);
    EXPECT_NE(out_.str().find("Usage: phonevault"), std::string::npos);
    EXPECT_EQ(runCli({"--device", "nokia"}), 2);
    EXPECT_EQ(runCli({"--bogus"}), 2);
    EXPECT_EQ(runCli({"--dest"}), 2);
}

TEST(BackupCLIParseTest, ConfigFileThenFlags) {
    TempDir dir;
    writeFileContent(dir.file("config.json"), R"({"destination": "/from/config", "device": "iphone",
                                                  "transfer_timeout": 60})");
    std::string configPath = dir.file("config.json");
    std::vector<std::string> args = {"phonevault", "--device", "pixel", "--config", configPath,
                                     "--checksum", "--keep", "--serial", "R58M"};
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(&arg[0]);
    }

    CliOptions options;
    std::string error;
    ASSERT_TRUE(BackupCLI::parseArguments(static_cast<int>(argv.size()), argv.data(), options, error)) << error;
    EXPECT_EQ(options.config.destinationRoot, "/from/config");
    EXPECT_EQ(options.config.deviceType, "pixel");
    EXPECT_EQ(options.config.transferTimeout, std::chrono::seconds(60));
    EXPECT_TRUE(options.config.verifyChecksums);
    EXPECT_EQ(options.config.adbSerial, "R58M");
    EXPECT_EQ(options.deleteMode, CliOptions::DeleteMode::Never);
}

TEST(BackupCLIFormatTest, Formatting) {
    EXPECT_EQ(BackupCLI::formatGigabytes(0), "0.00 GB");
    EXPECT_EQ(BackupCLI::formatGigabytes(3ULL * 1024 * 1024 * 1024 / 2), "1.50 GB");
    EXPECT_EQ(BackupCLI::formatMegabytes(5.0 * 1024 * 1024), "5.00");

    TransferOutcome outcome;
    outcome.candidate = makeCandidate("IMG_1.HEIC", 2 * 1024 * 1024);
    outcome.index = 1;
    outcome.total = 3;
    outcome.state = TransferState::Copied;
    outcome.bytesPerSecond = 1024 * 1024;
    EXPECT_EQ(BackupCLI::formatOutcome(outcome),
              "Copied: IMG_1.HEIC (1/3, 33.33%) | Size: 2.00 MB | Speed: 1.00 MB/s");

    outcome.state = TransferState::Skipped;
    EXPECT_EQ(BackupCLI::formatOutcome(outcome), "Skipped (already copied): IMG_1.HEIC (1/3, 33.33%)");

    outcome.state = TransferState::Failed;
    outcome.error = "timed out";
    EXPECT_EQ(BackupCLI::formatOutcome(outcome), "Error copying IMG_1.HEIC (1/3, 33.33%): timed out");
}

TEST(BackupCLIFormatTest, ExpandPath) {
    const char* home = std::getenv("HOME");
    if (home) {
        EXPECT_EQ(BackupCLI::expandPath("~/Pictures"), (fs::path(home) / "Pictures").lexically_normal().string());
    }
    EXPECT_EQ(BackupCLI::expandPath("/a/b/../c"), "/a/c");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
