#include "backup/transfer_engine.hpp"
#include "common/logger.hpp"
#include <chrono>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

TransferEngine::TransferEngine(TransportAdapter& adapter, const std::string& destinationRoot)
    : adapter_(adapter)
    , destinationRoot_(destinationRoot) {
}

std::string TransferEngine::destinationFor(const MediaCandidate& candidate) const {
    return (fs::path(destinationRoot_) / candidate.fileName).string();
}

bool TransferEngine::matchesSize(const std::string& path, uint64_t expectedSize) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return false;
    }
    uint64_t size = fs::file_size(path, ec);
    return !ec && size == expectedSize;
}

std::vector<TransferOutcome> TransferEngine::run(const Catalog& catalog,
                                                 const std::atomic<bool>* cancelFlag) {
    std::vector<TransferOutcome> outcomes;
    outcomes.reserve(catalog.size());
    bytesCopied_ = 0;

    const size_t total = catalog.size();
    for (size_t i = 0; i < total; ++i) {
        if (cancelFlag && cancelFlag->load()) {
            Logger::warning("Transfer cancelled after " + std::to_string(i) + " of " +
                            std::to_string(total) + " file(s)");
            break;
        }

        TransferOutcome outcome = transferOne(catalog[i], i + 1, total);
        outcomes.push_back(outcome);
        if (outcomeCallback_) {
            outcomeCallback_(i + 1, total, outcome);
        }
    }
    return outcomes;
}

TransferOutcome TransferEngine::transferOne(const MediaCandidate& candidate, size_t index, size_t total) {
    TransferOutcome outcome;
    outcome.candidate = candidate;
    outcome.index = index;
    outcome.total = total;

    std::string destPath = destinationFor(candidate);
    if (matchesSize(destPath, candidate.sizeBytes)) {
        outcome.state = TransferState::Skipped;
        Logger::debug("Skipped (already copied): " + candidate.fileName);
        return outcome;
    }

    adapter_.clearLastError();
    auto start = std::chrono::steady_clock::now();
    bool fetched = false;
    std::string fetchError;
    try {
        fetched = adapter_.fetch(candidate, destPath);
    } catch (const std::exception& e) {
        fetchError = e.what();
    }
    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;

    if (!fetched) {
        if (fetchError.empty()) {
            fetchError = adapter_.getLastError().empty() ? "fetch failed" : adapter_.getLastError();
        }
        outcome.state = TransferState::Failed;
        outcome.error = fetchError;
        Logger::error("Error copying " + candidate.fileName + ": " + outcome.error);
        return outcome;
    }

    outcome.state = TransferState::Copied;
    outcome.elapsedSeconds = elapsed.count();
    outcome.bytesPerSecond = outcome.elapsedSeconds > 0.0
        ? static_cast<double>(candidate.sizeBytes) / outcome.elapsedSeconds
        : 0.0;
    bytesCopied_ += candidate.sizeBytes;

    Logger::info("Copied " + candidate.fileName + " (" + std::to_string(candidate.sizeBytes) +
                 " bytes in " + std::to_string(outcome.elapsedSeconds) + " s)");
    return outcome;
}
