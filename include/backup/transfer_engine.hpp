#pragma once

#include "backup/transport_adapter.hpp"
#include "common/backup_status.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

using OutcomeCallback = std::function<void(size_t index, size_t total, const TransferOutcome& outcome)>;

// Copies the catalog sequentially into a flat destination directory. A
// destination file that already exists with the expected size is skipped,
// which makes re-running over an interrupted backup cheap.
class TransferEngine {
public:
    TransferEngine(TransportAdapter& adapter, const std::string& destinationRoot);

    void setOutcomeCallback(OutcomeCallback callback) { outcomeCallback_ = callback; }

    // Stops between candidates once cancelFlag is set. Candidates not reached
    // get no outcome. A fetch that fails or throws yields a Failed outcome and
    // the loop moves on.
    std::vector<TransferOutcome> run(const Catalog& catalog,
                                     const std::atomic<bool>* cancelFlag = nullptr);

    uint64_t bytesCopied() const { return bytesCopied_; }

    std::string destinationFor(const MediaCandidate& candidate) const;

    // True when path exists with exactly expectedSize bytes
    static bool matchesSize(const std::string& path, uint64_t expectedSize);

private:
    TransferOutcome transferOne(const MediaCandidate& candidate, size_t index, size_t total);

    TransportAdapter& adapter_;
    std::string destinationRoot_;
    OutcomeCallback outcomeCallback_;
    uint64_t bytesCopied_{0};
};
