#pragma once

#include "backup/transport_adapter.hpp"
#include "common/backup_status.hpp"
#include <atomic>
#include <functional>

using DeletionCallback = std::function<void(size_t index, size_t total, const DeletionOutcome& outcome)>;

// The only caller of TransportAdapter::remove(). It accepts nothing but a
// VerificationResult and removes exactly its verified candidates. There is no
// confirmation step and no undo; callers confirm before calling run().
class DeletionGate {
public:
    explicit DeletionGate(TransportAdapter& adapter);

    void setDeletionCallback(DeletionCallback callback) { deletionCallback_ = callback; }

    DeletionReport run(const VerificationResult& verification,
                       const std::atomic<bool>* cancelFlag = nullptr);

private:
    TransportAdapter& adapter_;
    DeletionCallback deletionCallback_;
};
