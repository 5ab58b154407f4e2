#include "common/backup_status.hpp"
#include <algorithm>

size_t DeletionReport::deletedCount() const {
    return static_cast<size_t>(std::count_if(outcomes.begin(), outcomes.end(),
                                             [](const DeletionOutcome& o) { return o.deleted; }));
}

size_t DeletionReport::failedCount() const {
    return outcomes.size() - deletedCount();
}

std::string transferStateToString(TransferState state) {
    switch (state) {
        case TransferState::Skipped: return "skipped";
        case TransferState::Copied:  return "copied";
        case TransferState::Failed:  return "failed";
        default:                     return "unknown";
    }
}
