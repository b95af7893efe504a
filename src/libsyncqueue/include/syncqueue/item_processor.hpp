#pragma once

#include "syncqueue/sync_action.hpp"

namespace syncqueue {

// Applies one handler attempt to one queue item and computes its next state:
//
//   PENDING -> SYNCED   handler succeeded
//   PENDING -> PENDING  handler failed, attempts left
//   PENDING -> FAILED   handler failed, attempts exhausted
//
// A handler that reports the action as not its own leaves the item as is.
class ItemProcessor {
public:
    ProcessResult process(const QueueItem& item, const SyncActionHandler& handler) const;

private:
    static ProcessResult fail(const QueueItem& item, const std::string& message);
};

} // namespace syncqueue
