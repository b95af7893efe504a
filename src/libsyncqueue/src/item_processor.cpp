#include "syncqueue/item_processor.hpp"
#include <exception>

namespace syncqueue {

ProcessResult ItemProcessor::fail(const QueueItem& item, const std::string& message) {
    QueueItem next = item;
    next.attempts = item.attempts + 1;
    next.status = next.attempts >= next.max_attempts ? ItemStatus::Failed : ItemStatus::Pending;
    next.error = message;

    ProcessResult result;
    result.success = false;
    result.item = std::move(next);
    result.error = message;
    return result;
}

ProcessResult ItemProcessor::process(const QueueItem& item, const SyncActionHandler& handler) const {
    HandlerResult outcome;
    try {
        outcome = handler(item.action);
    } catch (const std::exception& e) {
        return fail(item, e.what());
    } catch (...) {
        return fail(item, "Unknown error");
    }

    if (outcome.success && outcome.skipped) {
        ProcessResult result;
        result.success = true;
        result.item = item;
        result.skipped = true;
        return result;
    }

    if (outcome.success) {
        QueueItem next = item;
        next.status = ItemStatus::Synced;
        ProcessResult result;
        result.success = true;
        result.item = std::move(next);
        return result;
    }

    return fail(item, outcome.error.value_or("Unknown error"));
}

} // namespace syncqueue
