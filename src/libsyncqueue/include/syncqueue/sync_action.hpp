#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace syncqueue {

// Base action tags. Applications add their own UPPER_SNAKE_CASE tags;
// the queue never validates a tag beyond it being non-empty.
constexpr const char* kActionFormSubmit = "FORM_SUBMIT";
constexpr const char* kActionFormUpdate = "FORM_UPDATE";
constexpr const char* kActionFormDelete = "FORM_DELETE";

constexpr int kDefaultMaxAttempts = 3;

// Shared default queue namespace in the durable store.
constexpr const char* kDefaultQueueKey = "offline-sync-queue";

using PayloadValue = std::variant<std::nullptr_t, bool, int64_t, double, std::string>;
using Payload = std::map<std::string, PayloadValue>;

struct SyncAction {
    std::string type;
    Payload payload;
};

bool operator==(const SyncAction& a, const SyncAction& b);
bool operator!=(const SyncAction& a, const SyncAction& b);

enum class ItemStatus : uint8_t {
    Pending = 0,
    Synced = 1,
    Failed = 2
};

const char* to_string(ItemStatus status);
std::optional<ItemStatus> status_from_string(const std::string& s);

struct QueueItem {
    std::string id;
    SyncAction action;
    std::chrono::system_clock::time_point created_at;
    int attempts = 0;
    int max_attempts = kDefaultMaxAttempts;
    ItemStatus status = ItemStatus::Pending;
    std::optional<std::string> error;
};

// What a remote handler reports for one action.
struct HandlerResult {
    bool success = false;
    std::optional<std::string> error;
    bool skipped = false;   // handler does not own this action type

    static HandlerResult ok() { return {true, std::nullopt, false}; }
    static HandlerResult failure(std::string message) { return {false, std::move(message), false}; }
    static HandlerResult not_mine() { return {true, std::nullopt, true}; }
};

// Outcome of one item in a sweep. `item` carries the item's next state.
struct ProcessResult {
    bool success = false;
    std::optional<QueueItem> item;
    std::optional<std::string> error;
    bool skipped = false;
};

using SyncActionHandler = std::function<HandlerResult(const SyncAction&)>;

// Renders a payload value for logs and form bodies.
std::string payload_value_to_string(const PayloadValue& value);

} // namespace syncqueue
