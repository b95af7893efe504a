#include "syncqueue/sync_action.hpp"
#include <sstream>

namespace syncqueue {

bool operator==(const SyncAction& a, const SyncAction& b) {
    return a.type == b.type && a.payload == b.payload;
}

bool operator!=(const SyncAction& a, const SyncAction& b) {
    return !(a == b);
}

const char* to_string(ItemStatus status) {
    switch (status) {
        case ItemStatus::Pending: return "PENDING";
        case ItemStatus::Synced: return "SYNCED";
        case ItemStatus::Failed: return "FAILED";
    }
    return "UNKNOWN";
}

std::optional<ItemStatus> status_from_string(const std::string& s) {
    if (s == "PENDING") return ItemStatus::Pending;
    if (s == "SYNCED") return ItemStatus::Synced;
    if (s == "FAILED") return ItemStatus::Failed;
    return std::nullopt;
}

std::string payload_value_to_string(const PayloadValue& value) {
    struct Visitor {
        std::string operator()(std::nullptr_t) const { return "null"; }
        std::string operator()(bool b) const { return b ? "true" : "false"; }
        std::string operator()(int64_t i) const { return std::to_string(i); }
        std::string operator()(double d) const {
            std::ostringstream os;
            os << d;
            return os.str();
        }
        std::string operator()(const std::string& s) const { return s; }
    };
    return std::visit(Visitor{}, value);
}

} // namespace syncqueue
