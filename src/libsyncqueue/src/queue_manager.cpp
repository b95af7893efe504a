#include "syncqueue/queue_manager.hpp"
#include "syncqueue/connectivity_monitor.hpp"
#include "syncqueue/item_id.hpp"
#include "syncqueue/queue_codec.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <set>
#include <stdexcept>

namespace syncqueue {

QueueManager::QueueManager(DurableStorePtr store,
                           const ConnectivityMonitor* connectivity,
                           Options options)
    : store_(std::move(store))
    , connectivity_(connectivity)
    , options_(std::move(options)) {
    if (!store_) {
        throw std::invalid_argument("QueueManager: store must not be null");
    }
    if (options_.storage_key.empty()) {
        throw std::invalid_argument("QueueManager: storage key must not be empty");
    }
    if (options_.max_attempts < 1) {
        throw std::invalid_argument("QueueManager: max_attempts must be at least 1");
    }
}

QueueManager::QueueManager(DurableStorePtr store, const ConnectivityMonitor* connectivity)
    : QueueManager(std::move(store), connectivity, Options{}) {}

QueueManager::~QueueManager() = default;

void QueueManager::require_initialized(const char* operation) const {
    if (!initialized_) {
        throw std::logic_error(std::string("QueueManager: ") + operation +
                               " called before initialize()");
    }
}

void QueueManager::initialize() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (initialized_) {
            return;
        }

        std::vector<QueueItem> loaded;
        auto stored = store_->get(options_.storage_key);
        if (stored) {
            try {
                loaded = QueueCodec::decode(*stored);
            } catch (const std::exception& e) {
                std::cerr << "[QueueManager] Discarding unreadable queue '"
                          << options_.storage_key << "': " << e.what() << std::endl;
                loaded.clear();
            }
        }

        std::set<std::string> seen;
        items_.clear();
        for (auto& item : loaded) {
            if (!seen.insert(item.id).second) {
                std::cerr << "[QueueManager] Dropping duplicate item id: " << item.id << std::endl;
                continue;
            }
            items_.push_back(std::move(item));
        }

        initialized_ = true;
        std::cout << "[QueueManager] Loaded " << items_.size() << " items from '"
                  << options_.storage_key << "'" << std::endl;
    }
    notify();
}

bool QueueManager::is_initialized() const {
    return initialized_.load();
}

void QueueManager::persist_locked() {
    if (!store_->set(options_.storage_key, QueueCodec::encode(items_))) {
        if (!storage_warned_.exchange(true)) {
            std::cerr << "[QueueManager] Storage unavailable, queue '" << options_.storage_key
                      << "' is held in memory only" << std::endl;
        }
    }
}

QueueItem QueueManager::add(SyncAction action) {
    return add(std::move(action), options_.max_attempts);
}

QueueItem QueueManager::add(SyncAction action, int max_attempts) {
    if (action.type.empty()) {
        throw std::invalid_argument("QueueManager: action type must not be empty");
    }
    if (max_attempts < 1) {
        throw std::invalid_argument("QueueManager: max_attempts must be at least 1");
    }

    QueueItem item;
    item.action = std::move(action);
    item.created_at = std::chrono::system_clock::now();
    item.attempts = 0;
    item.max_attempts = max_attempts;
    item.status = ItemStatus::Pending;

    {
        std::lock_guard<std::mutex> lk(mutex_);
        require_initialized("add");

        do {
            item.id = generate_item_id();
        } while (std::any_of(items_.begin(), items_.end(),
                             [&](const QueueItem& q) { return q.id == item.id; }));

        items_.push_back(item);
        persist_locked();
    }

    std::cout << "[QueueManager] Queued action " << item.action.type
              << " as " << item.id << std::endl;
    notify();
    return item;
}

bool QueueManager::remove(const std::string& id) {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        require_initialized("remove");

        auto it = std::find_if(items_.begin(), items_.end(),
                               [&](const QueueItem& q) { return q.id == id; });
        if (it == items_.end()) {
            return false;
        }
        items_.erase(it);
        persist_locked();
    }

    std::cout << "[QueueManager] Removed item: " << id << std::endl;
    notify();
    return true;
}

void QueueManager::clear() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        require_initialized("clear");

        items_.clear();
        if (!store_->remove(options_.storage_key) && !storage_warned_.exchange(true)) {
            std::cerr << "[QueueManager] Storage unavailable, queue '" << options_.storage_key
                      << "' cleared in memory only" << std::endl;
        }
    }

    std::cout << "[QueueManager] Cleared queue '" << options_.storage_key << "'" << std::endl;
    notify();
}

std::vector<ProcessResult> QueueManager::process_all(const SyncActionHandler& handler) {
    if (!handler) {
        throw std::invalid_argument("QueueManager: handler must be callable");
    }
    require_initialized("process_all");

    if (connectivity_ && connectivity_->is_offline()) {
        std::cerr << "[QueueManager] Cannot process queue while offline" << std::endl;
        return {};
    }

    bool expected = false;
    if (!sweeping_.compare_exchange_strong(expected, true)) {
        std::cout << "[QueueManager] Sweep already in progress, skipping" << std::endl;
        return {};
    }

    struct SweepReset {
        std::atomic<bool>& flag;
        ~SweepReset() { flag = false; }
    } sweep_reset{sweeping_};

    std::vector<QueueItem> pending;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        for (const auto& item : items_) {
            if (item.status == ItemStatus::Pending) {
                pending.push_back(item);
            }
        }
    }

    std::vector<ProcessResult> results;
    results.reserve(pending.size());

    for (const auto& item : pending) {
        ProcessResult result = processor_.process(item, handler);

        if (!result.skipped) {
            std::lock_guard<std::mutex> lk(mutex_);
            auto it = std::find_if(items_.begin(), items_.end(),
                                   [&](const QueueItem& q) { return q.id == item.id; });
            // an item removed while its handler ran stays removed
            if (it != items_.end()) {
                if (result.success) {
                    items_.erase(it);
                } else if (result.item) {
                    *it = *result.item;
                }
                persist_locked();
            }
        }

        if (result.skipped) {
            // owned by another handler, left as is
        } else if (result.success) {
            std::cout << "[QueueManager] Synced item: " << item.id << std::endl;
        } else {
            std::cerr << "[QueueManager] Sync failed for item: " << item.id
                      << " (attempt " << result.item->attempts << "/" << result.item->max_attempts
                      << "), error: " << result.error.value_or("") << std::endl;
        }

        results.push_back(std::move(result));
    }

    sweeping_ = false;
    notify();
    return results;
}

std::vector<QueueItem> QueueManager::get_queue() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return items_;
}

size_t QueueManager::get_queue_length() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return items_.size();
}

size_t QueueManager::pending_count() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return static_cast<size_t>(std::count_if(items_.begin(), items_.end(),
        [](const QueueItem& q) { return q.status == ItemStatus::Pending; }));
}

bool QueueManager::is_processing() const {
    return sweeping_.load();
}

QueueManager::Stats QueueManager::stats() const {
    Stats stats = {0, 0, 0};
    std::lock_guard<std::mutex> lk(mutex_);
    for (const auto& item : items_) {
        if (item.status == ItemStatus::Pending) stats.pending_count++;
        if (item.status == ItemStatus::Failed) stats.failed_count++;
        stats.total_attempts += item.attempts;
    }
    return stats;
}

QueueManager::Unsubscribe QueueManager::subscribe(Listener listener) {
    if (!listener) {
        throw std::invalid_argument("QueueManager: listener must be callable");
    }
    std::lock_guard<std::mutex> lk(listeners_mutex_);
    uint64_t id = next_listener_id_++;
    listeners_.emplace(id, std::move(listener));
    return [this, id]() {
        std::lock_guard<std::mutex> lk(listeners_mutex_);
        listeners_.erase(id);
    };
}

void QueueManager::notify() {
    std::vector<Listener> targets;
    {
        std::lock_guard<std::mutex> lk(listeners_mutex_);
        for (const auto& entry : listeners_) {
            targets.push_back(entry.second);
        }
    }
    if (targets.empty()) {
        return;
    }
    const std::vector<QueueItem> snapshot = get_queue();
    for (const auto& listener : targets) {
        try {
            listener(snapshot);
        } catch (const std::exception& e) {
            std::cerr << "[QueueManager] Listener failed: " << e.what() << std::endl;
        }
    }
}

} // namespace syncqueue
