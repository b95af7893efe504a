#pragma once

#include "syncqueue/durable_store.hpp"
#include "syncqueue/item_processor.hpp"
#include "syncqueue/sync_action.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace syncqueue {

class ConnectivityMonitor;

// Owns the ordered in-memory queue and mirrors every mutation to a
// DurableStore before returning.
//
// All operations except the read accessors throw std::logic_error until
// initialize() has run. Subscribers receive a snapshot after each
// committed mutation and once after each sweep.
class QueueManager {
public:
    using Listener = std::function<void(const std::vector<QueueItem>&)>;
    using Unsubscribe = std::function<void()>;

    struct Options {
        std::string storage_key = kDefaultQueueKey;
        int max_attempts = kDefaultMaxAttempts;
    };

    struct Stats {
        int pending_count;
        int failed_count;
        int total_attempts;
    };

    // `connectivity` may be null, in which case the queue is always online.
    QueueManager(DurableStorePtr store,
                 const ConnectivityMonitor* connectivity,
                 Options options);
    QueueManager(DurableStorePtr store, const ConnectivityMonitor* connectivity = nullptr);
    ~QueueManager();

    QueueManager(const QueueManager&) = delete;
    QueueManager& operator=(const QueueManager&) = delete;

    // Loads the persisted queue once. Later calls are no-ops.
    void initialize();
    bool is_initialized() const;

    QueueItem add(SyncAction action);
    QueueItem add(SyncAction action, int max_attempts);
    bool remove(const std::string& id);
    void clear();

    // Runs one sweep over the items that are PENDING right now, in FIFO
    // order. Returns an empty list when offline or when a sweep is already
    // running.
    std::vector<ProcessResult> process_all(const SyncActionHandler& handler);

    std::vector<QueueItem> get_queue() const;
    size_t get_queue_length() const;
    size_t pending_count() const;
    bool is_processing() const;
    Stats stats() const;

    const std::string& storage_key() const { return options_.storage_key; }

    Unsubscribe subscribe(Listener listener);

private:
    void require_initialized(const char* operation) const;
    void persist_locked();
    void notify();

    DurableStorePtr store_;
    const ConnectivityMonitor* connectivity_;
    Options options_;
    ItemProcessor processor_;

    mutable std::mutex mutex_;
    std::vector<QueueItem> items_;
    std::atomic<bool> initialized_{false};

    std::atomic<bool> sweeping_{false};
    std::atomic<bool> storage_warned_{false};

    mutable std::mutex listeners_mutex_;
    std::map<uint64_t, Listener> listeners_;
    uint64_t next_listener_id_ = 1;
};

} // namespace syncqueue
