#pragma once

#include "syncqueue/connectivity_monitor.hpp"
#include "syncqueue/queue_manager.hpp"
#include "syncqueue/sync_action.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace syncqueue {

struct SubmissionResult {
    bool success = false;
    std::optional<std::string> error;
    bool queued = false;
    std::optional<std::string> queue_item_id;
};

// Consumer-facing facade for one action type.
//
// Online, submit() calls the remote handler directly. Offline, it queues
// the value. When connectivity returns with pending items, it replays the
// queue once. Several orchestrators may share one QueueManager; each only
// advances items of its own action type.
class SubmissionOrchestrator {
public:
    using OnlineSubmit = std::function<HandlerResult(const Payload&)>;

    struct Options {
        std::string action_type;
        OnlineSubmit online_submit;
        std::function<void()> on_success;
        std::function<void()> on_queued;
        std::function<void(const std::string&)> on_error;
        std::function<void(const QueueItem&)> on_synced;
        std::function<void(const QueueItem&, const std::string&)> on_sync_error;
    };

    struct State {
        bool is_offline;
        size_t pending_count;
        size_t queue_length;
        bool is_processing;
        std::optional<std::chrono::system_clock::time_point> last_sync_attempt;
    };

    // Both collaborators must outlive the orchestrator. The destructor
    // blocks until listener calls already running on other threads finish,
    // so it must not run from inside one of this orchestrator's callbacks.
    SubmissionOrchestrator(QueueManager& queue, ConnectivityMonitor& connectivity, Options options);
    ~SubmissionOrchestrator();

    SubmissionOrchestrator(const SubmissionOrchestrator&) = delete;
    SubmissionOrchestrator& operator=(const SubmissionOrchestrator&) = delete;

    SubmissionResult submit(const Payload& value);

    // Replays the queue now unless offline or already replaying.
    std::vector<ProcessResult> sync_now();

    State state() const;
    const std::string& action_type() const { return options_.action_type; }

    // Handler handed to the queue: submits owned actions, passes over the rest.
    HandlerResult handle_queued_action(const SyncAction& action);

private:
    // Tracks listener calls in flight. Shared with the subscribed lambdas so
    // a call that lost the race with the destructor can still check it.
    struct Lifeline {
        std::mutex mutex;
        std::condition_variable idle;
        int in_flight = 0;
        bool closed = false;

        bool enter();
        void leave();
        void close();
    };

    class Scope {
    public:
        explicit Scope(Lifeline& life) : life_(life), entered_(life.enter()) {}
        ~Scope() { if (entered_) life_.leave(); }
        explicit operator bool() const { return entered_; }

    private:
        Lifeline& life_;
        bool entered_;
    };

    void on_connectivity_changed(bool offline);
    void on_queue_changed(const std::vector<QueueItem>& items);
    std::vector<ProcessResult> reconcile(const char* reason);
    size_t owned_pending(const std::vector<QueueItem>& items) const;

    template <typename Callback, typename... Args>
    void invoke_callback(const char* name, const Callback& cb, Args&&... args);

    QueueManager& queue_;
    ConnectivityMonitor& connectivity_;
    Options options_;

    std::atomic<bool> processing_{false};
    std::atomic<size_t> observed_pending_{0};

    mutable std::mutex sync_mutex_;
    std::optional<std::chrono::system_clock::time_point> last_sync_attempt_;

    std::shared_ptr<Lifeline> lifeline_;
    ConnectivityMonitor::Unsubscribe connectivity_subscription_;
    QueueManager::Unsubscribe queue_subscription_;
};

} // namespace syncqueue
