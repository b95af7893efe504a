#include "syncqueue/submission_orchestrator.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace syncqueue {

bool SubmissionOrchestrator::Lifeline::enter() {
    std::lock_guard<std::mutex> lk(mutex);
    if (closed) return false;
    in_flight++;
    return true;
}

void SubmissionOrchestrator::Lifeline::leave() {
    std::lock_guard<std::mutex> lk(mutex);
    if (--in_flight == 0) idle.notify_all();
}

void SubmissionOrchestrator::Lifeline::close() {
    std::unique_lock<std::mutex> lk(mutex);
    closed = true;
    idle.wait(lk, [this] { return in_flight == 0; });
}

template <typename Callback, typename... Args>
void SubmissionOrchestrator::invoke_callback(const char* name, const Callback& cb, Args&&... args) {
    if (!cb) return;
    try {
        cb(std::forward<Args>(args)...);
    } catch (const std::exception& e) {
        std::cerr << "[SubmissionOrchestrator] " << name << " callback failed: "
                  << e.what() << std::endl;
    }
}

SubmissionOrchestrator::SubmissionOrchestrator(QueueManager& queue,
                                               ConnectivityMonitor& connectivity,
                                               Options options)
    : queue_(queue)
    , connectivity_(connectivity)
    , options_(std::move(options)) {
    if (options_.action_type.empty()) {
        throw std::invalid_argument("SubmissionOrchestrator: action type must not be empty");
    }
    if (!options_.online_submit) {
        throw std::invalid_argument("SubmissionOrchestrator: online_submit must be callable");
    }

    observed_pending_ = owned_pending(queue_.get_queue());
    lifeline_ = std::make_shared<Lifeline>();

    std::shared_ptr<Lifeline> life = lifeline_;
    connectivity_subscription_ = connectivity_.subscribe([this, life](bool offline) {
        Scope scope(*life);
        if (scope) on_connectivity_changed(offline);
    });
    queue_subscription_ = queue_.subscribe([this, life](const std::vector<QueueItem>& items) {
        Scope scope(*life);
        if (scope) on_queue_changed(items);
    });
}

SubmissionOrchestrator::~SubmissionOrchestrator() {
    if (connectivity_subscription_) connectivity_subscription_();
    if (queue_subscription_) queue_subscription_();
    // A notification may have copied our listener before the unsubscribe.
    lifeline_->close();
}

SubmissionResult SubmissionOrchestrator::submit(const Payload& value) {
    SubmissionResult result;

    if (connectivity_.is_offline()) {
        QueueItem item = queue_.add(SyncAction{options_.action_type, value});
        invoke_callback("on_queued", options_.on_queued);

        result.success = true;
        result.queued = true;
        result.queue_item_id = item.id;
        return result;
    }

    result.queued = false;
    try {
        HandlerResult outcome = options_.online_submit(value);
        result.success = outcome.success;
        result.error = outcome.error;
    } catch (const std::exception& e) {
        result.success = false;
        result.error = std::string(e.what());
    } catch (...) {
        result.success = false;
        result.error = std::string("Submission failed");
    }

    if (result.success) {
        invoke_callback("on_success", options_.on_success);
    } else if (result.error) {
        std::cerr << "[SubmissionOrchestrator] " << options_.action_type
                  << " submit failed: " << *result.error << std::endl;
        invoke_callback("on_error", options_.on_error, *result.error);
    }
    return result;
}

HandlerResult SubmissionOrchestrator::handle_queued_action(const SyncAction& action) {
    if (action.type != options_.action_type) {
        return HandlerResult::not_mine();
    }
    return options_.online_submit(action.payload);
}

void SubmissionOrchestrator::on_connectivity_changed(bool offline) {
    if (offline) {
        return;
    }
    if (queue_.pending_count() == 0) {
        return;
    }
    reconcile("connection restored");
}

void SubmissionOrchestrator::on_queue_changed(const std::vector<QueueItem>& items) {
    size_t pending = owned_pending(items);
    size_t previous = observed_pending_.exchange(pending);

    if (pending > previous && !connectivity_.is_offline() && queue_.is_initialized()) {
        reconcile("pending items while online");
    }
}

std::vector<ProcessResult> SubmissionOrchestrator::sync_now() {
    if (connectivity_.is_offline()) {
        std::cerr << "[SubmissionOrchestrator] Cannot sync " << options_.action_type
                  << " while offline" << std::endl;
        return {};
    }
    return reconcile("manual sync");
}

std::vector<ProcessResult> SubmissionOrchestrator::reconcile(const char* reason) {
    bool expected = false;
    if (!processing_.compare_exchange_strong(expected, true)) {
        return {};
    }

    {
        std::lock_guard<std::mutex> lk(sync_mutex_);
        last_sync_attempt_ = std::chrono::system_clock::now();
    }
    std::cout << "[SubmissionOrchestrator] Syncing " << options_.action_type
              << " (" << reason << ")" << std::endl;

    std::vector<ProcessResult> results;
    try {
        results = queue_.process_all([this](const SyncAction& action) {
            return handle_queued_action(action);
        });
    } catch (...) {
        processing_ = false;
        throw;
    }
    processing_ = false;

    int failed = 0;
    for (const auto& result : results) {
        if (result.skipped || !result.item) {
            continue;
        }
        if (result.success) {
            invoke_callback("on_synced", options_.on_synced, *result.item);
        } else {
            failed++;
            invoke_callback("on_sync_error", options_.on_sync_error, *result.item,
                            result.error.value_or("Unknown error"));
        }
    }
    if (failed > 0) {
        std::cerr << "[SubmissionOrchestrator] " << failed << " " << options_.action_type
                  << " actions failed to sync" << std::endl;
    }

    return results;
}

size_t SubmissionOrchestrator::owned_pending(const std::vector<QueueItem>& items) const {
    return static_cast<size_t>(std::count_if(items.begin(), items.end(),
        [this](const QueueItem& q) {
            return q.status == ItemStatus::Pending && q.action.type == options_.action_type;
        }));
}

SubmissionOrchestrator::State SubmissionOrchestrator::state() const {
    State s;
    s.is_offline = connectivity_.is_offline();
    s.pending_count = queue_.pending_count();
    s.queue_length = queue_.get_queue_length();
    s.is_processing = processing_.load() || queue_.is_processing();
    {
        std::lock_guard<std::mutex> lk(sync_mutex_);
        s.last_sync_attempt = last_sync_attempt_;
    }
    return s;
}

} // namespace syncqueue
