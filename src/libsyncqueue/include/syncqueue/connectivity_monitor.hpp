#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

namespace syncqueue {

// Tracks the host's offline signal and fans out offline<->online transitions.
class ConnectivityMonitor {
public:
    using Listener = std::function<void(bool offline)>;
    using Unsubscribe = std::function<void()>;
    // Returns true when the backend is reachable.
    using Probe = std::function<bool()>;

    explicit ConnectivityMonitor(bool initially_offline = false);
    ~ConnectivityMonitor();

    ConnectivityMonitor(const ConnectivityMonitor&) = delete;
    ConnectivityMonitor& operator=(const ConnectivityMonitor&) = delete;

    bool is_offline() const;

    // Listener runs once per transition, on the thread that observed it.
    // The monitor must outlive the returned handle's use.
    Unsubscribe subscribe(Listener listener);

    // Push-style signal from the host platform.
    void set_offline(bool offline);

    // Polling fallback for hosts without transition events.
    void start_polling(Probe probe, std::chrono::milliseconds interval);
    void stop();

    size_t listener_count() const;

private:
    void notify(bool offline);

    std::atomic<bool> offline_;

    mutable std::mutex listeners_mutex_;
    std::map<uint64_t, Listener> listeners_;
    uint64_t next_listener_id_ = 1;

    std::mutex poll_mutex_;
    std::condition_variable poll_cond_;
    std::thread poll_thread_;
    std::atomic<bool> polling_{false};
};

} // namespace syncqueue
