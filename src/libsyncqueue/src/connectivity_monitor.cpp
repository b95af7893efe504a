#include "syncqueue/connectivity_monitor.hpp"
#include <iostream>
#include <stdexcept>
#include <vector>

namespace syncqueue {

ConnectivityMonitor::ConnectivityMonitor(bool initially_offline)
    : offline_(initially_offline) {}

ConnectivityMonitor::~ConnectivityMonitor() {
    stop();
}

bool ConnectivityMonitor::is_offline() const {
    return offline_.load();
}

ConnectivityMonitor::Unsubscribe ConnectivityMonitor::subscribe(Listener listener) {
    if (!listener) {
        throw std::invalid_argument("ConnectivityMonitor: listener must be callable");
    }
    std::lock_guard<std::mutex> lk(listeners_mutex_);
    uint64_t id = next_listener_id_++;
    listeners_.emplace(id, std::move(listener));
    return [this, id]() {
        std::lock_guard<std::mutex> lk(listeners_mutex_);
        listeners_.erase(id);
    };
}

size_t ConnectivityMonitor::listener_count() const {
    std::lock_guard<std::mutex> lk(listeners_mutex_);
    return listeners_.size();
}

void ConnectivityMonitor::set_offline(bool offline) {
    bool previous = offline_.exchange(offline);
    if (previous == offline) {
        return;
    }
    std::cout << "[ConnectivityMonitor] Connection state changed to: "
              << (offline ? "OFFLINE" : "ONLINE") << std::endl;
    notify(offline);
}

void ConnectivityMonitor::notify(bool offline) {
    std::vector<Listener> targets;
    {
        std::lock_guard<std::mutex> lk(listeners_mutex_);
        targets.reserve(listeners_.size());
        for (const auto& entry : listeners_) {
            targets.push_back(entry.second);
        }
    }
    for (const auto& listener : targets) {
        try {
            listener(offline);
        } catch (const std::exception& e) {
            std::cerr << "[ConnectivityMonitor] Listener failed: " << e.what() << std::endl;
        }
    }
}

void ConnectivityMonitor::start_polling(Probe probe, std::chrono::milliseconds interval) {
    if (!probe) {
        throw std::invalid_argument("ConnectivityMonitor: probe must be callable");
    }
    bool expected = false;
    if (!polling_.compare_exchange_strong(expected, true)) {
        std::cout << "[ConnectivityMonitor] Polling already started, skipping" << std::endl;
        return;
    }

    poll_thread_ = std::thread([this, probe, interval]() {
        std::unique_lock<std::mutex> lk(poll_mutex_);
        while (polling_) {
            lk.unlock();
            bool reachable = false;
            try {
                reachable = probe();
            } catch (const std::exception& e) {
                std::cerr << "[ConnectivityMonitor] Probe failed: " << e.what() << std::endl;
            }
            set_offline(!reachable);
            lk.lock();
            poll_cond_.wait_for(lk, interval, [this] { return !polling_; });
        }
    });
    std::cout << "[ConnectivityMonitor] Polling every " << interval.count() << " ms" << std::endl;
}

void ConnectivityMonitor::stop() {
    {
        std::lock_guard<std::mutex> lk(poll_mutex_);
        polling_ = false;
    }
    poll_cond_.notify_all();
    if (poll_thread_.joinable()) {
        poll_thread_.join();
    }
}

} // namespace syncqueue
