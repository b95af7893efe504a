#include "syncqueue/connectivity_monitor.hpp"
#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace syncqueue;

void test_initial_state() {
    std::cout << "Test: initial state... ";

    ConnectivityMonitor online;
    ConnectivityMonitor offline(true);
    assert(!online.is_offline());
    assert(offline.is_offline());

    std::cout << "✓" << std::endl;
}

void test_one_notification_per_transition() {
    std::cout << "Test: listeners fire once per transition... ";

    ConnectivityMonitor monitor;
    std::vector<bool> events;
    auto unsubscribe = monitor.subscribe([&](bool offline) { events.push_back(offline); });

    monitor.set_offline(false);
    monitor.set_offline(true);
    monitor.set_offline(true);
    monitor.set_offline(false);
    monitor.set_offline(false);

    assert((events == std::vector<bool>{true, false}));
    assert(!monitor.is_offline());

    unsubscribe();
    assert(monitor.listener_count() == 0);
    monitor.set_offline(true);
    assert(events.size() == 2);

    std::cout << "✓" << std::endl;
}

void test_fan_out() {
    std::cout << "Test: every subscriber is notified... ";

    ConnectivityMonitor monitor(true);
    int first = 0;
    int second = 0;
    auto u1 = monitor.subscribe([&](bool) { first++; });
    auto u2 = monitor.subscribe([&](bool) { second++; });
    assert(monitor.listener_count() == 2);

    monitor.set_offline(false);
    assert(first == 1 && second == 1);

    u1();
    monitor.set_offline(true);
    assert(first == 1 && second == 2);
    u2();

    std::cout << "✓" << std::endl;
}

void test_polling_fallback() {
    std::cout << "Test: polling probe drives transitions... ";

    ConnectivityMonitor monitor;
    std::atomic<bool> reachable{false};
    std::mutex events_mutex;
    std::vector<bool> events;
    auto unsubscribe = monitor.subscribe([&](bool offline) {
        std::lock_guard<std::mutex> lk(events_mutex);
        events.push_back(offline);
    });

    monitor.start_polling([&]() { return reachable.load(); }, std::chrono::milliseconds(5));

    auto wait_for = [&](bool offline) {
        for (int i = 0; i < 400 && monitor.is_offline() != offline; ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return monitor.is_offline() == offline;
    };

    assert(wait_for(true));
    reachable = true;
    assert(wait_for(false));

    monitor.stop();
    unsubscribe();

    std::lock_guard<std::mutex> lk(events_mutex);
    assert(events.size() >= 2);
    assert(events[0] == true);
    assert(events[1] == false);

    std::cout << "✓" << std::endl;
}

void test_throwing_probe_counts_as_offline() {
    std::cout << "Test: a throwing probe reports offline... ";

    ConnectivityMonitor monitor;
    monitor.start_polling([]() -> bool { throw std::runtime_error("dns failure"); },
                          std::chrono::milliseconds(5));
    for (int i = 0; i < 400 && !monitor.is_offline(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    assert(monitor.is_offline());
    monitor.stop();

    std::cout << "✓" << std::endl;
}

void test_throwing_listener_is_contained() {
    std::cout << "Test: a throwing listener does not stop the others or the poller... ";

    ConnectivityMonitor monitor;
    std::atomic<int> calls{0};
    auto bad = monitor.subscribe([](bool) { throw std::runtime_error("listener bug"); });
    auto good = monitor.subscribe([&](bool) { calls++; });

    monitor.set_offline(true);
    assert(calls == 1);

    std::atomic<bool> reachable{true};
    monitor.start_polling([&]() { return reachable.load(); }, std::chrono::milliseconds(5));
    for (int i = 0; i < 400 && monitor.is_offline(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    assert(!monitor.is_offline());

    // the poll thread survived the throwing listener and still tracks changes
    reachable = false;
    for (int i = 0; i < 400 && !monitor.is_offline(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    assert(monitor.is_offline());
    monitor.stop();
    assert(calls == 3);

    bad();
    good();
    std::cout << "✓" << std::endl;
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "  Connectivity Monitor Tests" << std::endl;
    std::cout << "========================================" << std::endl << std::endl;

    try {
        test_initial_state();
        test_one_notification_per_transition();
        test_fan_out();
        test_polling_fallback();
        test_throwing_probe_counts_as_offline();
        test_throwing_listener_is_contained();

        std::cout << std::endl << "  ✓ All tests passed!" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cout << std::endl << "  ✗ Test suite failed: " << e.what() << std::endl;
        return 1;
    }
}
