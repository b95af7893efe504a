#include "syncqueue/config.hpp"
#include "syncqueue/connectivity_monitor.hpp"
#include "syncqueue/durable_store.hpp"
#include "syncqueue/http_submitter.hpp"
#include "syncqueue/queue_manager.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <ctime>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace {

std::atomic<bool> g_running{true};

void handle_signal(int) {
    g_running = false;
}

void print_usage() {
    std::cerr << "usage: syncqueue-cli <command> [args]\n"
              << "  add TYPE [key=value ...]   queue an action\n"
              << "  list                       show queued items\n"
              << "  remove ID                  drop one item\n"
              << "  sync [URL]                 deliver pending items by HTTP POST\n"
              << "  watch [URL]                poll connectivity, sync on every reconnect\n"
              << "  clear                      drop every item\n"
              << "  stats                      queue statistics\n"
              << "environment: SYNCQUEUE_DATA_DIR, SYNCQUEUE_DB_FILE, SYNCQUEUE_STORAGE_KEY,\n"
              << "             SYNCQUEUE_MAX_ATTEMPTS, SYNCQUEUE_SUBMIT_URL, SYNCQUEUE_TIMEOUT_MS,\n"
              << "             SYNCQUEUE_PROBE_URL, SYNCQUEUE_POLL_INTERVAL_MS\n";
}

void report(const std::vector<syncqueue::ProcessResult>& results, int& failed) {
    int synced = 0;
    failed = 0;
    for (const auto& r : results) {
        if (r.success) synced++; else failed++;
    }
    std::cout << "Processed " << results.size() << " items: "
              << synced << " synced, " << failed << " failed" << std::endl;
}

// Integers and booleans are typed; everything else stays a string.
syncqueue::PayloadValue parse_value(const std::string& raw) {
    if (raw == "true") return true;
    if (raw == "false") return false;
    if (raw == "null") return nullptr;
    size_t digits_from = (!raw.empty() && raw[0] == '-') ? 1 : 0;
    if (raw.size() > digits_from &&
        raw.find_first_not_of("0123456789", digits_from) == std::string::npos) {
        try {
            return static_cast<int64_t>(std::stoll(raw));
        } catch (const std::out_of_range&) {
            return raw;
        }
    }
    return raw;
}

void print_item(const syncqueue::QueueItem& item) {
    std::time_t created = std::chrono::system_clock::to_time_t(item.created_at);
    char stamp[32] = {0};
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", std::localtime(&created));

    std::cout << item.id << "  " << syncqueue::to_string(item.status)
              << "  " << item.action.type
              << "  attempts=" << item.attempts << "/" << item.max_attempts
              << "  created=" << stamp;
    if (item.error) {
        std::cout << "  error=\"" << *item.error << "\"";
    }
    std::cout << "\n";
    for (const auto& entry : item.action.payload) {
        std::cout << "    " << entry.first << " = "
                  << syncqueue::payload_value_to_string(entry.second) << "\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage();
        return 2;
    }

    try {
        syncqueue::Config cfg = syncqueue::Config::from_env();
        std::string command = argv[1];
        std::vector<std::string> args(argv + 2, argv + argc);

        auto store = syncqueue::make_sqlite_store(cfg.database_path());
        syncqueue::QueueManager::Options options;
        options.storage_key = cfg.storage_key;
        options.max_attempts = cfg.max_attempts;
        // Without a reachability URL the CLI assumes it is online.
        syncqueue::ConnectivityMonitor connectivity(false);
        syncqueue::QueueManager queue(store, &connectivity, options);
        queue.initialize();

        if (command == "add") {
            if (args.empty()) {
                print_usage();
                return 2;
            }
            syncqueue::SyncAction action;
            action.type = args[0];
            for (size_t i = 1; i < args.size(); ++i) {
                auto eq = args[i].find('=');
                if (eq == std::string::npos || eq == 0) {
                    std::cerr << "Expected key=value, got: " << args[i] << std::endl;
                    return 2;
                }
                action.payload[args[i].substr(0, eq)] = parse_value(args[i].substr(eq + 1));
            }
            auto item = queue.add(std::move(action));
            std::cout << item.id << std::endl;
            return 0;
        }

        if (command == "list") {
            for (const auto& item : queue.get_queue()) {
                print_item(item);
            }
            return 0;
        }

        if (command == "remove") {
            if (args.size() != 1) {
                print_usage();
                return 2;
            }
            if (!queue.remove(args[0])) {
                std::cerr << "No queued item with id " << args[0] << std::endl;
                return 1;
            }
            return 0;
        }

        if (command == "sync" || command == "watch") {
            std::string url = args.empty() ? cfg.submit_url : args[0];
            if (url.empty()) {
                std::cerr << "No endpoint: pass URL or set SYNCQUEUE_SUBMIT_URL" << std::endl;
                return 2;
            }
            syncqueue::CurlSubmitter submitter(url, cfg.request_timeout);

            if (command == "sync") {
                if (!cfg.probe_url.empty()) {
                    syncqueue::CurlConnectivityProbe reachable(cfg.probe_url, cfg.request_timeout);
                    connectivity.set_offline(!reachable());
                }
                if (connectivity.is_offline()) {
                    std::cerr << "Offline: " << cfg.probe_url << " is unreachable, "
                              << queue.pending_count() << " items left queued" << std::endl;
                    return 1;
                }
                int failed = 0;
                report(queue.process_all(submitter), failed);
                return failed == 0 ? 0 : 1;
            }

            if (cfg.probe_url.empty()) {
                std::cerr << "watch needs SYNCQUEUE_PROBE_URL" << std::endl;
                return 2;
            }
            std::signal(SIGINT, handle_signal);
            std::signal(SIGTERM, handle_signal);

            // First successful poll counts as a reconnect and drains the backlog.
            connectivity.set_offline(true);
            auto unsubscribe = connectivity.subscribe([&](bool offline) {
                if (offline) {
                    std::cout << "Connection lost, queueing" << std::endl;
                    return;
                }
                if (queue.pending_count() == 0) return;
                int failed = 0;
                report(queue.process_all(submitter), failed);
            });

            connectivity.start_polling(
                syncqueue::CurlConnectivityProbe(cfg.probe_url, cfg.request_timeout),
                cfg.poll_interval);
            std::cout << "Watching " << cfg.probe_url << " every "
                      << cfg.poll_interval.count() << " ms, Ctrl-C to stop" << std::endl;

            while (g_running) {
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
            connectivity.stop();
            unsubscribe();
            return 0;
        }

        if (command == "clear") {
            queue.clear();
            return 0;
        }

        if (command == "stats") {
            auto stats = queue.stats();
            std::cout << "items:    " << queue.get_queue_length() << "\n"
                      << "pending:  " << stats.pending_count << "\n"
                      << "failed:   " << stats.failed_count << "\n"
                      << "attempts: " << stats.total_attempts << std::endl;
            return 0;
        }

        print_usage();
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Exception caught: " << e.what() << std::endl;
        return 1;
    }
}
