#pragma once

#include "syncqueue/sync_action.hpp"
#include <chrono>
#include <string>

namespace syncqueue {

struct Config {
    std::string data_dir = ".";
    std::string database_file = "syncqueue.db";
    std::string storage_key = kDefaultQueueKey;
    int max_attempts = kDefaultMaxAttempts;
    std::chrono::milliseconds poll_interval{10000};
    std::chrono::milliseconds request_timeout{10000};
    std::string submit_url;
    std::string probe_url;

    std::string database_path() const;

    // Defaults overlaid with SYNCQUEUE_* environment variables.
    static Config from_env();
};

} // namespace syncqueue
