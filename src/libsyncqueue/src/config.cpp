#include "syncqueue/config.hpp"
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

namespace syncqueue {

namespace {

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

// Keeps `current` when the variable is unset or not a positive integer.
long long env_positive(const char* name, long long current) {
    const char* value = env(name);
    if (!value) {
        return current;
    }
    size_t used = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(value, &used);
    } catch (const std::exception& e) {
        std::cerr << "[Config] Ignoring invalid " << name << "=" << value
                  << ": " << e.what() << std::endl;
        return current;
    }
    if (used != std::string(value).size() || parsed <= 0) {
        std::cerr << "[Config] Ignoring invalid " << name << "=" << value << std::endl;
        return current;
    }
    return parsed;
}

} // namespace

std::string Config::database_path() const {
    if (data_dir.empty()) {
        return database_file;
    }
    if (data_dir.back() == '/') {
        return data_dir + database_file;
    }
    return data_dir + "/" + database_file;
}

Config Config::from_env() {
    Config cfg;

    if (const char* v = env("SYNCQUEUE_DATA_DIR")) cfg.data_dir = v;
    if (const char* v = env("SYNCQUEUE_DB_FILE")) cfg.database_file = v;
    if (const char* v = env("SYNCQUEUE_STORAGE_KEY")) cfg.storage_key = v;
    if (const char* v = env("SYNCQUEUE_SUBMIT_URL")) cfg.submit_url = v;
    if (const char* v = env("SYNCQUEUE_PROBE_URL")) cfg.probe_url = v;

    cfg.max_attempts = static_cast<int>(env_positive("SYNCQUEUE_MAX_ATTEMPTS", cfg.max_attempts));
    cfg.poll_interval = std::chrono::milliseconds(
        env_positive("SYNCQUEUE_POLL_INTERVAL_MS", cfg.poll_interval.count()));
    cfg.request_timeout = std::chrono::milliseconds(
        env_positive("SYNCQUEUE_TIMEOUT_MS", cfg.request_timeout.count()));

    return cfg;
}

} // namespace syncqueue
