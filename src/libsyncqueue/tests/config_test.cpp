#include "syncqueue/config.hpp"
#include <cassert>
#include <cstdlib>
#include <iostream>

using namespace syncqueue;

static void clear_env() {
    for (const char* name : {"SYNCQUEUE_DATA_DIR", "SYNCQUEUE_DB_FILE", "SYNCQUEUE_STORAGE_KEY",
                             "SYNCQUEUE_MAX_ATTEMPTS", "SYNCQUEUE_POLL_INTERVAL_MS",
                             "SYNCQUEUE_TIMEOUT_MS", "SYNCQUEUE_SUBMIT_URL", "SYNCQUEUE_PROBE_URL"}) {
        unsetenv(name);
    }
}

void test_defaults() {
    std::cout << "Test: defaults... ";

    clear_env();
    Config cfg = Config::from_env();
    assert(cfg.storage_key == kDefaultQueueKey);
    assert(cfg.max_attempts == 3);
    assert(cfg.database_path() == "./syncqueue.db");
    assert(cfg.poll_interval == std::chrono::milliseconds(10000));
    assert(cfg.submit_url.empty());

    cfg.data_dir = "/var/lib/app/";
    assert(cfg.database_path() == "/var/lib/app/syncqueue.db");
    cfg.data_dir = "";
    assert(cfg.database_path() == "syncqueue.db");

    std::cout << "✓" << std::endl;
}

void test_environment_overrides() {
    std::cout << "Test: environment overrides... ";

    clear_env();
    setenv("SYNCQUEUE_DATA_DIR", "/tmp/forms", 1);
    setenv("SYNCQUEUE_STORAGE_KEY", "profile-queue", 1);
    setenv("SYNCQUEUE_MAX_ATTEMPTS", "5", 1);
    setenv("SYNCQUEUE_TIMEOUT_MS", "250", 1);
    setenv("SYNCQUEUE_SUBMIT_URL", "https://api.example.com/forms", 1);

    Config cfg = Config::from_env();
    assert(cfg.database_path() == "/tmp/forms/syncqueue.db");
    assert(cfg.storage_key == "profile-queue");
    assert(cfg.max_attempts == 5);
    assert(cfg.request_timeout == std::chrono::milliseconds(250));
    assert(cfg.submit_url == "https://api.example.com/forms");

    std::cout << "✓" << std::endl;
}

void test_invalid_numbers_keep_defaults() {
    std::cout << "Test: invalid numbers keep defaults... ";

    clear_env();
    setenv("SYNCQUEUE_MAX_ATTEMPTS", "three", 1);
    setenv("SYNCQUEUE_POLL_INTERVAL_MS", "-5", 1);
    setenv("SYNCQUEUE_TIMEOUT_MS", "100ms", 1);

    Config cfg = Config::from_env();
    assert(cfg.max_attempts == 3);
    assert(cfg.poll_interval == std::chrono::milliseconds(10000));
    assert(cfg.request_timeout == std::chrono::milliseconds(10000));
    clear_env();

    std::cout << "✓" << std::endl;
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "  Config Tests" << std::endl;
    std::cout << "========================================" << std::endl << std::endl;

    try {
        test_defaults();
        test_environment_overrides();
        test_invalid_numbers_keep_defaults();

        std::cout << std::endl << "  ✓ All tests passed!" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cout << std::endl << "  ✗ Test suite failed: " << e.what() << std::endl;
        return 1;
    }
}
