#pragma once

#include "syncqueue/durable_store.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace syncqueue {

class SqliteStore : public DurableStore {
public:
    explicit SqliteStore(const std::string& db_path);
    ~SqliteStore() override;

    std::optional<Bytes> get(const std::string& key) override;
    bool set(const std::string& key, const Bytes& value) override;
    bool remove(const std::string& key) override;
    bool available() const override;

private:
    void warn_unavailable(const char* operation);

    struct Impl;
    std::unique_ptr<Impl> impl_;
    mutable std::mutex mutex_;
    std::atomic<bool> warned_{false};
};

} // namespace syncqueue
