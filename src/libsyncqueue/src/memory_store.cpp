#include "syncqueue/durable_store.hpp"
#include <map>
#include <mutex>

namespace syncqueue {

class MemoryStore : public DurableStore {
public:
    std::optional<Bytes> get(const std::string& key) override {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = values_.find(key);
        if (it == values_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool set(const std::string& key, const Bytes& value) override {
        std::lock_guard<std::mutex> lk(mutex_);
        values_[key] = value;
        return true;
    }

    bool remove(const std::string& key) override {
        std::lock_guard<std::mutex> lk(mutex_);
        values_.erase(key);
        return true;
    }

    bool available() const override { return true; }

private:
    std::mutex mutex_;
    std::map<std::string, Bytes> values_;
};

DurableStorePtr make_memory_store() {
    return std::make_shared<MemoryStore>();
}

} // namespace syncqueue
