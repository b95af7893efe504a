#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace syncqueue {

// Key/value persistence that survives process restarts.
//
// Implementations never throw on a missing key or an unusable backend:
// reads come back empty and writes report false. A call that returns has
// been committed to the backend.
class DurableStore {
public:
    using Bytes = std::vector<uint8_t>;

    virtual ~DurableStore() = default;

    virtual std::optional<Bytes> get(const std::string& key) = 0;
    virtual bool set(const std::string& key, const Bytes& value) = 0;
    virtual bool remove(const std::string& key) = 0;

    // False when the backend could not be opened; the store then acts empty.
    virtual bool available() const = 0;
};

using DurableStorePtr = std::shared_ptr<DurableStore>;

// Process-local backend. Nothing survives the process.
DurableStorePtr make_memory_store();

// SQLite backend at db_path. Falls back to an empty, read-only view when
// the database cannot be opened.
DurableStorePtr make_sqlite_store(const std::string& db_path);

} // namespace syncqueue
