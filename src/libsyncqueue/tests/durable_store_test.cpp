#include "syncqueue/durable_store.hpp"
#include <cassert>
#include <cstdio>
#include <iostream>
#include <string>
#include <unistd.h>

using namespace syncqueue;

static DurableStore::Bytes make_bytes(const std::string& s) {
    return DurableStore::Bytes(s.begin(), s.end());
}

static std::string temp_db_path(const std::string& name) {
    return "/tmp/syncqueue_" + name + "_" + std::to_string(::getpid()) + ".db";
}

static void remove_db(const std::string& path) {
    std::remove(path.c_str());
    std::remove((path + "-wal").c_str());
    std::remove((path + "-shm").c_str());
}

void test_memory_store() {
    std::cout << "Test: memory store get/set/remove... ";

    auto store = make_memory_store();
    assert(store->available());
    assert(!store->get("missing").has_value());

    assert(store->set("k", make_bytes("v1")));
    assert(store->set("k", make_bytes("v2")));
    assert(*store->get("k") == make_bytes("v2"));

    assert(store->remove("k"));
    assert(!store->get("k").has_value());
    assert(store->remove("k"));

    std::cout << "✓" << std::endl;
}

void test_sqlite_store_persists_across_reopen() {
    std::cout << "Test: sqlite store keeps values across reopen... ";

    std::string path = temp_db_path("reopen");
    remove_db(path);
    {
        auto store = make_sqlite_store(path);
        assert(store->available());
        assert(!store->get("queue").has_value());
        assert(store->set("queue", make_bytes("first")));
        assert(store->set("queue", make_bytes("second")));
        assert(store->set("other", make_bytes("")));
    }
    {
        auto store = make_sqlite_store(path);
        auto value = store->get("queue");
        assert(value.has_value());
        assert(*value == make_bytes("second"));

        auto empty = store->get("other");
        assert(empty.has_value() && empty->empty());

        assert(store->remove("queue"));
        assert(!store->get("queue").has_value());
    }
    remove_db(path);

    std::cout << "✓" << std::endl;
}

void test_sqlite_store_unavailable_degrades() {
    std::cout << "Test: unopenable sqlite store acts empty... ";

    auto store = make_sqlite_store("/nonexistent-syncqueue-dir/nested/queue.db");
    assert(!store->available());
    assert(!store->get("queue").has_value());
    assert(!store->set("queue", make_bytes("x")));
    assert(!store->remove("queue"));
    assert(!store->get("queue").has_value());

    std::cout << "✓" << std::endl;
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "  Durable Store Tests" << std::endl;
    std::cout << "========================================" << std::endl << std::endl;

    try {
        test_memory_store();
        test_sqlite_store_persists_across_reopen();
        test_sqlite_store_unavailable_degrades();

        std::cout << std::endl << "  ✓ All tests passed!" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cout << std::endl << "  ✗ Test suite failed: " << e.what() << std::endl;
        return 1;
    }
}
