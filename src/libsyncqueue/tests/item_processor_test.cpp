#include "syncqueue/item_processor.hpp"
#include <cassert>
#include <iostream>
#include <stdexcept>

using namespace syncqueue;

static QueueItem pending_item(int attempts = 0) {
    QueueItem item;
    item.id = "test-item";
    item.action = SyncAction{kActionFormSubmit, {{"data", std::string("test")}}};
    item.created_at = std::chrono::system_clock::now();
    item.attempts = attempts;
    item.max_attempts = 3;
    item.status = ItemStatus::Pending;
    return item;
}

void test_success_marks_synced() {
    std::cout << "Test: successful handler marks item SYNCED... ";

    ItemProcessor processor;
    int calls = 0;
    SyncAction seen;
    auto result = processor.process(pending_item(), [&](const SyncAction& a) {
        calls++;
        seen = a;
        return HandlerResult::ok();
    });

    assert(calls == 1);
    assert(seen == pending_item().action);
    assert(result.success);
    assert(!result.skipped);
    assert(result.item->status == ItemStatus::Synced);
    assert(result.item->attempts == 0);

    std::cout << "✓" << std::endl;
}

void test_failure_counts_attempt() {
    std::cout << "Test: failed handler increments attempts and stays PENDING... ";

    ItemProcessor processor;
    auto result = processor.process(pending_item(), [](const SyncAction&) {
        return HandlerResult::failure("Failed");
    });

    assert(!result.success);
    assert(result.item->attempts == 1);
    assert(result.item->status == ItemStatus::Pending);
    assert(*result.item->error == "Failed");
    assert(*result.error == "Failed");

    std::cout << "✓" << std::endl;
}

void test_last_attempt_marks_failed() {
    std::cout << "Test: final failed attempt marks item FAILED... ";

    ItemProcessor processor;
    auto result = processor.process(pending_item(2), [](const SyncAction&) {
        return HandlerResult::failure("Failed");
    });

    assert(!result.success);
    assert(result.item->attempts == 3);
    assert(result.item->status == ItemStatus::Failed);

    std::cout << "✓" << std::endl;
}

void test_throwing_handler_is_a_failure() {
    std::cout << "Test: handler exceptions become failed attempts... ";

    ItemProcessor processor;
    auto result = processor.process(pending_item(), [](const SyncAction&) -> HandlerResult {
        throw std::runtime_error("Network error");
    });
    assert(!result.success);
    assert(result.item->attempts == 1);
    assert(*result.item->error == "Network error");

    auto odd = processor.process(pending_item(), [](const SyncAction&) -> HandlerResult {
        throw 42;
    });
    assert(!odd.success);
    assert(*odd.error == "Unknown error");

    auto silent = processor.process(pending_item(), [](const SyncAction&) {
        return HandlerResult{false, std::nullopt, false};
    });
    assert(*silent.item->error == "Unknown error");

    std::cout << "✓" << std::endl;
}

void test_not_mine_leaves_item_untouched() {
    std::cout << "Test: not-mine result leaves item untouched... ";

    ItemProcessor processor;
    QueueItem item = pending_item(1);
    item.error = "earlier";
    auto result = processor.process(item, [](const SyncAction&) {
        return HandlerResult::not_mine();
    });

    assert(result.success);
    assert(result.skipped);
    assert(result.item->status == ItemStatus::Pending);
    assert(result.item->attempts == 1);
    assert(*result.item->error == "earlier");

    std::cout << "✓" << std::endl;
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "  Item Processor Tests" << std::endl;
    std::cout << "========================================" << std::endl << std::endl;

    try {
        test_success_marks_synced();
        test_failure_counts_attempt();
        test_last_attempt_marks_failed();
        test_throwing_handler_is_a_failure();
        test_not_mine_leaves_item_untouched();

        std::cout << std::endl << "  ✓ All tests passed!" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cout << std::endl << "  ✗ Test suite failed: " << e.what() << std::endl;
        return 1;
    }
}
