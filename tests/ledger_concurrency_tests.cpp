#include "ledger/ledger_engine.h"
#include "ledger/ledger_query.h"
#include "ledger/undo_engine.h"
#include "stock/in_memory_ledger_storage.h"

#include <atomic>
#include <cassert>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

namespace {

using namespace std::chrono_literals;

ledger::ApplyCommand putaway(const std::string &item, const std::string &to, stock::Quantity q) {
    ledger::ApplyCommand command;
    command.type = stock::TransactionType::Putaway;
    command.item_id = item;
    command.quantity = q;
    command.to_location_id = to;
    command.actor_user_id = "seeder";
    return command;
}

ledger::ApplyCommand removal(const std::string &item, const std::string &from, stock::Quantity q) {
    ledger::ApplyCommand command;
    command.type = stock::TransactionType::Remove;
    command.item_id = item;
    command.quantity = q;
    command.from_location_id = from;
    command.actor_user_id = "picker";
    return command;
}

}  // namespace

int main() {
    {
        // 16 pickers race for 10 units; exactly 10 single-unit removals win.
        stock::InMemoryLedgerStorage storage;
        ledger::LedgerConfig config;
        config.lock_timeout = 2000ms;
        ledger::LedgerEngine engine(storage, config);
        auto seeded = engine.apply(putaway("A", "L1", 10), std::chrono::system_clock::now());
        assert(seeded.ok());

        std::atomic<int> succeeded{0};
        std::atomic<int> insufficient{0};
        std::atomic<int> other{0};
        std::vector<std::thread> threads;
        for (int i = 0; i < 16; ++i) {
            threads.emplace_back([&]() {
                auto result =
                    engine.apply(removal("A", "L1", 1), std::chrono::system_clock::now());
                if (result.ok()) {
                    succeeded += 1;
                } else if (result.error == ledger::LedgerError::InsufficientStock) {
                    insufficient += 1;
                } else {
                    other += 1;
                }
            });
        }
        for (auto &thread : threads) {
            thread.join();
        }
        assert(succeeded.load() == 10);
        assert(insufficient.load() == 6);
        assert(other.load() == 0);
        assert(storage.quantity("A", "L1") == 0);
        assert(storage.transactionCount() == 11);
    }

    {
        // Distinct items proceed independently and all land.
        stock::InMemoryLedgerStorage storage;
        ledger::LedgerEngine engine(storage);
        ledger::LedgerQueryService query(storage);
        std::vector<std::thread> threads;
        for (int t = 0; t < 8; ++t) {
            threads.emplace_back([&engine, t]() {
                const std::string item = "ITEM-" + std::to_string(t);
                for (int i = 0; i < 50; ++i) {
                    auto result =
                        engine.apply(putaway(item, "L" + std::to_string(i % 3), 2),
                                     std::chrono::system_clock::now());
                    assert(result.ok());
                }
                for (int i = 0; i < 25; ++i) {
                    auto result = engine.apply(removal(item, "L" + std::to_string(i % 3), 2),
                                               std::chrono::system_clock::now());
                    assert(result.ok());
                }
            });
        }
        for (auto &thread : threads) {
            thread.join();
        }
        for (int t = 0; t < 8; ++t) {
            assert(query.itemTotal("ITEM-" + std::to_string(t)) == 50);
        }
        assert(storage.transactionCount() == 8 * 75);
    }

    {
        // A held item lock turns into a retryable Conflict, not a hang.
        stock::InMemoryLedgerStorage storage;
        ledger::LedgerConfig config;
        config.lock_timeout = 20ms;
        ledger::LedgerEngine engine(storage, config);
        ledger::UndoEngine undo(storage, config);
        auto seeded = engine.apply(putaway("A", "L1", 3), std::chrono::system_clock::now());
        assert(seeded.ok());

        auto holder = storage.beginTransaction("A", 50ms);
        assert(holder.has_value());

        ledger::LedgerResult blocked_apply;
        ledger::LedgerResult blocked_undo;
        ledger::LedgerResult free_item;
        std::thread contender([&]() {
            blocked_apply = engine.apply(removal("A", "L1", 1), std::chrono::system_clock::now());
            blocked_undo = undo.undo(seeded.record->id, "supervisor",
                                     std::chrono::system_clock::now());
            free_item = engine.apply(putaway("B", "L1", 1), std::chrono::system_clock::now());
        });
        contender.join();
        storage.rollbackTransaction(*holder);

        assert(blocked_apply.error == ledger::LedgerError::Conflict);
        assert(ledger::isRetryable(blocked_apply.error));
        assert(blocked_undo.error == ledger::LedgerError::Conflict);
        assert(free_item.ok());
        assert(storage.quantity("A", "L1") == 3);

        auto retried = engine.apply(removal("A", "L1", 1), std::chrono::system_clock::now());
        assert(retried.ok());
    }

    {
        // Concurrent undo attempts of the same record: exactly one wins.
        stock::InMemoryLedgerStorage storage;
        ledger::LedgerConfig config;
        config.lock_timeout = 2000ms;
        ledger::LedgerEngine engine(storage, config);
        ledger::UndoEngine undo(storage, config);
        auto seeded = engine.apply(putaway("A", "L1", 4), std::chrono::system_clock::now());
        assert(seeded.ok());

        std::atomic<int> undone{0};
        std::atomic<int> already{0};
        std::vector<std::thread> threads;
        for (int i = 0; i < 8; ++i) {
            threads.emplace_back([&]() {
                auto result = undo.undo(seeded.record->id, "supervisor",
                                        std::chrono::system_clock::now());
                if (result.ok()) {
                    undone += 1;
                } else if (result.error == ledger::LedgerError::AlreadyUndone) {
                    already += 1;
                }
            });
        }
        for (auto &thread : threads) {
            thread.join();
        }
        assert(undone.load() == 1);
        assert(already.load() == 7);
        assert(storage.quantity("A", "L1") == 0);
    }

    {
        // A request stamped before it waited on the item lock still records as
        // the newest, so undo follows the order the operations were applied.
        stock::InMemoryLedgerStorage storage;
        ledger::LedgerConfig config;
        config.lock_timeout = 2000ms;
        ledger::LedgerEngine engine(storage, config);
        ledger::UndoEngine undo(storage, config);
        auto base = stock::Timestamp{} + std::chrono::seconds{1700000000};

        auto holder = storage.beginTransaction("A", 50ms);
        assert(holder.has_value());

        ledger::LedgerResult waited;
        std::thread waiter([&]() { waited = engine.apply(putaway("A", "L1", 3), base); });
        std::this_thread::sleep_for(30ms);

        bool raised = storage.increment(*holder, "L1", 2);
        assert(raised);
        stock::TransactionRecord held;
        held.type = stock::TransactionType::Putaway;
        held.quantity = 2;
        held.item_id = "A";
        held.to_location_id = "L1";
        held.actor_user_id = "holder";
        held.created_at = base + 5s;
        held.status = stock::TransactionStatus::Completed;
        auto first = storage.append(*holder, held);
        assert(first.has_value());
        bool committed = storage.commitTransaction(*holder);
        assert(committed);
        waiter.join();

        assert(waited.ok());
        assert(waited.record->id == first->id + 1);
        assert(waited.record->created_at >= first->created_at);
        assert(storage.findMostRecentCompleted("A")->id == waited.record->id);
        assert(undo.undo(first->id, "supervisor", base + 6s).error ==
               ledger::LedgerError::NotLatest);

        auto undone = undo.undo(waited.record->id, "supervisor", base);
        assert(undone.ok());
        assert(*undone.record->undone_at >= waited.record->created_at);
        assert(undo.undo(first->id, "supervisor", base + 6s).ok());
        assert(storage.quantity("A", "L1") == 0);

        // Undone records still bound the next stamp.
        auto later = engine.apply(putaway("A", "L1", 1), base);
        assert(later.ok());
        assert(later.record->created_at >= waited.record->created_at);
        assert(storage.findMostRecentCompleted("A")->id == later.record->id);
    }

    return 0;
}
