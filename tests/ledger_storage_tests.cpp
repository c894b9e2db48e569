#include "stock/in_memory_ledger_storage.h"

#include <cassert>
#include <chrono>
#include <future>
#include <string>

namespace {

using namespace std::chrono_literals;

stock::TransactionRecord putawayRecord(const std::string &item,
                                       const std::string &location,
                                       stock::Quantity quantity) {
    stock::TransactionRecord record;
    record.type = stock::TransactionType::Putaway;
    record.item_id = item;
    record.quantity = quantity;
    record.to_location_id = location;
    record.actor_user_id = "user-1";
    record.created_at = std::chrono::system_clock::now();
    return record;
}

}  // namespace

int main() {
    {
        stock::InMemoryLedgerStorage storage;
        auto tx = storage.beginTransaction("A", 50ms);
        assert(tx.has_value());
        assert(storage.increment(*tx, "L1", 5));
        auto stored = storage.append(*tx, putawayRecord("A", "L1", 5));
        assert(stored.has_value() && stored->id == 1);
        bool committed = storage.commitTransaction(*tx);
        assert(committed);
        assert(storage.quantity("A", "L1") == 5);
        assert(storage.transactionCount() == 1);
        assert(storage.findMostRecentCompleted("A")->id == 1);

        // A finished unit can no longer mutate.
        assert(!storage.increment(*tx, "L1", 1));
        assert(!storage.commitTransaction(*tx));
    }

    {
        stock::InMemoryLedgerStorage storage;
        auto seed = storage.beginTransaction("A", 50ms);
        assert(storage.increment(*seed, "L1", 5));
        auto first = storage.append(*seed, putawayRecord("A", "L1", 5));
        assert(first.has_value());
        assert(storage.commitTransaction(*seed));

        auto tx = storage.beginTransaction("A", 50ms);
        assert(storage.decrement(*tx, "L1", 3));
        assert(storage.increment(*tx, "L2", 3));
        assert(!storage.decrement(*tx, "L1", 3));
        assert(storage.markUndone(*tx, first->id, std::chrono::system_clock::now(), "user-2"));
        auto second = storage.append(*tx, putawayRecord("A", "L2", 3));
        assert(second.has_value());
        storage.rollbackTransaction(*tx);

        assert(storage.quantity("A", "L1") == 5);
        assert(storage.quantity("A", "L2") == 0);
        assert(storage.stockEntries().size() == 1);
        assert(!storage.findById(second->id).has_value());
        auto restored = storage.findById(first->id);
        assert(restored->status == stock::TransactionStatus::Completed);
        assert(!restored->undone_by_user_id.has_value());
        assert(storage.findMostRecentCompleted("A")->id == first->id);
    }

    {
        // Units are bound to their item.
        stock::InMemoryLedgerStorage storage;
        auto tx = storage.beginTransaction("A", 50ms);
        assert(!storage.append(*tx, putawayRecord("B", "L1", 1)).has_value());
        stock::Transaction forged{tx->unit_id, "B"};
        assert(!storage.increment(forged, "L1", 1));
        storage.rollbackTransaction(*tx);
        assert(storage.stockEntries().empty());
    }

    {
        // The item lock excludes a second unit on the same item only.
        stock::InMemoryLedgerStorage storage;
        auto holder = storage.beginTransaction("A", 50ms);
        assert(holder.has_value());

        auto contender = std::async(std::launch::async, [&storage]() {
            return storage.beginTransaction("A", 20ms);
        });
        auto blocked = contender.get();
        assert(!blocked.has_value());

        auto other_item = std::async(std::launch::async, [&storage]() {
            auto tx = storage.beginTransaction("B", 20ms);
            bool acquired = tx.has_value();
            if (tx) {
                storage.rollbackTransaction(*tx);
            }
            return acquired;
        });
        assert(other_item.get());

        storage.rollbackTransaction(*holder);
        auto after = std::async(std::launch::async, [&storage]() {
            auto tx = storage.beginTransaction("A", 20ms);
            bool acquired = tx.has_value();
            if (tx) {
                storage.rollbackTransaction(*tx);
            }
            return acquired;
        });
        assert(after.get());
    }

    {
        stock::InMemoryLedgerStorage storage;
        auto record = putawayRecord("A", "L1", 4);
        record.id = 3;
        storage.restoreStock("A", "L1", 4);
        assert(storage.restoreRecord(record));
        assert(!storage.restoreRecord(record));
        assert(storage.restoreUndone(3, std::chrono::system_clock::now(), "user-1"));
        assert(!storage.restoreUndone(3, std::chrono::system_clock::now(), "user-1"));
        assert(storage.quantity("A", "L1") == 4);

        auto tx = storage.beginTransaction("A", 50ms);
        auto next = storage.append(*tx, putawayRecord("A", "L1", 1));
        assert(next->id == 4);
        storage.rollbackTransaction(*tx);
    }

    return 0;
}
