#include "ledger/ledger_engine.h"
#include "ledger/ledger_query.h"
#include "ledger/undo_engine.h"
#include "stock/in_memory_ledger_storage.h"

#include <cassert>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace {

// Delegates to an in-memory store but refuses to make commits durable.
class FailingCommitStorage : public stock::InMemoryLedgerStorage {
public:
    bool fail_commit{false};
    int commits{0};

    bool commitTransaction(const stock::Transaction &transaction) override {
        commits += 1;
        if (fail_commit) {
            rollbackTransaction(transaction);
            return false;
        }
        return stock::InMemoryLedgerStorage::commitTransaction(transaction);
    }
};

stock::Timestamp at(int seconds) {
    return stock::Timestamp{} + std::chrono::seconds{1700000000 + seconds};
}

ledger::ApplyCommand putaway(const std::string &item,
                             const std::string &to,
                             stock::Quantity quantity) {
    ledger::ApplyCommand command;
    command.type = stock::TransactionType::Putaway;
    command.item_id = item;
    command.quantity = quantity;
    command.to_location_id = to;
    command.actor_user_id = "user-1";
    return command;
}

ledger::ApplyCommand removal(const std::string &item,
                             const std::string &from,
                             stock::Quantity quantity) {
    ledger::ApplyCommand command;
    command.type = stock::TransactionType::Remove;
    command.item_id = item;
    command.quantity = quantity;
    command.from_location_id = from;
    command.actor_user_id = "user-1";
    return command;
}

ledger::ApplyCommand transfer(const std::string &item,
                              const std::string &from,
                              const std::string &to,
                              stock::Quantity quantity) {
    ledger::ApplyCommand command;
    command.type = stock::TransactionType::Move;
    command.item_id = item;
    command.quantity = quantity;
    command.from_location_id = from;
    command.to_location_id = to;
    command.actor_user_id = "user-1";
    return command;
}

}  // namespace

int main() {
    {
        stock::InMemoryLedgerStorage storage;
        ledger::LedgerEngine engine(storage);
        ledger::LedgerQueryService query(storage);

        auto created = engine.apply(putaway("A", "L1", 10), at(0));
        assert(created.ok());
        assert(created.record->id == 1);
        assert(created.record->status == stock::TransactionStatus::Completed);
        assert(created.record->to_location_id == std::optional<std::string>("L1"));
        assert(!created.record->from_location_id.has_value());
        assert(created.record->created_at == at(0));
        assert(storage.quantity("A", "L1") == 10);

        auto moved = engine.apply(transfer("A", "L1", "L2", 4), at(1));
        assert(moved.ok());
        assert(storage.quantity("A", "L1") == 6);
        assert(storage.quantity("A", "L2") == 4);
        assert(query.itemTotal("A") == 10);

        auto removed = engine.apply(removal("A", "L2", 4), at(2));
        assert(removed.ok());
        assert(storage.quantity("A", "L2") == 0);
        assert(query.itemTotal("A") == 6);

        auto grouped = query.stockByLocation();
        assert(grouped.size() == 2);
        assert(grouped["L1"].size() == 1 && grouped["L1"][0].quantity == 6);
        assert(grouped["L2"][0].quantity == 0);

        auto history = query.listTransactions({});
        assert(history.size() == 3);
        assert(history[0].type == stock::TransactionType::Remove);
        assert(history[2].type == stock::TransactionType::Putaway);
    }

    {
        // Operand validation happens before anything is touched.
        FailingCommitStorage storage;
        ledger::LedgerEngine engine(storage);

        auto zero = engine.apply(putaway("A", "L1", 0), at(0));
        assert(zero.error == ledger::LedgerError::InvalidOperand);
        assert(!zero.record.has_value());

        auto no_item = engine.apply(putaway("", "L1", 1), at(0));
        assert(no_item.error == ledger::LedgerError::InvalidOperand);

        auto no_actor = putaway("A", "L1", 1);
        no_actor.actor_user_id.clear();
        assert(engine.apply(no_actor, at(0)).error == ledger::LedgerError::InvalidOperand);

        auto putaway_with_source = putaway("A", "L1", 1);
        putaway_with_source.from_location_id = "L0";
        assert(engine.apply(putaway_with_source, at(0)).error ==
               ledger::LedgerError::InvalidOperand);

        auto remove_without_source = removal("A", "L1", 1);
        remove_without_source.from_location_id.reset();
        assert(engine.apply(remove_without_source, at(0)).error ==
               ledger::LedgerError::InvalidOperand);

        assert(engine.apply(transfer("A", "L1", "L1", 1), at(0)).error ==
               ledger::LedgerError::InvalidOperand);

        assert(storage.commits == 0);
        assert(storage.transactionCount() == 0);
        assert(storage.stockEntries().empty());
    }

    {
        stock::InMemoryLedgerStorage storage;
        ledger::LedgerEngine engine(storage);

        auto empty = engine.apply(removal("A", "L1", 1), at(0));
        assert(empty.error == ledger::LedgerError::InsufficientStock);
        assert(!ledger::isRetryable(empty.error));
        assert(storage.quantity("A", "L1") == 0);
        assert(storage.transactionCount() == 0);

        assert(engine.apply(putaway("A", "L1", 3), at(1)).ok());
        auto short_move = engine.apply(transfer("A", "L1", "L2", 4), at(2));
        assert(short_move.error == ledger::LedgerError::InsufficientStock);
        assert(storage.quantity("A", "L1") == 3);
        assert(storage.quantity("A", "L2") == 0);
        assert(storage.transactionCount() == 1);
    }

    {
        FailingCommitStorage storage;
        ledger::LedgerEngine engine(storage);
        ledger::UndoEngine undo(storage);
        assert(engine.apply(putaway("A", "L1", 5), at(0)).ok());

        storage.fail_commit = true;
        auto lost = engine.apply(removal("A", "L1", 2), at(1));
        assert(lost.error == ledger::LedgerError::StorageUnavailable);
        assert(!ledger::isRetryable(lost.error));
        assert(storage.quantity("A", "L1") == 5);
        assert(storage.transactionCount() == 1);

        auto lost_undo = undo.undo(1, "user-2", at(2));
        assert(lost_undo.error == ledger::LedgerError::StorageUnavailable);
        assert(storage.quantity("A", "L1") == 5);
        assert(storage.findById(1)->status == stock::TransactionStatus::Completed);
    }

    {
        // Timestamps are kept at microsecond resolution.
        stock::InMemoryLedgerStorage storage;
        ledger::LedgerEngine engine(storage);
        auto now = at(0) + std::chrono::nanoseconds{1500};
        auto result = engine.apply(putaway("A", "L1", 1), now);
        assert(result.ok());
        assert(result.record->created_at == at(0) + std::chrono::microseconds{1});
    }

    {
        // Identifiers longer than a wire string are refused before any change.
        stock::InMemoryLedgerStorage storage;
        ledger::LedgerEngine engine(storage);
        ledger::UndoEngine undo(storage);
        std::string oversized(70000, 'x');

        auto long_item = engine.apply(putaway(oversized, "L1", 5), at(0));
        assert(long_item.error == ledger::LedgerError::InvalidOperand);
        auto long_location = engine.apply(putaway("A", oversized, 5), at(0));
        assert(long_location.error == ledger::LedgerError::InvalidOperand);
        auto long_actor = putaway("A", "L1", 5);
        long_actor.actor_user_id = oversized;
        assert(engine.apply(long_actor, at(0)).error == ledger::LedgerError::InvalidOperand);
        assert(storage.transactionCount() == 0);
        assert(storage.stockEntries().empty());

        std::string widest(65535, 'y');
        auto fits = engine.apply(putaway(widest, "L1", 5), at(1));
        assert(fits.ok());
        assert(storage.quantity(widest, "L1") == 5);
        auto refused = undo.undo(fits.record->id, oversized, at(2));
        assert(refused.error == ledger::LedgerError::InvalidOperand);
        assert(storage.findById(fits.record->id)->status == stock::TransactionStatus::Completed);
    }

    {
        assert(std::string(ledger::errorCode(ledger::LedgerError::None)) == "OK");
        assert(std::string(ledger::errorCode(ledger::LedgerError::NotLatest)) == "NOT_LATEST");
        assert(ledger::parseErrorCode("STORAGE_UNAVAILABLE") ==
               ledger::LedgerError::StorageUnavailable);
        assert(!ledger::parseErrorCode("nope").has_value());
        assert(ledger::isRetryable(ledger::LedgerError::Conflict));
        assert(!ledger::isRetryable(ledger::LedgerError::NotFound));
    }

    {
        // Random apply/undo sequences: no stock goes negative, and each item
        // total equals the signed sum of its COMPLETED records.
        stock::InMemoryLedgerStorage storage;
        ledger::LedgerEngine engine(storage);
        ledger::UndoEngine undo(storage);
        ledger::LedgerQueryService query(storage);

        const std::vector<std::string> items{"A", "B", "C"};
        const std::vector<std::string> locations{"L1", "L2", "L3"};
        std::mt19937 rng(20240611);
        std::uniform_int_distribution<std::size_t> pick(0, 2);
        std::uniform_int_distribution<stock::Quantity> amount(1, 6);
        std::uniform_int_distribution<int> action(0, 9);

        for (int step = 0; step < 600; ++step) {
            const auto &item = items[pick(rng)];
            const auto &from = locations[pick(rng)];
            const auto &to = locations[(pick(rng) + 1) % locations.size()];
            const auto before = query.itemTotal(item);
            const auto now = at(step);
            int choice = action(rng);

            if (choice < 2) {
                auto latest = storage.findMostRecentCompleted(item);
                if (!latest) {
                    continue;
                }
                auto result = undo.undo(latest->id, "auditor", now);
                if (result.ok()) {
                    std::int64_t expected = static_cast<std::int64_t>(before);
                    if (latest->type == stock::TransactionType::Putaway) {
                        expected -= latest->quantity;
                    } else if (latest->type == stock::TransactionType::Remove) {
                        expected += latest->quantity;
                    }
                    assert(static_cast<std::int64_t>(query.itemTotal(item)) == expected);
                } else {
                    assert(result.error == ledger::LedgerError::InsufficientStock);
                    assert(query.itemTotal(item) == before);
                }
                continue;
            }

            ledger::ApplyCommand command;
            if (choice < 5) {
                command = putaway(item, to, amount(rng));
            } else if (choice < 8) {
                command = removal(item, from, amount(rng));
            } else {
                command = transfer(item, from, to, amount(rng));
            }
            auto result = engine.apply(command, now);
            if (!result.ok()) {
                assert(result.error == ledger::LedgerError::InsufficientStock ||
                       result.error == ledger::LedgerError::InvalidOperand);
                assert(query.itemTotal(item) == before);
                continue;
            }
            switch (command.type) {
                case stock::TransactionType::Putaway:
                    assert(query.itemTotal(item) == before + command.quantity);
                    break;
                case stock::TransactionType::Remove:
                    assert(query.itemTotal(item) == before - command.quantity);
                    break;
                case stock::TransactionType::Move:
                    assert(query.itemTotal(item) == before);
                    break;
            }
        }

        std::map<std::string, std::int64_t> replayed;
        for (const auto &record : query.listTransactions({})) {
            if (record.status != stock::TransactionStatus::Completed) {
                continue;
            }
            if (record.type == stock::TransactionType::Putaway) {
                replayed[record.item_id] += record.quantity;
            } else if (record.type == stock::TransactionType::Remove) {
                replayed[record.item_id] -= record.quantity;
            }
        }
        for (const auto &item : items) {
            assert(static_cast<std::int64_t>(query.itemTotal(item)) == replayed[item]);
        }
    }

    return 0;
}
