#include "ledger/ledger_engine.h"
#include "ledger/ledger_query.h"
#include "ledger/undo_engine.h"
#include "stock/in_memory_ledger_storage.h"

#include <cassert>
#include <chrono>
#include <optional>
#include <string>

namespace {

stock::Timestamp at(int seconds) {
    return stock::Timestamp{} + std::chrono::seconds{1700000000 + seconds};
}

ledger::ApplyCommand command(stock::TransactionType type,
                             const std::string &item,
                             stock::Quantity quantity,
                             std::optional<std::string> from,
                             std::optional<std::string> to) {
    ledger::ApplyCommand out;
    out.type = type;
    out.item_id = item;
    out.quantity = quantity;
    out.from_location_id = std::move(from);
    out.to_location_id = std::move(to);
    out.actor_user_id = "operator";
    return out;
}

stock::TransactionId applyOk(ledger::LedgerEngine &engine,
                             const ledger::ApplyCommand &cmd,
                             stock::Timestamp now) {
    auto result = engine.apply(cmd, now);
    assert(result.ok());
    return result.record->id;
}

}  // namespace

int main() {
    using stock::TransactionType;

    {
        // PUTAWAY followed by its undo leaves stock as it was.
        stock::InMemoryLedgerStorage storage;
        ledger::LedgerEngine engine(storage);
        ledger::UndoEngine undo(storage);

        auto id = applyOk(engine, command(TransactionType::Putaway, "A", 7, std::nullopt, "L1"),
                          at(0));
        auto result = undo.undo(id, "supervisor", at(5));
        assert(result.ok());
        assert(result.record->id == id);
        assert(result.record->status == stock::TransactionStatus::Undone);
        assert(result.record->undone_at == at(5));
        assert(result.record->undone_by_user_id == std::optional<std::string>("supervisor"));
        assert(storage.quantity("A", "L1") == 0);
        assert(storage.transactionCount() == 1);

        auto stored = storage.findById(id);
        assert(stored->status == stock::TransactionStatus::Undone);
        assert(stored->actor_user_id == "operator");

        // A second undo is refused and changes nothing.
        auto again = undo.undo(id, "supervisor", at(6));
        assert(again.error == ledger::LedgerError::AlreadyUndone);
        assert(!again.record.has_value());
        assert(storage.findById(id)->undone_at == at(5));
        assert(storage.quantity("A", "L1") == 0);
    }

    {
        stock::InMemoryLedgerStorage storage;
        ledger::UndoEngine undo(storage);
        auto missing = undo.undo(42, "supervisor", at(0));
        assert(missing.error == ledger::LedgerError::NotFound);
        auto anonymous = undo.undo(42, "", at(0));
        assert(anonymous.error == ledger::LedgerError::InvalidOperand);
    }

    {
        // Only the newest COMPLETED record of an item can be undone.
        stock::InMemoryLedgerStorage storage;
        ledger::LedgerEngine engine(storage);
        ledger::UndoEngine undo(storage);

        auto t1 = applyOk(engine, command(TransactionType::Putaway, "A", 10, std::nullopt, "L1"),
                          at(0));
        auto t2 = applyOk(engine, command(TransactionType::Remove, "A", 3, "L1", std::nullopt),
                          at(1));
        auto unrelated =
            applyOk(engine, command(TransactionType::Putaway, "B", 1, std::nullopt, "L1"), at(2));

        auto early = undo.undo(t1, "supervisor", at(3));
        assert(early.error == ledger::LedgerError::NotLatest);
        assert(storage.quantity("A", "L1") == 7);

        assert(undo.undo(t2, "supervisor", at(4)).ok());
        assert(storage.quantity("A", "L1") == 10);
        assert(undo.undo(t1, "supervisor", at(5)).ok());
        assert(storage.quantity("A", "L1") == 0);
        assert(storage.findById(unrelated)->status == stock::TransactionStatus::Completed);
        assert(!storage.findMostRecentCompleted("A").has_value());
    }

    {
        // Two operations on the same clock tick: the later id is the newer one.
        stock::InMemoryLedgerStorage storage;
        ledger::LedgerEngine engine(storage);
        ledger::UndoEngine undo(storage);
        auto t1 = applyOk(engine, command(TransactionType::Putaway, "A", 2, std::nullopt, "L1"),
                          at(0));
        auto t2 = applyOk(engine, command(TransactionType::Putaway, "A", 3, std::nullopt, "L2"),
                          at(0));
        assert(undo.undo(t1, "supervisor", at(1)).error == ledger::LedgerError::NotLatest);
        assert(undo.undo(t2, "supervisor", at(1)).ok());
        assert(undo.undo(t1, "supervisor", at(1)).ok());
    }

    {
        // MOVE 5 L1->L2 then REMOVE 1 at L2. Undoing the MOVE while the REMOVE
        // stands is an ordering violation, checked before stock.
        stock::InMemoryLedgerStorage storage;
        ledger::LedgerEngine engine(storage);
        ledger::UndoEngine undo(storage);
        ledger::LedgerQueryService query(storage);

        applyOk(engine, command(TransactionType::Putaway, "A", 5, std::nullopt, "L1"), at(0));
        auto moved =
            applyOk(engine, command(TransactionType::Move, "A", 5, "L1", "L2"), at(1));
        assert(storage.quantity("A", "L1") == 0);
        assert(storage.quantity("A", "L2") == 5);
        auto removed =
            applyOk(engine, command(TransactionType::Remove, "A", 1, "L2", std::nullopt), at(2));
        assert(undo.undo(moved, "supervisor", at(3)).error == ledger::LedgerError::NotLatest);

        assert(undo.undo(removed, "supervisor", at(4)).ok());
        assert(undo.undo(moved, "supervisor", at(5)).ok());
        assert(storage.quantity("A", "L1") == 5);
        assert(storage.quantity("A", "L2") == 0);
        assert(query.itemTotal("A") == 5);
    }

    {
        // Same shape, but L2 lost one unit while the MOVE is still the latest
        // COMPLETED record: undo needs 5 at L2 and finds 4.
        stock::InMemoryLedgerStorage storage;
        ledger::LedgerEngine engine(storage);
        ledger::UndoEngine undo(storage);

        applyOk(engine, command(TransactionType::Putaway, "A", 5, std::nullopt, "L1"), at(0));
        auto moved =
            applyOk(engine, command(TransactionType::Move, "A", 5, "L1", "L2"), at(1));
        auto removed =
            applyOk(engine, command(TransactionType::Remove, "A", 1, "L2", std::nullopt), at(2));
        auto tx = storage.beginTransaction("A", std::chrono::milliseconds{50});
        assert(tx.has_value());
        bool flipped = storage.markUndone(*tx, removed, at(3), "system");
        assert(flipped);
        bool committed = storage.commitTransaction(*tx);
        assert(committed);
        assert(storage.quantity("A", "L2") == 4);

        auto failed = undo.undo(moved, "supervisor", at(4));
        assert(failed.error == ledger::LedgerError::InsufficientStock);
        assert(failed.message.find("L2") != std::string::npos);
        assert(failed.message.find("available 4") != std::string::npos);
        assert(failed.message.find("required 5") != std::string::npos);
        assert(storage.quantity("A", "L2") == 4);
        assert(storage.quantity("A", "L1") == 0);
        assert(storage.findById(moved)->status == stock::TransactionStatus::Completed);
    }

    {
        // Undo REMOVE always has room to give stock back.
        stock::InMemoryLedgerStorage storage;
        ledger::LedgerEngine engine(storage);
        ledger::UndoEngine undo(storage);
        applyOk(engine, command(TransactionType::Putaway, "A", 3, std::nullopt, "L1"), at(0));
        auto removed =
            applyOk(engine, command(TransactionType::Remove, "A", 3, "L1", std::nullopt), at(1));
        assert(storage.quantity("A", "L1") == 0);
        assert(undo.undo(removed, "supervisor", at(2)).ok());
        assert(storage.quantity("A", "L1") == 3);
    }

    return 0;
}
