#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "stock/ledger_storage.h"
#include "stock/stock_table.h"
#include "stock/transaction_log.h"

namespace stock {

// Thread-safe in-process storage. Each item has its own timed mutex, held by
// the unit of work from begin to commit/rollback; a unit must finish on the
// thread that began it. Short-lived reads and writes of the shared tables go
// through data_mutex_.
class InMemoryLedgerStorage : public LedgerStorage {
public:
    std::optional<Transaction> beginTransaction(const ItemId &item_id,
                                                std::chrono::milliseconds timeout) override;
    bool commitTransaction(const Transaction &transaction) override;
    void rollbackTransaction(const Transaction &transaction) override;

    Quantity quantity(const ItemId &item_id, const LocationId &location_id) const override;
    bool increment(const Transaction &transaction,
                   const LocationId &location_id,
                   Quantity delta) override;
    bool decrement(const Transaction &transaction,
                   const LocationId &location_id,
                   Quantity delta) override;

    std::optional<TransactionRecord> append(const Transaction &transaction,
                                            TransactionRecord record) override;
    std::optional<TransactionRecord> findById(TransactionId id) const override;
    std::optional<TransactionRecord> findMostRecentCompleted(
        const ItemId &item_id) const override;
    bool hasNewerCompleted(const TransactionRecord &record) const override;
    std::optional<Timestamp> latestCreatedAt(const ItemId &item_id) const override;
    bool markUndone(const Transaction &transaction,
                    TransactionId id,
                    Timestamp undone_at,
                    const UserId &undone_by) override;

    std::vector<TransactionRecord> queryTransactions(
        const TransactionFilter &filter) const override;
    std::vector<StockEntry> stockEntries() const override;
    std::size_t transactionCount() const override;

    // Journal replay. Applied outside any unit of work, before the storage
    // serves requests.
    void restoreStock(const ItemId &item_id, const LocationId &location_id, Quantity quantity);
    bool restoreRecord(const TransactionRecord &record);
    bool restoreUndone(TransactionId id, Timestamp undone_at, const UserId &undone_by);

private:
    struct RollbackStep {
        enum class Kind : std::uint8_t {
            RestoreStock,
            EraseRecord,
            RestoreCompleted
        };

        Kind kind{Kind::RestoreStock};
        LocationId location_id;
        bool existed{false};
        Quantity previous{0};
        TransactionId transaction_id{0};
    };

    struct Unit {
        ItemId item_id;
        std::shared_ptr<std::timed_mutex> lock;
        std::vector<RollbackStep> steps;
    };

    std::shared_ptr<std::timed_mutex> itemLock(const ItemId &item_id);
    Unit *findUnitLocked(const Transaction &transaction);
    void undoStepsLocked(Unit &unit);

    std::mutex locks_mutex_;
    std::unordered_map<ItemId, std::shared_ptr<std::timed_mutex>> item_locks_;

    mutable std::shared_mutex data_mutex_;
    UnitId next_unit_id_{1};
    std::unordered_map<UnitId, Unit> units_;
    StockTable stock_;
    TransactionLog log_;
};

}  // namespace stock
