#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <vector>

#include "stock/stock_models.h"

namespace stock {

// Stock store plus transaction log behind one unit-of-work boundary.
//
// beginTransaction() takes the exclusive lock of one item; every read used to
// validate a decision and every write acting on it happens while that lock is
// held. Mutating calls must pass the handle of the unit they belong to and
// may only touch that unit's item.
class LedgerStorage {
public:
    virtual ~LedgerStorage() = default;

    // nullopt when the item lock is not acquired within `timeout`.
    virtual std::optional<Transaction> beginTransaction(const ItemId &item_id,
                                                        std::chrono::milliseconds timeout) = 0;
    // false when the unit could not be made durable. The unit is rolled back
    // and its lock released in that case.
    virtual bool commitTransaction(const Transaction &transaction) = 0;
    virtual void rollbackTransaction(const Transaction &transaction) = 0;

    virtual Quantity quantity(const ItemId &item_id, const LocationId &location_id) const = 0;
    virtual bool increment(const Transaction &transaction,
                           const LocationId &location_id,
                           Quantity delta) = 0;
    virtual bool decrement(const Transaction &transaction,
                           const LocationId &location_id,
                           Quantity delta) = 0;

    // Assigns the id. nullopt when the record's item is not the unit's item.
    virtual std::optional<TransactionRecord> append(const Transaction &transaction,
                                                    TransactionRecord record) = 0;
    virtual std::optional<TransactionRecord> findById(TransactionId id) const = 0;
    virtual std::optional<TransactionRecord> findMostRecentCompleted(
        const ItemId &item_id) const = 0;
    virtual bool hasNewerCompleted(const TransactionRecord &record) const = 0;
    virtual std::optional<Timestamp> latestCreatedAt(const ItemId &item_id) const = 0;
    virtual bool markUndone(const Transaction &transaction,
                            TransactionId id,
                            Timestamp undone_at,
                            const UserId &undone_by) = 0;

    virtual std::vector<TransactionRecord> queryTransactions(
        const TransactionFilter &filter) const = 0;
    virtual std::vector<StockEntry> stockEntries() const = 0;
    virtual std::size_t transactionCount() const = 0;
};

}  // namespace stock
