#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <unordered_map>
#include <utility>
#include <vector>

#include "stock/stock_models.h"

namespace stock {

// Append-mostly record store. Completed records are also indexed per item by
// (created_at, id) so the newest completed record is found without a scan.
// Not synchronized; the owning storage guards it.
class TransactionLog {
public:
    TransactionRecord append(TransactionRecord record);
    // Inserts a record that already carries an id (journal replay).
    bool restore(const TransactionRecord &record);

    std::optional<TransactionRecord> findById(TransactionId id) const;
    std::optional<TransactionRecord> findMostRecentCompleted(const ItemId &item_id) const;
    bool hasNewerCompleted(const TransactionRecord &record) const;
    // Newest created_at of any record of the item, undone ones included.
    std::optional<Timestamp> latestCreatedAt(const ItemId &item_id) const;

    bool markUndone(TransactionId id, Timestamp undone_at, const UserId &undone_by);

    // Rollback helpers for a unit of work that did not commit.
    void erase(TransactionId id);
    void restoreCompleted(TransactionId id);

    std::vector<TransactionRecord> query(const TransactionFilter &filter) const;
    std::size_t size() const;
    TransactionId nextId() const;

private:
    using OrderKey = std::pair<Timestamp, TransactionId>;

    static OrderKey orderKey(const TransactionRecord &record);
    void indexCompleted(const TransactionRecord &record);
    void unindexCompleted(const TransactionRecord &record);

    TransactionId next_id_{1};
    std::map<TransactionId, TransactionRecord> records_;
    std::unordered_map<ItemId, std::set<OrderKey>> completed_by_item_;
    std::unordered_map<ItemId, std::set<OrderKey>> all_by_item_;
};

}  // namespace stock
