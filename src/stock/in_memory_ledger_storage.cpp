#include "stock/in_memory_ledger_storage.h"

namespace stock {

std::optional<Transaction> InMemoryLedgerStorage::beginTransaction(
    const ItemId &item_id,
    std::chrono::milliseconds timeout) {
    auto lock = itemLock(item_id);
    if (!lock->try_lock_for(timeout)) {
        return std::nullopt;
    }

    std::unique_lock<std::shared_mutex> guard(data_mutex_);
    Transaction transaction{next_unit_id_++, item_id};
    units_.emplace(transaction.unit_id, Unit{item_id, std::move(lock), {}});
    return transaction;
}

bool InMemoryLedgerStorage::commitTransaction(const Transaction &transaction) {
    std::shared_ptr<std::timed_mutex> lock;
    {
        std::unique_lock<std::shared_mutex> guard(data_mutex_);
        auto *unit = findUnitLocked(transaction);
        if (!unit) {
            return false;
        }
        lock = std::move(unit->lock);
        units_.erase(transaction.unit_id);
    }
    lock->unlock();
    return true;
}

void InMemoryLedgerStorage::rollbackTransaction(const Transaction &transaction) {
    std::shared_ptr<std::timed_mutex> lock;
    {
        std::unique_lock<std::shared_mutex> guard(data_mutex_);
        auto *unit = findUnitLocked(transaction);
        if (!unit) {
            return;
        }
        undoStepsLocked(*unit);
        lock = std::move(unit->lock);
        units_.erase(transaction.unit_id);
    }
    lock->unlock();
}

Quantity InMemoryLedgerStorage::quantity(const ItemId &item_id,
                                         const LocationId &location_id) const {
    std::shared_lock<std::shared_mutex> guard(data_mutex_);
    return stock_.quantity(item_id, location_id);
}

bool InMemoryLedgerStorage::increment(const Transaction &transaction,
                                      const LocationId &location_id,
                                      Quantity delta) {
    std::unique_lock<std::shared_mutex> guard(data_mutex_);
    auto *unit = findUnitLocked(transaction);
    if (!unit) {
        return false;
    }
    const bool existed = stock_.contains(unit->item_id, location_id);
    const Quantity previous = stock_.quantity(unit->item_id, location_id);
    if (!stock_.increment(unit->item_id, location_id, delta)) {
        return false;
    }
    unit->steps.push_back(RollbackStep{RollbackStep::Kind::RestoreStock, location_id, existed,
                                       previous, 0});
    return true;
}

bool InMemoryLedgerStorage::decrement(const Transaction &transaction,
                                      const LocationId &location_id,
                                      Quantity delta) {
    std::unique_lock<std::shared_mutex> guard(data_mutex_);
    auto *unit = findUnitLocked(transaction);
    if (!unit) {
        return false;
    }
    const Quantity previous = stock_.quantity(unit->item_id, location_id);
    if (!stock_.decrement(unit->item_id, location_id, delta)) {
        return false;
    }
    unit->steps.push_back(RollbackStep{RollbackStep::Kind::RestoreStock, location_id, true,
                                       previous, 0});
    return true;
}

std::optional<TransactionRecord> InMemoryLedgerStorage::append(const Transaction &transaction,
                                                               TransactionRecord record) {
    std::unique_lock<std::shared_mutex> guard(data_mutex_);
    auto *unit = findUnitLocked(transaction);
    if (!unit || record.item_id != unit->item_id) {
        return std::nullopt;
    }
    auto stored = log_.append(std::move(record));
    RollbackStep step;
    step.kind = RollbackStep::Kind::EraseRecord;
    step.transaction_id = stored.id;
    unit->steps.push_back(std::move(step));
    return stored;
}

std::optional<TransactionRecord> InMemoryLedgerStorage::findById(TransactionId id) const {
    std::shared_lock<std::shared_mutex> guard(data_mutex_);
    return log_.findById(id);
}

std::optional<TransactionRecord> InMemoryLedgerStorage::findMostRecentCompleted(
    const ItemId &item_id) const {
    std::shared_lock<std::shared_mutex> guard(data_mutex_);
    return log_.findMostRecentCompleted(item_id);
}

bool InMemoryLedgerStorage::hasNewerCompleted(const TransactionRecord &record) const {
    std::shared_lock<std::shared_mutex> guard(data_mutex_);
    return log_.hasNewerCompleted(record);
}

std::optional<Timestamp> InMemoryLedgerStorage::latestCreatedAt(const ItemId &item_id) const {
    std::shared_lock<std::shared_mutex> guard(data_mutex_);
    return log_.latestCreatedAt(item_id);
}

bool InMemoryLedgerStorage::markUndone(const Transaction &transaction,
                                       TransactionId id,
                                       Timestamp undone_at,
                                       const UserId &undone_by) {
    std::unique_lock<std::shared_mutex> guard(data_mutex_);
    auto *unit = findUnitLocked(transaction);
    if (!unit) {
        return false;
    }
    auto record = log_.findById(id);
    if (!record || record->item_id != unit->item_id) {
        return false;
    }
    if (!log_.markUndone(id, undone_at, undone_by)) {
        return false;
    }
    RollbackStep step;
    step.kind = RollbackStep::Kind::RestoreCompleted;
    step.transaction_id = id;
    unit->steps.push_back(std::move(step));
    return true;
}

std::vector<TransactionRecord> InMemoryLedgerStorage::queryTransactions(
    const TransactionFilter &filter) const {
    std::shared_lock<std::shared_mutex> guard(data_mutex_);
    return log_.query(filter);
}

std::vector<StockEntry> InMemoryLedgerStorage::stockEntries() const {
    std::shared_lock<std::shared_mutex> guard(data_mutex_);
    return stock_.entries();
}

std::size_t InMemoryLedgerStorage::transactionCount() const {
    std::shared_lock<std::shared_mutex> guard(data_mutex_);
    return log_.size();
}

void InMemoryLedgerStorage::restoreStock(const ItemId &item_id,
                                         const LocationId &location_id,
                                         Quantity quantity) {
    std::unique_lock<std::shared_mutex> guard(data_mutex_);
    stock_.set(item_id, location_id, quantity);
}

bool InMemoryLedgerStorage::restoreRecord(const TransactionRecord &record) {
    std::unique_lock<std::shared_mutex> guard(data_mutex_);
    return log_.restore(record);
}

bool InMemoryLedgerStorage::restoreUndone(TransactionId id,
                                          Timestamp undone_at,
                                          const UserId &undone_by) {
    std::unique_lock<std::shared_mutex> guard(data_mutex_);
    return log_.markUndone(id, undone_at, undone_by);
}

std::shared_ptr<std::timed_mutex> InMemoryLedgerStorage::itemLock(const ItemId &item_id) {
    std::scoped_lock lock(locks_mutex_);
    auto &slot = item_locks_[item_id];
    if (!slot) {
        slot = std::make_shared<std::timed_mutex>();
    }
    return slot;
}

InMemoryLedgerStorage::Unit *InMemoryLedgerStorage::findUnitLocked(
    const Transaction &transaction) {
    auto it = units_.find(transaction.unit_id);
    if (it == units_.end() || it->second.item_id != transaction.item_id) {
        return nullptr;
    }
    return &it->second;
}

void InMemoryLedgerStorage::undoStepsLocked(Unit &unit) {
    for (auto it = unit.steps.rbegin(); it != unit.steps.rend(); ++it) {
        switch (it->kind) {
            case RollbackStep::Kind::RestoreStock:
                if (it->existed) {
                    stock_.set(unit.item_id, it->location_id, it->previous);
                } else {
                    stock_.erase(unit.item_id, it->location_id);
                }
                break;
            case RollbackStep::Kind::EraseRecord:
                log_.erase(it->transaction_id);
                break;
            case RollbackStep::Kind::RestoreCompleted:
                log_.restoreCompleted(it->transaction_id);
                break;
        }
    }
    unit.steps.clear();
}

}  // namespace stock
