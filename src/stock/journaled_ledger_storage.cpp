#include "stock/journaled_ledger_storage.h"

namespace stock {

JournaledLedgerStorage::JournaledLedgerStorage(std::string journal_path)
    : journal_(std::move(journal_path)) {}

bool JournaledLedgerStorage::open(std::string &reason) {
    std::scoped_lock lock(journal_mutex_);
    admin::LogFields fields;
    fields.path = journal_.path();
    if (!journal_.open([this](const JournalOp &op) { applyReplayed(op); }, replay_stats_,
                       reason)) {
        fields.reason = reason;
        logger_.log("error", "journal_open_failed", "Failed to open ledger journal", fields);
        return false;
    }
    fields.count = replay_stats_.frames;
    fields.bytes = journal_.bytesWritten();
    if (replay_rejected_ > 0) {
        admin::LogFields rejected = fields;
        rejected.count = replay_rejected_;
        logger_.log("warn", "journal_ops_rejected",
                    "Journal ops conflicting with replayed state were skipped", rejected);
    }
    if (replay_stats_.torn_bytes > 0) {
        fields.reason = "dropped " + std::to_string(replay_stats_.torn_bytes) +
                        " bytes of torn tail";
        logger_.log("warn", "journal_replayed", "Ledger journal replayed with torn tail",
                    fields);
    } else {
        logger_.log("info", "journal_replayed", "Ledger journal replayed", fields);
    }
    return true;
}

const ReplayStats &JournaledLedgerStorage::replayStats() const {
    return replay_stats_;
}

std::uint64_t JournaledLedgerStorage::journalBytes() const {
    std::scoped_lock lock(journal_mutex_);
    return journal_.bytesWritten();
}

std::optional<Transaction> JournaledLedgerStorage::beginTransaction(
    const ItemId &item_id,
    std::chrono::milliseconds timeout) {
    return memory_.beginTransaction(item_id, timeout);
}

bool JournaledLedgerStorage::commitTransaction(const Transaction &transaction) {
    auto ops = takeOps(transaction);
    if (!ops.empty()) {
        bool written = false;
        std::string error;
        {
            std::scoped_lock lock(journal_mutex_);
            written = journal_.append(ops);
            if (!written) {
                error = journal_.lastError();
            }
        }
        if (!written) {
            admin::LogFields fields;
            fields.path = journal_.path();
            fields.reason = error;
            fields.item_id = transaction.item_id;
            fields.count = ops.size();
            logger_.log("error", "journal_write_failed",
                        "Ledger journal write failed; unit rolled back", fields);
            memory_.rollbackTransaction(transaction);
            return false;
        }
    }
    return memory_.commitTransaction(transaction);
}

void JournaledLedgerStorage::rollbackTransaction(const Transaction &transaction) {
    takeOps(transaction);
    memory_.rollbackTransaction(transaction);
}

Quantity JournaledLedgerStorage::quantity(const ItemId &item_id,
                                          const LocationId &location_id) const {
    return memory_.quantity(item_id, location_id);
}

bool JournaledLedgerStorage::increment(const Transaction &transaction,
                                       const LocationId &location_id,
                                       Quantity delta) {
    if (!memory_.increment(transaction, location_id, delta)) {
        return false;
    }
    JournalOp op;
    op.kind = JournalOpKind::SetStock;
    op.stock = StockEntry{transaction.item_id, location_id,
                          memory_.quantity(transaction.item_id, location_id)};
    bufferOp(transaction, std::move(op));
    return true;
}

bool JournaledLedgerStorage::decrement(const Transaction &transaction,
                                       const LocationId &location_id,
                                       Quantity delta) {
    if (!memory_.decrement(transaction, location_id, delta)) {
        return false;
    }
    JournalOp op;
    op.kind = JournalOpKind::SetStock;
    op.stock = StockEntry{transaction.item_id, location_id,
                          memory_.quantity(transaction.item_id, location_id)};
    bufferOp(transaction, std::move(op));
    return true;
}

std::optional<TransactionRecord> JournaledLedgerStorage::append(const Transaction &transaction,
                                                                TransactionRecord record) {
    auto stored = memory_.append(transaction, std::move(record));
    if (!stored) {
        return std::nullopt;
    }
    JournalOp op;
    op.kind = JournalOpKind::AppendRecord;
    op.record = *stored;
    bufferOp(transaction, std::move(op));
    return stored;
}

std::optional<TransactionRecord> JournaledLedgerStorage::findById(TransactionId id) const {
    return memory_.findById(id);
}

std::optional<TransactionRecord> JournaledLedgerStorage::findMostRecentCompleted(
    const ItemId &item_id) const {
    return memory_.findMostRecentCompleted(item_id);
}

bool JournaledLedgerStorage::hasNewerCompleted(const TransactionRecord &record) const {
    return memory_.hasNewerCompleted(record);
}

std::optional<Timestamp> JournaledLedgerStorage::latestCreatedAt(const ItemId &item_id) const {
    return memory_.latestCreatedAt(item_id);
}

bool JournaledLedgerStorage::markUndone(const Transaction &transaction,
                                        TransactionId id,
                                        Timestamp undone_at,
                                        const UserId &undone_by) {
    if (!memory_.markUndone(transaction, id, undone_at, undone_by)) {
        return false;
    }
    JournalOp op;
    op.kind = JournalOpKind::MarkUndone;
    op.transaction_id = id;
    op.undone_at = undone_at;
    op.undone_by_user_id = undone_by;
    bufferOp(transaction, std::move(op));
    return true;
}

std::vector<TransactionRecord> JournaledLedgerStorage::queryTransactions(
    const TransactionFilter &filter) const {
    return memory_.queryTransactions(filter);
}

std::vector<StockEntry> JournaledLedgerStorage::stockEntries() const {
    return memory_.stockEntries();
}

std::size_t JournaledLedgerStorage::transactionCount() const {
    return memory_.transactionCount();
}

void JournaledLedgerStorage::applyReplayed(const JournalOp &op) {
    switch (op.kind) {
        case JournalOpKind::SetStock:
            memory_.restoreStock(op.stock.item_id, op.stock.location_id, op.stock.quantity);
            break;
        case JournalOpKind::AppendRecord:
            if (!memory_.restoreRecord(op.record)) {
                replay_rejected_ += 1;
            }
            break;
        case JournalOpKind::MarkUndone:
            if (!memory_.restoreUndone(op.transaction_id, op.undone_at, op.undone_by_user_id)) {
                replay_rejected_ += 1;
            }
            break;
    }
}

void JournaledLedgerStorage::bufferOp(const Transaction &transaction, JournalOp op) {
    std::scoped_lock lock(pending_mutex_);
    pending_[transaction.unit_id].push_back(std::move(op));
}

std::vector<JournalOp> JournaledLedgerStorage::takeOps(const Transaction &transaction) {
    std::scoped_lock lock(pending_mutex_);
    auto it = pending_.find(transaction.unit_id);
    if (it == pending_.end()) {
        return {};
    }
    auto ops = std::move(it->second);
    pending_.erase(it);
    return ops;
}

}  // namespace stock
