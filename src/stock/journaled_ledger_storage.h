#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "admin/logging.h"
#include "stock/in_memory_ledger_storage.h"
#include "stock/ledger_journal.h"

namespace stock {

// In-memory storage made durable by a write-ahead journal. A unit's effects
// are buffered while it runs and written as one journal frame on commit; the
// in-memory commit only happens after the frame is flushed.
class JournaledLedgerStorage : public LedgerStorage {
public:
    explicit JournaledLedgerStorage(std::string journal_path);

    // Rebuilds state from the journal. Must be called before serving.
    bool open(std::string &reason);
    const ReplayStats &replayStats() const;
    std::uint64_t journalBytes() const;

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

private:
    void applyReplayed(const JournalOp &op);
    void bufferOp(const Transaction &transaction, JournalOp op);
    std::vector<JournalOp> takeOps(const Transaction &transaction);

    InMemoryLedgerStorage memory_;
    LedgerJournal journal_;
    ReplayStats replay_stats_{};
    std::size_t replay_rejected_{0};
    mutable std::mutex journal_mutex_;
    std::mutex pending_mutex_;
    std::unordered_map<UnitId, std::vector<JournalOp>> pending_;
    admin::StructuredLogger logger_{};
};

}  // namespace stock
