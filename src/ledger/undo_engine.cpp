#include "ledger/undo_engine.h"

#include <algorithm>

#include "ledger/stock_effects.h"
#include "stock/movement.h"
#include "stock/record_codec.h"

namespace ledger {
namespace {

LedgerResult notFound(stock::TransactionId id) {
    return LedgerResult::failure(LedgerError::NotFound,
                                 "Transaction " + std::to_string(id) + " not found");
}

}  // namespace

UndoEngine::UndoEngine(stock::LedgerStorage &storage, LedgerConfig config)
    : storage_(storage), config_(config) {}

LedgerResult UndoEngine::undo(stock::TransactionId transaction_id,
                              const stock::UserId &requesting_user_id,
                              stock::Timestamp now) {
    if (requesting_user_id.empty()) {
        return LedgerResult::failure(LedgerError::InvalidOperand,
                                     "Requesting user id is required");
    }
    if (!stock::wire::fitsString(requesting_user_id)) {
        return LedgerResult::failure(LedgerError::InvalidOperand,
                                     "Requesting user id is limited to " +
                                         std::to_string(stock::wire::kMaxStringBytes) + " bytes");
    }

    // Unlocked read only to learn which item to lock.
    auto located = storage_.findById(transaction_id);
    if (!located) {
        return notFound(transaction_id);
    }

    auto transaction = storage_.beginTransaction(located->item_id, config_.lock_timeout);
    if (!transaction) {
        return LedgerResult::failure(LedgerError::Conflict,
                                     "Item " + located->item_id + " is busy, retry the request");
    }

    // The first read may have seen a unit that was rolled back since.
    auto record = storage_.findById(transaction_id);
    if (!record) {
        storage_.rollbackTransaction(*transaction);
        return notFound(transaction_id);
    }
    if (record->status == stock::TransactionStatus::Undone) {
        storage_.rollbackTransaction(*transaction);
        return LedgerResult::failure(LedgerError::AlreadyUndone, "Transaction already undone");
    }
    if (storage_.hasNewerCompleted(*record)) {
        storage_.rollbackTransaction(*transaction);
        return LedgerResult::failure(LedgerError::NotLatest,
                                     "Can only undo the most recent transaction for an item");
    }

    auto movement = stock::movementOf(*record);
    if (!movement) {
        storage_.rollbackTransaction(*transaction);
        return LedgerResult::failure(LedgerError::InvalidOperand,
                                     "Stored transaction has inconsistent locations");
    }
    auto deltas = stock::inverseEffect(*movement, record->quantity);
    if (auto shortfall = findShortfall(storage_, record->item_id, deltas)) {
        storage_.rollbackTransaction(*transaction);
        return LedgerResult::failure(LedgerError::InsufficientStock,
                                     describeShortfall(*shortfall));
    }
    if (!applyDeltas(storage_, *transaction, deltas)) {
        storage_.rollbackTransaction(*transaction);
        return LedgerResult::failure(LedgerError::InvalidOperand,
                                     "Quantity exceeds the capacity of a stock entry");
    }

    // Never before the record itself, whatever `now` the caller captured.
    auto undone_at = std::max(toStoredPrecision(now), record->created_at);
    if (!storage_.markUndone(*transaction, transaction_id, undone_at, requesting_user_id)) {
        storage_.rollbackTransaction(*transaction);
        return LedgerResult::failure(LedgerError::AlreadyUndone, "Transaction already undone");
    }
    if (!storage_.commitTransaction(*transaction)) {
        return LedgerResult::failure(LedgerError::StorageUnavailable,
                                     "Ledger storage is unavailable");
    }

    record->status = stock::TransactionStatus::Undone;
    record->undone_at = undone_at;
    record->undone_by_user_id = requesting_user_id;
    return LedgerResult::success(std::move(*record), "Transaction undone");
}

}  // namespace ledger
