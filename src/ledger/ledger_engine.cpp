#include "ledger/ledger_engine.h"

#include "ledger/stock_effects.h"
#include "stock/movement.h"
#include "stock/record_codec.h"

namespace ledger {
namespace {

std::optional<std::string> validateCommand(const ApplyCommand &command) {
    if (command.quantity == 0) {
        return "Quantity must be positive";
    }
    if (command.item_id.empty()) {
        return "Item id is required";
    }
    if (command.actor_user_id.empty()) {
        return "Actor user id is required";
    }
    if (!stock::wire::fitsString(command.item_id) ||
        !stock::wire::fitsString(command.actor_user_id) ||
        !stock::wire::fitsString(command.from_location_id.value_or("")) ||
        !stock::wire::fitsString(command.to_location_id.value_or(""))) {
        return "Identifiers are limited to " + std::to_string(stock::wire::kMaxStringBytes) +
               " bytes";
    }
    return std::nullopt;
}

std::string locationRequirement(stock::TransactionType type) {
    switch (type) {
        case stock::TransactionType::Putaway:
            return "PUTAWAY requires a destination location and no source location";
        case stock::TransactionType::Remove:
            return "REMOVE requires a source location and no destination location";
        case stock::TransactionType::Move:
            return "MOVE requires distinct source and destination locations";
    }
    return "Unknown transaction type";
}

}  // namespace

LedgerEngine::LedgerEngine(stock::LedgerStorage &storage, LedgerConfig config)
    : storage_(storage), config_(config) {}

LedgerResult LedgerEngine::apply(const ApplyCommand &command, stock::Timestamp now) {
    if (auto problem = validateCommand(command)) {
        return LedgerResult::failure(LedgerError::InvalidOperand, *problem);
    }
    auto movement =
        stock::makeMovement(command.type, command.from_location_id, command.to_location_id);
    if (!movement) {
        return LedgerResult::failure(LedgerError::InvalidOperand,
                                     locationRequirement(command.type));
    }
    auto deltas = stock::forwardEffect(*movement, command.quantity);

    auto transaction = storage_.beginTransaction(command.item_id, config_.lock_timeout);
    if (!transaction) {
        return LedgerResult::failure(LedgerError::Conflict,
                                     "Item " + command.item_id + " is busy, retry the request");
    }

    if (auto shortfall = findShortfall(storage_, command.item_id, deltas)) {
        storage_.rollbackTransaction(*transaction);
        return LedgerResult::failure(LedgerError::InsufficientStock,
                                     describeShortfall(*shortfall));
    }
    if (!applyDeltas(storage_, *transaction, deltas)) {
        storage_.rollbackTransaction(*transaction);
        return LedgerResult::failure(LedgerError::InvalidOperand,
                                     "Quantity exceeds the capacity of a stock entry");
    }

    stock::TransactionRecord record;
    record.type = command.type;
    record.quantity = command.quantity;
    record.item_id = command.item_id;
    record.from_location_id = stock::sourceLocation(*movement);
    record.to_location_id = stock::destinationLocation(*movement);
    record.actor_user_id = command.actor_user_id;
    record.created_at = stampForNewRecord(storage_, command.item_id, now);
    record.status = stock::TransactionStatus::Completed;

    auto stored = storage_.append(*transaction, std::move(record));
    if (!stored) {
        storage_.rollbackTransaction(*transaction);
        return LedgerResult::failure(LedgerError::StorageUnavailable,
                                     "Transaction record could not be stored");
    }
    if (!storage_.commitTransaction(*transaction)) {
        return LedgerResult::failure(LedgerError::StorageUnavailable,
                                     "Ledger storage is unavailable");
    }
    return LedgerResult::success(std::move(*stored), "Transaction applied");
}

const LedgerConfig &LedgerEngine::config() const {
    return config_;
}

}  // namespace ledger
