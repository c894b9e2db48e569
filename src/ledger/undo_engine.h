#pragma once

#include "ledger/ledger_config.h"
#include "ledger/ledger_errors.h"
#include "stock/ledger_storage.h"

namespace ledger {

// Reverses the most recent COMPLETED transaction of an item. The record is
// flipped to UNDONE in place; no compensating record is written.
class UndoEngine {
public:
    explicit UndoEngine(stock::LedgerStorage &storage, LedgerConfig config = {});

    LedgerResult undo(stock::TransactionId transaction_id,
                      const stock::UserId &requesting_user_id,
                      stock::Timestamp now);

private:
    stock::LedgerStorage &storage_;
    LedgerConfig config_;
};

}  // namespace ledger
