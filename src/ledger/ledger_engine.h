#pragma once

#include <optional>

#include "ledger/ledger_config.h"
#include "ledger/ledger_errors.h"
#include "stock/ledger_storage.h"

namespace ledger {

struct ApplyCommand {
    stock::TransactionType type{stock::TransactionType::Putaway};
    stock::ItemId item_id;
    stock::Quantity quantity{0};
    std::optional<stock::LocationId> from_location_id;
    std::optional<stock::LocationId> to_location_id;
    stock::UserId actor_user_id;
};

// Applies one PUTAWAY, REMOVE or MOVE as a single unit of work: either the
// stock change and its COMPLETED record both commit, or neither does.
class LedgerEngine {
public:
    explicit LedgerEngine(stock::LedgerStorage &storage, LedgerConfig config = {});

    LedgerResult apply(const ApplyCommand &command, stock::Timestamp now);

    const LedgerConfig &config() const;

private:
    stock::LedgerStorage &storage_;
    LedgerConfig config_;
};

}  // namespace ledger
