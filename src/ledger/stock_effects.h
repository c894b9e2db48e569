#pragma once

#include <optional>
#include <string>
#include <vector>

#include "stock/ledger_storage.h"
#include "stock/movement.h"

namespace ledger {

struct Shortfall {
    stock::LocationId location_id;
    stock::Quantity available{0};
    stock::Quantity required{0};
};

// First decrease that current stock cannot cover. Call with the item lock held.
std::optional<Shortfall> findShortfall(const stock::LedgerStorage &storage,
                                       const stock::ItemId &item_id,
                                       const std::vector<stock::StockDelta> &deltas);

// false as soon as one delta is refused; the caller rolls the unit back.
bool applyDeltas(stock::LedgerStorage &storage,
                 const stock::Transaction &transaction,
                 const std::vector<stock::StockDelta> &deltas);

std::string describeShortfall(const Shortfall &shortfall);

// Stored timestamps keep microseconds, the journal's resolution.
stock::Timestamp toStoredPrecision(stock::Timestamp time);

// Stamp for a new record of `item_id`: `now` at stored precision, raised to
// the item's newest created_at so records sort in the order they were
// applied. Call with the item lock held.
stock::Timestamp stampForNewRecord(const stock::LedgerStorage &storage,
                                   const stock::ItemId &item_id,
                                   stock::Timestamp now);

}  // namespace ledger
