#pragma once

#include <cstdint>
#include <map>
#include <vector>

#include "stock/ledger_storage.h"

namespace ledger {

// Read-only views for history and stock summary screens. No item locks are
// taken, so a view may include a unit that is still in flight.
class LedgerQueryService {
public:
    explicit LedgerQueryService(const stock::LedgerStorage &storage);

    std::vector<stock::TransactionRecord> listTransactions(
        const stock::TransactionFilter &filter) const;
    std::map<stock::LocationId, std::vector<stock::StockEntry>> stockByLocation() const;
    std::uint64_t itemTotal(const stock::ItemId &item_id) const;

private:
    const stock::LedgerStorage &storage_;
};

}  // namespace ledger
