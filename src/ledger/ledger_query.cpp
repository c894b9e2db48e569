#include "ledger/ledger_query.h"

namespace ledger {

LedgerQueryService::LedgerQueryService(const stock::LedgerStorage &storage)
    : storage_(storage) {}

std::vector<stock::TransactionRecord> LedgerQueryService::listTransactions(
    const stock::TransactionFilter &filter) const {
    return storage_.queryTransactions(filter);
}

std::map<stock::LocationId, std::vector<stock::StockEntry>>
LedgerQueryService::stockByLocation() const {
    std::map<stock::LocationId, std::vector<stock::StockEntry>> grouped;
    for (auto &entry : storage_.stockEntries()) {
        auto location = entry.location_id;
        grouped[location].push_back(std::move(entry));
    }
    return grouped;
}

std::uint64_t LedgerQueryService::itemTotal(const stock::ItemId &item_id) const {
    std::uint64_t total = 0;
    for (const auto &entry : storage_.stockEntries()) {
        if (entry.item_id == item_id) {
            total += entry.quantity;
        }
    }
    return total;
}

}  // namespace ledger
