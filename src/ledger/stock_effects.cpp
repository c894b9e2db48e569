#include "ledger/stock_effects.h"

namespace ledger {

std::optional<Shortfall> findShortfall(const stock::LedgerStorage &storage,
                                       const stock::ItemId &item_id,
                                       const std::vector<stock::StockDelta> &deltas) {
    for (const auto &delta : deltas) {
        if (delta.direction != stock::Direction::Decrease) {
            continue;
        }
        auto available = storage.quantity(item_id, delta.location_id);
        if (available < delta.quantity) {
            return Shortfall{delta.location_id, available, delta.quantity};
        }
    }
    return std::nullopt;
}

bool applyDeltas(stock::LedgerStorage &storage,
                 const stock::Transaction &transaction,
                 const std::vector<stock::StockDelta> &deltas) {
    for (const auto &delta : deltas) {
        bool applied = delta.direction == stock::Direction::Increase
                           ? storage.increment(transaction, delta.location_id, delta.quantity)
                           : storage.decrement(transaction, delta.location_id, delta.quantity);
        if (!applied) {
            return false;
        }
    }
    return true;
}

std::string describeShortfall(const Shortfall &shortfall) {
    return "Insufficient stock at location " + shortfall.location_id + ": available " +
           std::to_string(shortfall.available) + ", required " +
           std::to_string(shortfall.required);
}

stock::Timestamp toStoredPrecision(stock::Timestamp time) {
    return std::chrono::time_point_cast<std::chrono::microseconds>(time);
}

stock::Timestamp stampForNewRecord(const stock::LedgerStorage &storage,
                                   const stock::ItemId &item_id,
                                   stock::Timestamp now) {
    auto stamp = toStoredPrecision(now);
    auto latest = storage.latestCreatedAt(item_id);
    if (latest && *latest > stamp) {
        return *latest;
    }
    return stamp;
}

}  // namespace ledger
