#include "stock/stock_table.h"

#include <limits>

namespace stock {

Quantity StockTable::quantity(const ItemId &item_id, const LocationId &location_id) const {
    auto it = entries_.find(Key{location_id, item_id});
    if (it == entries_.end()) {
        return 0;
    }
    return it->second;
}

bool StockTable::contains(const ItemId &item_id, const LocationId &location_id) const {
    return entries_.find(Key{location_id, item_id}) != entries_.end();
}

bool StockTable::increment(const ItemId &item_id,
                           const LocationId &location_id,
                           Quantity delta) {
    if (delta == 0) {
        return false;
    }
    auto [it, inserted] = entries_.try_emplace(Key{location_id, item_id}, 0);
    if (it->second > std::numeric_limits<Quantity>::max() - delta) {
        if (inserted) {
            entries_.erase(it);
        }
        return false;
    }
    it->second += delta;
    return true;
}

bool StockTable::decrement(const ItemId &item_id,
                           const LocationId &location_id,
                           Quantity delta) {
    if (delta == 0) {
        return false;
    }
    auto it = entries_.find(Key{location_id, item_id});
    if (it == entries_.end() || it->second < delta) {
        return false;
    }
    it->second -= delta;
    return true;
}

void StockTable::set(const ItemId &item_id, const LocationId &location_id, Quantity quantity) {
    entries_[Key{location_id, item_id}] = quantity;
}

void StockTable::erase(const ItemId &item_id, const LocationId &location_id) {
    entries_.erase(Key{location_id, item_id});
}

std::vector<StockEntry> StockTable::entries() const {
    std::vector<StockEntry> out;
    out.reserve(entries_.size());
    for (const auto &[key, quantity] : entries_) {
        out.push_back(StockEntry{key.second, key.first, quantity});
    }
    return out;
}

std::size_t StockTable::size() const {
    return entries_.size();
}

}  // namespace stock
