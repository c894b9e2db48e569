#pragma once

#include <cstddef>
#include <map>
#include <utility>
#include <vector>

#include "stock/stock_models.h"

namespace stock {

// Quantities per (item, location). An absent entry reads as zero. Not
// synchronized; the owning storage guards it.
class StockTable {
public:
    Quantity quantity(const ItemId &item_id, const LocationId &location_id) const;
    bool contains(const ItemId &item_id, const LocationId &location_id) const;

    bool increment(const ItemId &item_id, const LocationId &location_id, Quantity delta);
    bool decrement(const ItemId &item_id, const LocationId &location_id, Quantity delta);
    void set(const ItemId &item_id, const LocationId &location_id, Quantity quantity);
    void erase(const ItemId &item_id, const LocationId &location_id);

    std::vector<StockEntry> entries() const;
    std::size_t size() const;

private:
    // Keyed by (location, item) so entries() comes out grouped by location.
    using Key = std::pair<LocationId, ItemId>;

    std::map<Key, Quantity> entries_;
};

}  // namespace stock
