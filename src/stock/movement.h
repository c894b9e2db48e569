#pragma once

#include <optional>
#include <variant>
#include <vector>

#include "stock/stock_models.h"

namespace stock {

struct Putaway {
    LocationId to;
};

struct Remove {
    LocationId from;
};

struct Move {
    LocationId from;
    LocationId to;
};

// Every operation kind, with its forward effect and the exact inverse of it.
using Movement = std::variant<Putaway, Remove, Move>;

enum class Direction : std::uint8_t {
    Increase,
    Decrease
};

struct StockDelta {
    LocationId location_id;
    Direction direction{Direction::Increase};
    Quantity quantity{0};
};

// nullopt when the locations do not fit the type: PUTAWAY takes only `to`,
// REMOVE only `from`, MOVE both and they must differ. Empty ids count as absent.
std::optional<Movement> makeMovement(TransactionType type,
                                     const std::optional<LocationId> &from,
                                     const std::optional<LocationId> &to);
std::optional<Movement> movementOf(const TransactionRecord &record);

TransactionType movementType(const Movement &movement);
std::optional<LocationId> sourceLocation(const Movement &movement);
std::optional<LocationId> destinationLocation(const Movement &movement);

// Decreases come first in both lists.
std::vector<StockDelta> forwardEffect(const Movement &movement, Quantity quantity);
std::vector<StockDelta> inverseEffect(const Movement &movement, Quantity quantity);

}  // namespace stock
