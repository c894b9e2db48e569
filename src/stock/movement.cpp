#include "stock/movement.h"

namespace stock {
namespace {

bool present(const std::optional<LocationId> &location) {
    return location.has_value() && !location->empty();
}

std::vector<StockDelta> effectOf(const Putaway &putaway, Quantity quantity) {
    return {StockDelta{putaway.to, Direction::Increase, quantity}};
}

std::vector<StockDelta> effectOf(const Remove &remove, Quantity quantity) {
    return {StockDelta{remove.from, Direction::Decrease, quantity}};
}

std::vector<StockDelta> effectOf(const Move &move, Quantity quantity) {
    return {StockDelta{move.from, Direction::Decrease, quantity},
            StockDelta{move.to, Direction::Increase, quantity}};
}

TransactionType typeOf(const Putaway &) {
    return TransactionType::Putaway;
}

TransactionType typeOf(const Remove &) {
    return TransactionType::Remove;
}

TransactionType typeOf(const Move &) {
    return TransactionType::Move;
}

}  // namespace

std::optional<Movement> makeMovement(TransactionType type,
                                     const std::optional<LocationId> &from,
                                     const std::optional<LocationId> &to) {
    switch (type) {
        case TransactionType::Putaway:
            if (!present(to) || present(from)) {
                return std::nullopt;
            }
            return Movement{Putaway{*to}};
        case TransactionType::Remove:
            if (!present(from) || present(to)) {
                return std::nullopt;
            }
            return Movement{Remove{*from}};
        case TransactionType::Move:
            if (!present(from) || !present(to) || *from == *to) {
                return std::nullopt;
            }
            return Movement{Move{*from, *to}};
    }
    return std::nullopt;
}

std::optional<Movement> movementOf(const TransactionRecord &record) {
    return makeMovement(record.type, record.from_location_id, record.to_location_id);
}

TransactionType movementType(const Movement &movement) {
    return std::visit([](const auto &kind) { return typeOf(kind); }, movement);
}

std::optional<LocationId> sourceLocation(const Movement &movement) {
    if (const auto *remove = std::get_if<Remove>(&movement)) {
        return remove->from;
    }
    if (const auto *move = std::get_if<Move>(&movement)) {
        return move->from;
    }
    return std::nullopt;
}

std::optional<LocationId> destinationLocation(const Movement &movement) {
    if (const auto *putaway = std::get_if<Putaway>(&movement)) {
        return putaway->to;
    }
    if (const auto *move = std::get_if<Move>(&movement)) {
        return move->to;
    }
    return std::nullopt;
}

std::vector<StockDelta> forwardEffect(const Movement &movement, Quantity quantity) {
    return std::visit([quantity](const auto &kind) { return effectOf(kind, quantity); },
                      movement);
}

std::vector<StockDelta> inverseEffect(const Movement &movement, Quantity quantity) {
    auto forward = forwardEffect(movement, quantity);
    std::vector<StockDelta> inverse;
    inverse.reserve(forward.size());
    for (auto it = forward.rbegin(); it != forward.rend(); ++it) {
        StockDelta delta = *it;
        delta.direction = delta.direction == Direction::Increase ? Direction::Decrease
                                                                 : Direction::Increase;
        inverse.push_back(std::move(delta));
    }
    return inverse;
}

}  // namespace stock
