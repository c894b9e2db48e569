#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace stock {

using ItemId = std::string;
using LocationId = std::string;
using UserId = std::string;
using Quantity = std::uint32_t;
using TransactionId = std::uint64_t;
using UnitId = std::uint64_t;
using Timestamp = std::chrono::system_clock::time_point;

enum class TransactionType : std::uint8_t {
    Putaway = 1,
    Remove = 2,
    Move = 3
};

enum class TransactionStatus : std::uint8_t {
    Completed = 1,
    Undone = 2
};

struct StockEntry {
    ItemId item_id;
    LocationId location_id;
    Quantity quantity{0};
};

struct TransactionRecord {
    TransactionId id{0};
    TransactionType type{TransactionType::Putaway};
    Quantity quantity{0};
    ItemId item_id;
    std::optional<LocationId> from_location_id;
    std::optional<LocationId> to_location_id;
    UserId actor_user_id;
    Timestamp created_at{};

    TransactionStatus status{TransactionStatus::Completed};
    std::optional<Timestamp> undone_at;
    std::optional<UserId> undone_by_user_id;
};

struct TransactionFilter {
    std::optional<Timestamp> start;
    std::optional<Timestamp> end;
    std::optional<TransactionType> type;
    std::optional<TransactionStatus> status;
    std::optional<LocationId> location_id;
    std::optional<ItemId> item_id;
};

// Handle for one unit of work. Holds the item lock until commit or rollback.
struct Transaction {
    UnitId unit_id{0};
    ItemId item_id;
};

const char *transactionTypeName(TransactionType type);
const char *transactionStatusName(TransactionStatus status);
std::optional<TransactionType> parseTransactionType(const std::string &name);
std::optional<TransactionStatus> parseTransactionStatus(const std::string &name);

// Record ordering used for the recency rule: created_at first, id breaks ties.
bool isNewerThan(const TransactionRecord &lhs, const TransactionRecord &rhs);

bool matchesFilter(const TransactionRecord &record, const TransactionFilter &filter);

}  // namespace stock
