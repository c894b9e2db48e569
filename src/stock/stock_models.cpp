#include "stock/stock_models.h"

namespace stock {

const char *transactionTypeName(TransactionType type) {
    switch (type) {
        case TransactionType::Putaway:
            return "PUTAWAY";
        case TransactionType::Remove:
            return "REMOVE";
        case TransactionType::Move:
            return "MOVE";
    }
    return "UNKNOWN";
}

const char *transactionStatusName(TransactionStatus status) {
    switch (status) {
        case TransactionStatus::Completed:
            return "COMPLETED";
        case TransactionStatus::Undone:
            return "UNDONE";
    }
    return "UNKNOWN";
}

std::optional<TransactionType> parseTransactionType(const std::string &name) {
    if (name == "PUTAWAY") {
        return TransactionType::Putaway;
    }
    if (name == "REMOVE") {
        return TransactionType::Remove;
    }
    if (name == "MOVE") {
        return TransactionType::Move;
    }
    return std::nullopt;
}

std::optional<TransactionStatus> parseTransactionStatus(const std::string &name) {
    if (name == "COMPLETED") {
        return TransactionStatus::Completed;
    }
    if (name == "UNDONE") {
        return TransactionStatus::Undone;
    }
    return std::nullopt;
}

bool isNewerThan(const TransactionRecord &lhs, const TransactionRecord &rhs) {
    if (lhs.created_at != rhs.created_at) {
        return lhs.created_at > rhs.created_at;
    }
    return lhs.id > rhs.id;
}

bool matchesFilter(const TransactionRecord &record, const TransactionFilter &filter) {
    if (filter.start && record.created_at < *filter.start) {
        return false;
    }
    if (filter.end && record.created_at > *filter.end) {
        return false;
    }
    if (filter.type && record.type != *filter.type) {
        return false;
    }
    if (filter.status && record.status != *filter.status) {
        return false;
    }
    if (filter.item_id && record.item_id != *filter.item_id) {
        return false;
    }
    if (filter.location_id) {
        const bool from_match = record.from_location_id == filter.location_id;
        const bool to_match = record.to_location_id == filter.location_id;
        if (!from_match && !to_match) {
            return false;
        }
    }
    return true;
}

}  // namespace stock
