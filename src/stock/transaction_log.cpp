#include "stock/transaction_log.h"

#include <algorithm>

namespace stock {

TransactionRecord TransactionLog::append(TransactionRecord record) {
    record.id = next_id_++;
    all_by_item_[record.item_id].insert(orderKey(record));
    indexCompleted(record);
    auto [it, inserted] = records_.emplace(record.id, std::move(record));
    return it->second;
}

bool TransactionLog::restore(const TransactionRecord &record) {
    if (record.id == 0 || records_.count(record.id) != 0) {
        return false;
    }
    records_.emplace(record.id, record);
    all_by_item_[record.item_id].insert(orderKey(record));
    indexCompleted(record);
    next_id_ = std::max(next_id_, record.id + 1);
    return true;
}

std::optional<TransactionRecord> TransactionLog::findById(TransactionId id) const {
    auto it = records_.find(id);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<TransactionRecord> TransactionLog::findMostRecentCompleted(
    const ItemId &item_id) const {
    auto index_it = completed_by_item_.find(item_id);
    if (index_it == completed_by_item_.end() || index_it->second.empty()) {
        return std::nullopt;
    }
    return findById(index_it->second.rbegin()->second);
}

bool TransactionLog::hasNewerCompleted(const TransactionRecord &record) const {
    auto index_it = completed_by_item_.find(record.item_id);
    if (index_it == completed_by_item_.end()) {
        return false;
    }
    return index_it->second.upper_bound(orderKey(record)) != index_it->second.end();
}

std::optional<Timestamp> TransactionLog::latestCreatedAt(const ItemId &item_id) const {
    auto index_it = all_by_item_.find(item_id);
    if (index_it == all_by_item_.end() || index_it->second.empty()) {
        return std::nullopt;
    }
    return index_it->second.rbegin()->first;
}

bool TransactionLog::markUndone(TransactionId id,
                                Timestamp undone_at,
                                const UserId &undone_by) {
    auto it = records_.find(id);
    if (it == records_.end() || it->second.status == TransactionStatus::Undone) {
        return false;
    }
    unindexCompleted(it->second);
    it->second.status = TransactionStatus::Undone;
    it->second.undone_at = undone_at;
    it->second.undone_by_user_id = undone_by;
    return true;
}

void TransactionLog::erase(TransactionId id) {
    auto it = records_.find(id);
    if (it == records_.end()) {
        return;
    }
    unindexCompleted(it->second);
    auto all_it = all_by_item_.find(it->second.item_id);
    if (all_it != all_by_item_.end()) {
        all_it->second.erase(orderKey(it->second));
        if (all_it->second.empty()) {
            all_by_item_.erase(all_it);
        }
    }
    records_.erase(it);
}

void TransactionLog::restoreCompleted(TransactionId id) {
    auto it = records_.find(id);
    if (it == records_.end() || it->second.status == TransactionStatus::Completed) {
        return;
    }
    it->second.status = TransactionStatus::Completed;
    it->second.undone_at.reset();
    it->second.undone_by_user_id.reset();
    indexCompleted(it->second);
}

std::vector<TransactionRecord> TransactionLog::query(const TransactionFilter &filter) const {
    std::vector<TransactionRecord> out;
    for (const auto &[id, record] : records_) {
        if (matchesFilter(record, filter)) {
            out.push_back(record);
        }
    }
    std::sort(out.begin(), out.end(),
              [](const TransactionRecord &lhs, const TransactionRecord &rhs) {
                  return isNewerThan(lhs, rhs);
              });
    return out;
}

std::size_t TransactionLog::size() const {
    return records_.size();
}

TransactionId TransactionLog::nextId() const {
    return next_id_;
}

TransactionLog::OrderKey TransactionLog::orderKey(const TransactionRecord &record) {
    return OrderKey{record.created_at, record.id};
}

void TransactionLog::indexCompleted(const TransactionRecord &record) {
    if (record.status != TransactionStatus::Completed) {
        return;
    }
    completed_by_item_[record.item_id].insert(orderKey(record));
}

void TransactionLog::unindexCompleted(const TransactionRecord &record) {
    auto index_it = completed_by_item_.find(record.item_id);
    if (index_it == completed_by_item_.end()) {
        return;
    }
    index_it->second.erase(orderKey(record));
    if (index_it->second.empty()) {
        completed_by_item_.erase(index_it);
    }
}

}  // namespace stock
