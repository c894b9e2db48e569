#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "stock/stock_models.h"

namespace ledger {

enum class LedgerError : std::uint8_t {
    None,
    InvalidOperand,
    InsufficientStock,
    NotFound,
    AlreadyUndone,
    NotLatest,
    Conflict,
    StorageUnavailable
};

// Wire code, e.g. "INSUFFICIENT_STOCK". None maps to "OK".
const char *errorCode(LedgerError error);
std::optional<LedgerError> parseErrorCode(const std::string &code);

// Only lock contention is worth retrying unchanged.
bool isRetryable(LedgerError error);

struct LedgerResult {
    LedgerError error{LedgerError::None};
    std::string message;
    std::optional<stock::TransactionRecord> record;

    bool ok() const {
        return error == LedgerError::None;
    }

    static LedgerResult success(stock::TransactionRecord record, std::string message);
    static LedgerResult failure(LedgerError error, std::string message);
};

}  // namespace ledger
