#include "ledger/ledger_errors.h"

#include <array>
#include <utility>

namespace ledger {
namespace {

constexpr std::array<std::pair<LedgerError, const char *>, 8> kCodes{{
    {LedgerError::None, "OK"},
    {LedgerError::InvalidOperand, "INVALID_OPERAND"},
    {LedgerError::InsufficientStock, "INSUFFICIENT_STOCK"},
    {LedgerError::NotFound, "NOT_FOUND"},
    {LedgerError::AlreadyUndone, "ALREADY_UNDONE"},
    {LedgerError::NotLatest, "NOT_LATEST"},
    {LedgerError::Conflict, "CONFLICT"},
    {LedgerError::StorageUnavailable, "STORAGE_UNAVAILABLE"},
}};

}  // namespace

const char *errorCode(LedgerError error) {
    for (const auto &[value, code] : kCodes) {
        if (value == error) {
            return code;
        }
    }
    return "UNKNOWN";
}

std::optional<LedgerError> parseErrorCode(const std::string &code) {
    for (const auto &[value, name] : kCodes) {
        if (code == name) {
            return value;
        }
    }
    return std::nullopt;
}

bool isRetryable(LedgerError error) {
    return error == LedgerError::Conflict;
}

LedgerResult LedgerResult::success(stock::TransactionRecord record, std::string message) {
    LedgerResult result;
    result.message = std::move(message);
    result.record = std::move(record);
    return result;
}

LedgerResult LedgerResult::failure(LedgerError error, std::string message) {
    LedgerResult result;
    result.error = error;
    result.message = std::move(message);
    return result;
}

}  // namespace ledger
