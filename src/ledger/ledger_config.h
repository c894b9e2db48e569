#pragma once

#include <chrono>

namespace ledger {

struct LedgerConfig {
    // Longest wait for an item lock before a request fails with Conflict.
    std::chrono::milliseconds lock_timeout{250};
};

}  // namespace ledger
