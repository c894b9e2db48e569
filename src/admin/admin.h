#pragma once

#include "admin/logging.h"

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace net {
class LedgerServer;
}

namespace admin {

struct AdminStatus {
    std::uint64_t requests_total{0};
    std::uint64_t bytes_total{0};
    std::uint64_t error_total{0};
    std::uint64_t applied_total{0};
    std::uint64_t undone_total{0};
    std::uint64_t conflict_total{0};
    std::size_t transactions_total{0};
    std::size_t stock_entries{0};
    std::chrono::seconds uptime{0};
};

class AdminService {
public:
    explicit AdminService(net::LedgerServer &server);

    AdminStatus getStatus() const;

private:
    net::LedgerServer &server_;
    mutable StructuredLogger logger_{};
};

}  // namespace admin
