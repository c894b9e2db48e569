#include "admin/admin.h"

#include "net/server.h"

#include <chrono>

namespace admin {

AdminService::AdminService(net::LedgerServer &server) : server_(server) {}

AdminStatus AdminService::getStatus() const {
    AdminStatus status;
    auto metrics = server_.metrics();
    status.requests_total = metrics.requests_total;
    status.bytes_total = metrics.bytes_total;
    status.error_total = metrics.error_total;
    status.applied_total = metrics.applied_total;
    status.undone_total = metrics.undone_total;
    status.conflict_total = metrics.conflict_total;
    status.transactions_total = server_.storage().transactionCount();
    status.stock_entries = server_.storage().stockEntries().size();
    status.uptime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - server_.startTime());

    LogFields fields;
    fields.request_trace_id = StructuredLogger::generateTraceId();
    fields.count = status.transactions_total;
    logger_.log("info", "admin_status", "Admin status requested", fields);

    return status;
}

}  // namespace admin
