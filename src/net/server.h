#pragma once

#include "admin/logging.h"
#include "ledger/ledger_config.h"
#include "ledger/ledger_engine.h"
#include "ledger/ledger_query.h"
#include "ledger/undo_engine.h"
#include "net/codec.h"
#include "net/protocol.h"
#include "stock/ledger_storage.h"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace net {

struct ServerConfig {
    // Largest response payload; history pages are cut to fit it.
    std::size_t max_frame_bytes{FrameDecoder::kDefaultMaxPayload};
    std::size_t max_history_records{500};
    ledger::LedgerConfig ledger{};
};

// Decodes ledger requests, routes them to the engines and encodes the reply.
// handlePacket() is safe to call from several worker threads at once.
class LedgerServer {
public:
    struct Metrics {
        std::uint64_t requests_total{0};
        std::uint64_t bytes_total{0};
        std::uint64_t error_total{0};
        std::uint64_t applied_total{0};
        std::uint64_t undone_total{0};
        std::uint64_t conflict_total{0};
    };

    explicit LedgerServer(std::shared_ptr<stock::LedgerStorage> storage = nullptr,
                          ServerConfig config = ServerConfig{});

    // Always answers: unknown types and versions get an ErrorRes frame.
    std::vector<std::uint8_t> handlePacket(const FrameHeader &header,
                                           const std::vector<std::uint8_t> &payload,
                                           stock::Timestamp now,
                                           std::uint64_t connection_id = 0);

    // Dispatcher lane key: the item a request mutates, or the connection for
    // reads and requests that do not name a known item.
    std::uint64_t routeKey(const FrameHeader &header,
                           const std::vector<std::uint8_t> &payload,
                           std::uint64_t connection_id) const;

    Metrics metrics() const;
    std::chrono::steady_clock::time_point startTime() const;
    const ServerConfig &config() const;
    const stock::LedgerStorage &storage() const;
    admin::StructuredLogger &logger();

private:
    std::vector<std::uint8_t> handleApply(const FrameHeader &header,
                                          const std::vector<std::uint8_t> &payload,
                                          stock::Timestamp now,
                                          admin::LogFields fields);
    std::vector<std::uint8_t> handleUndo(const FrameHeader &header,
                                         const std::vector<std::uint8_t> &payload,
                                         stock::Timestamp now,
                                         admin::LogFields fields);
    std::vector<std::uint8_t> handleHistory(const FrameHeader &header,
                                            const std::vector<std::uint8_t> &payload,
                                            admin::LogFields fields);
    std::vector<std::uint8_t> handleStockSummary(const FrameHeader &header,
                                                 const std::vector<std::uint8_t> &payload,
                                                 admin::LogFields fields);
    std::vector<std::uint8_t> reject(const FrameHeader &header,
                                     const std::string &code,
                                     const std::string &message,
                                     admin::LogFields fields);
    void countResult(const ledger::LedgerResult &result);

    std::shared_ptr<stock::LedgerStorage> storage_;
    ServerConfig config_;
    ledger::LedgerEngine ledger_engine_;
    ledger::UndoEngine undo_engine_;
    ledger::LedgerQueryService query_service_;

    std::atomic<std::uint64_t> requests_total_{0};
    std::atomic<std::uint64_t> bytes_total_{0};
    std::atomic<std::uint64_t> error_total_{0};
    std::atomic<std::uint64_t> applied_total_{0};
    std::atomic<std::uint64_t> undone_total_{0};
    std::atomic<std::uint64_t> conflict_total_{0};
    std::chrono::steady_clock::time_point started_at_;
    admin::StructuredLogger logger_{};
};

}  // namespace net
