#include "net/server.h"

#include <algorithm>
#include <functional>
#include <limits>
#include <sstream>
#include <string>
#include <utility>

#include "stock/in_memory_ledger_storage.h"
#include "stock/record_codec.h"

namespace net {

namespace {

std::shared_ptr<stock::LedgerStorage> orInMemory(std::shared_ptr<stock::LedgerStorage> storage) {
    if (!storage) {
        return std::make_shared<stock::InMemoryLedgerStorage>();
    }
    return storage;
}

TransactionResponse toResponse(const ledger::LedgerResult &result) {
    TransactionResponse response;
    response.success = result.ok();
    response.code = ledger::errorCode(result.error);
    response.message = result.message;
    response.record = result.record;
    return response;
}

void describeRecord(const stock::TransactionRecord &record, admin::LogFields &fields) {
    fields.transaction_id = record.id;
    fields.transaction_type = stock::transactionTypeName(record.type);
    fields.item_id = record.item_id;
    fields.from_location_id = record.from_location_id;
    fields.to_location_id = record.to_location_id;
    fields.quantity = record.quantity;
}

std::vector<std::uint8_t> frame(PacketType type,
                                std::uint16_t version,
                                const std::vector<std::uint8_t> &encoded) {
    return Codec::encode(static_cast<std::uint16_t>(type), version, encoded);
}

}  // namespace

LedgerServer::LedgerServer(std::shared_ptr<stock::LedgerStorage> storage, ServerConfig config)
    : storage_(orInMemory(std::move(storage))),
      config_(config),
      ledger_engine_(*storage_, config_.ledger),
      undo_engine_(*storage_, config_.ledger),
      query_service_(*storage_),
      started_at_(std::chrono::steady_clock::now()) {
    admin::LogFields fields;
    fields.count = config_.max_history_records;
    fields.bytes = config_.max_frame_bytes;
    logger_.log("info", "server_started", "Ledger server started", fields);
}

std::vector<std::uint8_t> LedgerServer::handlePacket(const FrameHeader &header,
                                                     const std::vector<std::uint8_t> &payload,
                                                     stock::Timestamp now,
                                                     std::uint64_t connection_id) {
    requests_total_ += 1;
    bytes_total_ += payload.size();

    admin::LogFields fields;
    fields.request_trace_id = admin::StructuredLogger::generateTraceId();
    fields.connection_id = connection_id;
    fields.packet_type = header.type;
    fields.bytes = payload.size();

    if (header.version < kMinProtocolVersion || header.version > kMaxProtocolVersion) {
        std::ostringstream message;
        message << "Unsupported protocol version " << header.version << " (supported "
                << kMinProtocolVersion << "-" << kMaxProtocolVersion << ")";
        return reject(header, "UNSUPPORTED_VERSION", message.str(), std::move(fields));
    }

    switch (static_cast<PacketType>(header.type)) {
        case PacketType::ApplyReq:
            return handleApply(header, payload, now, std::move(fields));
        case PacketType::UndoReq:
            return handleUndo(header, payload, now, std::move(fields));
        case PacketType::HistoryReq:
            return handleHistory(header, payload, std::move(fields));
        case PacketType::StockSummaryReq:
            return handleStockSummary(header, payload, std::move(fields));
        default:
            break;
    }
    return reject(header, "UNKNOWN_PACKET",
                  "Unknown packet type " + std::to_string(header.type), std::move(fields));
}

std::vector<std::uint8_t> LedgerServer::handleApply(const FrameHeader &header,
                                                    const std::vector<std::uint8_t> &payload,
                                                    stock::Timestamp now,
                                                    admin::LogFields fields) {
    ApplyRequest request;
    if (!decodeApplyRequest(payload, request)) {
        TransactionResponse response;
        response.code = ledger::errorCode(ledger::LedgerError::InvalidOperand);
        response.message = "Malformed apply payload";
        error_total_ += 1;
        fields.code = response.code;
        fields.reason = response.message;
        logger_.log("warn", "ledger_apply_failed", response.message, fields);
        return frame(PacketType::ApplyRes, header.version, encodeTransactionResponse(response));
    }

    ledger::ApplyCommand command;
    command.type = request.type;
    command.item_id = request.item_id;
    command.quantity = request.quantity;
    command.from_location_id = request.from_location_id;
    command.to_location_id = request.to_location_id;
    command.actor_user_id = request.actor_user_id;
    auto result = ledger_engine_.apply(command, now);
    countResult(result);

    fields.transaction_type = stock::transactionTypeName(request.type);
    fields.item_id = request.item_id;
    fields.from_location_id = request.from_location_id;
    fields.to_location_id = request.to_location_id;
    fields.quantity = request.quantity;
    fields.user_id = request.actor_user_id;
    fields.code = ledger::errorCode(result.error);
    if (result.ok()) {
        applied_total_ += 1;
        describeRecord(*result.record, fields);
        logger_.log("info", "ledger_applied", result.message, fields);
    } else {
        fields.reason = result.message;
        logger_.log("warn", "ledger_apply_failed", result.message, fields);
    }
    return frame(PacketType::ApplyRes, header.version,
                 encodeTransactionResponse(toResponse(result)));
}

std::vector<std::uint8_t> LedgerServer::handleUndo(const FrameHeader &header,
                                                   const std::vector<std::uint8_t> &payload,
                                                   stock::Timestamp now,
                                                   admin::LogFields fields) {
    UndoRequest request;
    if (!decodeUndoRequest(payload, request)) {
        TransactionResponse response;
        response.code = ledger::errorCode(ledger::LedgerError::InvalidOperand);
        response.message = "Malformed undo payload";
        error_total_ += 1;
        fields.code = response.code;
        fields.reason = response.message;
        logger_.log("warn", "ledger_undo_failed", response.message, fields);
        return frame(PacketType::UndoRes, header.version, encodeTransactionResponse(response));
    }

    auto result = undo_engine_.undo(request.transaction_id, request.requesting_user_id, now);
    countResult(result);

    fields.transaction_id = request.transaction_id;
    fields.user_id = request.requesting_user_id;
    fields.code = ledger::errorCode(result.error);
    if (result.ok()) {
        undone_total_ += 1;
        describeRecord(*result.record, fields);
        logger_.log("info", "ledger_undone", result.message, fields);
    } else {
        fields.reason = result.message;
        logger_.log("warn", "ledger_undo_failed", result.message, fields);
    }
    return frame(PacketType::UndoRes, header.version,
                 encodeTransactionResponse(toResponse(result)));
}

std::vector<std::uint8_t> LedgerServer::handleHistory(const FrameHeader &header,
                                                      const std::vector<std::uint8_t> &payload,
                                                      admin::LogFields fields) {
    HistoryRequest request;
    HistoryResponse response;
    if (!decodeHistoryRequest(payload, request)) {
        response.code = ledger::errorCode(ledger::LedgerError::InvalidOperand);
        response.message = "Malformed history payload";
        error_total_ += 1;
        fields.code = response.code;
        fields.reason = response.message;
        logger_.log("warn", "request_rejected", response.message, fields);
        return frame(PacketType::HistoryRes, header.version, encodeHistoryResponse(response));
    }

    auto matches = query_service_.listTransactions(request.filter);
    response.success = true;
    response.code = ledger::errorCode(ledger::LedgerError::None);
    response.message = "Transaction history";
    response.total = static_cast<std::uint32_t>(
        std::min<std::size_t>(matches.size(), std::numeric_limits<std::uint32_t>::max()));
    response.offset = request.offset;

    std::size_t limit = config_.max_history_records;
    if (request.limit > 0) {
        limit = std::min<std::size_t>(limit, request.limit);
    }
    std::size_t used = encodeHistoryResponse(response).size();
    for (std::size_t i = request.offset; i < matches.size() && response.records.size() < limit;
         ++i) {
        std::vector<std::uint8_t> encoded;
        stock::wire::write_record(matches[i], encoded);
        if (used + encoded.size() > config_.max_frame_bytes) {
            break;
        }
        used += encoded.size();
        response.records.push_back(std::move(matches[i]));
    }
    if (response.records.empty() && request.offset < matches.size() && limit > 0) {
        response = HistoryResponse{};
        response.code = ledger::errorCode(ledger::LedgerError::InvalidOperand);
        response.message = "Transaction at offset " + std::to_string(request.offset) +
                           " does not fit in a response frame";
        error_total_ += 1;
        fields.code = response.code;
        fields.reason = response.message;
        logger_.log("warn", "request_rejected", response.message, fields);
        return frame(PacketType::HistoryRes, header.version, encodeHistoryResponse(response));
    }

    fields.item_id = request.filter.item_id;
    fields.count = response.records.size();
    logger_.log("info", "history_listed", response.message, fields);
    return frame(PacketType::HistoryRes, header.version, encodeHistoryResponse(response));
}

std::vector<std::uint8_t> LedgerServer::handleStockSummary(
    const FrameHeader &header,
    const std::vector<std::uint8_t> &payload,
    admin::LogFields fields) {
    StockSummaryRequest request;
    StockSummaryResponse response;
    if (!decodeStockSummaryRequest(payload, request)) {
        response.code = ledger::errorCode(ledger::LedgerError::InvalidOperand);
        response.message = "Malformed stock summary payload";
        error_total_ += 1;
        fields.code = response.code;
        fields.reason = response.message;
        logger_.log("warn", "request_rejected", response.message, fields);
        return frame(PacketType::StockSummaryRes, header.version,
                     encodeStockSummaryResponse(response));
    }

    response.success = true;
    response.code = ledger::errorCode(ledger::LedgerError::None);
    response.message = "Stock summary";
    for (auto &[location, entries] : query_service_.stockByLocation()) {
        for (auto &entry : entries) {
            response.entries.push_back(std::move(entry));
        }
    }
    fields.count = response.entries.size();
    logger_.log("info", "stock_summary_listed", response.message, fields);
    return frame(PacketType::StockSummaryRes, header.version,
                 encodeStockSummaryResponse(response));
}

std::vector<std::uint8_t> LedgerServer::reject(const FrameHeader &header,
                                               const std::string &code,
                                               const std::string &message,
                                               admin::LogFields fields) {
    error_total_ += 1;
    ErrorResponse response;
    response.request_type = header.type;
    response.code = code;
    response.message = message;
    fields.code = code;
    fields.reason = message;
    logger_.log("warn", "request_rejected", message, fields);
    auto version = header.version < kMinProtocolVersion || header.version > kMaxProtocolVersion
                       ? kMaxProtocolVersion
                       : header.version;
    return frame(PacketType::ErrorRes, version, encodeErrorResponse(response));
}

void LedgerServer::countResult(const ledger::LedgerResult &result) {
    if (result.ok()) {
        return;
    }
    error_total_ += 1;
    if (result.error == ledger::LedgerError::Conflict) {
        conflict_total_ += 1;
    }
}

std::uint64_t LedgerServer::routeKey(const FrameHeader &header,
                                     const std::vector<std::uint8_t> &payload,
                                     std::uint64_t connection_id) const {
    std::hash<std::string> hash;
    switch (static_cast<PacketType>(header.type)) {
        case PacketType::ApplyReq: {
            ApplyRequest request;
            if (decodeApplyRequest(payload, request)) {
                return hash(request.item_id);
            }
            break;
        }
        case PacketType::UndoReq: {
            UndoRequest request;
            if (decodeUndoRequest(payload, request)) {
                if (auto record = storage_->findById(request.transaction_id)) {
                    return hash(record->item_id);
                }
            }
            break;
        }
        default:
            break;
    }
    return connection_id;
}

LedgerServer::Metrics LedgerServer::metrics() const {
    Metrics metrics;
    metrics.requests_total = requests_total_.load();
    metrics.bytes_total = bytes_total_.load();
    metrics.error_total = error_total_.load();
    metrics.applied_total = applied_total_.load();
    metrics.undone_total = undone_total_.load();
    metrics.conflict_total = conflict_total_.load();
    return metrics;
}

std::chrono::steady_clock::time_point LedgerServer::startTime() const {
    return started_at_;
}

const ServerConfig &LedgerServer::config() const {
    return config_;
}

const stock::LedgerStorage &LedgerServer::storage() const {
    return *storage_;
}

admin::StructuredLogger &LedgerServer::logger() {
    return logger_;
}

}  // namespace net
