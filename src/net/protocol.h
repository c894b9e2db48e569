#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "stock/stock_models.h"

namespace net {

constexpr std::uint16_t kMinProtocolVersion = 1;
constexpr std::uint16_t kMaxProtocolVersion = 1;

enum class PacketType : std::uint16_t {
    ApplyReq = 100,
    ApplyRes = 101,
    UndoReq = 102,
    UndoRes = 103,
    HistoryReq = 200,
    HistoryRes = 201,
    StockSummaryReq = 202,
    StockSummaryRes = 203,
    ErrorRes = 900
};

struct ApplyRequest {
    stock::TransactionType type{stock::TransactionType::Putaway};
    std::string item_id;
    std::uint32_t quantity{0};
    std::optional<std::string> from_location_id;
    std::optional<std::string> to_location_id;
    std::string actor_user_id;
};

struct UndoRequest {
    std::uint64_t transaction_id{0};
    std::string requesting_user_id;
};

// Answer to ApplyReq and UndoReq. `record` is set on success.
struct TransactionResponse {
    bool success{false};
    std::string code;
    std::string message;
    std::optional<stock::TransactionRecord> record;
};

// Newest first. `limit` 0 asks for as many as the server sends in one page.
struct HistoryRequest {
    stock::TransactionFilter filter;
    std::uint32_t offset{0};
    std::uint32_t limit{0};
};

// One page of matches starting at `offset`; `total` counts every match.
struct HistoryResponse {
    bool success{false};
    std::string code;
    std::string message;
    std::uint32_t total{0};
    std::uint32_t offset{0};
    std::vector<stock::TransactionRecord> records;
};

struct StockSummaryRequest {};

// Entries ordered by location, then item.
struct StockSummaryResponse {
    bool success{false};
    std::string code;
    std::string message;
    std::vector<stock::StockEntry> entries;
};

// Sent for unknown packet types and unsupported protocol versions.
struct ErrorResponse {
    std::uint16_t request_type{0};
    std::string code;
    std::string message;
    std::uint16_t min_version{kMinProtocolVersion};
    std::uint16_t max_version{kMaxProtocolVersion};
};

std::vector<std::uint8_t> encodeApplyRequest(const ApplyRequest &request);
bool decodeApplyRequest(const std::vector<std::uint8_t> &payload, ApplyRequest &out);

std::vector<std::uint8_t> encodeUndoRequest(const UndoRequest &request);
bool decodeUndoRequest(const std::vector<std::uint8_t> &payload, UndoRequest &out);

std::vector<std::uint8_t> encodeTransactionResponse(const TransactionResponse &response);
bool decodeTransactionResponse(const std::vector<std::uint8_t> &payload,
                               TransactionResponse &out);

std::vector<std::uint8_t> encodeHistoryRequest(const HistoryRequest &request);
bool decodeHistoryRequest(const std::vector<std::uint8_t> &payload, HistoryRequest &out);

std::vector<std::uint8_t> encodeHistoryResponse(const HistoryResponse &response);
bool decodeHistoryResponse(const std::vector<std::uint8_t> &payload, HistoryResponse &out);

std::vector<std::uint8_t> encodeStockSummaryRequest(const StockSummaryRequest &request);
bool decodeStockSummaryRequest(const std::vector<std::uint8_t> &payload,
                               StockSummaryRequest &out);

std::vector<std::uint8_t> encodeStockSummaryResponse(const StockSummaryResponse &response);
bool decodeStockSummaryResponse(const std::vector<std::uint8_t> &payload,
                                StockSummaryResponse &out);

std::vector<std::uint8_t> encodeErrorResponse(const ErrorResponse &response);
bool decodeErrorResponse(const std::vector<std::uint8_t> &payload, ErrorResponse &out);

}  // namespace net
