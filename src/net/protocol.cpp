#include "net/protocol.h"

#include "stock/record_codec.h"

namespace net {

using namespace stock::wire;

namespace {

bool read_bool(const std::vector<std::uint8_t> &payload, std::size_t &offset, bool &out) {
    std::uint8_t value = 0;
    if (!read_u8(payload, offset, value) || value > 1) {
        return false;
    }
    out = value != 0;
    return true;
}

void write_bool(bool value, std::vector<std::uint8_t> &out) {
    write_u8(value ? 1 : 0, out);
}

bool read_optional_timestamp(const std::vector<std::uint8_t> &payload,
                             std::size_t &offset,
                             std::optional<stock::Timestamp> &out) {
    bool present = false;
    if (!read_bool(payload, offset, present)) {
        return false;
    }
    out.reset();
    if (!present) {
        return true;
    }
    stock::Timestamp value{};
    if (!read_timestamp(payload, offset, value)) {
        return false;
    }
    out = value;
    return true;
}

void write_optional_timestamp(const std::optional<stock::Timestamp> &value,
                              std::vector<std::uint8_t> &out) {
    write_bool(value.has_value(), out);
    if (value) {
        write_timestamp(*value, out);
    }
}

// 0 means "no type filter".
bool read_optional_type(const std::vector<std::uint8_t> &payload,
                        std::size_t &offset,
                        std::optional<stock::TransactionType> &out) {
    std::uint8_t value = 0;
    if (!read_u8(payload, offset, value)) {
        return false;
    }
    out.reset();
    if (value == 0) {
        return true;
    }
    if (value > static_cast<std::uint8_t>(stock::TransactionType::Move)) {
        return false;
    }
    out = static_cast<stock::TransactionType>(value);
    return true;
}

bool read_optional_status(const std::vector<std::uint8_t> &payload,
                          std::size_t &offset,
                          std::optional<stock::TransactionStatus> &out) {
    std::uint8_t value = 0;
    if (!read_u8(payload, offset, value)) {
        return false;
    }
    out.reset();
    if (value == 0) {
        return true;
    }
    if (value > static_cast<std::uint8_t>(stock::TransactionStatus::Undone)) {
        return false;
    }
    out = static_cast<stock::TransactionStatus>(value);
    return true;
}

bool read_status_header(const std::vector<std::uint8_t> &payload,
                        std::size_t &offset,
                        bool &success,
                        std::string &code,
                        std::string &message) {
    return read_bool(payload, offset, success) && read_string(payload, offset, code) &&
           read_string(payload, offset, message);
}

void write_status_header(bool success,
                         const std::string &code,
                         const std::string &message,
                         std::vector<std::uint8_t> &out) {
    write_bool(success, out);
    write_string(code, out);
    write_string(message, out);
}

}  // namespace

std::vector<std::uint8_t> encodeApplyRequest(const ApplyRequest &request) {
    std::vector<std::uint8_t> out;
    write_u8(static_cast<std::uint8_t>(request.type), out);
    write_string(request.item_id, out);
    write_u32(request.quantity, out);
    write_optional_string(request.from_location_id, out);
    write_optional_string(request.to_location_id, out);
    write_string(request.actor_user_id, out);
    return out;
}

bool decodeApplyRequest(const std::vector<std::uint8_t> &payload, ApplyRequest &out) {
    std::size_t offset = 0;
    std::uint8_t type = 0;
    if (!read_u8(payload, offset, type) || !read_string(payload, offset, out.item_id) ||
        !read_u32(payload, offset, out.quantity) ||
        !read_optional_string(payload, offset, out.from_location_id) ||
        !read_optional_string(payload, offset, out.to_location_id) ||
        !read_string(payload, offset, out.actor_user_id)) {
        return false;
    }
    if (type < static_cast<std::uint8_t>(stock::TransactionType::Putaway) ||
        type > static_cast<std::uint8_t>(stock::TransactionType::Move)) {
        return false;
    }
    out.type = static_cast<stock::TransactionType>(type);
    return offset == payload.size();
}

std::vector<std::uint8_t> encodeUndoRequest(const UndoRequest &request) {
    std::vector<std::uint8_t> out;
    write_u64(request.transaction_id, out);
    write_string(request.requesting_user_id, out);
    return out;
}

bool decodeUndoRequest(const std::vector<std::uint8_t> &payload, UndoRequest &out) {
    std::size_t offset = 0;
    if (!read_u64(payload, offset, out.transaction_id) ||
        !read_string(payload, offset, out.requesting_user_id)) {
        return false;
    }
    return offset == payload.size();
}

std::vector<std::uint8_t> encodeTransactionResponse(const TransactionResponse &response) {
    std::vector<std::uint8_t> out;
    write_status_header(response.success, response.code, response.message, out);
    write_bool(response.record.has_value(), out);
    if (response.record) {
        write_record(*response.record, out);
    }
    return out;
}

bool decodeTransactionResponse(const std::vector<std::uint8_t> &payload,
                               TransactionResponse &out) {
    std::size_t offset = 0;
    bool has_record = false;
    if (!read_status_header(payload, offset, out.success, out.code, out.message) ||
        !read_bool(payload, offset, has_record)) {
        return false;
    }
    out.record.reset();
    if (has_record) {
        stock::TransactionRecord record;
        if (!read_record(payload, offset, record)) {
            return false;
        }
        out.record = std::move(record);
    }
    return offset == payload.size();
}

std::vector<std::uint8_t> encodeHistoryRequest(const HistoryRequest &request) {
    const auto &filter = request.filter;
    std::vector<std::uint8_t> out;
    write_optional_timestamp(filter.start, out);
    write_optional_timestamp(filter.end, out);
    write_u8(filter.type ? static_cast<std::uint8_t>(*filter.type) : 0, out);
    write_u8(filter.status ? static_cast<std::uint8_t>(*filter.status) : 0, out);
    write_optional_string(filter.location_id, out);
    write_optional_string(filter.item_id, out);
    write_u32(request.offset, out);
    write_u32(request.limit, out);
    return out;
}

bool decodeHistoryRequest(const std::vector<std::uint8_t> &payload, HistoryRequest &out) {
    auto &filter = out.filter;
    std::size_t offset = 0;
    if (!read_optional_timestamp(payload, offset, filter.start) ||
        !read_optional_timestamp(payload, offset, filter.end) ||
        !read_optional_type(payload, offset, filter.type) ||
        !read_optional_status(payload, offset, filter.status) ||
        !read_optional_string(payload, offset, filter.location_id) ||
        !read_optional_string(payload, offset, filter.item_id) ||
        !read_u32(payload, offset, out.offset) || !read_u32(payload, offset, out.limit)) {
        return false;
    }
    return offset == payload.size();
}

std::vector<std::uint8_t> encodeHistoryResponse(const HistoryResponse &response) {
    std::vector<std::uint8_t> out;
    write_status_header(response.success, response.code, response.message, out);
    write_u32(response.total, out);
    write_u32(response.offset, out);
    write_u32(static_cast<std::uint32_t>(response.records.size()), out);
    for (const auto &record : response.records) {
        write_record(record, out);
    }
    return out;
}

bool decodeHistoryResponse(const std::vector<std::uint8_t> &payload, HistoryResponse &out) {
    std::size_t offset = 0;
    std::uint32_t count = 0;
    if (!read_status_header(payload, offset, out.success, out.code, out.message) ||
        !read_u32(payload, offset, out.total) || !read_u32(payload, offset, out.offset) ||
        !read_u32(payload, offset, count)) {
        return false;
    }
    out.records.clear();
    for (std::uint32_t i = 0; i < count; ++i) {
        stock::TransactionRecord record;
        if (!read_record(payload, offset, record)) {
            return false;
        }
        out.records.push_back(std::move(record));
    }
    return offset == payload.size();
}

std::vector<std::uint8_t> encodeStockSummaryRequest(const StockSummaryRequest &) {
    return {};
}

bool decodeStockSummaryRequest(const std::vector<std::uint8_t> &payload,
                               StockSummaryRequest &) {
    return payload.empty();
}

std::vector<std::uint8_t> encodeStockSummaryResponse(const StockSummaryResponse &response) {
    std::vector<std::uint8_t> out;
    write_status_header(response.success, response.code, response.message, out);
    write_u32(static_cast<std::uint32_t>(response.entries.size()), out);
    for (const auto &entry : response.entries) {
        write_stock_entry(entry, out);
    }
    return out;
}

bool decodeStockSummaryResponse(const std::vector<std::uint8_t> &payload,
                                StockSummaryResponse &out) {
    std::size_t offset = 0;
    std::uint32_t count = 0;
    if (!read_status_header(payload, offset, out.success, out.code, out.message) ||
        !read_u32(payload, offset, count)) {
        return false;
    }
    out.entries.clear();
    for (std::uint32_t i = 0; i < count; ++i) {
        stock::StockEntry entry;
        if (!read_stock_entry(payload, offset, entry)) {
            return false;
        }
        out.entries.push_back(std::move(entry));
    }
    return offset == payload.size();
}

std::vector<std::uint8_t> encodeErrorResponse(const ErrorResponse &response) {
    std::vector<std::uint8_t> out;
    write_u16(response.request_type, out);
    write_string(response.code, out);
    write_string(response.message, out);
    write_u16(response.min_version, out);
    write_u16(response.max_version, out);
    return out;
}

bool decodeErrorResponse(const std::vector<std::uint8_t> &payload, ErrorResponse &out) {
    std::size_t offset = 0;
    if (!read_u16(payload, offset, out.request_type) ||
        !read_string(payload, offset, out.code) || !read_string(payload, offset, out.message) ||
        !read_u16(payload, offset, out.min_version) ||
        !read_u16(payload, offset, out.max_version)) {
        return false;
    }
    return offset == payload.size();
}

}  // namespace net
