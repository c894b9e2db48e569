#include "stock/record_codec.h"

#include <algorithm>
#include <limits>

namespace stock::wire {

bool read_u8(const std::vector<std::uint8_t> &payload, std::size_t &offset, std::uint8_t &out) {
    if (offset + 1 > payload.size()) {
        return false;
    }
    out = payload[offset];
    offset += 1;
    return true;
}

void write_u8(std::uint8_t value, std::vector<std::uint8_t> &out) {
    out.push_back(value);
}

bool read_u16(const std::vector<std::uint8_t> &payload, std::size_t &offset,
              std::uint16_t &out) {
    if (offset + 2 > payload.size()) {
        return false;
    }
    out = static_cast<std::uint16_t>((payload[offset] << 8) | payload[offset + 1]);
    offset += 2;
    return true;
}

void write_u16(std::uint16_t value, std::vector<std::uint8_t> &out) {
    out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<std::uint8_t>(value & 0xFF));
}

bool read_u32(const std::vector<std::uint8_t> &payload, std::size_t &offset,
              std::uint32_t &out) {
    if (offset + 4 > payload.size()) {
        return false;
    }
    out = (static_cast<std::uint32_t>(payload[offset]) << 24) |
          (static_cast<std::uint32_t>(payload[offset + 1]) << 16) |
          (static_cast<std::uint32_t>(payload[offset + 2]) << 8) |
          static_cast<std::uint32_t>(payload[offset + 3]);
    offset += 4;
    return true;
}

void write_u32(std::uint32_t value, std::vector<std::uint8_t> &out) {
    out.push_back(static_cast<std::uint8_t>((value >> 24) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((value >> 16) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<std::uint8_t>(value & 0xFF));
}

bool read_u64(const std::vector<std::uint8_t> &payload, std::size_t &offset,
              std::uint64_t &out) {
    if (offset + 8 > payload.size()) {
        return false;
    }
    out = 0;
    for (int i = 0; i < 8; ++i) {
        out = (out << 8) | payload[offset + static_cast<std::size_t>(i)];
    }
    offset += 8;
    return true;
}

void write_u64(std::uint64_t value, std::vector<std::uint8_t> &out) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFF));
    }
}

bool read_string(const std::vector<std::uint8_t> &payload, std::size_t &offset,
                 std::string &out) {
    std::uint16_t size = 0;
    if (!read_u16(payload, offset, size)) {
        return false;
    }
    if (offset + size > payload.size()) {
        return false;
    }
    out.assign(reinterpret_cast<const char *>(payload.data() + offset), size);
    offset += size;
    return true;
}

bool fitsString(const std::string &value) {
    return value.size() <= kMaxStringBytes;
}

void write_string(const std::string &value, std::vector<std::uint8_t> &out) {
    auto length = static_cast<std::uint16_t>(
        std::min<std::size_t>(value.size(), std::numeric_limits<std::uint16_t>::max()));
    write_u16(length, out);
    out.insert(out.end(), value.begin(), value.begin() + length);
}

bool read_optional_string(const std::vector<std::uint8_t> &payload,
                          std::size_t &offset,
                          std::optional<std::string> &out) {
    std::uint8_t present = 0;
    if (!read_u8(payload, offset, present)) {
        return false;
    }
    if (present == 0) {
        out.reset();
        return true;
    }
    std::string value;
    if (!read_string(payload, offset, value)) {
        return false;
    }
    out = std::move(value);
    return true;
}

void write_optional_string(const std::optional<std::string> &value,
                           std::vector<std::uint8_t> &out) {
    write_u8(value.has_value() ? 1 : 0, out);
    if (value) {
        write_string(*value, out);
    }
}

bool read_timestamp(const std::vector<std::uint8_t> &payload, std::size_t &offset,
                    Timestamp &out) {
    std::uint64_t raw = 0;
    if (!read_u64(payload, offset, raw)) {
        return false;
    }
    out = Timestamp{std::chrono::duration_cast<Timestamp::duration>(
        std::chrono::microseconds{static_cast<std::int64_t>(raw)})};
    return true;
}

void write_timestamp(Timestamp value, std::vector<std::uint8_t> &out) {
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
                      value.time_since_epoch())
                      .count();
    write_u64(static_cast<std::uint64_t>(micros), out);
}

bool read_record(const std::vector<std::uint8_t> &payload,
                 std::size_t &offset,
                 TransactionRecord &out) {
    std::uint8_t type = 0;
    std::uint8_t status = 0;
    std::uint8_t has_undone_at = 0;
    if (!read_u64(payload, offset, out.id) || !read_u8(payload, offset, type) ||
        !read_u32(payload, offset, out.quantity) ||
        !read_string(payload, offset, out.item_id) ||
        !read_optional_string(payload, offset, out.from_location_id) ||
        !read_optional_string(payload, offset, out.to_location_id) ||
        !read_string(payload, offset, out.actor_user_id) ||
        !read_timestamp(payload, offset, out.created_at) ||
        !read_u8(payload, offset, status) ||
        !read_u8(payload, offset, has_undone_at)) {
        return false;
    }
    if (type < static_cast<std::uint8_t>(TransactionType::Putaway) ||
        type > static_cast<std::uint8_t>(TransactionType::Move)) {
        return false;
    }
    if (status != static_cast<std::uint8_t>(TransactionStatus::Completed) &&
        status != static_cast<std::uint8_t>(TransactionStatus::Undone)) {
        return false;
    }
    out.type = static_cast<TransactionType>(type);
    out.status = static_cast<TransactionStatus>(status);
    out.undone_at.reset();
    if (has_undone_at != 0) {
        Timestamp undone_at{};
        if (!read_timestamp(payload, offset, undone_at)) {
            return false;
        }
        out.undone_at = undone_at;
    }
    return read_optional_string(payload, offset, out.undone_by_user_id);
}

void write_record(const TransactionRecord &record, std::vector<std::uint8_t> &out) {
    write_u64(record.id, out);
    write_u8(static_cast<std::uint8_t>(record.type), out);
    write_u32(record.quantity, out);
    write_string(record.item_id, out);
    write_optional_string(record.from_location_id, out);
    write_optional_string(record.to_location_id, out);
    write_string(record.actor_user_id, out);
    write_timestamp(record.created_at, out);
    write_u8(static_cast<std::uint8_t>(record.status), out);
    write_u8(record.undone_at.has_value() ? 1 : 0, out);
    if (record.undone_at) {
        write_timestamp(*record.undone_at, out);
    }
    write_optional_string(record.undone_by_user_id, out);
}

bool read_stock_entry(const std::vector<std::uint8_t> &payload,
                      std::size_t &offset,
                      StockEntry &out) {
    return read_string(payload, offset, out.item_id) &&
           read_string(payload, offset, out.location_id) &&
           read_u32(payload, offset, out.quantity);
}

void write_stock_entry(const StockEntry &entry, std::vector<std::uint8_t> &out) {
    write_string(entry.item_id, out);
    write_string(entry.location_id, out);
    write_u32(entry.quantity, out);
}

}  // namespace stock::wire
