#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "stock/stock_models.h"

namespace stock::wire {

// Big-endian primitives shared by the journal and the network protocol.
// Readers advance `offset` and return false on a short buffer.
bool read_u8(const std::vector<std::uint8_t> &payload, std::size_t &offset, std::uint8_t &out);
void write_u8(std::uint8_t value, std::vector<std::uint8_t> &out);

bool read_u16(const std::vector<std::uint8_t> &payload, std::size_t &offset, std::uint16_t &out);
void write_u16(std::uint16_t value, std::vector<std::uint8_t> &out);

bool read_u32(const std::vector<std::uint8_t> &payload, std::size_t &offset, std::uint32_t &out);
void write_u32(std::uint32_t value, std::vector<std::uint8_t> &out);

bool read_u64(const std::vector<std::uint8_t> &payload, std::size_t &offset, std::uint64_t &out);
void write_u64(std::uint64_t value, std::vector<std::uint8_t> &out);

// Strings carry a u16 length; callers reject longer values before encoding.
constexpr std::size_t kMaxStringBytes = 0xFFFF;
bool fitsString(const std::string &value);

bool read_string(const std::vector<std::uint8_t> &payload, std::size_t &offset, std::string &out);
void write_string(const std::string &value, std::vector<std::uint8_t> &out);

bool read_optional_string(const std::vector<std::uint8_t> &payload,
                          std::size_t &offset,
                          std::optional<std::string> &out);
void write_optional_string(const std::optional<std::string> &value,
                           std::vector<std::uint8_t> &out);

// Microseconds since the epoch, two's complement in a u64.
bool read_timestamp(const std::vector<std::uint8_t> &payload, std::size_t &offset, Timestamp &out);
void write_timestamp(Timestamp value, std::vector<std::uint8_t> &out);

bool read_record(const std::vector<std::uint8_t> &payload,
                 std::size_t &offset,
                 TransactionRecord &out);
void write_record(const TransactionRecord &record, std::vector<std::uint8_t> &out);

bool read_stock_entry(const std::vector<std::uint8_t> &payload,
                      std::size_t &offset,
                      StockEntry &out);
void write_stock_entry(const StockEntry &entry, std::vector<std::uint8_t> &out);

}  // namespace stock::wire
