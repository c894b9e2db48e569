#include "stock/ledger_journal.h"

#include <algorithm>
#include <filesystem>
#include <iterator>
#include <limits>

#include "stock/record_codec.h"

namespace stock {

LedgerJournal::LedgerJournal(std::string path) : path_(std::move(path)) {}

bool LedgerJournal::open(const Visitor &visitor, ReplayStats &stats, std::string &reason) {
    namespace fs = std::filesystem;
    stats = ReplayStats{};
    close();

    std::error_code ec;
    const bool exists = fs::exists(path_, ec);
    if (exists && !fs::is_regular_file(path_, ec)) {
        reason = "Journal path is not a regular file";
        return false;
    }

    std::vector<std::uint8_t> buffer;
    if (exists) {
        std::ifstream in(path_, std::ios::binary);
        if (!in) {
            reason = "Failed to read journal";
            return false;
        }
        buffer.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    std::size_t offset = 0;
    while (offset + kFrameHeaderSize <= buffer.size()) {
        std::size_t cursor = offset;
        std::uint32_t length = 0;
        std::uint32_t expected_checksum = 0;
        if (!wire::read_u32(buffer, cursor, length) ||
            !wire::read_u32(buffer, cursor, expected_checksum) ||
            cursor + length > buffer.size()) {
            break;
        }
        std::vector<std::uint8_t> payload(buffer.begin() + static_cast<std::ptrdiff_t>(cursor),
                                          buffer.begin() +
                                              static_cast<std::ptrdiff_t>(cursor + length));
        if (checksum(payload) != expected_checksum) {
            break;
        }
        std::vector<JournalOp> ops;
        if (!decodePayload(payload, ops)) {
            break;
        }
        for (const auto &op : ops) {
            visitor(op);
        }
        stats.frames += 1;
        stats.ops += ops.size();
        offset = cursor + length;
    }

    stats.torn_bytes = buffer.size() - offset;
    if (stats.torn_bytes > 0) {
        fs::resize_file(path_, offset, ec);
        if (ec) {
            reason = "Failed to truncate torn journal tail: " + ec.message();
            return false;
        }
    }

    out_.open(path_, std::ios::binary | std::ios::app);
    if (!out_) {
        reason = "Failed to open journal for append";
        return false;
    }
    failed_ = false;
    last_error_.clear();
    bytes_written_ = offset;
    return true;
}

bool LedgerJournal::append(const std::vector<JournalOp> &ops) {
    if (!out_.is_open() || failed_) {
        if (last_error_.empty()) {
            last_error_ = "Journal is not open";
        }
        return false;
    }
    auto frame = encodeFrame(ops);
    out_.write(reinterpret_cast<const char *>(frame.data()),
               static_cast<std::streamsize>(frame.size()));
    out_.flush();
    if (!out_) {
        // Part or all of the frame may have reached the file. Cut it off so a
        // unit reported as failed is never replayed.
        failed_ = true;
        out_.close();
        std::error_code ec;
        std::filesystem::resize_file(path_, bytes_written_, ec);
        last_error_ = ec ? "Journal write failed and the partial frame could not be removed: " +
                               ec.message()
                         : "Journal write failed";
        return false;
    }
    bytes_written_ += frame.size();
    return true;
}

void LedgerJournal::close() {
    if (out_.is_open()) {
        out_.close();
    }
}

bool LedgerJournal::isOpen() const {
    return out_.is_open() && !failed_;
}

const std::string &LedgerJournal::path() const {
    return path_;
}

std::uint64_t LedgerJournal::bytesWritten() const {
    return bytes_written_;
}

const std::string &LedgerJournal::lastError() const {
    return last_error_;
}

std::vector<std::uint8_t> LedgerJournal::encodeFrame(const std::vector<JournalOp> &ops) {
    std::vector<std::uint8_t> payload;
    auto count = static_cast<std::uint16_t>(
        std::min<std::size_t>(ops.size(), std::numeric_limits<std::uint16_t>::max()));
    wire::write_u16(count, payload);
    for (std::uint16_t i = 0; i < count; ++i) {
        const auto &op = ops[i];
        wire::write_u8(static_cast<std::uint8_t>(op.kind), payload);
        switch (op.kind) {
            case JournalOpKind::SetStock:
                wire::write_stock_entry(op.stock, payload);
                break;
            case JournalOpKind::AppendRecord:
                wire::write_record(op.record, payload);
                break;
            case JournalOpKind::MarkUndone:
                wire::write_u64(op.transaction_id, payload);
                wire::write_timestamp(op.undone_at, payload);
                wire::write_string(op.undone_by_user_id, payload);
                break;
        }
    }

    std::vector<std::uint8_t> frame;
    frame.reserve(kFrameHeaderSize + payload.size());
    wire::write_u32(static_cast<std::uint32_t>(payload.size()), frame);
    wire::write_u32(checksum(payload), frame);
    frame.insert(frame.end(), payload.begin(), payload.end());
    return frame;
}

bool LedgerJournal::decodePayload(const std::vector<std::uint8_t> &payload,
                                  std::vector<JournalOp> &ops) {
    std::size_t offset = 0;
    std::uint16_t count = 0;
    if (!wire::read_u16(payload, offset, count)) {
        return false;
    }
    ops.clear();
    ops.reserve(count);
    for (std::uint16_t i = 0; i < count; ++i) {
        std::uint8_t kind = 0;
        if (!wire::read_u8(payload, offset, kind)) {
            return false;
        }
        JournalOp op;
        switch (static_cast<JournalOpKind>(kind)) {
            case JournalOpKind::SetStock:
                if (!wire::read_stock_entry(payload, offset, op.stock)) {
                    return false;
                }
                break;
            case JournalOpKind::AppendRecord:
                if (!wire::read_record(payload, offset, op.record)) {
                    return false;
                }
                break;
            case JournalOpKind::MarkUndone:
                if (!wire::read_u64(payload, offset, op.transaction_id) ||
                    !wire::read_timestamp(payload, offset, op.undone_at) ||
                    !wire::read_string(payload, offset, op.undone_by_user_id)) {
                    return false;
                }
                break;
            default:
                return false;
        }
        op.kind = static_cast<JournalOpKind>(kind);
        ops.push_back(std::move(op));
    }
    return offset == payload.size();
}

std::uint32_t LedgerJournal::checksum(const std::vector<std::uint8_t> &payload) {
    std::uint32_t hash = 2166136261u;
    for (std::uint8_t byte : payload) {
        hash ^= byte;
        hash *= 16777619u;
    }
    return hash;
}

}  // namespace stock
