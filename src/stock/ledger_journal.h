#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <functional>
#include <string>
#include <vector>

#include "stock/stock_models.h"

namespace stock {

enum class JournalOpKind : std::uint8_t {
    SetStock = 1,
    AppendRecord = 2,
    MarkUndone = 3
};

struct JournalOp {
    JournalOpKind kind{JournalOpKind::SetStock};
    StockEntry stock{};
    TransactionRecord record{};
    TransactionId transaction_id{0};
    Timestamp undone_at{};
    UserId undone_by_user_id;
};

struct ReplayStats {
    std::size_t frames{0};
    std::size_t ops{0};
    std::size_t torn_bytes{0};
};

// Append-only file of committed units. One frame per unit:
//   [u32 length][u32 fnv1a(payload)][payload]
// payload = u16 op count, then tagged ops.
class LedgerJournal {
public:
    using Visitor = std::function<void(const JournalOp &)>;

    explicit LedgerJournal(std::string path);

    // Replays every intact frame, cuts a torn tail off the file and opens it
    // for appending. false when the file cannot be read or opened.
    bool open(const Visitor &visitor, ReplayStats &stats, std::string &reason);
    // On failure the file is cut back to the last good frame and the journal
    // refuses further appends until reopened.
    bool append(const std::vector<JournalOp> &ops);
    void close();

    bool isOpen() const;
    const std::string &path() const;
    std::uint64_t bytesWritten() const;
    const std::string &lastError() const;

    static std::vector<std::uint8_t> encodeFrame(const std::vector<JournalOp> &ops);
    static bool decodePayload(const std::vector<std::uint8_t> &payload,
                              std::vector<JournalOp> &ops);
    static std::uint32_t checksum(const std::vector<std::uint8_t> &payload);

private:
    static constexpr std::size_t kFrameHeaderSize = 8;

    std::string path_;
    std::ofstream out_;
    bool failed_{false};
    std::string last_error_;
    std::uint64_t bytes_written_{0};
};

}  // namespace stock
