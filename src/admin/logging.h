#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>

namespace admin {

struct LogFields {
    std::optional<std::string> request_trace_id;
    std::optional<std::uint64_t> connection_id;
    std::optional<std::uint16_t> packet_type;
    std::optional<std::uint64_t> transaction_id;
    std::optional<std::string> transaction_type;
    std::optional<std::string> item_id;
    std::optional<std::string> from_location_id;
    std::optional<std::string> to_location_id;
    std::optional<std::string> user_id;
    std::optional<std::uint64_t> quantity;
    std::optional<std::uint64_t> count;
    std::optional<std::uint64_t> bytes;
    std::optional<std::string> code;
    std::optional<std::string> path;
    std::optional<std::string> reason;
};

// One JSON object per line. Levels are "debug", "info", "warn" and "error";
// entries below the minimum level are dropped.
class StructuredLogger {
public:
    StructuredLogger();
    explicit StructuredLogger(std::ostream &out);

    void log(const std::string &level,
             const std::string &event,
             const std::string &message,
             const LogFields &fields = {});

    void setMinimumLevel(const std::string &level);

    static std::string generateTraceId();

private:
    std::ostream *out_;
    std::atomic<int> minimum_rank_{0};
    std::mutex mutex_;
};

// UTC, second precision unless `with_micros` ("2024-01-02T03:04:05.000006Z").
std::string formatIsoTimestamp(std::chrono::system_clock::time_point time,
                               bool with_micros = false);

}  // namespace admin
