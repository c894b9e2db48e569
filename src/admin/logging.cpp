#include "admin/logging.h"

#include <array>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>

namespace admin {
namespace {

int levelRank(const std::string &level) {
    if (level == "debug") {
        return 0;
    }
    if (level == "info") {
        return 1;
    }
    if (level == "warn") {
        return 2;
    }
    if (level == "error") {
        return 3;
    }
    return 1;
}

void writeEscaped(std::ostringstream &out, const std::string &value) {
    for (char ch : value) {
        switch (ch) {
            case '"':
                out << "\\\"";
                break;
            case '\\':
                out << "\\\\";
                break;
            case '\n':
                out << "\\n";
                break;
            case '\r':
                out << "\\r";
                break;
            case '\t':
                out << "\\t";
                break;
            default:
                if (static_cast<unsigned char>(ch) < 0x20) {
                    out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(static_cast<unsigned char>(ch)) << std::dec;
                } else {
                    out << ch;
                }
                break;
        }
    }
}

class JsonLine {
public:
    JsonLine() {
        out_ << '{';
    }

    void text(const char *key, const std::optional<std::string> &value) {
        if (!value.has_value() || value->empty()) {
            return;
        }
        separator();
        out_ << '"' << key << "\":\"";
        writeEscaped(out_, *value);
        out_ << '"';
    }

    template <typename T>
    void number(const char *key, const std::optional<T> &value) {
        if (!value.has_value()) {
            return;
        }
        separator();
        out_ << '"' << key << "\":" << *value;
    }

    std::string finish() {
        out_ << '}';
        return out_.str();
    }

private:
    void separator() {
        if (!first_) {
            out_ << ',';
        }
        first_ = false;
    }

    std::ostringstream out_;
    bool first_{true};
};

}  // namespace

StructuredLogger::StructuredLogger() : out_(&std::cout) {}

StructuredLogger::StructuredLogger(std::ostream &out) : out_(&out) {}

void StructuredLogger::log(const std::string &level,
                           const std::string &event,
                           const std::string &message,
                           const LogFields &fields) {
    if (levelRank(level) < minimum_rank_) {
        return;
    }

    JsonLine line;
    line.text("timestamp", formatIsoTimestamp(std::chrono::system_clock::now(), true));
    line.text("level", level);
    line.text("event", event);
    line.text("message", message);
    line.text("request_trace_id", fields.request_trace_id);
    line.number("connection_id", fields.connection_id);
    line.number("packet_type", fields.packet_type);
    line.number("transaction_id", fields.transaction_id);
    line.text("transaction_type", fields.transaction_type);
    line.text("item_id", fields.item_id);
    line.text("from_location_id", fields.from_location_id);
    line.text("to_location_id", fields.to_location_id);
    line.text("user_id", fields.user_id);
    line.number("quantity", fields.quantity);
    line.number("count", fields.count);
    line.number("bytes", fields.bytes);
    line.text("code", fields.code);
    line.text("path", fields.path);
    line.text("reason", fields.reason);
    auto entry = line.finish();

    std::lock_guard<std::mutex> lock(mutex_);
    *out_ << entry << std::endl;
}

void StructuredLogger::setMinimumLevel(const std::string &level) {
    minimum_rank_ = levelRank(level);
}

std::string StructuredLogger::generateTraceId() {
    std::array<unsigned char, 16> bytes{};
    thread_local std::mt19937 generator{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, 255);
    for (auto &byte : bytes) {
        byte = static_cast<unsigned char>(dist(generator));
    }
    std::ostringstream out;
    out << std::hex << std::setfill('0');
    for (unsigned char byte : bytes) {
        out << std::setw(2) << static_cast<int>(byte);
    }
    return out.str();
}

std::string formatIsoTimestamp(std::chrono::system_clock::time_point time, bool with_micros) {
    auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(time);
    if (seconds > time) {
        seconds -= std::chrono::seconds{1};
    }
    auto as_time_t = std::chrono::system_clock::to_time_t(seconds);
    std::tm utc_tm{};
#if defined(_WIN32)
    gmtime_s(&utc_tm, &as_time_t);
#else
    gmtime_r(&as_time_t, &utc_tm);
#endif
    std::ostringstream stamp;
    stamp << std::put_time(&utc_tm, "%Y-%m-%dT%H:%M:%S");
    if (with_micros) {
        auto micros =
            std::chrono::duration_cast<std::chrono::microseconds>(time - seconds).count();
        stamp << '.' << std::setw(6) << std::setfill('0') << micros;
    }
    stamp << 'Z';
    return stamp.str();
}

}  // namespace admin
