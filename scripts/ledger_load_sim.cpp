#include "admin/admin.h"
#include "net/codec.h"
#include "net/connection_pipeline.h"
#include "net/protocol.h"
#include "net/request_dispatcher.h"
#include "net/server.h"
#include "stock/in_memory_ledger_storage.h"
#include "stock/journaled_ledger_storage.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace {

struct Options {
    std::size_t items{8};
    std::size_t locations{4};
    std::size_t clients{8};
    std::size_t operations{200};
    std::size_t workers{4};
    std::size_t queue_capacity{256};
    std::uint32_t initial_stock{50};
    std::string journal_path{};
    std::string log_path{"docs/ledger_run.log"};
    std::string summary_path{"docs/ledger_summary.md"};
};

void printUsage(const char *argv0) {
    std::cout << "Usage: " << argv0
              << " [--items N] [--locations N] [--clients N] [--operations N]"
              << " [--workers N] [--queue-capacity N] [--journal-path PATH] [--log-path PATH]"
              << " [--summary-path PATH]\n";
}

std::optional<std::size_t> parseSize(const char *value) {
    if (value == nullptr) {
        return std::nullopt;
    }
    try {
        std::size_t idx = 0;
        std::string text(value);
        std::size_t result = std::stoull(text, &idx, 10);
        if (idx != text.size()) {
            return std::nullopt;
        }
        return result;
    } catch (const std::exception &) {
        return std::nullopt;
    }
}

Options parseArgs(int argc, char **argv) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        auto nextValue = [&]() -> const char * {
            if (i + 1 >= argc) {
                return nullptr;
            }
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            std::exit(0);
        } else if (arg == "--items") {
            if (auto value = parseSize(nextValue())) {
                options.items = *value;
            }
        } else if (arg == "--locations") {
            if (auto value = parseSize(nextValue())) {
                options.locations = *value;
            }
        } else if (arg == "--clients") {
            if (auto value = parseSize(nextValue())) {
                options.clients = *value;
            }
        } else if (arg == "--operations") {
            if (auto value = parseSize(nextValue())) {
                options.operations = *value;
            }
        } else if (arg == "--workers") {
            if (auto value = parseSize(nextValue())) {
                options.workers = *value;
            }
        } else if (arg == "--queue-capacity") {
            if (auto value = parseSize(nextValue())) {
                options.queue_capacity = *value;
            }
        } else if (arg == "--journal-path") {
            if (auto value = nextValue()) {
                options.journal_path = value;
            }
        } else if (arg == "--log-path") {
            if (auto value = nextValue()) {
                options.log_path = value;
            }
        } else if (arg == "--summary-path") {
            if (auto value = nextValue()) {
                options.summary_path = value;
            }
        } else {
            std::cerr << "Unknown option " << arg << "\n";
            printUsage(argv[0]);
            std::exit(2);
        }
    }
    if (options.locations < 2) {
        options.locations = 2;
    }
    if (options.items == 0) {
        options.items = 1;
    }
    return options;
}

void ensureParentDir(const std::string &path) {
    if (path.empty()) {
        return;
    }
    std::filesystem::path target(path);
    auto parent = target.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }
}

std::string itemName(std::size_t index) {
    return "SKU-" + std::to_string(1000 + index);
}

std::string locationName(std::size_t index) {
    return "BIN-" + std::to_string(index + 1);
}

net::FrameHeader makeHeader(net::PacketType type, std::size_t length) {
    net::FrameHeader header{};
    header.length = static_cast<std::uint32_t>(length);
    header.type = static_cast<std::uint16_t>(type);
    header.version = net::kMaxProtocolVersion;
    return header;
}

// Responses produced by worker threads, parked per connection until the
// owning client picks them up.
class ResponseBoard {
public:
    void post(std::uint64_t connection_id, std::vector<std::uint8_t> frame) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            inbox_[connection_id].push_back(std::move(frame));
        }
        cv_.notify_all();
    }

    std::vector<std::uint8_t> take(std::uint64_t connection_id) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [&] { return !inbox_[connection_id].empty(); });
        auto &queue = inbox_[connection_id];
        auto frame = std::move(queue.front());
        queue.erase(queue.begin());
        return frame;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::unordered_map<std::uint64_t, std::vector<std::vector<std::uint8_t>>> inbox_;
};

bool decodeSingleFrame(const std::vector<std::uint8_t> &bytes,
                       net::FrameHeader &header,
                       std::vector<std::uint8_t> &payload) {
    net::FrameDecoder decoder;
    decoder.append(bytes);
    return decoder.nextFrame(header, payload);
}

struct ClientStats {
    std::map<std::string, std::size_t> codes;
    std::size_t requests{0};
    std::size_t malformed{0};
};

struct TotalsCheck {
    std::size_t items_checked{0};
    std::size_t mismatches{0};
};

// Replays the signed effect of every COMPLETED record and compares it with
// the stock table. MOVE contributes nothing to an item total.
TotalsCheck checkItemTotals(const std::vector<stock::TransactionRecord> &history,
                            const net::StockSummaryResponse &summary) {
    std::map<std::string, std::int64_t> expected;
    for (const auto &record : history) {
        if (record.status != stock::TransactionStatus::Completed) {
            continue;
        }
        switch (record.type) {
            case stock::TransactionType::Putaway:
                expected[record.item_id] += record.quantity;
                break;
            case stock::TransactionType::Remove:
                expected[record.item_id] -= record.quantity;
                break;
            case stock::TransactionType::Move:
                expected[record.item_id] += 0;
                break;
        }
    }
    std::map<std::string, std::int64_t> actual;
    for (const auto &entry : summary.entries) {
        actual[entry.item_id] += entry.quantity;
    }

    TotalsCheck check;
    for (const auto &[item, total] : expected) {
        check.items_checked += 1;
        if (actual[item] != total) {
            check.mismatches += 1;
        }
    }
    return check;
}

// Pages through the whole history. false when a page cannot be decoded or
// the pages do not add up to the announced total.
bool fetchHistory(net::LedgerServer &server, std::vector<stock::TransactionRecord> &records) {
    records.clear();
    std::uint32_t offset = 0;
    for (;;) {
        net::HistoryRequest request;
        request.offset = offset;
        auto payload = net::encodeHistoryRequest(request);
        auto frame = server.handlePacket(makeHeader(net::PacketType::HistoryReq, payload.size()),
                                         payload, std::chrono::system_clock::now());
        net::FrameHeader header{};
        std::vector<std::uint8_t> body;
        net::HistoryResponse page;
        if (!decodeSingleFrame(frame, header, body) ||
            !net::decodeHistoryResponse(body, page) || !page.success) {
            return false;
        }
        if (page.records.empty()) {
            return records.size() == page.total;
        }
        offset += static_cast<std::uint32_t>(page.records.size());
        for (auto &record : page.records) {
            records.push_back(std::move(record));
        }
    }
}

}  // namespace

int main(int argc, char **argv) {
    Options options = parseArgs(argc, argv);
    ensureParentDir(options.log_path);
    ensureParentDir(options.summary_path);
    ensureParentDir(options.journal_path);

    std::ofstream log_file;
    std::streambuf *saved_buf = std::cout.rdbuf();
    if (!options.log_path.empty()) {
        log_file.open(options.log_path, std::ios::out | std::ios::trunc);
        if (log_file) {
            std::cout.rdbuf(log_file.rdbuf());
        }
    }

    std::shared_ptr<stock::LedgerStorage> storage;
    std::shared_ptr<stock::JournaledLedgerStorage> journaled;
    if (!options.journal_path.empty()) {
        journaled = std::make_shared<stock::JournaledLedgerStorage>(options.journal_path);
        std::string reason;
        if (!journaled->open(reason)) {
            std::cout.rdbuf(saved_buf);
            std::cerr << "Failed to open journal " << options.journal_path << ": " << reason
                      << std::endl;
            return 1;
        }
        storage = journaled;
    } else {
        storage = std::make_shared<stock::InMemoryLedgerStorage>();
    }

    net::LedgerServer server(storage);
    admin::AdminService admin_service(server);
    ResponseBoard board;

    net::DispatcherConfig dispatch_config;
    dispatch_config.lanes = options.workers;
    dispatch_config.lane_capacity = options.queue_capacity;
    net::RequestDispatcher dispatcher(dispatch_config, [&server, &board](const net::RequestJob &job) {
        auto response = server.handlePacket(job.header, job.payload,
                                            std::chrono::system_clock::now(), job.connection_id);
        board.post(job.connection_id, std::move(response));
    });
    std::atomic<std::size_t> rejected_jobs{0};
    net::ConnectionPipeline pipeline(
        [&dispatcher, &server, &rejected_jobs](std::uint64_t connection_id,
                                               const net::FrameHeader &header,
                                               std::vector<std::uint8_t> payload,
                                               std::chrono::steady_clock::time_point received_at) {
            net::RequestJob job;
            job.connection_id = connection_id;
            job.route_key = server.routeKey(header, payload, connection_id);
            job.header = header;
            job.payload = std::move(payload);
            job.received_at = received_at;
            if (!dispatcher.enqueue(std::move(job))) {
                rejected_jobs += 1;
            }
        },
        server.config().max_frame_bytes);
    dispatcher.start();

    auto started = std::chrono::steady_clock::now();

    // Seed stock on a connection of its own.
    const std::uint64_t seed_connection = 1;
    pipeline.registerConnection(seed_connection);
    std::size_t seed_failures = 0;
    for (std::size_t item = 0; item < options.items; ++item) {
        for (std::size_t location = 0; location < options.locations; ++location) {
            net::ApplyRequest request;
            request.type = stock::TransactionType::Putaway;
            request.item_id = itemName(item);
            request.quantity = options.initial_stock;
            request.to_location_id = locationName(location);
            request.actor_user_id = "seeder";
            auto payload = net::encodeApplyRequest(request);
            auto frame = net::Codec::encode(
                static_cast<std::uint16_t>(net::PacketType::ApplyReq),
                net::kMaxProtocolVersion, payload);
            pipeline.onRead(seed_connection, frame, std::chrono::steady_clock::now());
            net::FrameHeader header{};
            std::vector<std::uint8_t> body;
            net::TransactionResponse response;
            if (!decodeSingleFrame(board.take(seed_connection), header, body) ||
                !net::decodeTransactionResponse(body, response) || !response.success) {
                seed_failures += 1;
            }
        }
    }
    pipeline.removeConnection(seed_connection);

    std::vector<ClientStats> stats(options.clients);
    std::vector<std::thread> clients;
    clients.reserve(options.clients);
    for (std::size_t c = 0; c < options.clients; ++c) {
        clients.emplace_back([&, c]() {
            const std::uint64_t connection_id = 100 + c;
            const std::string user_id = "client_" + std::to_string(c + 1);
            pipeline.registerConnection(connection_id);
            std::mt19937 rng(static_cast<std::uint32_t>(c * 7919 + 17));
            std::uniform_int_distribution<std::size_t> pick_item(0, options.items - 1);
            std::uniform_int_distribution<std::size_t> pick_location(0, options.locations - 1);
            std::uniform_int_distribution<std::uint32_t> pick_quantity(1, 10);
            std::uniform_int_distribution<int> pick_action(0, 99);
            std::optional<std::uint64_t> last_transaction;
            auto &mine = stats[c];

            for (std::size_t op = 0; op < options.operations; ++op) {
                std::vector<std::uint8_t> frame;
                int action = pick_action(rng);
                if (action < 15 && last_transaction) {
                    net::UndoRequest request;
                    request.transaction_id = *last_transaction;
                    request.requesting_user_id = user_id;
                    auto payload = net::encodeUndoRequest(request);
                    frame = net::Codec::encode(
                        static_cast<std::uint16_t>(net::PacketType::UndoReq),
                        net::kMaxProtocolVersion, payload);
                    last_transaction.reset();
                } else {
                    net::ApplyRequest request;
                    request.item_id = itemName(pick_item(rng));
                    request.quantity = pick_quantity(rng);
                    request.actor_user_id = user_id;
                    auto from = pick_location(rng);
                    if (action < 45) {
                        request.type = stock::TransactionType::Putaway;
                        request.to_location_id = locationName(from);
                    } else if (action < 75) {
                        request.type = stock::TransactionType::Remove;
                        request.from_location_id = locationName(from);
                    } else {
                        request.type = stock::TransactionType::Move;
                        request.from_location_id = locationName(from);
                        request.to_location_id =
                            locationName((from + 1) % options.locations);
                    }
                    auto payload = net::encodeApplyRequest(request);
                    frame = net::Codec::encode(
                        static_cast<std::uint16_t>(net::PacketType::ApplyReq),
                        net::kMaxProtocolVersion, payload);
                }

                // Deliver in two reads to exercise frame reassembly.
                auto split = frame.size() / 2;
                std::vector<std::uint8_t> head(frame.begin(), frame.begin() + split);
                std::vector<std::uint8_t> tail(frame.begin() + split, frame.end());
                auto now = std::chrono::steady_clock::now();
                pipeline.onRead(connection_id, head, now);
                pipeline.onRead(connection_id, tail, now);
                mine.requests += 1;

                net::FrameHeader header{};
                std::vector<std::uint8_t> body;
                net::TransactionResponse response;
                if (!decodeSingleFrame(board.take(connection_id), header, body) ||
                    !net::decodeTransactionResponse(body, response)) {
                    mine.malformed += 1;
                    continue;
                }
                mine.codes[response.code] += 1;
                if (response.success && response.record &&
                    response.record->status == stock::TransactionStatus::Completed) {
                    last_transaction = response.record->id;
                }
            }
            pipeline.removeConnection(connection_id);
        });
    }
    for (auto &client : clients) {
        client.join();
    }
    dispatcher.stop();

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    std::vector<stock::TransactionRecord> history;
    net::StockSummaryResponse summary_view;
    bool views_ok = true;
    {
        if (!fetchHistory(server, history)) {
            views_ok = false;
            std::cerr << "History could not be read back" << std::endl;
        }
        net::FrameHeader header{};
        std::vector<std::uint8_t> body;
        auto summary_payload = net::encodeStockSummaryRequest(net::StockSummaryRequest{});
        auto frame = server.handlePacket(
            makeHeader(net::PacketType::StockSummaryReq, summary_payload.size()),
            summary_payload, std::chrono::system_clock::now());
        if (!decodeSingleFrame(frame, header, body) ||
            !net::decodeStockSummaryResponse(body, summary_view)) {
            views_ok = false;
            std::cerr << "Stock summary response could not be decoded" << std::endl;
        }
    }
    auto totals = checkItemTotals(history, summary_view);
    auto status = admin_service.getStatus();

    std::map<std::string, std::size_t> codes;
    std::size_t total_requests = 0;
    std::size_t malformed = 0;
    for (const auto &client : stats) {
        total_requests += client.requests;
        malformed += client.malformed;
        for (const auto &[code, count] : client.codes) {
            codes[code] += count;
        }
    }

    if (log_file) {
        log_file.flush();
        log_file.close();
    }

    std::ostringstream summary;
    summary << "# Ledger Load Summary\n\n";
    summary << "Generated by `scripts/ledger_load_sim.cpp`.\n\n";
    summary << "## Command\n";
    summary << "```bash\n";
    summary << "./build/ledger_load_sim";
    summary << " --items " << options.items;
    summary << " --locations " << options.locations;
    summary << " --clients " << options.clients;
    summary << " --operations " << options.operations;
    summary << " --workers " << options.workers;
    summary << " --queue-capacity " << options.queue_capacity;
    if (!options.journal_path.empty()) {
        summary << " --journal-path " << options.journal_path;
    }
    if (!options.log_path.empty()) {
        summary << " --log-path " << options.log_path;
    }
    if (!options.summary_path.empty()) {
        summary << " --summary-path " << options.summary_path;
    }
    summary << "\n```\n\n";
    summary << "## Requests\n";
    summary << "- Seed putaways failed: " << seed_failures << "\n";
    summary << "- Client requests: " << total_requests << "\n";
    summary << "- Undecodable responses: " << malformed << "\n";
    for (const auto &[code, count] : codes) {
        summary << "- " << code << ": " << count << "\n";
    }
    summary << "- Duration: " << duration.count() << " ms\n\n";

    summary << "## Server Status\n";
    summary << "- Requests total: " << status.requests_total << "\n";
    summary << "- Errors total: " << status.error_total << "\n";
    summary << "- Applied: " << status.applied_total << "\n";
    summary << "- Undone: " << status.undone_total << "\n";
    summary << "- Conflicts: " << status.conflict_total << "\n";
    summary << "- Transactions stored: " << status.transactions_total << "\n";
    summary << "- Stock entries: " << status.stock_entries << "\n";
    summary << "- Requests dropped by queue: " << dispatcher.droppedCount() << "\n";
    summary << "- Requests refused by queue: " << rejected_jobs.load() << "\n";
    if (journaled) {
        summary << "- Journal bytes: " << journaled->journalBytes() << "\n";
    }
    summary << "\n## Validation\n";
    summary << "- History records read back: " << history.size() << "\n";
    summary << "- Item totals match completed history: " << totals.items_checked
            << " items, " << totals.mismatches << " mismatches\n";
    summary << "  - Status: " << (views_ok && totals.mismatches == 0 ? "PASS" : "FAIL") << "\n";

    if (!options.summary_path.empty()) {
        std::ofstream summary_file(options.summary_path, std::ios::out | std::ios::trunc);
        if (summary_file) {
            summary_file << summary.str();
        }
    }

    std::cout.rdbuf(saved_buf);
    std::cout << summary.str();

    return views_ok && totals.mismatches == 0 && malformed == 0 ? 0 : 1;
}
