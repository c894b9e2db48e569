#pragma once

#include "net/codec.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace net {

// Per-connection frame reassembly in front of the request dispatcher.
class ConnectionPipeline {
public:
    using DispatchFn = std::function<void(std::uint64_t,
                                          const FrameHeader &,
                                          std::vector<std::uint8_t>,
                                          std::chrono::steady_clock::time_point)>;

    ConnectionPipeline(DispatchFn dispatch, std::size_t max_frame_bytes);

    void registerConnection(std::uint64_t connection_id);
    void removeConnection(std::uint64_t connection_id);
    bool hasConnection(std::uint64_t connection_id) const;
    std::size_t connectionCount() const;

    // Dispatches every complete frame. false when the connection is unknown
    // or sent an oversize frame; in the latter case it has been removed.
    bool onRead(std::uint64_t connection_id,
                const std::vector<std::uint8_t> &bytes,
                std::chrono::steady_clock::time_point now);

private:
    struct Frame {
        FrameHeader header{};
        std::vector<std::uint8_t> payload;
    };

    DispatchFn dispatch_;
    std::size_t max_frame_bytes_;
    mutable std::mutex mutex_;
    std::unordered_map<std::uint64_t, FrameDecoder> decoders_;
};

}  // namespace net
