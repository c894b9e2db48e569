#include "net/connection_pipeline.h"

namespace net {

ConnectionPipeline::ConnectionPipeline(DispatchFn dispatch, std::size_t max_frame_bytes)
    : dispatch_(std::move(dispatch)), max_frame_bytes_(max_frame_bytes) {}

void ConnectionPipeline::registerConnection(std::uint64_t connection_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    decoders_.emplace(connection_id, FrameDecoder{max_frame_bytes_});
}

void ConnectionPipeline::removeConnection(std::uint64_t connection_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    decoders_.erase(connection_id);
}

bool ConnectionPipeline::hasConnection(std::uint64_t connection_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return decoders_.count(connection_id) > 0;
}

std::size_t ConnectionPipeline::connectionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return decoders_.size();
}

bool ConnectionPipeline::onRead(std::uint64_t connection_id,
                                const std::vector<std::uint8_t> &bytes,
                                std::chrono::steady_clock::time_point now) {
    std::vector<Frame> frames;
    bool healthy = true;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = decoders_.find(connection_id);
        if (it == decoders_.end()) {
            return false;
        }
        it->second.append(bytes);
        Frame frame;
        while (it->second.nextFrame(frame.header, frame.payload)) {
            frames.push_back(std::move(frame));
            frame = Frame{};
        }
        if (it->second.poisoned()) {
            decoders_.erase(it);
            healthy = false;
        }
    }

    // Frames decoded ahead of an oversize one are still served.
    if (dispatch_) {
        for (auto &frame : frames) {
            dispatch_(connection_id, frame.header, std::move(frame.payload), now);
        }
    }
    return healthy;
}

}  // namespace net
