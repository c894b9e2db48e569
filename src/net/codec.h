#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace net {

struct FrameHeader {
    std::uint32_t length;
    std::uint16_t type;
    std::uint16_t version;
};

class Codec {
public:
    static constexpr std::size_t kHeaderSize = 8;

    static std::vector<std::uint8_t> encode(std::uint16_t type,
                                            std::uint16_t version,
                                            std::span<const std::uint8_t> payload);
};

// Splits a byte stream into frames. A header announcing more than
// `max_payload_bytes` poisons the decoder: no further frame is produced and
// the connection should be dropped.
class FrameDecoder {
public:
    static constexpr std::size_t kDefaultMaxPayload = 64 * 1024;

    explicit FrameDecoder(std::size_t max_payload_bytes = kDefaultMaxPayload);

    void append(std::span<const std::uint8_t> data);
    bool nextFrame(FrameHeader &header, std::vector<std::uint8_t> &payload);

    bool poisoned() const;
    std::size_t buffered() const;

private:
    std::vector<std::uint8_t> buffer_;
    std::size_t max_payload_bytes_;
    bool poisoned_{false};
};

}  // namespace net
