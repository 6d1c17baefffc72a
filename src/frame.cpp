#include "frame.hpp"

#include <limits>
#include <stdexcept>

namespace netguard {

FrameHeader encode_frame_header(std::uint32_t length) {
    return FrameHeader{
        static_cast<std::uint8_t>((length >> 24) & 0xFF),
        static_cast<std::uint8_t>((length >> 16) & 0xFF),
        static_cast<std::uint8_t>((length >> 8) & 0xFF),
        static_cast<std::uint8_t>(length & 0xFF),
    };
}

std::uint32_t decode_frame_length(const std::uint8_t* header) {
    return (static_cast<std::uint32_t>(header[0]) << 24) |
           (static_cast<std::uint32_t>(header[1]) << 16) |
           (static_cast<std::uint32_t>(header[2]) << 8) |
           static_cast<std::uint32_t>(header[3]);
}

Bytes encode_frame(const Bytes& payload) {
    if (payload.size() > std::numeric_limits<std::uint32_t>::max()) {
        throw std::length_error("frame payload exceeds 4-byte length prefix");
    }
    auto header = encode_frame_header(static_cast<std::uint32_t>(payload.size()));

    Bytes out;
    out.reserve(kFrameHeaderSize + payload.size());
    out.insert(out.end(), header.begin(), header.end());
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

std::optional<Bytes> decode_frame(const Bytes& buffer) {
    if (buffer.size() < kFrameHeaderSize) return std::nullopt;

    std::uint64_t length = decode_frame_length(buffer.data());
    if (buffer.size() - kFrameHeaderSize != length) return std::nullopt;

    return Bytes(buffer.begin() + kFrameHeaderSize, buffer.end());
}

}
