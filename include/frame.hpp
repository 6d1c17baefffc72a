#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>

#include "bytes.hpp"

namespace netguard {

// Wire unit: 4-byte big-endian length L followed by exactly L payload bytes.
inline constexpr std::size_t kFrameHeaderSize = 4;

using FrameHeader = std::array<std::uint8_t, kFrameHeaderSize>;

FrameHeader encode_frame_header(std::uint32_t length);
std::uint32_t decode_frame_length(const std::uint8_t* header);

// Header followed by payload. Throws std::length_error above 2^32-1 bytes.
Bytes encode_frame(const Bytes& payload);

// Returns the payload when `buffer` holds exactly one complete frame.
std::optional<Bytes> decode_frame(const Bytes& buffer);

}
