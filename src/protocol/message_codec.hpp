#pragma once

#include <cstdint>
#include <optional>
#include <vector>
#include "messages.hpp"

namespace deskstream {

// Frame layout on the wire:
//   [length:4, big-endian][type:1][payload:length-1]
// length counts the type byte plus payload.
struct FrameHeader {
    uint32_t length = 0;
    MessageType type = MessageType::SCREEN_FRAME;

    size_t payload_size() const { return length - 1; }
};

// Parse and validate the 5-byte header. Rejects zero length, oversize frames
// and unknown type tags.
bool parse_frame_header(const uint8_t* header, FrameHeader& out);

// Serialize a message payload (no frame header)
std::vector<uint8_t> encode_payload(const TransportMessage& message);

// Full wire frame: header + payload
std::vector<uint8_t> encode_frame(const TransportMessage& message);

// Decode a payload of the given type. Returns nullopt on truncated input,
// trailing bytes, out-of-range enums or a screen frame that violates the
// delta invariants.
std::optional<TransportMessage> decode_payload(MessageType type, const uint8_t* data, size_t size);

// Check the delta-frame structural invariants (reference id present iff
// is_delta, regions block-aligned, non-overlapping, inside the frame and the
// payload). Raw frames larger than MAX_FRAME_SIZE are rejected.
bool validate_screen_frame(const ScreenFrame& frame);

}  // namespace deskstream
