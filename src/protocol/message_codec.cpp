#include "message_codec.hpp"
#include "deskstream/config.hpp"
#include "../util/byte_buffer.hpp"
#include <algorithm>

namespace deskstream {

namespace {

void put_time(ByteWriter& w, Timestamp ts) {
    w.put_i64(to_unix_ms(ts));
}

bool get_time(ByteReader& r, Timestamp& ts) {
    int64_t ms;
    if (!r.get_i64(ms)) return false;
    ts = from_unix_ms(ms);
    return true;
}

template <typename E>
bool get_enum(ByteReader& r, E& out, uint8_t max_value) {
    uint8_t v;
    if (!r.get_u8(v) || v > max_value) return false;
    out = static_cast<E>(v);
    return true;
}

template <typename E>
void put_enum(ByteWriter& w, E v) {
    w.put_u8(static_cast<uint8_t>(v));
}

// ---- writers ----

void write(ByteWriter& w, const ScreenFrame& m) {
    w.put_string(m.frame_id);
    put_time(w, m.timestamp);
    w.put_i32(m.width);
    w.put_i32(m.height);
    put_enum(w, m.format);
    w.put_u8(static_cast<uint8_t>(std::clamp(m.quality, 0, 100)));
    w.put_bool(m.is_delta);
    w.put_bool(m.reference_frame_id.has_value());
    if (m.reference_frame_id) {
        w.put_string(*m.reference_frame_id);
    }
    w.put_u32(static_cast<uint32_t>(m.regions.size()));
    for (const auto& r : m.regions) {
        w.put_i32(r.x);
        w.put_i32(r.y);
        w.put_i32(r.width);
        w.put_i32(r.height);
        w.put_u32(r.data_offset);
        w.put_u32(r.data_length);
    }
    w.put_bytes(m.data);
}

void write(ByteWriter& w, const InputEvent& m) {
    w.put_string(m.event_id);
    put_time(w, m.timestamp);
    put_enum(w, m.type);
    w.put_i32(m.x);
    w.put_i32(m.y);
    w.put_string(m.key_code);
    w.put_bool(m.pressed);
    w.put_string(m.text);
}

void write(ByteWriter& w, const PairingRequest& m) {
    w.put_string(m.client_id);
    w.put_string(m.client_name);
    w.put_string(m.pin);
    w.put_string(m.session_token);
    put_time(w, m.requested_at);
}

void write(ByteWriter& w, const PairingResponse& m) {
    w.put_bool(m.success);
    w.put_string(m.session_token);
    put_enum(w, m.failure_reason);
    w.put_string(m.message);
}

void write(ByteWriter& w, const ConnectionQuality& m) {
    w.put_f64(m.fps);
    w.put_i64(m.bandwidth);
    w.put_i64(m.latency_ms);
    put_time(w, m.timestamp);
    put_enum(w, m.rating);
}

void write(ByteWriter& w, const ClipboardData& m) {
    put_enum(w, m.content_type);
    w.put_string(m.text);
    w.put_bytes(m.image_data);
    put_time(w, m.timestamp);
}

void write(ByteWriter& w, const FileTransferRequest& m) {
    w.put_string(m.transfer_id);
    w.put_string(m.file_name);
    w.put_i64(m.file_size);
    w.put_string(m.mime_type);
    put_enum(w, m.direction);
    put_time(w, m.timestamp);
}

void write(ByteWriter& w, const FileTransferResponse& m) {
    w.put_string(m.transfer_id);
    w.put_bool(m.accepted);
    put_enum(w, m.rejection);
    w.put_string(m.message);
}

void write(ByteWriter& w, const FileTransferChunk& m) {
    w.put_string(m.transfer_id);
    w.put_i64(m.offset);
    w.put_bytes(m.data);
    w.put_bool(m.last_chunk);
}

void write(ByteWriter& w, const FileTransferComplete& m) {
    w.put_string(m.transfer_id);
    w.put_bool(m.success);
    w.put_string(m.error_message);
    w.put_string(m.saved_path);
}

void write(ByteWriter& w, const AudioChunk& m) {
    w.put_bytes(m.data);
    w.put_i32(m.sample_rate);
    w.put_i32(m.channels);
    w.put_i32(m.bits_per_sample);
    w.put_i32(m.duration_ms);
    w.put_string(m.format);
    put_time(w, m.timestamp);
}

void write(ByteWriter& w, const ChatMessage& m) {
    w.put_string(m.message_id);
    w.put_string(m.sender_id);
    w.put_string(m.sender_name);
    w.put_string(m.text);
    put_time(w, m.timestamp);
    w.put_bool(m.read);
    w.put_string(m.message_type);
}

void write(ByteWriter& w, const FrameAck& m) {
    w.put_string(m.frame_id);
    put_time(w, m.sent_at);
    w.put_bool(m.request_full_frame);
}

// ---- readers ----

bool read(ByteReader& r, ScreenFrame& m) {
    uint8_t quality;
    bool has_reference;
    if (!r.get_string(m.frame_id) || !get_time(r, m.timestamp) ||
        !r.get_i32(m.width) || !r.get_i32(m.height) ||
        !get_enum(r, m.format, static_cast<uint8_t>(PixelFormat::RAW)) ||
        !r.get_u8(quality) || !r.get_bool(m.is_delta) || !r.get_bool(has_reference)) {
        return false;
    }
    m.quality = quality;

    if (has_reference) {
        std::string ref;
        if (!r.get_string(ref)) return false;
        m.reference_frame_id = std::move(ref);
    }

    uint32_t region_count;
    if (!r.get_u32(region_count)) return false;
    // Each region is 24 bytes; bound the reservation by what is actually left
    if (region_count > r.remaining() / 24) return false;
    m.regions.resize(region_count);
    for (auto& reg : m.regions) {
        int32_t x, y, w, h;
        if (!r.get_i32(x) || !r.get_i32(y) || !r.get_i32(w) || !r.get_i32(h) ||
            !r.get_u32(reg.data_offset) || !r.get_u32(reg.data_length)) {
            return false;
        }
        reg.x = x;
        reg.y = y;
        reg.width = w;
        reg.height = h;
    }
    return r.get_bytes(m.data);
}

bool read(ByteReader& r, InputEvent& m) {
    return r.get_string(m.event_id) && get_time(r, m.timestamp) &&
           get_enum(r, m.type, static_cast<uint8_t>(InputEventType::TEXT_INPUT)) &&
           r.get_i32(m.x) && r.get_i32(m.y) && r.get_string(m.key_code) &&
           r.get_bool(m.pressed) && r.get_string(m.text);
}

bool read(ByteReader& r, PairingRequest& m) {
    return r.get_string(m.client_id) && r.get_string(m.client_name) &&
           r.get_string(m.pin) && r.get_string(m.session_token) &&
           get_time(r, m.requested_at);
}

bool read(ByteReader& r, PairingResponse& m) {
    return r.get_bool(m.success) && r.get_string(m.session_token) &&
           get_enum(r, m.failure_reason, static_cast<uint8_t>(PairingFailureReason::HOST_REFUSED)) &&
           r.get_string(m.message);
}

bool read(ByteReader& r, ConnectionQuality& m) {
    return r.get_f64(m.fps) && r.get_i64(m.bandwidth) && r.get_i64(m.latency_ms) &&
           get_time(r, m.timestamp) &&
           get_enum(r, m.rating, static_cast<uint8_t>(QualityRating::POOR));
}

bool read(ByteReader& r, ClipboardData& m) {
    return get_enum(r, m.content_type, static_cast<uint8_t>(ClipboardContentType::IMAGE)) &&
           r.get_string(m.text) && r.get_bytes(m.image_data) && get_time(r, m.timestamp);
}

bool read(ByteReader& r, FileTransferRequest& m) {
    return r.get_string(m.transfer_id) && r.get_string(m.file_name) &&
           r.get_i64(m.file_size) && r.get_string(m.mime_type) &&
           get_enum(r, m.direction, static_cast<uint8_t>(FileTransferDirection::DOWNLOAD)) &&
           get_time(r, m.timestamp);
}

bool read(ByteReader& r, FileTransferResponse& m) {
    return r.get_string(m.transfer_id) && r.get_bool(m.accepted) &&
           get_enum(r, m.rejection, static_cast<uint8_t>(FileTransferRejection::ERROR)) &&
           r.get_string(m.message);
}

bool read(ByteReader& r, FileTransferChunk& m) {
    return r.get_string(m.transfer_id) && r.get_i64(m.offset) &&
           r.get_bytes(m.data) && r.get_bool(m.last_chunk);
}

bool read(ByteReader& r, FileTransferComplete& m) {
    return r.get_string(m.transfer_id) && r.get_bool(m.success) &&
           r.get_string(m.error_message) && r.get_string(m.saved_path);
}

bool read(ByteReader& r, AudioChunk& m) {
    return r.get_bytes(m.data) && r.get_i32(m.sample_rate) && r.get_i32(m.channels) &&
           r.get_i32(m.bits_per_sample) && r.get_i32(m.duration_ms) &&
           r.get_string(m.format) && get_time(r, m.timestamp);
}

bool read(ByteReader& r, ChatMessage& m) {
    return r.get_string(m.message_id) && r.get_string(m.sender_id) &&
           r.get_string(m.sender_name) && r.get_string(m.text) &&
           get_time(r, m.timestamp) && r.get_bool(m.read) && r.get_string(m.message_type);
}

bool read(ByteReader& r, FrameAck& m) {
    return r.get_string(m.frame_id) && get_time(r, m.sent_at) && r.get_bool(m.request_full_frame);
}

template <typename T>
std::optional<TransportMessage> decode_as(const uint8_t* data, size_t size) {
    ByteReader reader(data, size);
    T msg;
    if (!read(reader, msg) || !reader.at_end()) {
        return std::nullopt;
    }
    return TransportMessage(std::move(msg));
}

}  // namespace

bool parse_frame_header(const uint8_t* header, FrameHeader& out) {
    uint32_t length = (static_cast<uint32_t>(header[0]) << 24) |
                      (static_cast<uint32_t>(header[1]) << 16) |
                      (static_cast<uint32_t>(header[2]) << 8) |
                      static_cast<uint32_t>(header[3]);
    uint8_t type = header[4];

    if (length < 1 || length > MAX_FRAME_SIZE) {
        return false;
    }
    if (type < 1 || type > MESSAGE_TYPE_COUNT) {
        return false;
    }

    out.length = length;
    out.type = static_cast<MessageType>(type);
    return true;
}

std::vector<uint8_t> encode_payload(const TransportMessage& message) {
    ByteWriter writer;
    std::visit([&writer](const auto& m) { write(writer, m); }, message);
    return writer.take();
}

std::vector<uint8_t> encode_frame(const TransportMessage& message) {
    std::vector<uint8_t> payload = encode_payload(message);
    uint32_t length = static_cast<uint32_t>(payload.size() + 1);

    std::vector<uint8_t> frame(FRAME_HEADER_SIZE + payload.size());
    frame[0] = (length >> 24) & 0xFF;
    frame[1] = (length >> 16) & 0xFF;
    frame[2] = (length >> 8) & 0xFF;
    frame[3] = length & 0xFF;
    frame[4] = static_cast<uint8_t>(message_type_of(message));
    std::copy(payload.begin(), payload.end(), frame.begin() + FRAME_HEADER_SIZE);
    return frame;
}

std::optional<TransportMessage> decode_payload(MessageType type, const uint8_t* data, size_t size) {
    switch (type) {
        case MessageType::SCREEN_FRAME: {
            auto msg = decode_as<ScreenFrame>(data, size);
            if (msg && !validate_screen_frame(std::get<ScreenFrame>(*msg))) {
                return std::nullopt;
            }
            return msg;
        }
        case MessageType::INPUT_EVENT:            return decode_as<InputEvent>(data, size);
        case MessageType::PAIRING_REQUEST:        return decode_as<PairingRequest>(data, size);
        case MessageType::PAIRING_RESPONSE:       return decode_as<PairingResponse>(data, size);
        case MessageType::CONNECTION_QUALITY:     return decode_as<ConnectionQuality>(data, size);
        case MessageType::CLIPBOARD:              return decode_as<ClipboardData>(data, size);
        case MessageType::FILE_TRANSFER_REQUEST:  return decode_as<FileTransferRequest>(data, size);
        case MessageType::FILE_TRANSFER_RESPONSE: return decode_as<FileTransferResponse>(data, size);
        case MessageType::FILE_TRANSFER_CHUNK:    return decode_as<FileTransferChunk>(data, size);
        case MessageType::FILE_TRANSFER_COMPLETE: return decode_as<FileTransferComplete>(data, size);
        case MessageType::AUDIO_CHUNK:            return decode_as<AudioChunk>(data, size);
        case MessageType::CHAT_MESSAGE:           return decode_as<ChatMessage>(data, size);
        case MessageType::FRAME_ACK:              return decode_as<FrameAck>(data, size);
    }
    return std::nullopt;
}

bool validate_screen_frame(const ScreenFrame& frame) {
    if (frame.width < 0 || frame.height < 0) {
        return false;
    }
    // A Raw frame must fit in one wire frame
    const uint64_t raw_size = static_cast<uint64_t>(frame.width) * static_cast<uint64_t>(frame.height) *
                              BYTES_PER_PIXEL;
    if (frame.format == PixelFormat::RAW && raw_size > MAX_FRAME_SIZE) {
        return false;
    }
    if (!frame.is_delta) {
        return !frame.reference_frame_id && frame.regions.empty();
    }
    if (!frame.reference_frame_id || frame.format != PixelFormat::RAW) {
        return false;
    }

    // Regions start on block boundaries, so each one owns at least one block
    const uint64_t cols = (static_cast<uint64_t>(frame.width) + BLOCK_SIZE - 1) / BLOCK_SIZE;
    const uint64_t rows = (static_cast<uint64_t>(frame.height) + BLOCK_SIZE - 1) / BLOCK_SIZE;
    if (frame.regions.size() > cols * rows) {
        return false;
    }

    const uint64_t payload_size = frame.data.size();
    uint64_t expected_offset = 0;
    const DeltaRegion* prev = nullptr;

    for (const auto& r : frame.regions) {
        if (r.x < 0 || r.y < 0 || r.width <= 0 || r.height <= 0 ||
            r.x % BLOCK_SIZE != 0 || r.y % BLOCK_SIZE != 0 ||
            static_cast<int64_t>(r.x) + r.width > frame.width ||
            static_cast<int64_t>(r.y) + r.height > frame.height) {
            return false;
        }
        uint64_t expected_len = static_cast<uint64_t>(r.width) * r.height * BYTES_PER_PIXEL;
        if (r.data_length != expected_len ||
            static_cast<uint64_t>(r.data_offset) + r.data_length > payload_size) {
            return false;
        }
        // Packed contiguously in region order
        if (r.data_offset != expected_offset) {
            return false;
        }
        expected_offset += r.data_length;

        // Sorted row-major by (y, x)
        if (prev && (r.y < prev->y || (r.y == prev->y && r.x <= prev->x))) {
            return false;
        }
        prev = &r;
    }
    if (expected_offset != payload_size) {
        return false;
    }

    // With aligned origins two regions overlap iff they share a block. Every
    // block is claimed at most once before rejecting, so this is linear in
    // the grid size.
    std::vector<bool> claimed(static_cast<size_t>(cols * rows), false);
    for (const auto& r : frame.regions) {
        const int first_col = r.x / BLOCK_SIZE;
        const int end_col = (r.x + r.width - 1) / BLOCK_SIZE + 1;
        const int first_row = r.y / BLOCK_SIZE;
        const int end_row = (r.y + r.height - 1) / BLOCK_SIZE + 1;
        for (int row = first_row; row < end_row; row++) {
            for (int col = first_col; col < end_col; col++) {
                const size_t index = static_cast<size_t>(row) * cols + static_cast<size_t>(col);
                if (claimed[index]) return false;
                claimed[index] = true;
            }
        }
    }
    return true;
}

}  // namespace deskstream
