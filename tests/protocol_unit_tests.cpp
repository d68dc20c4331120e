#include <chrono>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "deskstream/config.hpp"
#include "protocol/message_codec.hpp"
#include "protocol/messages.hpp"

using deskstream::DeltaRegion;
using deskstream::FrameHeader;
using deskstream::MessageType;
using deskstream::PixelFormat;
using deskstream::ScreenFrame;
using deskstream::TransportMessage;

namespace {

int fail(const char* name, const char* msg) {
    std::cerr << "[FAIL] " << name << ": " << msg << '\n';
    return 1;
}

void put_header(uint8_t* out, uint32_t length, uint8_t type) {
    out[0] = (length >> 24) & 0xFF;
    out[1] = (length >> 16) & 0xFF;
    out[2] = (length >> 8) & 0xFF;
    out[3] = length & 0xFF;
    out[4] = type;
}

// Two 64x64 regions side by side on a 128x64 frame
ScreenFrame make_delta() {
    ScreenFrame frame;
    frame.frame_id = "frame-2";
    frame.width = 128;
    frame.height = 64;
    frame.format = PixelFormat::RAW;
    frame.is_delta = true;
    frame.reference_frame_id = "frame-1";

    const uint32_t region_bytes = 64 * 64 * deskstream::BYTES_PER_PIXEL;
    DeltaRegion left;
    left.x = 0;
    left.y = 0;
    left.width = 64;
    left.height = 64;
    left.data_offset = 0;
    left.data_length = region_bytes;
    DeltaRegion right = left;
    right.x = 64;
    right.data_offset = region_bytes;
    frame.regions = {left, right};
    frame.data.assign(region_bytes * 2, 0x5A);
    return frame;
}

// Every byte value, so raw payloads cannot hide escaping or truncation bugs
std::vector<uint8_t> all_bytes() {
    std::vector<uint8_t> bytes(256);
    for (int i = 0; i < 256; i++) {
        bytes[i] = static_cast<uint8_t>(i);
    }
    return bytes;
}

// Encode as a full wire frame, parse the header and decode the payload back
template <typename T>
std::optional<T> round_trip(const T& message) {
    const std::vector<uint8_t> frame = deskstream::encode_frame(message);
    FrameHeader header;
    if (!deskstream::parse_frame_header(frame.data(), header) ||
        header.type != deskstream::message_type_of<T>() ||
        header.payload_size() != frame.size() - deskstream::FRAME_HEADER_SIZE) {
        return std::nullopt;
    }
    auto decoded = deskstream::decode_payload(header.type, frame.data() + deskstream::FRAME_HEADER_SIZE,
                                              header.payload_size());
    if (!decoded || !std::holds_alternative<T>(*decoded)) {
        return std::nullopt;
    }
    return std::get<T>(std::move(*decoded));
}

const deskstream::Timestamp TEST_STAMP = deskstream::from_unix_ms(1700000123456);
const char* const UNICODE_TEXT = "Gr\xC3\xBC\xC3\x9F\xC3\xA9 \xE6\x97\xA5\xE6\x9C\xAC \xF0\x9F\x96\xA5";

int test_header_parsing() {
    uint8_t header[deskstream::FRAME_HEADER_SIZE];
    FrameHeader parsed;

    put_header(header, 10, static_cast<uint8_t>(MessageType::FRAME_ACK));
    if (!deskstream::parse_frame_header(header, parsed)) {
        return fail("test_header_parsing", "valid header rejected");
    }
    if (parsed.length != 10 || parsed.type != MessageType::FRAME_ACK || parsed.payload_size() != 9) {
        return fail("test_header_parsing", "header fields wrong");
    }

    put_header(header, 0, static_cast<uint8_t>(MessageType::FRAME_ACK));
    if (deskstream::parse_frame_header(header, parsed)) {
        return fail("test_header_parsing", "zero length accepted");
    }

    put_header(header, deskstream::MAX_FRAME_SIZE + 1, static_cast<uint8_t>(MessageType::SCREEN_FRAME));
    if (deskstream::parse_frame_header(header, parsed)) {
        return fail("test_header_parsing", "oversize frame accepted");
    }

    put_header(header, 10, 0x00);
    if (deskstream::parse_frame_header(header, parsed)) {
        return fail("test_header_parsing", "tag 0 accepted");
    }
    put_header(header, 10, deskstream::MESSAGE_TYPE_COUNT + 1);
    if (deskstream::parse_frame_header(header, parsed)) {
        return fail("test_header_parsing", "unknown tag accepted");
    }
    return 0;
}

int test_frame_layout() {
    deskstream::FrameAck ack;
    ack.frame_id = "abc";
    ack.request_full_frame = true;

    const std::vector<uint8_t> frame = deskstream::encode_frame(ack);
    const std::vector<uint8_t> payload = deskstream::encode_payload(ack);
    if (frame.size() != payload.size() + deskstream::FRAME_HEADER_SIZE) {
        return fail("test_frame_layout", "frame size mismatch");
    }

    FrameHeader parsed;
    if (!deskstream::parse_frame_header(frame.data(), parsed)) {
        return fail("test_frame_layout", "own header rejected");
    }
    if (parsed.length != payload.size() + 1 || parsed.type != MessageType::FRAME_ACK) {
        return fail("test_frame_layout", "length must count the tag byte");
    }
    if (std::memcmp(frame.data() + deskstream::FRAME_HEADER_SIZE, payload.data(), payload.size()) != 0) {
        return fail("test_frame_layout", "payload not copied verbatim");
    }

    auto decoded = deskstream::decode_payload(parsed.type, frame.data() + deskstream::FRAME_HEADER_SIZE,
                                              parsed.payload_size());
    if (!decoded || !std::holds_alternative<deskstream::FrameAck>(*decoded)) {
        return fail("test_frame_layout", "ack did not decode");
    }
    const auto& out = std::get<deskstream::FrameAck>(*decoded);
    if (out.frame_id != "abc" || !out.request_full_frame) {
        return fail("test_frame_layout", "ack fields lost");
    }
    return 0;
}

int test_malformed_payloads() {
    deskstream::PairingRequest request;
    request.client_id = "viewer-1";
    request.client_name = "Viewer";
    request.pin = "123456";
    std::vector<uint8_t> payload = deskstream::encode_payload(request);

    if (!deskstream::decode_payload(MessageType::PAIRING_REQUEST, payload.data(), payload.size())) {
        return fail("test_malformed_payloads", "valid request rejected");
    }
    if (deskstream::decode_payload(MessageType::PAIRING_REQUEST, payload.data(), payload.size() - 1)) {
        return fail("test_malformed_payloads", "truncated payload accepted");
    }

    std::vector<uint8_t> trailing = payload;
    trailing.push_back(0);
    if (deskstream::decode_payload(MessageType::PAIRING_REQUEST, trailing.data(), trailing.size())) {
        return fail("test_malformed_payloads", "trailing bytes accepted");
    }

    // Out-of-range failure reason
    deskstream::PairingResponse response;
    response.message = "x";
    std::vector<uint8_t> bad_enum = deskstream::encode_payload(response);
    // success(1) + token length(4) + empty token, then the reason byte
    bad_enum[5] = 0x7F;
    if (deskstream::decode_payload(MessageType::PAIRING_RESPONSE, bad_enum.data(), bad_enum.size())) {
        return fail("test_malformed_payloads", "unknown failure reason accepted");
    }

    // Screen frame whose regions break the delta invariants is rejected at decode
    ScreenFrame frame = make_delta();
    frame.regions[1].x = 32;
    std::vector<uint8_t> overlapping = deskstream::encode_payload(frame);
    if (deskstream::decode_payload(MessageType::SCREEN_FRAME, overlapping.data(), overlapping.size())) {
        return fail("test_malformed_payloads", "overlapping regions accepted");
    }

    // Payload of the wrong type does not decode as another
    if (deskstream::decode_payload(MessageType::FRAME_ACK, payload.data(), payload.size())) {
        return fail("test_malformed_payloads", "request decoded as ack");
    }
    return 0;
}

int test_screen_frame_invariants() {
    const char* name = "test_screen_frame_invariants";

    ScreenFrame delta = make_delta();
    if (!deskstream::validate_screen_frame(delta)) {
        return fail(name, "valid delta rejected");
    }
    std::vector<uint8_t> payload = deskstream::encode_payload(delta);
    auto decoded = deskstream::decode_payload(MessageType::SCREEN_FRAME, payload.data(), payload.size());
    if (!decoded) {
        return fail(name, "valid delta did not decode");
    }
    const auto& out = std::get<ScreenFrame>(*decoded);
    if (out.regions != delta.regions || out.reference_frame_id != delta.reference_frame_id ||
        out.data != delta.data) {
        return fail(name, "delta fields lost");
    }

    ScreenFrame full;
    full.frame_id = "frame-1";
    full.width = 2;
    full.height = 2;
    full.data.assign(16, 0);
    if (!deskstream::validate_screen_frame(full)) {
        return fail(name, "full frame rejected");
    }

    ScreenFrame f = full;
    f.reference_frame_id = "frame-0";
    if (deskstream::validate_screen_frame(f)) {
        return fail(name, "full frame with reference accepted");
    }

    f = delta;
    f.reference_frame_id.reset();
    if (deskstream::validate_screen_frame(f)) {
        return fail(name, "delta without reference accepted");
    }

    f = delta;
    f.format = PixelFormat::JPEG;
    if (deskstream::validate_screen_frame(f)) {
        return fail(name, "compressed delta accepted");
    }

    f = delta;
    f.regions[1].width = 128;
    if (deskstream::validate_screen_frame(f)) {
        return fail(name, "region outside the frame accepted");
    }

    f = delta;
    f.data.pop_back();
    if (deskstream::validate_screen_frame(f)) {
        return fail(name, "short payload accepted");
    }

    f = delta;
    f.data.push_back(0);
    if (deskstream::validate_screen_frame(f)) {
        return fail(name, "payload with unclaimed bytes accepted");
    }

    f = delta;
    std::swap(f.regions[0], f.regions[1]);
    if (deskstream::validate_screen_frame(f)) {
        return fail(name, "unsorted regions accepted");
    }

    f = delta;
    f.regions[1].x = 32;
    f.regions[1].width = 96;
    if (deskstream::validate_screen_frame(f)) {
        return fail(name, "region off the block grid accepted");
    }

    // Block-aligned origins that still cover the same pixels
    f = delta;
    f.height = 128;
    f.regions[0].width = 128;
    f.regions[0].height = 128;
    f.regions[0].data_length = 128 * 128 * deskstream::BYTES_PER_PIXEL;
    f.regions[1].y = 64;
    f.regions[1].data_offset = f.regions[0].data_length;
    f.data.assign(f.regions[0].data_length + f.regions[1].data_length, 0x5A);
    if (deskstream::validate_screen_frame(f)) {
        return fail(name, "overlapping aligned regions accepted");
    }

    f = delta;
    f.regions[0].data_length -= 4;
    if (deskstream::validate_screen_frame(f)) {
        return fail(name, "region length mismatch accepted");
    }
    return 0;
}

int test_large_region_count_validates_quickly() {
    const char* name = "test_large_region_count_validates_quickly";

    // Widest frame that still fits one wire frame, one pixel per block column
    ScreenFrame frame;
    frame.frame_id = "wide";
    frame.width = static_cast<int>(deskstream::MAX_FRAME_SIZE / deskstream::BYTES_PER_PIXEL);
    frame.height = 1;
    frame.format = PixelFormat::RAW;
    frame.is_delta = true;
    frame.reference_frame_id = "base";

    const int count = frame.width / deskstream::BLOCK_SIZE;
    frame.regions.resize(static_cast<size_t>(count));
    for (int i = 0; i < count; i++) {
        DeltaRegion& r = frame.regions[static_cast<size_t>(i)];
        r.x = i * deskstream::BLOCK_SIZE;
        r.width = 1;
        r.height = 1;
        r.data_offset = static_cast<uint32_t>(i) * deskstream::BYTES_PER_PIXEL;
        r.data_length = deskstream::BYTES_PER_PIXEL;
    }
    frame.data.assign(static_cast<size_t>(count) * deskstream::BYTES_PER_PIXEL, 0x11);

    const std::vector<uint8_t> payload = deskstream::encode_payload(frame);
    const auto started = std::chrono::steady_clock::now();
    auto decoded = deskstream::decode_payload(MessageType::SCREEN_FRAME, payload.data(), payload.size());

    // Same shape with a final region that lands on an already claimed block
    frame.regions.back().x = frame.regions[frame.regions.size() - 2].x;
    frame.regions.back().y = 0;
    const bool duplicate_rejected = !deskstream::validate_screen_frame(frame);
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (!decoded || std::get<ScreenFrame>(*decoded).regions.size() != static_cast<size_t>(count)) {
        return fail(name, "valid many-region delta rejected");
    }
    if (!duplicate_rejected) {
        return fail(name, "duplicate region accepted");
    }
    if (elapsed.count() > 2000) {
        return fail(name, "region validation is not linear");
    }

    // Dimensions too large for one wire frame are refused outright
    ScreenFrame huge = make_delta();
    huge.width = 1 << 30;
    if (deskstream::validate_screen_frame(huge)) {
        return fail(name, "oversized raw frame accepted");
    }
    std::vector<uint8_t> huge_payload = deskstream::encode_payload(huge);
    if (deskstream::decode_payload(MessageType::SCREEN_FRAME, huge_payload.data(), huge_payload.size())) {
        return fail(name, "oversized raw frame decoded");
    }
    return 0;
}

int test_round_trip_media_messages() {
    const char* name = "test_round_trip_media_messages";
    const std::vector<uint8_t> bytes = all_bytes();

    ScreenFrame frame;
    frame.frame_id = UNICODE_TEXT;
    frame.timestamp = TEST_STAMP;
    frame.data = bytes;
    frame.width = 1920;
    frame.height = 1080;
    frame.format = PixelFormat::JPEG;
    frame.quality = 42;
    auto frame_out = round_trip(frame);
    if (!frame_out || frame_out->frame_id != frame.frame_id || frame_out->timestamp != TEST_STAMP ||
        frame_out->data != bytes || frame_out->width != 1920 || frame_out->height != 1080 ||
        frame_out->format != PixelFormat::JPEG || frame_out->quality != 42 || frame_out->is_delta ||
        frame_out->reference_frame_id || !frame_out->regions.empty()) {
        return fail(name, "screen frame fields lost");
    }

    deskstream::AudioChunk audio;
    audio.data = bytes;
    audio.sample_rate = 44100;
    audio.channels = 1;
    audio.bits_per_sample = 24;
    audio.duration_ms = -20;
    audio.format = "Opus";
    audio.timestamp = TEST_STAMP;
    auto audio_out = round_trip(audio);
    if (!audio_out || audio_out->data != bytes || audio_out->sample_rate != 44100 ||
        audio_out->channels != 1 || audio_out->bits_per_sample != 24 || audio_out->duration_ms != -20 ||
        audio_out->format != "Opus" || audio_out->timestamp != TEST_STAMP) {
        return fail(name, "audio chunk fields lost");
    }

    deskstream::ClipboardData clip;
    clip.content_type = deskstream::ClipboardContentType::IMAGE;
    clip.text = UNICODE_TEXT;
    clip.image_data = bytes;
    clip.timestamp = TEST_STAMP;
    auto clip_out = round_trip(clip);
    if (!clip_out || clip_out->content_type != deskstream::ClipboardContentType::IMAGE ||
        clip_out->text != UNICODE_TEXT || clip_out->image_data != bytes || clip_out->timestamp != TEST_STAMP) {
        return fail(name, "clipboard fields lost");
    }

    deskstream::ConnectionQuality quality;
    quality.fps = 29.97;
    quality.bandwidth = -1;
    quality.latency_ms = 1234567890123LL;
    quality.timestamp = deskstream::from_unix_ms(-5000);
    quality.rating = deskstream::QualityRating::GOOD;
    auto quality_out = round_trip(quality);
    if (!quality_out || quality_out->fps != 29.97 || quality_out->bandwidth != -1 ||
        quality_out->latency_ms != 1234567890123LL ||
        quality_out->timestamp != deskstream::from_unix_ms(-5000) ||
        quality_out->rating != deskstream::QualityRating::GOOD) {
        return fail(name, "connection quality fields lost");
    }
    return 0;
}

int test_round_trip_control_messages() {
    const char* name = "test_round_trip_control_messages";

    deskstream::InputEvent input;
    input.event_id = "evt-7";
    input.timestamp = TEST_STAMP;
    input.type = deskstream::InputEventType::TEXT_INPUT;
    input.x = -120;
    input.y = -1;
    input.key_code = "AltGr";
    input.pressed = true;
    input.text = UNICODE_TEXT;
    auto input_out = round_trip(input);
    if (!input_out || input_out->event_id != "evt-7" || input_out->timestamp != TEST_STAMP ||
        input_out->type != deskstream::InputEventType::TEXT_INPUT || input_out->x != -120 ||
        input_out->y != -1 || input_out->key_code != "AltGr" || !input_out->pressed ||
        input_out->text != UNICODE_TEXT) {
        return fail(name, "input event fields lost");
    }

    deskstream::ChatMessage chat;
    chat.message_id = "m-1";
    chat.sender_id = "viewer";
    chat.sender_name = UNICODE_TEXT;
    chat.text = std::string("line\0one\nline two", 17);
    chat.timestamp = TEST_STAMP;
    chat.read = true;
    chat.message_type = "system";
    auto chat_out = round_trip(chat);
    if (!chat_out || chat_out->message_id != "m-1" || chat_out->sender_id != "viewer" ||
        chat_out->sender_name != UNICODE_TEXT || chat_out->text != chat.text || chat_out->timestamp != TEST_STAMP ||
        !chat_out->read || chat_out->message_type != "system") {
        return fail(name, "chat message fields lost");
    }

    deskstream::PairingRequest request;
    request.client_id = "viewer";
    request.client_name = UNICODE_TEXT;
    request.pin = "000000";
    request.session_token = "token";
    request.requested_at = TEST_STAMP;
    auto request_out = round_trip(request);
    if (!request_out || request_out->client_id != "viewer" || request_out->client_name != UNICODE_TEXT ||
        request_out->pin != "000000" || request_out->session_token != "token" ||
        request_out->requested_at != TEST_STAMP) {
        return fail(name, "pairing request fields lost");
    }

    deskstream::PairingResponse response;
    response.success = false;
    response.session_token = "";
    response.failure_reason = deskstream::PairingFailureReason::TOO_MANY_ATTEMPTS;
    response.message = UNICODE_TEXT;
    auto response_out = round_trip(response);
    if (!response_out || response_out->success || !response_out->session_token.empty() ||
        response_out->failure_reason != deskstream::PairingFailureReason::TOO_MANY_ATTEMPTS ||
        response_out->message != UNICODE_TEXT) {
        return fail(name, "pairing response fields lost");
    }

    deskstream::FrameAck ack;
    ack.frame_id = UNICODE_TEXT;
    ack.sent_at = TEST_STAMP;
    ack.request_full_frame = true;
    auto ack_out = round_trip(ack);
    if (!ack_out || ack_out->frame_id != UNICODE_TEXT || ack_out->sent_at != TEST_STAMP || !ack_out->request_full_frame) {
        return fail(name, "frame ack fields lost");
    }
    return 0;
}

int test_round_trip_file_transfer_messages() {
    const char* name = "test_round_trip_file_transfer_messages";

    deskstream::FileTransferRequest request;
    request.transfer_id = "xfer-1";
    request.file_name = UNICODE_TEXT;
    request.file_size = -42;
    request.mime_type = "image/png";
    request.direction = deskstream::FileTransferDirection::DOWNLOAD;
    request.timestamp = TEST_STAMP;
    auto request_out = round_trip(request);
    if (!request_out || request_out->transfer_id != "xfer-1" || request_out->file_name != UNICODE_TEXT ||
        request_out->file_size != -42 || request_out->mime_type != "image/png" ||
        request_out->direction != deskstream::FileTransferDirection::DOWNLOAD ||
        request_out->timestamp != TEST_STAMP) {
        return fail(name, "transfer request fields lost");
    }

    deskstream::FileTransferResponse response;
    response.transfer_id = "xfer-1";
    response.accepted = false;
    response.rejection = deskstream::FileTransferRejection::ERROR;
    response.message = UNICODE_TEXT;
    auto response_out = round_trip(response);
    if (!response_out || response_out->transfer_id != "xfer-1" || response_out->accepted ||
        response_out->rejection != deskstream::FileTransferRejection::ERROR ||
        response_out->message != UNICODE_TEXT) {
        return fail(name, "transfer response fields lost");
    }

    deskstream::FileTransferChunk chunk;
    chunk.transfer_id = "xfer-1";
    chunk.offset = 1LL << 40;
    chunk.data = all_bytes();
    chunk.last_chunk = true;
    auto chunk_out = round_trip(chunk);
    if (!chunk_out || chunk_out->transfer_id != "xfer-1" || chunk_out->offset != (1LL << 40) ||
        chunk_out->data != all_bytes() || !chunk_out->last_chunk) {
        return fail(name, "transfer chunk fields lost");
    }

    deskstream::FileTransferComplete complete;
    complete.transfer_id = "xfer-1";
    complete.success = true;
    complete.error_message = "";
    complete.saved_path = std::string("/tmp/") + UNICODE_TEXT;
    auto complete_out = round_trip(complete);
    if (!complete_out || complete_out->transfer_id != "xfer-1" || !complete_out->success ||
        !complete_out->error_message.empty() || complete_out->saved_path != complete.saved_path) {
        return fail(name, "transfer completion fields lost");
    }
    return 0;
}

int test_type_names() {
    if (std::string(deskstream::message_type_name(MessageType::SCREEN_FRAME)) != "screen-frame" ||
        std::string(deskstream::message_type_name(MessageType::FRAME_ACK)) != "frame-ack") {
        return fail("test_type_names", "unexpected type name");
    }
    if (deskstream::message_type_of<deskstream::PairingRequest>() != MessageType::PAIRING_REQUEST ||
        deskstream::message_type_of<deskstream::FrameAck>() != MessageType::FRAME_ACK) {
        return fail("test_type_names", "variant order does not match tags");
    }
    TransportMessage message = deskstream::ChatMessage{};
    if (deskstream::message_type_of(message) != MessageType::CHAT_MESSAGE) {
        return fail("test_type_names", "runtime tag mismatch");
    }
    return 0;
}

}  // namespace

int main() {
    if (int rc = test_header_parsing(); rc != 0) {
        return rc;
    }
    if (int rc = test_frame_layout(); rc != 0) {
        return rc;
    }
    if (int rc = test_malformed_payloads(); rc != 0) {
        return rc;
    }
    if (int rc = test_screen_frame_invariants(); rc != 0) {
        return rc;
    }
    if (int rc = test_large_region_count_validates_quickly(); rc != 0) {
        return rc;
    }
    if (int rc = test_round_trip_media_messages(); rc != 0) {
        return rc;
    }
    if (int rc = test_round_trip_control_messages(); rc != 0) {
        return rc;
    }
    if (int rc = test_round_trip_file_transfer_messages(); rc != 0) {
        return rc;
    }
    if (int rc = test_type_names(); rc != 0) {
        return rc;
    }

    std::cout << "[PASS] protocol unit tests\n";
    return 0;
}
