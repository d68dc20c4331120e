#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>
#include "../util/clock.hpp"

namespace deskstream {

// Peer description supplied by discovery. Read-only to the core.
enum class DeviceKind : uint8_t {
    UNKNOWN = 0,
    DESKTOP = 1,
    MOBILE = 2
};

struct DeviceInfo {
    std::string device_id;
    std::string device_name;
    std::string ip_address;
    uint16_t port = 0;
    DeviceKind kind = DeviceKind::UNKNOWN;
    Timestamp last_seen;
    bool online = false;
};

enum class PixelFormat : uint8_t {
    JPEG = 0,
    PNG = 1,
    RAW = 2       // BGRA, width * 4 bytes per row
};

struct DeltaRegion {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;
    uint32_t data_offset = 0;   // Into the frame payload
    uint32_t data_length = 0;

    bool operator==(const DeltaRegion& o) const {
        return x == o.x && y == o.y && width == o.width && height == o.height &&
               data_offset == o.data_offset && data_length == o.data_length;
    }
};

struct ScreenFrame {
    std::string frame_id;
    Timestamp timestamp;
    std::vector<uint8_t> data;
    int width = 0;
    int height = 0;
    PixelFormat format = PixelFormat::RAW;
    int quality = 75;
    bool is_delta = false;
    std::optional<std::string> reference_frame_id;  // Set iff is_delta
    std::vector<DeltaRegion> regions;               // Non-empty only for deltas
};

enum class InputEventType : uint8_t {
    MOUSE_MOVE = 0,
    MOUSE_CLICK = 1,
    MOUSE_WHEEL = 2,
    KEY_PRESS = 3,
    KEY_RELEASE = 4,
    TEXT_INPUT = 5
};

struct InputEvent {
    std::string event_id;
    Timestamp timestamp;
    InputEventType type = InputEventType::MOUSE_MOVE;
    int x = 0;
    int y = 0;
    std::string key_code;
    bool pressed = false;
    std::string text;
};

struct PairingRequest {
    std::string client_id;
    std::string client_name;
    std::string pin;
    std::string session_token;   // Non-empty when resuming a dropped session
    Timestamp requested_at;
};

enum class PairingFailureReason : uint8_t {
    NONE = 0,
    INVALID_PIN = 1,
    PIN_EXPIRED = 2,
    TOO_MANY_ATTEMPTS = 3,
    HOST_REFUSED = 4
};

struct PairingResponse {
    bool success = false;
    std::string session_token;
    PairingFailureReason failure_reason = PairingFailureReason::NONE;
    std::string message;
};

enum class QualityRating : uint8_t {
    EXCELLENT = 0,
    GOOD = 1,
    FAIR = 2,
    POOR = 3
};

struct ConnectionQuality {
    double fps = 0.0;
    int64_t bandwidth = 0;     // Bytes per second
    int64_t latency_ms = 0;
    Timestamp timestamp;
    QualityRating rating = QualityRating::POOR;
};

// Coarse classification for display; never used for control decisions
QualityRating calculate_rating(double fps, int64_t latency_ms, int64_t bandwidth);
const char* quality_rating_name(QualityRating rating);

enum class ClipboardContentType : uint8_t {
    NONE = 0,
    TEXT = 1,
    IMAGE = 2
};

struct ClipboardData {
    ClipboardContentType content_type = ClipboardContentType::NONE;
    std::string text;
    std::vector<uint8_t> image_data;
    Timestamp timestamp;
};

enum class FileTransferDirection : uint8_t {
    UPLOAD = 0,
    DOWNLOAD = 1
};

enum class FileTransferRejection : uint8_t {
    NONE = 0,
    FILE_TOO_LARGE = 1,
    FILE_TYPE_NOT_ALLOWED = 2,
    INSUFFICIENT_DISK_SPACE = 3,
    USER_DECLINED = 4,
    INVALID_PATH = 5,
    ERROR = 6
};

struct FileTransferRequest {
    std::string transfer_id;
    std::string file_name;
    int64_t file_size = 0;
    std::string mime_type = "application/octet-stream";
    FileTransferDirection direction = FileTransferDirection::UPLOAD;
    Timestamp timestamp;
};

struct FileTransferResponse {
    std::string transfer_id;
    bool accepted = false;
    FileTransferRejection rejection = FileTransferRejection::NONE;
    std::string message;
};

struct FileTransferChunk {
    std::string transfer_id;
    int64_t offset = 0;
    std::vector<uint8_t> data;
    bool last_chunk = false;
};

struct FileTransferComplete {
    std::string transfer_id;
    bool success = false;
    std::string error_message;
    std::string saved_path;
};

struct AudioChunk {
    std::vector<uint8_t> data;
    int sample_rate = 48000;
    int channels = 2;
    int bits_per_sample = 16;
    int duration_ms = 0;
    std::string format = "PCM";
    Timestamp timestamp;
};

struct ChatMessage {
    std::string message_id;
    std::string sender_id;
    std::string sender_name;
    std::string text;
    Timestamp timestamp;
    bool read = false;
    std::string message_type;
};

// Viewer -> host receipt for a screen frame. sent_at echoes the frame
// timestamp so the host can measure round-trip latency on its own clock.
struct FrameAck {
    std::string frame_id;
    Timestamp sent_at;
    bool request_full_frame = false;
};

// Wire type tags. Values are part of the protocol; append only.
enum class MessageType : uint8_t {
    SCREEN_FRAME = 0x01,
    INPUT_EVENT = 0x02,
    PAIRING_REQUEST = 0x03,
    PAIRING_RESPONSE = 0x04,
    CONNECTION_QUALITY = 0x05,
    CLIPBOARD = 0x06,
    FILE_TRANSFER_REQUEST = 0x07,
    FILE_TRANSFER_RESPONSE = 0x08,
    FILE_TRANSFER_CHUNK = 0x09,
    FILE_TRANSFER_COMPLETE = 0x0A,
    AUDIO_CHUNK = 0x0B,
    CHAT_MESSAGE = 0x0C,
    FRAME_ACK = 0x0D
};

// Variant order must match MessageType (index + 1 == tag)
using TransportMessage = std::variant<
    ScreenFrame,
    InputEvent,
    PairingRequest,
    PairingResponse,
    ConnectionQuality,
    ClipboardData,
    FileTransferRequest,
    FileTransferResponse,
    FileTransferChunk,
    FileTransferComplete,
    AudioChunk,
    ChatMessage,
    FrameAck>;

constexpr uint8_t MESSAGE_TYPE_COUNT = std::variant_size_v<TransportMessage>;

namespace detail {
template <typename T, typename... Ts>
struct type_index;

template <typename T, typename... Ts>
struct type_index<T, T, Ts...> : std::integral_constant<size_t, 0> {};

template <typename T, typename U, typename... Ts>
struct type_index<T, U, Ts...> : std::integral_constant<size_t, 1 + type_index<T, Ts...>::value> {};

template <typename T, typename V>
struct variant_index;

template <typename T, typename... Ts>
struct variant_index<T, std::variant<Ts...>> : type_index<T, Ts...> {};
}  // namespace detail

template <typename T>
constexpr MessageType message_type_of() {
    return static_cast<MessageType>(detail::variant_index<T, TransportMessage>::value + 1);
}

inline MessageType message_type_of(const TransportMessage& msg) {
    return static_cast<MessageType>(msg.index() + 1);
}

const char* message_type_name(MessageType type);

}  // namespace deskstream
