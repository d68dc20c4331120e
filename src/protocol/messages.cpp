#include "messages.hpp"

namespace deskstream {

QualityRating calculate_rating(double fps, int64_t latency_ms, int64_t bandwidth) {
    constexpr int64_t MIB = 1024 * 1024;

    if (fps >= 25 && latency_ms < 50 && bandwidth > 3 * MIB) {
        return QualityRating::EXCELLENT;
    }
    if (fps >= 15 && latency_ms < 100 && bandwidth > 1 * MIB) {
        return QualityRating::GOOD;
    }
    if (fps >= 10 && latency_ms < 200) {
        return QualityRating::FAIR;
    }
    return QualityRating::POOR;
}

const char* quality_rating_name(QualityRating rating) {
    switch (rating) {
        case QualityRating::EXCELLENT: return "excellent";
        case QualityRating::GOOD:      return "good";
        case QualityRating::FAIR:      return "fair";
        case QualityRating::POOR:      return "poor";
    }
    return "unknown";
}

const char* message_type_name(MessageType type) {
    switch (type) {
        case MessageType::SCREEN_FRAME:           return "screen-frame";
        case MessageType::INPUT_EVENT:            return "input-event";
        case MessageType::PAIRING_REQUEST:        return "pairing-request";
        case MessageType::PAIRING_RESPONSE:       return "pairing-response";
        case MessageType::CONNECTION_QUALITY:     return "connection-quality";
        case MessageType::CLIPBOARD:              return "clipboard";
        case MessageType::FILE_TRANSFER_REQUEST:  return "file-transfer-request";
        case MessageType::FILE_TRANSFER_RESPONSE: return "file-transfer-response";
        case MessageType::FILE_TRANSFER_CHUNK:    return "file-transfer-chunk";
        case MessageType::FILE_TRANSFER_COMPLETE: return "file-transfer-complete";
        case MessageType::AUDIO_CHUNK:            return "audio-chunk";
        case MessageType::CHAT_MESSAGE:           return "chat-message";
        case MessageType::FRAME_ACK:              return "frame-ack";
    }
    return "unknown";
}

}  // namespace deskstream
