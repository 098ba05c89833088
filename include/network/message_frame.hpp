#ifndef STUBCAS_NETWORK_MESSAGE_FRAME_HPP
#define STUBCAS_NETWORK_MESSAGE_FRAME_HPP

#include <cstdint>
#include <string>
#include <utility>

namespace stubcas {
namespace network {

// Message type used to route frames to RPC methods
enum class MessageType : uint8_t {
    READ_REQUEST = 0x01,
    READ_RESPONSE = 0x02,
    WRITE_REQUEST = 0x03,
    WRITE_RESPONSE = 0x04,
    QUERY_WRITE_STATUS_REQUEST = 0x05,
    QUERY_WRITE_STATUS_RESPONSE = 0x06,
    FIND_MISSING_BLOBS_REQUEST = 0x07,
    FIND_MISSING_BLOBS_RESPONSE = 0x08,
    BATCH_UPDATE_BLOBS_REQUEST = 0x09,
    BATCH_UPDATE_BLOBS_RESPONSE = 0x0A,
    GET_TREE_REQUEST = 0x0B,
    GET_TREE_RESPONSE = 0x0C,
    STREAM_END = 0x0D,
    STATUS = 0x0E
};

inline const char* message_type_to_string(MessageType type) {
    switch (type) {
        case MessageType::READ_REQUEST: return "READ_REQUEST";
        case MessageType::READ_RESPONSE: return "READ_RESPONSE";
        case MessageType::WRITE_REQUEST: return "WRITE_REQUEST";
        case MessageType::WRITE_RESPONSE: return "WRITE_RESPONSE";
        case MessageType::QUERY_WRITE_STATUS_REQUEST: return "QUERY_WRITE_STATUS_REQUEST";
        case MessageType::QUERY_WRITE_STATUS_RESPONSE: return "QUERY_WRITE_STATUS_RESPONSE";
        case MessageType::FIND_MISSING_BLOBS_REQUEST: return "FIND_MISSING_BLOBS_REQUEST";
        case MessageType::FIND_MISSING_BLOBS_RESPONSE: return "FIND_MISSING_BLOBS_RESPONSE";
        case MessageType::BATCH_UPDATE_BLOBS_REQUEST: return "BATCH_UPDATE_BLOBS_REQUEST";
        case MessageType::BATCH_UPDATE_BLOBS_RESPONSE: return "BATCH_UPDATE_BLOBS_RESPONSE";
        case MessageType::GET_TREE_REQUEST: return "GET_TREE_REQUEST";
        case MessageType::GET_TREE_RESPONSE: return "GET_TREE_RESPONSE";
        case MessageType::STREAM_END: return "STREAM_END";
        case MessageType::STATUS: return "STATUS";
        default: return "UNDEFINED";
    }
}

// Data structure used to represent a frame locally
struct MessageFrame {
    MessageType message_type{MessageType::STATUS};
    uint64_t payload_size{0};
    std::string payload;
};

inline MessageFrame make_frame(MessageType type, std::string payload) {
    MessageFrame frame;
    frame.message_type = type;
    frame.payload_size = payload.size();
    frame.payload = std::move(payload);
    return frame;
}

} // namespace network
} // namespace stubcas

#endif // STUBCAS_NETWORK_MESSAGE_FRAME_HPP
