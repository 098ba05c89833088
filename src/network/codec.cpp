#include "network/codec.hpp"
#include <boost/log/trivial.hpp>

namespace stubcas {
namespace network {

Codec::Codec(uint64_t max_payload_size)
  : max_payload_size_(max_payload_size) {
  BOOST_LOG_TRIVIAL(trace) << "Codec: Initializing Codec with max payload size: " << max_payload_size_;
}

std::size_t Codec::serialize(const MessageFrame& frame, std::ostream& output) {
  if (!output.good()) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Invalid output stream state";
    throw CodecError("Codec: Invalid output stream");
  }

  if (frame.payload_size != frame.payload.size()) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Frame declares " << frame.payload_size
                             << " payload bytes but carries " << frame.payload.size();
    throw CodecError("Codec: Inconsistent payload size");
  }

  std::size_t total_bytes = 0;

  // Write message type
  uint8_t msg_type = static_cast<uint8_t>(frame.message_type);
  write_bytes(output, &msg_type, sizeof(msg_type));
  total_bytes += sizeof(msg_type);

  // Write payload size in network byte order
  uint64_t network_payload_size = to_network_order(frame.payload_size);
  write_bytes(output, &network_payload_size, sizeof(network_payload_size));
  total_bytes += sizeof(network_payload_size);

  // Write payload if present
  if (frame.payload_size > 0) {
    write_bytes(output, frame.payload.data(), frame.payload.size());
    total_bytes += frame.payload.size();
  }

  output.flush();
  if (!output) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Failed to flush output stream";
    throw CodecError("Codec: Failed to flush output stream");
  }

  BOOST_LOG_TRIVIAL(trace) << "Codec: Serialized " << message_type_to_string(frame.message_type)
                           << " frame, total bytes written: " << total_bytes;
  return total_bytes;
}

std::optional<MessageFrame> Codec::deserialize(std::istream& input) {
  // Clean end of stream between frames
  if (input.peek() == std::char_traits<char>::eof()) {
    BOOST_LOG_TRIVIAL(debug) << "Codec: End of input stream";
    return std::nullopt;
  }

  MessageFrame frame;

  // Read message type
  uint8_t msg_type;
  read_bytes(input, &msg_type, sizeof(msg_type));
  frame.message_type = static_cast<MessageType>(msg_type);

  // Read payload size
  uint64_t network_payload_size;
  read_bytes(input, &network_payload_size, sizeof(network_payload_size));
  frame.payload_size = from_network_order(network_payload_size);

  if (frame.payload_size > max_payload_size_) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Payload size " << frame.payload_size
                             << " exceeds limit " << max_payload_size_;
    throw CodecError("Codec: Payload too large");
  }

  // Read payload if present
  if (frame.payload_size > 0) {
    frame.payload.resize(frame.payload_size);
    read_bytes(input, &frame.payload[0], frame.payload.size());
  }

  BOOST_LOG_TRIVIAL(trace) << "Codec: Deserialized " << message_type_to_string(frame.message_type)
                           << " frame, payload size: " << frame.payload_size;
  return frame;
}

void Codec::write_bytes(std::ostream& output, const void* data, std::size_t size) {
  if (!output.write(static_cast<const char*>(data), size)) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Failed to write " << size << " bytes to output stream";
    throw CodecError("Codec: Failed to write to output stream");
  }
}

void Codec::read_bytes(std::istream& input, void* data, std::size_t size) {
  if (!input.read(static_cast<char*>(data), size)) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Failed to read " << size << " bytes from input stream";
    throw CodecError("Codec: Failed to read from input stream");
  }
}

} // namespace network
} // namespace stubcas
