#ifndef STUBCAS_NETWORK_CODEC_HPP
#define STUBCAS_NETWORK_CODEC_HPP

#include <cstdint>
#include <iostream>
#include <optional>
#include <boost/endian/conversion.hpp>
#include "network/message_frame.hpp"
#include "network/network_error.hpp"

namespace stubcas {
namespace network {

// Frame layout: message type (1 byte), payload size (8 bytes, big-endian), payload
class Codec {
public:
  static constexpr std::size_t HEADER_SIZE = sizeof(uint8_t) + sizeof(uint64_t);
  static constexpr uint64_t DEFAULT_MAX_PAYLOAD_SIZE = 256ull * 1024 * 1024;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Codec(uint64_t max_payload_size = DEFAULT_MAX_PAYLOAD_SIZE);


  // ---- SERIALIZATION AND DESERIALIZATION ----
  // Serializes a message frame to an output stream, returns bytes written
  std::size_t serialize(const MessageFrame& frame, std::ostream& output);
  // Deserializes the next frame, nullopt when the stream ends cleanly between frames
  std::optional<MessageFrame> deserialize(std::istream& input);

private:
  // ---- PARAMETERS ----
  uint64_t max_payload_size_;


  // ---- STREAM OPERATIONS ----
  // Writes bytes to an output stream
  void write_bytes(std::ostream& output, const void* data, std::size_t size);
  // Reads bytes from an input stream
  void read_bytes(std::istream& input, void* data, std::size_t size);


  // ---- HOST TO NETWORK BYTE ORDER CONVERSION ----
  static uint64_t to_network_order(uint64_t host_value) {
    return boost::endian::native_to_big(host_value);
  }
  static uint64_t from_network_order(uint64_t network_value) {
    return boost::endian::big_to_native(network_value);
  }
};

} // namespace network
} // namespace stubcas

#endif // STUBCAS_NETWORK_CODEC_HPP
