#ifndef STUBCAS_NETWORK_WIRE_FORMAT_HPP
#define STUBCAS_NETWORK_WIRE_FORMAT_HPP

#include <cstdint>
#include <string>
#include "cas/messages.hpp"
#include "cas/status.hpp"
#include "network/network_error.hpp"

namespace stubcas {
namespace network {

// Appends big-endian fields to a payload buffer
class PayloadWriter {
public:
  explicit PayloadWriter(std::string& output) : output_(output) {}

  void write_uint32(uint32_t value);
  void write_uint64(uint64_t value);
  void write_int64(int64_t value);
  void write_bool(bool value);
  // Length-prefixed with a uint32
  void write_string(const std::string& value);
  void write_digest(const cas::WireDigest& digest);

private:
  std::string& output_;

  void write_bytes(const void* data, std::size_t size);
};

// Reads fields back from a payload buffer, throws CodecError on truncation
class PayloadReader {
public:
  explicit PayloadReader(const std::string& input) : input_(input) {}

  uint32_t read_uint32();
  uint64_t read_uint64();
  int64_t read_int64();
  bool read_bool();
  std::string read_string();
  cas::WireDigest read_digest();

  std::size_t remaining() const { return input_.size() - position_; }
  // Throws CodecError if unread bytes are left
  void expect_end() const;

private:
  const std::string& input_;
  std::size_t position_{0};

  void read_bytes(void* data, std::size_t size);
};


// ---- MESSAGE ENCODING ----
void encode(const cas::ReadRequest& message, PayloadWriter& writer);
void encode(const cas::ReadResponse& message, PayloadWriter& writer);
void encode(const cas::WriteRequest& message, PayloadWriter& writer);
void encode(const cas::WriteResponse& message, PayloadWriter& writer);
void encode(const cas::QueryWriteStatusRequest& message, PayloadWriter& writer);
void encode(const cas::QueryWriteStatusResponse& message, PayloadWriter& writer);
void encode(const cas::FindMissingBlobsRequest& message, PayloadWriter& writer);
void encode(const cas::FindMissingBlobsResponse& message, PayloadWriter& writer);
void encode(const cas::BatchUpdateBlobsRequest& message, PayloadWriter& writer);
void encode(const cas::BatchUpdateBlobsResponse& message, PayloadWriter& writer);
void encode(const cas::GetTreeRequest& message, PayloadWriter& writer);
void encode(const cas::GetTreeResponse& message, PayloadWriter& writer);
void encode(const cas::Status& message, PayloadWriter& writer);


// ---- MESSAGE DECODING ----
void decode(PayloadReader& reader, cas::ReadRequest& message);
void decode(PayloadReader& reader, cas::ReadResponse& message);
void decode(PayloadReader& reader, cas::WriteRequest& message);
void decode(PayloadReader& reader, cas::WriteResponse& message);
void decode(PayloadReader& reader, cas::QueryWriteStatusRequest& message);
void decode(PayloadReader& reader, cas::QueryWriteStatusResponse& message);
void decode(PayloadReader& reader, cas::FindMissingBlobsRequest& message);
void decode(PayloadReader& reader, cas::FindMissingBlobsResponse& message);
void decode(PayloadReader& reader, cas::BatchUpdateBlobsRequest& message);
void decode(PayloadReader& reader, cas::BatchUpdateBlobsResponse& message);
void decode(PayloadReader& reader, cas::GetTreeRequest& message);
void decode(PayloadReader& reader, cas::GetTreeResponse& message);
void decode(PayloadReader& reader, cas::Status& message);


template <typename Message>
std::string encode_payload(const Message& message) {
  std::string payload;
  PayloadWriter writer(payload);
  encode(message, writer);
  return payload;
}

// The whole payload must be consumed by the message
template <typename Message>
Message decode_payload(const std::string& payload) {
  PayloadReader reader(payload);
  Message message;
  decode(reader, message);
  reader.expect_end();
  return message;
}

} // namespace network
} // namespace stubcas

#endif // STUBCAS_NETWORK_WIRE_FORMAT_HPP
