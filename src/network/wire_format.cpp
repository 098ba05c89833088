#include "network/wire_format.hpp"
#include <cstring>
#include <limits>
#include <boost/endian/conversion.hpp>
#include <boost/log/trivial.hpp>

namespace stubcas {
namespace network {

//==============================================
// PAYLOAD WRITER
//==============================================

void PayloadWriter::write_uint32(uint32_t value) {
  uint32_t network_value = boost::endian::native_to_big(value);
  write_bytes(&network_value, sizeof(network_value));
}

void PayloadWriter::write_uint64(uint64_t value) {
  uint64_t network_value = boost::endian::native_to_big(value);
  write_bytes(&network_value, sizeof(network_value));
}

void PayloadWriter::write_int64(int64_t value) {
  write_uint64(static_cast<uint64_t>(value));
}

void PayloadWriter::write_bool(bool value) {
  uint8_t byte = value ? 1 : 0;
  write_bytes(&byte, sizeof(byte));
}

void PayloadWriter::write_string(const std::string& value) {
  if (value.size() > std::numeric_limits<uint32_t>::max()) {
    throw CodecError("Wire format: Field of " + std::to_string(value.size()) + " bytes is too large");
  }
  write_uint32(static_cast<uint32_t>(value.size()));
  write_bytes(value.data(), value.size());
}

void PayloadWriter::write_digest(const cas::WireDigest& digest) {
  write_string(digest.hash);
  write_int64(digest.size_bytes);
}

void PayloadWriter::write_bytes(const void* data, std::size_t size) {
  output_.append(static_cast<const char*>(data), size);
}


//==============================================
// PAYLOAD READER
//==============================================

uint32_t PayloadReader::read_uint32() {
  uint32_t network_value;
  read_bytes(&network_value, sizeof(network_value));
  return boost::endian::big_to_native(network_value);
}

uint64_t PayloadReader::read_uint64() {
  uint64_t network_value;
  read_bytes(&network_value, sizeof(network_value));
  return boost::endian::big_to_native(network_value);
}

int64_t PayloadReader::read_int64() {
  return static_cast<int64_t>(read_uint64());
}

bool PayloadReader::read_bool() {
  uint8_t byte;
  read_bytes(&byte, sizeof(byte));
  if (byte > 1) {
    throw CodecError("Wire format: Invalid boolean value " + std::to_string(byte));
  }
  return byte == 1;
}

std::string PayloadReader::read_string() {
  uint32_t length = read_uint32();
  // Checked before allocating
  if (length > remaining()) {
    BOOST_LOG_TRIVIAL(error) << "Wire format: Field length " << length << " exceeds remaining "
                             << remaining() << " bytes";
    throw CodecError("Wire format: Truncated field");
  }
  std::string value = input_.substr(position_, length);
  position_ += length;
  return value;
}

cas::WireDigest PayloadReader::read_digest() {
  cas::WireDigest digest;
  digest.hash = read_string();
  digest.size_bytes = read_int64();
  return digest;
}

void PayloadReader::expect_end() const {
  if (remaining() != 0) {
    BOOST_LOG_TRIVIAL(error) << "Wire format: " << remaining() << " trailing bytes in payload";
    throw CodecError("Wire format: Trailing bytes in payload");
  }
}

void PayloadReader::read_bytes(void* data, std::size_t size) {
  if (size > remaining()) {
    BOOST_LOG_TRIVIAL(error) << "Wire format: Failed to read " << size << " bytes, "
                             << remaining() << " remaining";
    throw CodecError("Wire format: Truncated payload");
  }
  std::memcpy(data, input_.data() + position_, size);
  position_ += size;
}

namespace {

// Count prefix of a list, bounded by the bytes left so a bogus count fails fast
uint32_t read_count(PayloadReader& reader, std::size_t min_element_size) {
  uint32_t count = reader.read_uint32();
  if (static_cast<uint64_t>(count) * min_element_size > reader.remaining()) {
    throw CodecError("Wire format: List of " + std::to_string(count) + " elements is truncated");
  }
  return count;
}

// Smallest encoding of a digest: empty hash length plus size
constexpr std::size_t MIN_DIGEST_SIZE = sizeof(uint32_t) + sizeof(int64_t);

void write_count(PayloadWriter& writer, std::size_t count) {
  if (count > std::numeric_limits<uint32_t>::max()) {
    throw CodecError("Wire format: List of " + std::to_string(count) + " elements is too large");
  }
  writer.write_uint32(static_cast<uint32_t>(count));
}

} // namespace


//==============================================
// MESSAGE ENCODING
//==============================================

void encode(const cas::ReadRequest& message, PayloadWriter& writer) {
  writer.write_string(message.resource_name);
  writer.write_int64(message.read_offset);
  writer.write_int64(message.read_limit);
}

void encode(const cas::ReadResponse& message, PayloadWriter& writer) {
  writer.write_string(message.data);
}

void encode(const cas::WriteRequest& message, PayloadWriter& writer) {
  writer.write_string(message.resource_name);
  writer.write_int64(message.write_offset);
  writer.write_bool(message.finish_write);
  writer.write_string(message.data);
}

void encode(const cas::WriteResponse& message, PayloadWriter& writer) {
  writer.write_int64(message.committed_size);
}

void encode(const cas::QueryWriteStatusRequest& message, PayloadWriter& writer) {
  writer.write_string(message.resource_name);
}

void encode(const cas::QueryWriteStatusResponse& message, PayloadWriter& writer) {
  writer.write_int64(message.committed_size);
  writer.write_bool(message.complete);
}

void encode(const cas::FindMissingBlobsRequest& message, PayloadWriter& writer) {
  writer.write_string(message.instance_name);
  write_count(writer, message.blob_digests.size());
  for (const auto& digest : message.blob_digests) {
    writer.write_digest(digest);
  }
}

void encode(const cas::FindMissingBlobsResponse& message, PayloadWriter& writer) {
  write_count(writer, message.missing_blob_digests.size());
  for (const auto& digest : message.missing_blob_digests) {
    writer.write_digest(digest);
  }
}

void encode(const cas::BatchUpdateBlobsRequest& message, PayloadWriter& writer) {
  writer.write_string(message.instance_name);
  write_count(writer, message.requests.size());
  for (const auto& request : message.requests) {
    writer.write_digest(request.digest);
    writer.write_string(request.data);
  }
}

void encode(const cas::BatchUpdateBlobsResponse& message, PayloadWriter& writer) {
  write_count(writer, message.responses.size());
  for (const auto& response : message.responses) {
    writer.write_digest(response.digest);
    encode(response.status, writer);
  }
}

void encode(const cas::GetTreeRequest& message, PayloadWriter& writer) {
  writer.write_string(message.instance_name);
  writer.write_digest(message.root_digest);
  writer.write_int64(message.page_size);
  writer.write_string(message.page_token);
}

void encode(const cas::GetTreeResponse& message, PayloadWriter& writer) {
  write_count(writer, message.directories.size());
  for (const auto& directory : message.directories) {
    writer.write_string(directory);
  }
  writer.write_string(message.next_page_token);
}

void encode(const cas::Status& message, PayloadWriter& writer) {
  writer.write_uint32(static_cast<uint32_t>(message.code));
  writer.write_string(message.message);
}


//==============================================
// MESSAGE DECODING
//==============================================

void decode(PayloadReader& reader, cas::ReadRequest& message) {
  message.resource_name = reader.read_string();
  message.read_offset = reader.read_int64();
  message.read_limit = reader.read_int64();
}

void decode(PayloadReader& reader, cas::ReadResponse& message) {
  message.data = reader.read_string();
}

void decode(PayloadReader& reader, cas::WriteRequest& message) {
  message.resource_name = reader.read_string();
  message.write_offset = reader.read_int64();
  message.finish_write = reader.read_bool();
  message.data = reader.read_string();
}

void decode(PayloadReader& reader, cas::WriteResponse& message) {
  message.committed_size = reader.read_int64();
}

void decode(PayloadReader& reader, cas::QueryWriteStatusRequest& message) {
  message.resource_name = reader.read_string();
}

void decode(PayloadReader& reader, cas::QueryWriteStatusResponse& message) {
  message.committed_size = reader.read_int64();
  message.complete = reader.read_bool();
}

void decode(PayloadReader& reader, cas::FindMissingBlobsRequest& message) {
  message.instance_name = reader.read_string();
  uint32_t count = read_count(reader, MIN_DIGEST_SIZE);
  message.blob_digests.clear();
  message.blob_digests.reserve(count);
  for (uint32_t i = 0; i < count; ++i) {
    message.blob_digests.push_back(reader.read_digest());
  }
}

void decode(PayloadReader& reader, cas::FindMissingBlobsResponse& message) {
  uint32_t count = read_count(reader, MIN_DIGEST_SIZE);
  message.missing_blob_digests.clear();
  message.missing_blob_digests.reserve(count);
  for (uint32_t i = 0; i < count; ++i) {
    message.missing_blob_digests.push_back(reader.read_digest());
  }
}

void decode(PayloadReader& reader, cas::BatchUpdateBlobsRequest& message) {
  message.instance_name = reader.read_string();
  uint32_t count = read_count(reader, MIN_DIGEST_SIZE + sizeof(uint32_t));
  message.requests.clear();
  message.requests.reserve(count);
  for (uint32_t i = 0; i < count; ++i) {
    cas::BatchUpdateBlobsRequest::Request request;
    request.digest = reader.read_digest();
    request.data = reader.read_string();
    message.requests.push_back(std::move(request));
  }
}

void decode(PayloadReader& reader, cas::BatchUpdateBlobsResponse& message) {
  uint32_t count = read_count(reader, MIN_DIGEST_SIZE + 2 * sizeof(uint32_t));
  message.responses.clear();
  message.responses.reserve(count);
  for (uint32_t i = 0; i < count; ++i) {
    cas::BatchUpdateBlobsResponse::Response response;
    response.digest = reader.read_digest();
    decode(reader, response.status);
    message.responses.push_back(std::move(response));
  }
}

void decode(PayloadReader& reader, cas::GetTreeRequest& message) {
  message.instance_name = reader.read_string();
  message.root_digest = reader.read_digest();
  message.page_size = reader.read_int64();
  message.page_token = reader.read_string();
}

void decode(PayloadReader& reader, cas::GetTreeResponse& message) {
  uint32_t count = read_count(reader, sizeof(uint32_t));
  message.directories.clear();
  message.directories.reserve(count);
  for (uint32_t i = 0; i < count; ++i) {
    message.directories.push_back(reader.read_string());
  }
  message.next_page_token = reader.read_string();
}

void decode(PayloadReader& reader, cas::Status& message) {
  message.code = cas::status_code_from_wire(reader.read_uint32());
  message.message = reader.read_string();
}

} // namespace network
} // namespace stubcas
