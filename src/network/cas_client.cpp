#include "network/cas_client.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>
#include "network/wire_format.hpp"

namespace stubcas {
namespace network {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CasClient::CasClient(const std::string& address) : address_(address) {
  size_t delimiter_pos = address.rfind(':');
  if (delimiter_pos == std::string::npos) {
    BOOST_LOG_TRIVIAL(error) << "CAS client: Invalid address format: " << address;
    throw std::invalid_argument("CAS client: Address must be host:port, got " + address);
  }
  connect(address.substr(0, delimiter_pos), address.substr(delimiter_pos + 1));
}

CasClient::CasClient(const std::string& host, uint16_t port)
  : address_(host + ":" + std::to_string(port)) {
  connect(host, std::to_string(port));
}

CasClient::~CasClient() {
  close();
}

void CasClient::connect(const std::string& host, const std::string& port) {
  BOOST_LOG_TRIVIAL(info) << "CAS client: Connecting to " << host << ":" << port;
  stream_.connect(host, port);
  if (!stream_) {
    BOOST_LOG_TRIVIAL(error) << "CAS client: Connection to " << address_ << " failed: " << stream_.error().message();
    throw ClientError(cas::StatusCode::UNAVAILABLE, "Failed to connect to " + address_ + ": " + stream_.error().message());
  }
  BOOST_LOG_TRIVIAL(debug) << "CAS client: Connected to " << address_;
}

void CasClient::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (stream_.socket().is_open()) {
    stream_.close();
    BOOST_LOG_TRIVIAL(debug) << "CAS client: Closed connection to " << address_;
  }
}


//==============================================
// BYTESTREAM SERVICE
//==============================================

std::vector<std::string> CasClient::read(const std::string& resource_name) {
  std::lock_guard<std::mutex> lock(mutex_);
  BOOST_LOG_TRIVIAL(debug) << "CAS client: Reading " << resource_name;

  cas::ReadRequest request;
  request.resource_name = resource_name;
  send_frame(make_frame(MessageType::READ_REQUEST, encode_payload(request)));

  std::vector<std::string> chunks;
  while (true) {
    MessageFrame frame = receive_frame();
    if (frame.message_type != MessageType::READ_RESPONSE) {
      expect_ok_status(frame);
      break;
    }
    chunks.push_back(decode_payload<cas::ReadResponse>(frame.payload).data);
  }

  BOOST_LOG_TRIVIAL(debug) << "CAS client: Read " << chunks.size() << " chunks for " << resource_name;
  return chunks;
}

std::string CasClient::read_blob(const hashing::Digest& digest) {
  std::string bytes;
  for (const auto& chunk : read(read_resource_name(digest))) {
    bytes.append(chunk);
  }
  return bytes;
}

int64_t CasClient::write(const std::vector<cas::WriteRequest>& requests) {
  std::lock_guard<std::mutex> lock(mutex_);
  BOOST_LOG_TRIVIAL(debug) << "CAS client: Writing stream of " << requests.size() << " messages";

  for (const auto& request : requests) {
    send_frame(make_frame(MessageType::WRITE_REQUEST, encode_payload(request)));
  }
  send_frame(make_frame(MessageType::STREAM_END, ""));

  MessageFrame frame = receive_frame();
  if (frame.message_type != MessageType::WRITE_RESPONSE) {
    expect_ok_status(frame);
    throw ClientError(cas::StatusCode::INTERNAL, "Write completed without a response");
  }
  auto response = decode_payload<cas::WriteResponse>(frame.payload);
  expect_ok_status(receive_frame());
  return response.committed_size;
}

int64_t CasClient::write_blob(const hashing::Digest& digest, const std::string& bytes, std::size_t chunk_size,
                              const std::string& upload_id, const std::string& instance_name) {
  if (chunk_size == 0) {
    throw std::invalid_argument("CAS client: Chunk size must be positive");
  }

  const std::string resource_name = upload_resource_name(digest, upload_id, instance_name);
  std::vector<cas::WriteRequest> requests;
  std::size_t offset = 0;
  do {
    cas::WriteRequest request;
    request.resource_name = resource_name;
    request.write_offset = static_cast<int64_t>(offset);
    request.data = bytes.substr(offset, chunk_size);
    offset += request.data.size();
    request.finish_write = offset >= bytes.size();
    requests.push_back(std::move(request));
  } while (offset < bytes.size());

  return write(requests);
}

cas::QueryWriteStatusResponse CasClient::query_write_status(const std::string& resource_name) {
  cas::QueryWriteStatusRequest request;
  request.resource_name = resource_name;
  return unary_call<cas::QueryWriteStatusResponse>(
    MessageType::QUERY_WRITE_STATUS_REQUEST, request, MessageType::QUERY_WRITE_STATUS_RESPONSE);
}


//==============================================
// CONTENT ADDRESSABLE STORAGE SERVICE
//==============================================

std::vector<cas::WireDigest> CasClient::find_missing_blobs(const std::vector<cas::WireDigest>& digests,
                                                           const std::string& instance_name) {
  cas::FindMissingBlobsRequest request;
  request.instance_name = instance_name;
  request.blob_digests = digests;
  return unary_call<cas::FindMissingBlobsResponse>(
    MessageType::FIND_MISSING_BLOBS_REQUEST, request, MessageType::FIND_MISSING_BLOBS_RESPONSE)
    .missing_blob_digests;
}

cas::BatchUpdateBlobsResponse CasClient::batch_update_blobs(const cas::BatchUpdateBlobsRequest& request) {
  return unary_call<cas::BatchUpdateBlobsResponse>(
    MessageType::BATCH_UPDATE_BLOBS_REQUEST, request, MessageType::BATCH_UPDATE_BLOBS_RESPONSE);
}

cas::GetTreeResponse CasClient::get_tree(const cas::GetTreeRequest& request) {
  return unary_call<cas::GetTreeResponse>(
    MessageType::GET_TREE_REQUEST, request, MessageType::GET_TREE_RESPONSE);
}


//==============================================
// RESOURCE NAMES
//==============================================

std::string CasClient::read_resource_name(const hashing::Digest& digest) {
  return "/blobs/" + digest.fingerprint.to_hex() + "/" + std::to_string(digest.size_bytes);
}

std::string CasClient::upload_resource_name(const hashing::Digest& digest, const std::string& upload_id,
                                            const std::string& instance_name) {
  return instance_name + "/uploads/" + upload_id + "/blobs/" + digest.fingerprint.to_hex() + "/" +
         std::to_string(digest.size_bytes);
}


//==============================================
// FRAME OPERATIONS
//==============================================

template <typename Response, typename Request>
Response CasClient::unary_call(MessageType request_type, const Request& request, MessageType response_type) {
  std::lock_guard<std::mutex> lock(mutex_);
  BOOST_LOG_TRIVIAL(debug) << "CAS client: Calling " << message_type_to_string(request_type);

  send_frame(make_frame(request_type, encode_payload(request)));

  MessageFrame frame = receive_frame();
  if (frame.message_type != response_type) {
    expect_ok_status(frame);
    throw ClientError(cas::StatusCode::INTERNAL,
      std::string("Call completed without a ") + message_type_to_string(response_type));
  }
  auto response = decode_payload<Response>(frame.payload);
  expect_ok_status(receive_frame());
  return response;
}

void CasClient::send_frame(const MessageFrame& frame) {
  try {
    codec_.serialize(frame, stream_);
  }
  catch (const CodecError& e) {
    throw ClientError(cas::StatusCode::UNAVAILABLE, std::string("Connection lost: ") + e.what());
  }
}

MessageFrame CasClient::receive_frame() {
  std::optional<MessageFrame> frame;
  try {
    frame = codec_.deserialize(stream_);
  }
  catch (const CodecError& e) {
    throw ClientError(cas::StatusCode::UNAVAILABLE, std::string("Connection lost: ") + e.what());
  }
  if (!frame) {
    throw ClientError(cas::StatusCode::UNAVAILABLE, "Connection closed by " + address_);
  }
  return std::move(*frame);
}

void CasClient::expect_ok_status(const MessageFrame& frame) {
  if (frame.message_type != MessageType::STATUS) {
    BOOST_LOG_TRIVIAL(error) << "CAS client: Unexpected " << message_type_to_string(frame.message_type) << " frame";
    throw ClientError(cas::StatusCode::INTERNAL,
      std::string("Unexpected frame ") + message_type_to_string(frame.message_type));
  }

  auto status = decode_payload<cas::Status>(frame.payload);
  if (!status.ok()) {
    BOOST_LOG_TRIVIAL(debug) << "CAS client: Call failed with " << status.code << ": " << status.message;
    throw ClientError(status.code, status.message);
  }
}

} // namespace network
} // namespace stubcas
