#ifndef STUBCAS_NETWORK_CAS_CLIENT_HPP
#define STUBCAS_NETWORK_CAS_CLIENT_HPP

#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/asio.hpp>
#include "cas/messages.hpp"
#include "cas/status.hpp"
#include "hashing/fingerprint.hpp"
#include "network/codec.hpp"

namespace stubcas {
namespace network {

// Raised when the server answers a call with a non-OK status
class ClientError : public std::runtime_error {
public:
  ClientError(cas::StatusCode code, const std::string& message)
    : std::runtime_error(std::string(cas::to_string(code)) + ": " + message)
    , code_(code)
    , status_message_(message) {}

  cas::StatusCode code() const { return code_; }
  const std::string& status_message() const { return status_message_; }

private:
  cas::StatusCode code_;
  std::string status_message_;
};

// Blocking client for the stub CAS wire protocol. Calls are serialized per client.
class CasClient {
public:
  CasClient(const CasClient&) = delete;
  CasClient& operator=(const CasClient&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Accepts "host:port", throws ClientError(UNAVAILABLE) if the connection fails
  explicit CasClient(const std::string& address);
  CasClient(const std::string& host, uint16_t port);
  ~CasClient();


  // ---- BYTESTREAM SERVICE ----
  // Returns the chunks of the read stream in order
  std::vector<std::string> read(const std::string& resource_name);
  // Reads "/blobs/{hash}/{size}" and concatenates the chunks
  std::string read_blob(const hashing::Digest& digest);
  // Sends the messages exactly as given, returns the committed size
  int64_t write(const std::vector<cas::WriteRequest>& requests);
  // Splits bytes into correctly offset chunks under an upload resource name
  int64_t write_blob(const hashing::Digest& digest, const std::string& bytes, std::size_t chunk_size,
                     const std::string& upload_id = "upload", const std::string& instance_name = "");
  cas::QueryWriteStatusResponse query_write_status(const std::string& resource_name);


  // ---- CONTENT ADDRESSABLE STORAGE SERVICE ----
  std::vector<cas::WireDigest> find_missing_blobs(const std::vector<cas::WireDigest>& digests,
                                                  const std::string& instance_name = "");
  cas::BatchUpdateBlobsResponse batch_update_blobs(const cas::BatchUpdateBlobsRequest& request);
  cas::GetTreeResponse get_tree(const cas::GetTreeRequest& request);


  // ---- CONNECTION ----
  void close();


  // ---- RESOURCE NAMES ----
  static std::string read_resource_name(const hashing::Digest& digest);
  static std::string upload_resource_name(const hashing::Digest& digest, const std::string& upload_id,
                                          const std::string& instance_name = "");

private:
  // ---- PARAMETERS ----
  boost::asio::ip::tcp::iostream stream_;
  std::string address_;
  Codec codec_;
  std::mutex mutex_;


  // ---- FRAME OPERATIONS ----
  void connect(const std::string& host, const std::string& port);
  void send_frame(const MessageFrame& frame);
  MessageFrame receive_frame();
  // Throws ClientError unless the frame is an OK status
  void expect_ok_status(const MessageFrame& frame);

  // Request frame, one response frame, OK status
  template <typename Response, typename Request>
  Response unary_call(MessageType request_type, const Request& request, MessageType response_type);
};

} // namespace network
} // namespace stubcas

#endif // STUBCAS_NETWORK_CAS_CLIENT_HPP
