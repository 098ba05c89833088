#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "cas/responder.hpp"
#include "cas/test_data.hpp"
#include "network/tcp_server.hpp"

namespace stubcas {
namespace server {

// A listening CAS test double: answers reads with known content, NotFound for valid
// but unknown content, and InvalidArgument for bad arguments.
class StubCas {
public:
  static constexpr int64_t DEFAULT_CHUNK_SIZE = 1024;
  static constexpr const char* DEFAULT_HOST = "127.0.0.1";

  StubCas(const StubCas&) = delete;
  StubCas& operator=(const StubCas&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // chunk_size_bytes: maximum content bytes per streamed read message, every message
  //   is full except the last. A negative value makes every request fail.
  // blobs: known fingerprints and their content, not checked for correctness.
  // port: 0 picks an ephemeral port.
  // Throws std::runtime_error if the listener cannot be started.
  StubCas(int64_t chunk_size_bytes, cas::BlobMap blobs, uint16_t port,
          const std::string& host = DEFAULT_HOST);
  ~StubCas();


  // ---- FACTORIES ----
  static std::unique_ptr<StubCas> with_content(int64_t chunk_size_bytes,
                                               const std::vector<cas::TestData>& files,
                                               const std::vector<cas::TestDirectory>& directories);
  static std::unique_ptr<StubCas> with_unverified_content(int64_t chunk_size_bytes, cas::BlobMap blobs);
  static std::unique_ptr<StubCas> with_unverified_content_and_port(int64_t chunk_size_bytes,
                                                                   cas::BlobMap blobs, uint16_t port);
  static std::unique_ptr<StubCas> with_roland_and_directory(int64_t chunk_size_bytes);
  static std::unique_ptr<StubCas> empty();
  static std::unique_ptr<StubCas> empty_with_port(uint16_t port);
  static std::unique_ptr<StubCas> always_errors();


  // ---- GETTERS ----
  // The "host:port" this server is listening on
  std::string address() const;
  std::size_t read_request_count() const { return responder_->read_request_count(); }
  std::vector<std::size_t> write_message_sizes() const { return responder_->write_message_sizes(); }
  cas::BlobMap blobs() const { return responder_->blobs(); }
  cas::Responder& responder() { return *responder_; }


  // ---- TEARDOWN ----
  void shutdown();

private:
  // ---- PARAMETERS ----
  std::unique_ptr<cas::Responder> responder_;
  std::unique_ptr<network::TCP_Server> server_;
};

} // namespace server
} // namespace stubcas
