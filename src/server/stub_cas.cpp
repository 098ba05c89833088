#include "server/stub_cas.hpp"
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace stubcas {
namespace server {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

StubCas::StubCas(int64_t chunk_size_bytes, cas::BlobMap blobs, uint16_t port, const std::string& host)
  : responder_(std::make_unique<cas::Responder>(chunk_size_bytes, std::move(blobs))) {
  server_ = std::make_unique<network::TCP_Server>(port, host, *responder_);
  if (!server_->start_listener()) {
    BOOST_LOG_TRIVIAL(error) << "StubCAS: Failed to listen on " << host << ":" << port;
    throw std::runtime_error("StubCAS: Failed to listen on " + host + ":" + std::to_string(port));
  }
  BOOST_LOG_TRIVIAL(info) << "StubCAS: Listening on " << address();
}

StubCas::~StubCas() {
  shutdown();
}

void StubCas::shutdown() {
  // Server first, its sessions hold references to the responder
  if (server_) {
    server_->shutdown();
  }
}


//==============================================
// FACTORIES
//==============================================

std::unique_ptr<StubCas> StubCas::with_content(int64_t chunk_size_bytes,
                                               const std::vector<cas::TestData>& files,
                                               const std::vector<cas::TestDirectory>& directories) {
  cas::BlobMap blobs;
  for (const auto& file : files) {
    blobs[file.fingerprint()] = file.bytes();
  }
  for (const auto& directory : directories) {
    blobs[directory.fingerprint()] = directory.bytes();
  }
  return with_unverified_content(chunk_size_bytes, std::move(blobs));
}

std::unique_ptr<StubCas> StubCas::with_unverified_content(int64_t chunk_size_bytes, cas::BlobMap blobs) {
  return with_unverified_content_and_port(chunk_size_bytes, std::move(blobs), 0);
}

std::unique_ptr<StubCas> StubCas::with_unverified_content_and_port(int64_t chunk_size_bytes,
                                                                   cas::BlobMap blobs, uint16_t port) {
  return std::make_unique<StubCas>(chunk_size_bytes, std::move(blobs), port);
}

std::unique_ptr<StubCas> StubCas::with_roland_and_directory(int64_t chunk_size_bytes) {
  return with_content(chunk_size_bytes, {cas::TestData::roland()},
                      {cas::TestDirectory::containing_roland()});
}

std::unique_ptr<StubCas> StubCas::empty() {
  return with_unverified_content(DEFAULT_CHUNK_SIZE, {});
}

std::unique_ptr<StubCas> StubCas::empty_with_port(uint16_t port) {
  return with_unverified_content_and_port(DEFAULT_CHUNK_SIZE, {}, port);
}

std::unique_ptr<StubCas> StubCas::always_errors() {
  return with_unverified_content(-1, {});
}


//==============================================
// GETTERS
//==============================================

std::string StubCas::address() const {
  return server_->address() + ":" + std::to_string(server_->bound_port());
}

} // namespace server
} // namespace stubcas
