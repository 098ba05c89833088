#ifndef STUBCAS_CAS_MESSAGES_HPP
#define STUBCAS_CAS_MESSAGES_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "cas/status.hpp"
#include "hashing/fingerprint.hpp"

namespace stubcas {
namespace cas {

// Digest as carried in requests: hex hash and declared size
struct WireDigest {
  std::string hash;
  int64_t size_bytes{0};

  bool operator==(const WireDigest& other) const {
    return hash == other.hash && size_bytes == other.size_bytes;
  }
  bool operator!=(const WireDigest& other) const { return !(*this == other); }
};

// Throws hashing::FingerprintError on a malformed hash or negative size
hashing::Digest to_digest(const WireDigest& wire);
WireDigest to_wire_digest(const hashing::Digest& digest);


// ---- BYTESTREAM SERVICE ----

struct ReadRequest {
  std::string resource_name;
  int64_t read_offset{0};
  int64_t read_limit{0};
};

struct ReadResponse {
  std::string data;
};

struct WriteRequest {
  std::string resource_name;
  int64_t write_offset{0};
  bool finish_write{false};
  std::string data;
};

struct WriteResponse {
  int64_t committed_size{0};
};

struct QueryWriteStatusRequest {
  std::string resource_name;
};

struct QueryWriteStatusResponse {
  int64_t committed_size{0};
  bool complete{false};
};


// ---- CONTENT ADDRESSABLE STORAGE SERVICE ----

struct FindMissingBlobsRequest {
  std::string instance_name;
  std::vector<WireDigest> blob_digests;
};

struct FindMissingBlobsResponse {
  std::vector<WireDigest> missing_blob_digests;
};

struct BatchUpdateBlobsRequest {
  struct Request {
    WireDigest digest;
    std::string data;
  };

  std::string instance_name;
  std::vector<Request> requests;
};

struct BatchUpdateBlobsResponse {
  struct Response {
    WireDigest digest;
    Status status;
  };

  std::vector<Response> responses;
};

struct GetTreeRequest {
  std::string instance_name;
  WireDigest root_digest;
  int64_t page_size{0};
  std::string page_token;
};

struct GetTreeResponse {
  // Encoded directory blobs
  std::vector<std::string> directories;
  std::string next_page_token;
};

} // namespace cas
} // namespace stubcas

#endif // STUBCAS_CAS_MESSAGES_HPP
