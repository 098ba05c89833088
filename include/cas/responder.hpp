#ifndef STUBCAS_CAS_RESPONDER_HPP
#define STUBCAS_CAS_RESPONDER_HPP

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "cas/messages.hpp"
#include "cas/status.hpp"
#include "hashing/fingerprint.hpp"

namespace stubcas {
namespace cas {

// Known content keyed by fingerprint, never checked against its bytes
using BlobMap = std::unordered_map<hashing::Fingerprint, std::string>;

// Splits on '/' into at most max_parts parts, the last part keeps any remaining separators
std::vector<std::string> split_resource_name(const std::string& resource_name, std::size_t max_parts);

// Answers ByteStream and ContentAddressableStorage calls against an in-memory blob map.
// Every call either returns its response or throws RpcError. Safe to call from many threads.
class Responder {
public:
  // Delete copy constructor and assignment operator
  Responder(const Responder&) = delete;
  Responder& operator=(const Responder&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // chunk_size_bytes bounds each streamed read chunk; a negative value makes every
  // read, write and find-missing call fail with INTERNAL. Zero is rejected.
  Responder(int64_t chunk_size_bytes, BlobMap blobs);
  ~Responder() = default;


  // ---- BYTESTREAM SERVICE ----
  // Returns the blob named by "/blobs/{hash}/{size}" split into chunks
  std::vector<ReadResponse> read(const ReadRequest& request);
  // Validates a complete client stream and commits the reassembled blob
  WriteResponse write(const std::vector<WriteRequest>& requests);
  // Resumable uploads are not supported
  QueryWriteStatusResponse query_write_status(const QueryWriteStatusRequest& request);


  // ---- CONTENT ADDRESSABLE STORAGE SERVICE ----
  // Returns the requested digests absent from the store, in request order
  FindMissingBlobsResponse find_missing_blobs(const FindMissingBlobsRequest& request);
  BatchUpdateBlobsResponse batch_update_blobs(const BatchUpdateBlobsRequest& request);
  GetTreeResponse get_tree(const GetTreeRequest& request);


  // ---- GETTERS ----
  std::size_t read_request_count() const;
  std::vector<std::size_t> write_message_sizes() const;
  // Snapshot copy of the current blob map
  BlobMap blobs() const;
  std::optional<std::string> get_blob(const hashing::Fingerprint& fingerprint) const;
  int64_t chunk_size_bytes() const { return chunk_size_bytes_; }
  bool should_always_fail() const { return chunk_size_bytes_ < 0; }

private:
  // Per-call accumulator for one write stream
  struct WriteInProgress {
    std::optional<std::string> resource_name;
    int64_t want_next_offset{0};
    std::string bytes;
  };

  // ---- PARAMETERS ----
  const int64_t chunk_size_bytes_;

  // Blob map and access mutex
  BlobMap blobs_;
  mutable std::mutex blobs_mutex_;

  // Counters observed by tests
  std::atomic<std::size_t> read_request_count_{0};
  std::vector<std::size_t> write_message_sizes_;
  mutable std::mutex write_sizes_mutex_;


  // ---- READ SUPPORT ----
  std::vector<ReadResponse> read_internal(const ReadRequest& request);
  std::vector<ReadResponse> split_into_chunks(const std::string& bytes) const;


  // ---- WRITE SUPPORT ----
  void record_write_message_size(std::size_t size);
  // Checks resource name consistency and offset continuity, then records and appends the chunk
  void accumulate(WriteInProgress& upload, const WriteRequest& request);
  // Parses "{instance}/uploads/{uuid}/blobs/{hash}/{size}"
  hashing::Digest parse_upload_resource_name(const std::string& resource_name) const;


  // ---- UTILITY METHODS ----
  RpcError always_fail_error() const;
};

} // namespace cas
} // namespace stubcas

#endif // STUBCAS_CAS_RESPONDER_HPP
