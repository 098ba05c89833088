#include "cas/responder.hpp"
#include <charconv>
#include <sstream>
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace stubcas {
namespace cas {

std::vector<std::string> split_resource_name(const std::string& resource_name, std::size_t max_parts) {
  std::vector<std::string> parts;
  if (max_parts == 0) {
    return parts;
  }

  std::size_t start = 0;
  while (parts.size() + 1 < max_parts) {
    std::size_t slash = resource_name.find('/', start);
    if (slash == std::string::npos) {
      break;
    }
    parts.push_back(resource_name.substr(start, slash - start));
    start = slash + 1;
  }
  parts.push_back(resource_name.substr(start));
  return parts;
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Responder::Responder(int64_t chunk_size_bytes, BlobMap blobs)
  : chunk_size_bytes_(chunk_size_bytes)
  , blobs_(std::move(blobs)) {
  if (chunk_size_bytes_ == 0) {
    BOOST_LOG_TRIVIAL(error) << "Responder: Chunk size of zero is not allowed";
    throw std::invalid_argument("Responder: Chunk size must be positive, or negative to always fail");
  }

  BOOST_LOG_TRIVIAL(info) << "Responder: Initializing with chunk size " << chunk_size_bytes_
                          << " and " << blobs_.size() << " known blobs"
                          << (should_always_fail() ? " (always failing)" : "");
}


//==============================================
// BYTESTREAM SERVICE
//==============================================

std::vector<ReadResponse> Responder::read(const ReadRequest& request) {
  // Counted before any validation
  ++read_request_count_;

  BOOST_LOG_TRIVIAL(info) << "Responder: Read request for " << request.resource_name;
  try {
    std::vector<ReadResponse> chunks = read_internal(request);
    BOOST_LOG_TRIVIAL(debug) << "Responder: Answering read of " << request.resource_name
                             << " with " << chunks.size() << " chunks";
    return chunks;
  }
  catch (const RpcError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Responder: Read failed with " << e.code() << ": " << e.what();
    throw;
  }
}

std::vector<ReadResponse> Responder::read_internal(const ReadRequest& request) {
  std::vector<std::string> parts = split_resource_name(request.resource_name, 4);
  if (parts.size() != 4 || parts[0] != "" || parts[1] != "blobs") {
    throw RpcError(StatusCode::INVALID_ARGUMENT,
      "Bad resource name format " + request.resource_name + " - want /blobs/some-sha256/size");
  }

  const std::string& digest = parts[2];
  hashing::Fingerprint fingerprint;
  try {
    fingerprint = hashing::Fingerprint::from_hex_string(digest);
  }
  catch (const hashing::FingerprintError& e) {
    throw RpcError(StatusCode::INVALID_ARGUMENT, "Bad digest " + digest + ": " + e.what());
  }

  // Takes precedence over NotFound
  if (should_always_fail()) {
    throw always_fail_error();
  }

  std::optional<std::string> bytes = get_blob(fingerprint);
  if (!bytes) {
    throw RpcError(StatusCode::NOT_FOUND, "Did not find digest " + fingerprint.to_hex());
  }

  return split_into_chunks(*bytes);
}

std::vector<ReadResponse> Responder::split_into_chunks(const std::string& bytes) const {
  const std::size_t chunk_size = static_cast<std::size_t>(chunk_size_bytes_);
  std::vector<ReadResponse> chunks;
  chunks.reserve((bytes.size() + chunk_size - 1) / chunk_size);

  // Every chunk is full except possibly the last, empty content yields no chunks
  for (std::size_t offset = 0; offset < bytes.size(); offset += chunk_size) {
    ReadResponse response;
    response.data = bytes.substr(offset, chunk_size);
    chunks.push_back(std::move(response));
  }
  return chunks;
}

WriteResponse Responder::write(const std::vector<WriteRequest>& requests) {
  BOOST_LOG_TRIVIAL(info) << "Responder: Write stream with " << requests.size() << " messages";

  try {
    WriteInProgress upload;
    for (const auto& request : requests) {
      accumulate(upload, request);
    }

    if (!upload.resource_name) {
      throw RpcError(StatusCode::INVALID_ARGUMENT, "Stream saw no messages");
    }

    hashing::Digest digest = parse_upload_resource_name(*upload.resource_name);
    if (digest.size_bytes != upload.bytes.size()) {
      std::ostringstream message;
      message << "Size was incorrect: resource name said size=" << digest.size_bytes
              << " but got " << upload.bytes.size();
      throw RpcError(StatusCode::INVALID_ARGUMENT, message.str());
    }

    // Only after structural validation, so malformed streams still report their own error
    if (should_always_fail()) {
      throw always_fail_error();
    }

    {
      std::lock_guard<std::mutex> lock(blobs_mutex_);
      blobs_[digest.fingerprint] = std::move(upload.bytes);
    }

    BOOST_LOG_TRIVIAL(info) << "Responder: Committed " << digest.size_bytes << " bytes for "
                            << digest.fingerprint;

    WriteResponse response;
    response.committed_size = static_cast<int64_t>(digest.size_bytes);
    return response;
  }
  catch (const RpcError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Responder: Write failed with " << e.code() << ": " << e.what();
    throw;
  }
}

void Responder::record_write_message_size(std::size_t size) {
  std::lock_guard<std::mutex> lock(write_sizes_mutex_);
  write_message_sizes_.push_back(size);
}

void Responder::accumulate(WriteInProgress& upload, const WriteRequest& request) {
  if (!upload.resource_name) {
    upload.resource_name = request.resource_name;
  } else if (*upload.resource_name != request.resource_name) {
    throw RpcError(StatusCode::INVALID_ARGUMENT,
      "All resource names in stream must be the same. Got " + request.resource_name +
      " but earlier saw " + *upload.resource_name);
  }

  if (request.write_offset != upload.want_next_offset) {
    throw RpcError(StatusCode::INVALID_ARGUMENT,
      "Missing chunk. Expected next offset " + std::to_string(upload.want_next_offset) +
      ", got next offset: " + std::to_string(request.write_offset));
  }

  // Only chunks that passed both checks are recorded
  record_write_message_size(request.data.size());
  upload.want_next_offset += static_cast<int64_t>(request.data.size());
  upload.bytes.append(request.data);
}

hashing::Digest Responder::parse_upload_resource_name(const std::string& resource_name) const {
  std::vector<std::string> parts = split_resource_name(resource_name, 6);
  if (parts.size() != 6 || parts[1] != "uploads" || parts[3] != "blobs") {
    throw RpcError(StatusCode::INVALID_ARGUMENT, "Bad resource name: " + resource_name);
  }

  hashing::Digest digest;
  try {
    digest.fingerprint = hashing::Fingerprint::from_hex_string(parts[4]);
  }
  catch (const hashing::FingerprintError& e) {
    throw RpcError(StatusCode::INVALID_ARGUMENT,
      "Bad fingerprint in resource name: " + parts[4] + ": " + e.what());
  }

  const std::string& size = parts[5];
  // An explicit plus sign is accepted, from_chars does not skip it
  const char* begin = size.data();
  const char* end = size.data() + size.size();
  if (begin != end && *begin == '+') {
    ++begin;
  }
  auto [ptr, ec] = std::from_chars(begin, end, digest.size_bytes);
  if (size.empty() || ec != std::errc() || ptr != end) {
    std::string reason = ec == std::errc::result_out_of_range ? "number too large" : "invalid digit";
    if (size.empty()) {
      reason = "cannot parse integer from empty string";
    }
    throw RpcError(StatusCode::INVALID_ARGUMENT, "Bad size in resource name: " + size + ": " + reason);
  }

  return digest;
}

QueryWriteStatusResponse Responder::query_write_status(const QueryWriteStatusRequest& request) {
  BOOST_LOG_TRIVIAL(debug) << "Responder: QueryWriteStatus for " << request.resource_name << " is not implemented";
  throw RpcError(StatusCode::UNIMPLEMENTED, "");
}


//==============================================
// CONTENT ADDRESSABLE STORAGE SERVICE
//==============================================

FindMissingBlobsResponse Responder::find_missing_blobs(const FindMissingBlobsRequest& request) {
  BOOST_LOG_TRIVIAL(info) << "Responder: FindMissingBlobs for " << request.blob_digests.size() << " digests";

  if (should_always_fail()) {
    BOOST_LOG_TRIVIAL(warning) << "Responder: FindMissingBlobs failing as configured";
    throw always_fail_error();
  }

  FindMissingBlobsResponse response;
  std::lock_guard<std::mutex> lock(blobs_mutex_);
  for (const auto& wire_digest : request.blob_digests) {
    // A malformed digest is a caller bug, FingerprintError escapes the call
    hashing::Digest digest = to_digest(wire_digest);
    if (blobs_.find(digest.fingerprint) == blobs_.end()) {
      response.missing_blob_digests.push_back(wire_digest);
    }
  }

  BOOST_LOG_TRIVIAL(debug) << "Responder: " << response.missing_blob_digests.size() << " of "
                           << request.blob_digests.size() << " digests are missing";
  return response;
}

BatchUpdateBlobsResponse Responder::batch_update_blobs(const BatchUpdateBlobsRequest& request) {
  BOOST_LOG_TRIVIAL(debug) << "Responder: BatchUpdateBlobs with " << request.requests.size()
                           << " blobs is not implemented";
  throw RpcError(StatusCode::UNIMPLEMENTED, "");
}

GetTreeResponse Responder::get_tree(const GetTreeRequest& request) {
  BOOST_LOG_TRIVIAL(debug) << "Responder: GetTree for " << request.root_digest.hash << " is not implemented";
  throw RpcError(StatusCode::UNIMPLEMENTED, "");
}


//==============================================
// GETTERS
//==============================================

std::size_t Responder::read_request_count() const {
  return read_request_count_.load();
}

std::vector<std::size_t> Responder::write_message_sizes() const {
  std::lock_guard<std::mutex> lock(write_sizes_mutex_);
  return write_message_sizes_;
}

BlobMap Responder::blobs() const {
  std::lock_guard<std::mutex> lock(blobs_mutex_);
  return blobs_;
}

std::optional<std::string> Responder::get_blob(const hashing::Fingerprint& fingerprint) const {
  std::lock_guard<std::mutex> lock(blobs_mutex_);
  auto it = blobs_.find(fingerprint);
  if (it == blobs_.end()) {
    return std::nullopt;
  }
  return it->second;
}


//==============================================
// UTILITY METHODS
//==============================================

RpcError Responder::always_fail_error() const {
  return RpcError(StatusCode::INTERNAL, "StubCAS is configured to always fail");
}

} // namespace cas
} // namespace stubcas
