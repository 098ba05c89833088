#include "cas/messages.hpp"

namespace stubcas {
namespace cas {

hashing::Digest to_digest(const WireDigest& wire) {
  if (wire.size_bytes < 0) {
    throw hashing::FingerprintError("Digest: Negative size " + std::to_string(wire.size_bytes) +
      " for hash " + wire.hash);
  }

  hashing::Digest digest;
  digest.fingerprint = hashing::Fingerprint::from_hex_string(wire.hash);
  digest.size_bytes = static_cast<uint64_t>(wire.size_bytes);
  return digest;
}

WireDigest to_wire_digest(const hashing::Digest& digest) {
  WireDigest wire;
  wire.hash = digest.fingerprint.to_hex();
  wire.size_bytes = static_cast<int64_t>(digest.size_bytes);
  return wire;
}

} // namespace cas
} // namespace stubcas
