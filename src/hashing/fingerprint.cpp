#include "hashing/fingerprint.hpp"
#include <algorithm>
#include <iomanip>
#include <memory>
#include <sstream>
#include <boost/log/trivial.hpp>
#include <openssl/evp.h>

namespace stubcas {
namespace hashing {

namespace {

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

//==============================================
// CONSTRUCTOR
//==============================================

Fingerprint::Fingerprint() {
  bytes_.fill(0);
}

Fingerprint::Fingerprint(const std::array<uint8_t, SIZE>& bytes) : bytes_(bytes) {}


//==============================================
// FACTORIES
//==============================================

Fingerprint Fingerprint::from_hex_string(const std::string& hex) {
  if (hex.length() != SIZE * 2) {
    throw FingerprintError("Fingerprint: Invalid length " + std::to_string(hex.length()) +
      " for hex string '" + hex + "', want " + std::to_string(SIZE * 2));
  }

  std::array<uint8_t, SIZE> bytes;
  for (std::size_t i = 0; i < SIZE; ++i) {
    int high = hex_value(hex[2 * i]);
    int low = hex_value(hex[2 * i + 1]);
    if (high < 0 || low < 0) {
      std::size_t bad_index = high < 0 ? 2 * i : 2 * i + 1;
      throw FingerprintError("Fingerprint: Invalid character '" + std::string(1, hex[bad_index]) +
        "' at index " + std::to_string(bad_index) + " in hex string '" + hex + "'");
    }
    bytes[i] = static_cast<uint8_t>((high << 4) | low);
  }
  return Fingerprint(bytes);
}

Fingerprint Fingerprint::of_bytes(const std::string& bytes) {
  // Message digest context released on every exit path
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx) {
    throw FingerprintError("Fingerprint: Failed to create hash context");
  }

  if (!EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr)) {
    throw FingerprintError("Fingerprint: Failed to initialize hash context");
  }

  if (!EVP_DigestUpdate(ctx.get(), bytes.data(), bytes.size())) {
    throw FingerprintError("Fingerprint: Failed to update hash");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  if (!EVP_DigestFinal_ex(ctx.get(), hash, &hash_len)) {
    throw FingerprintError("Fingerprint: Failed to finalize hash");
  }

  if (hash_len != SIZE) {
    throw FingerprintError("Fingerprint: Unexpected digest length " + std::to_string(hash_len));
  }

  std::array<uint8_t, SIZE> result;
  std::copy(hash, hash + SIZE, result.begin());
  return Fingerprint(result);
}


//==============================================
// GETTERS
//==============================================

std::string Fingerprint::to_hex() const {
  std::stringstream ss;
  for (uint8_t byte : bytes_) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return ss.str();
}

std::ostream& operator<<(std::ostream& os, const Fingerprint& fingerprint) {
  return os << fingerprint.to_hex();
}


//==============================================
// DIGEST
//==============================================

Digest Digest::of_bytes(const std::string& bytes) {
  Digest digest;
  digest.fingerprint = Fingerprint::of_bytes(bytes);
  digest.size_bytes = bytes.size();
  BOOST_LOG_TRIVIAL(trace) << "Fingerprint: Hashed " << bytes.size() << " bytes to " << digest.fingerprint;
  return digest;
}

std::ostream& operator<<(std::ostream& os, const Digest& digest) {
  return os << digest.fingerprint << "/" << digest.size_bytes;
}

} // namespace hashing
} // namespace stubcas
