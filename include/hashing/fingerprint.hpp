#ifndef STUBCAS_HASHING_FINGERPRINT_HPP
#define STUBCAS_HASHING_FINGERPRINT_HPP

#include <array>
#include <cstdint>
#include <functional>
#include <ostream>
#include <stdexcept>
#include <string>

namespace stubcas {
namespace hashing {

class FingerprintError : public std::runtime_error {
public:
  explicit FingerprintError(const std::string& message) : std::runtime_error(message) {}
};

class Fingerprint {
public:
  // SHA-256 digest width
  static constexpr std::size_t SIZE = 32;

  // ---- CONSTRUCTOR ----
  Fingerprint();
  explicit Fingerprint(const std::array<uint8_t, SIZE>& bytes);


  // ---- FACTORIES ----
  // Parses exactly 64 hex characters, throws FingerprintError otherwise
  static Fingerprint from_hex_string(const std::string& hex);
  // Hashes content with SHA-256 using OpenSSL EVP
  static Fingerprint of_bytes(const std::string& bytes);


  // ---- GETTERS ----
  // Lowercase hex rendering
  std::string to_hex() const;
  const std::array<uint8_t, SIZE>& bytes() const { return bytes_; }


  // ---- COMPARISON ----
  bool operator==(const Fingerprint& other) const { return bytes_ == other.bytes_; }
  bool operator!=(const Fingerprint& other) const { return bytes_ != other.bytes_; }
  bool operator<(const Fingerprint& other) const { return bytes_ < other.bytes_; }

private:
  // ---- PARAMETERS ----
  std::array<uint8_t, SIZE> bytes_;
};

std::ostream& operator<<(std::ostream& os, const Fingerprint& fingerprint);


// A fingerprint together with the length of the content it identifies
struct Digest {
  Fingerprint fingerprint;
  uint64_t size_bytes{0};

  static Digest of_bytes(const std::string& bytes);

  bool operator==(const Digest& other) const {
    return fingerprint == other.fingerprint && size_bytes == other.size_bytes;
  }
  bool operator!=(const Digest& other) const { return !(*this == other); }
};

std::ostream& operator<<(std::ostream& os, const Digest& digest);

} // namespace hashing
} // namespace stubcas

namespace std {

template <>
struct hash<stubcas::hashing::Fingerprint> {
  std::size_t operator()(const stubcas::hashing::Fingerprint& fingerprint) const noexcept {
    // Content is already uniformly distributed, the leading bytes are enough
    std::size_t value = 0;
    for (std::size_t i = 0; i < sizeof(value); ++i) {
      value = (value << 8) | fingerprint.bytes()[i];
    }
    return value;
  }
};

} // namespace std

#endif // STUBCAS_HASHING_FINGERPRINT_HPP
