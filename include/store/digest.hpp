#ifndef BULK_STORE_DIGEST_HPP
#define BULK_STORE_DIGEST_HPP

#include <cstddef>
#include <filesystem>
#include <ostream>
#include <string>
#include <utility>
#include "store_error.hpp"

namespace bulk::store {

// SHA-256 content fingerprint, always 64 lowercase hex characters.
// Only validate() and the hash_* functions can produce one.
class Digest {
public:
  static constexpr size_t HEX_LENGTH = 64;
  static constexpr size_t PREFIX_LENGTH = 3;   // Shard directory name length

  // ---- VALIDATION ----
  // Returns a typed digest or throws InvalidDigestFormat naming the candidate
  static Digest validate(const std::string& candidate);
  static bool is_valid(const std::string& candidate);


  // ---- ACCESSORS ----
  const std::string& hex() const { return hex_; }
  // First PREFIX_LENGTH characters, used as the shard directory
  std::string prefix() const { return hex_.substr(0, PREFIX_LENGTH); }
  // Remaining characters, used as the blob file name
  std::string suffix() const { return hex_.substr(PREFIX_LENGTH); }


  // ---- COMPARISON ----
  bool operator==(const Digest& other) const { return hex_ == other.hex_; }
  bool operator!=(const Digest& other) const { return hex_ != other.hex_; }
  bool operator<(const Digest& other) const { return hex_ < other.hex_; }

private:
  explicit Digest(std::string hex) : hex_(std::move(hex)) {}

  std::string hex_;

  friend Digest hash_bytes(const std::string& data);
  friend Digest hash_file(const std::filesystem::path& file_path);
};

std::ostream& operator<<(std::ostream& os, const Digest& digest);

// ---- DIGEST FUNCTION ----
// Streams the file through SHA-256; throws IoError if it cannot be read
Digest hash_file(const std::filesystem::path& file_path);
// SHA-256 over an in-memory buffer
Digest hash_bytes(const std::string& data);

// Lowercase hex encoding of raw bytes
std::string to_hex(const unsigned char* data, size_t length);

} // namespace bulk::store

#endif // BULK_STORE_DIGEST_HPP
