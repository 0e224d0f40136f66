#include "store/digest.hpp"
#include <openssl/evp.h>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace bulk::store {

namespace {

//==============================================
// RAII WRAPPER FOR THE DIGEST CONTEXT
//==============================================

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  // Create a context initialized for SHA-256
  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw StoreError("Digest: Failed to create hash context");
    }
    if (!EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr)) {
      EVP_MD_CTX_free(ctx);
      throw StoreError("Digest: Failed to initialize hash context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  DigestContext(const DigestContext&) = delete;
  DigestContext& operator=(const DigestContext&) = delete;

  void update(const char* data, size_t length) {
    if (length > 0 && !EVP_DigestUpdate(ctx, data, length)) {
      throw StoreError("Digest: Failed to update hash");
    }
  }

  std::string finish() {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (!EVP_DigestFinal_ex(ctx, hash, &hash_len)) {
      throw StoreError("Digest: Failed to finalize hash");
    }
    return to_hex(hash, hash_len);
  }
};

constexpr size_t READ_BUFFER_SIZE = 8192;

} // namespace


//==============================================
// VALIDATION
//==============================================

bool Digest::is_valid(const std::string& candidate) {
  if (candidate.size() != HEX_LENGTH) {
    return false;
  }
  for (char c : candidate) {
    const bool digit = c >= '0' && c <= '9';
    const bool lower = c >= 'a' && c <= 'f';
    if (!digit && !lower) {
      return false;
    }
  }
  return true;
}

Digest Digest::validate(const std::string& candidate) {
  if (!is_valid(candidate)) {
    BOOST_LOG_TRIVIAL(debug) << "Digest: Rejected malformed digest: '" << candidate << "'";
    throw InvalidDigestFormat(candidate);
  }
  return Digest(candidate);
}

std::ostream& operator<<(std::ostream& os, const Digest& digest) {
  return os << digest.hex();
}


//==============================================
// DIGEST FUNCTION
//==============================================

Digest hash_file(const std::filesystem::path& file_path) {
  BOOST_LOG_TRIVIAL(trace) << "Digest: Hashing file: " << file_path.string();

  std::ifstream file(file_path, std::ios::binary);
  if (!file) {
    throw IoError("Failed to open file for hashing", file_path);
  }

  DigestContext context;
  char buffer[READ_BUFFER_SIZE];
  std::uintmax_t total_bytes = 0;

  // Read the file in chunks so large blobs never sit in memory
  while (file.read(buffer, sizeof(buffer))) {
    context.update(buffer, static_cast<size_t>(file.gcount()));
    total_bytes += file.gcount();
  }

  // Handle final partial chunk if present
  if (file.gcount() > 0) {
    context.update(buffer, static_cast<size_t>(file.gcount()));
    total_bytes += file.gcount();
  }

  if (file.bad()) {
    throw IoError("Failed to read file for hashing", file_path);
  }

  Digest digest(context.finish());
  BOOST_LOG_TRIVIAL(debug) << "Digest: " << file_path.string() << " (" << total_bytes
                           << " bytes) -> " << digest.hex();
  return digest;
}

Digest hash_bytes(const std::string& data) {
  DigestContext context;
  context.update(data.data(), data.size());
  return Digest(context.finish());
}

std::string to_hex(const unsigned char* data, size_t length) {
  std::stringstream ss;
  for (size_t i = 0; i < length; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(data[i]);
  }
  return ss.str();
}

} // namespace bulk::store
