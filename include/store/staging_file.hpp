#ifndef BULK_STORE_STAGING_FILE_HPP
#define BULK_STORE_STAGING_FILE_HPP

#include <cstddef>
#include <filesystem>
#include <string>

namespace bulk::store {

// Scoped slot in the staging area. The constructor creates an empty file
// with a random 32-hex-digit name that did not exist before; the destructor
// removes it on every exit path, including exceptions.
class StagingFile {
public:
  static constexpr size_t RANDOM_BYTES = 16;     // 128 bits of randomness
  static constexpr int MAX_ATTEMPTS = 16;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit StagingFile(const std::filesystem::path& directory);
  ~StagingFile();

  StagingFile(const StagingFile&) = delete;
  StagingFile& operator=(const StagingFile&) = delete;
  StagingFile(StagingFile&& other) noexcept;
  StagingFile& operator=(StagingFile&&) = delete;


  // ---- ACCESSORS ----
  const std::filesystem::path& path() const { return path_; }

  // Fresh hex-encoded name drawn from the OpenSSL CSPRNG
  static std::string random_name();

private:
  std::filesystem::path path_;

  // Exclusive create; false if the name is already taken
  static bool create_exclusive(const std::filesystem::path& path);
};

} // namespace bulk::store

#endif // BULK_STORE_STAGING_FILE_HPP
