#pragma once

#include <filesystem>
#include <string>
#include <system_error>
#include "digest.hpp"
#include "store_error.hpp"

namespace bulk {
namespace store {

// Content-addressed store of immutable files under a root directory:
//   <root>/blobs/<3-hex-prefix>/<61-hex-suffix>   published, mode 0444
//   <root>/partial/<32-hex-random>                in-flight writes
// Safe for concurrent use by many threads and processes sharing the root;
// the hard link that publishes a blob is the only coordination point.
class BlobStore {
public:

  // ---- CONSTRUCTOR ----
  explicit BlobStore(const std::filesystem::path& root);
  virtual ~BlobStore() = default;


  // ---- LAYOUT ----
  const std::filesystem::path& root() const { return root_; }
  std::filesystem::path blob_dir() const;
  std::filesystem::path partial_dir() const;
  // Validates the digest before deriving anything from it
  std::filesystem::path blob_path(const std::string& digest) const;
  std::filesystem::path blob_path(const Digest& digest) const;
  // Creates blobs/ and partial/ if missing
  void init() const;


  // ---- QUERY OPERATIONS ----
  // True iff a regular file is published under the digest; never reads content
  bool exists(const std::string& digest) const;
  bool exists(const Digest& digest) const;
  // Re-hashes the published file; false if missing or corrupted
  bool verify(const std::string& digest) const;
  bool verify(const Digest& digest) const;


  // ---- WRITE OPERATIONS ----
  // Stores the content of source_path and returns its digest.
  // Storing content that is already present writes nothing.
  Digest store(const std::filesystem::path& source_path) const;
  // Garbage collection is not supported; always throws NotImplemented
  void clean();

protected:
  // ---- WRITE PRIMITIVES ----
  // Copies bytes only; the target keeps its own mode and ownership
  virtual void copy_content(const std::filesystem::path& source, const std::filesystem::path& target) const;
  // Hard-links staged to target; returns the link error instead of throwing
  virtual std::error_code link_blob(const std::filesystem::path& staged, const std::filesystem::path& target) const;

private:
  // ---- PARAMETERS ----
  std::filesystem::path root_;


  // ---- WRITE SUPPORT ----
  // Creates the directory and its parents, throws IoError on failure
  void ensure_directory(const std::filesystem::path& path) const;
  void make_read_only(const std::filesystem::path& path) const;
  // Atomically makes the staged file visible at target
  void publish(const std::filesystem::path& staged, const std::filesystem::path& target) const;
  void publish_by_rename(const std::filesystem::path& staged, const std::filesystem::path& target) const;
};

} // namespace store
} // namespace bulk
