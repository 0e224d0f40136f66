#include "store/blob_store.hpp"
#include "store/staging_file.hpp"
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <system_error>
#include <fcntl.h>
#include <unistd.h>
#include <boost/log/trivial.hpp>

namespace bulk {
namespace store {

namespace {

const char* const BLOB_DIR_NAME = "blobs";
const char* const PARTIAL_DIR_NAME = "partial";
constexpr size_t COPY_BUFFER_SIZE = 8192;

// Regular-file test that reports real failures instead of folding them into "no"
bool is_published_file(const std::filesystem::path& path) {
  std::error_code ec;
  const auto status = std::filesystem::status(path, ec);
  if (status.type() == std::filesystem::file_type::not_found) {
    return false;
  }
  if (ec) {
    throw IoError("Failed to stat", path, ec);
  }
  return status.type() == std::filesystem::file_type::regular;
}

std::error_code last_error() {
  return std::error_code(errno, std::generic_category());
}

// Flushes a file or directory to stable storage
void sync_path(const std::filesystem::path& path, int flags) {
  const int fd = ::open(path.c_str(), flags | O_CLOEXEC);
  if (fd == -1) {
    throw IoError("Failed to open for sync", path, last_error());
  }
  if (::fsync(fd) != 0) {
    const std::error_code ec = last_error();
    ::close(fd);
    throw IoError("Failed to sync", path, ec);
  }
  ::close(fd);
}

} // namespace

//==============================================
// CONSTRUCTOR
//==============================================

BlobStore::BlobStore(const std::filesystem::path& root) : root_(root) {
  BOOST_LOG_TRIVIAL(debug) << "BlobStore: Opened store at: " << root_.string();
}


//==============================================
// LAYOUT
//==============================================

std::filesystem::path BlobStore::blob_dir() const {
  return root_ / BLOB_DIR_NAME;
}

std::filesystem::path BlobStore::partial_dir() const {
  return root_ / PARTIAL_DIR_NAME;
}

std::filesystem::path BlobStore::blob_path(const std::string& digest) const {
  return blob_path(Digest::validate(digest));
}

std::filesystem::path BlobStore::blob_path(const Digest& digest) const {
  return blob_dir() / digest.prefix() / digest.suffix();
}

void BlobStore::init() const {
  BOOST_LOG_TRIVIAL(info) << "BlobStore: Initializing store layout at: " << root_.string();
  ensure_directory(blob_dir());
  ensure_directory(partial_dir());
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool BlobStore::exists(const std::string& digest) const {
  return exists(Digest::validate(digest));
}

bool BlobStore::exists(const Digest& digest) const {
  const bool found = is_published_file(blob_path(digest));
  BOOST_LOG_TRIVIAL(trace) << "BlobStore: Blob " << digest << (found ? " exists" : " not found");
  return found;
}

bool BlobStore::verify(const std::string& digest) const {
  return verify(Digest::validate(digest));
}

bool BlobStore::verify(const Digest& digest) const {
  BOOST_LOG_TRIVIAL(debug) << "BlobStore: Verifying blob " << digest;

  if (!exists(digest)) {
    BOOST_LOG_TRIVIAL(debug) << "BlobStore: Cannot verify missing blob " << digest;
    return false;
  }

  const Digest observed = hash_file(blob_path(digest));
  if (observed != digest) {
    BOOST_LOG_TRIVIAL(warning) << "BlobStore: Blob " << digest << " is corrupted, content hashes to " << observed;
    return false;
  }
  return true;
}


//==============================================
// WRITE OPERATIONS
//==============================================

Digest BlobStore::store(const std::filesystem::path& source_path) const {
  BOOST_LOG_TRIVIAL(info) << "BlobStore: Storing file: " << source_path.string();

  const Digest digest = hash_file(source_path);
  if (exists(digest)) {
    BOOST_LOG_TRIVIAL(debug) << "BlobStore: Blob " << digest << " already stored, skipping write";
    return digest;
  }

  const std::filesystem::path target = blob_path(digest);
  ensure_directory(target.parent_path());

  {
    StagingFile staging(partial_dir());
    copy_content(source_path, staging.path());
    sync_path(staging.path(), O_RDONLY);

    // The source may have changed between hashing and copying
    const Digest staged = hash_file(staging.path());
    if (staged != digest) {
      BOOST_LOG_TRIVIAL(error) << "BlobStore: Staged copy hashes to " << staged << ", expected " << digest;
      throw IoError("Source changed while being stored", source_path);
    }

    make_read_only(staging.path());
    publish(staging.path(), target);
  }

  // Make the new directory entry durable too
  sync_path(target.parent_path(), O_RDONLY | O_DIRECTORY);

  BOOST_LOG_TRIVIAL(info) << "BlobStore: Stored " << source_path.string() << " as " << digest;
  return digest;
}

void BlobStore::clean() {
  throw NotImplemented("BlobStore::clean");
}


//==============================================
// WRITE SUPPORT
//==============================================

void BlobStore::ensure_directory(const std::filesystem::path& path) const {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "BlobStore: Failed to create directory: " << path.string();
    throw IoError("Failed to create directory", path, ec);
  }
}

void BlobStore::copy_content(const std::filesystem::path& source, const std::filesystem::path& target) const {
  std::ifstream input(source, std::ios::binary);
  if (!input) {
    throw IoError("Failed to open source file", source);
  }

  std::ofstream output(target, std::ios::binary | std::ios::trunc);
  if (!output) {
    throw IoError("Failed to open staging file", target);
  }

  char buffer[COPY_BUFFER_SIZE];
  std::uintmax_t bytes_copied = 0;

  while (input.read(buffer, sizeof(buffer))) {
    output.write(buffer, input.gcount());
    bytes_copied += input.gcount();
  }

  // Handle final partial chunk if present
  if (input.gcount() > 0) {
    output.write(buffer, input.gcount());
    bytes_copied += input.gcount();
  }

  if (input.bad()) {
    throw IoError("Failed to read source file", source);
  }

  output.flush();
  if (!output) {
    throw IoError("Failed to write staging file", target);
  }

  BOOST_LOG_TRIVIAL(debug) << "BlobStore: Copied " << bytes_copied << " bytes into " << target.string();
}

void BlobStore::make_read_only(const std::filesystem::path& path) const {
  using std::filesystem::perms;

  std::error_code ec;
  std::filesystem::permissions(path, perms::owner_read | perms::group_read | perms::others_read,
                               std::filesystem::perm_options::replace, ec);
  if (ec) {
    throw IoError("Failed to make staging file read-only", path, ec);
  }
}

std::error_code BlobStore::link_blob(const std::filesystem::path& staged, const std::filesystem::path& target) const {
  std::error_code ec;
  std::filesystem::create_hard_link(staged, target, ec);
  return ec;
}

void BlobStore::publish(const std::filesystem::path& staged, const std::filesystem::path& target) const {
  const std::error_code ec = link_blob(staged, target);
  if (!ec) {
    BOOST_LOG_TRIVIAL(debug) << "BlobStore: Published " << target.string();
    return;
  }

  if (ec == std::errc::file_exists) {
    // Another writer published the same content first
    if (is_published_file(target)) {
      BOOST_LOG_TRIVIAL(debug) << "BlobStore: Blob already published by another writer: " << target.string();
      return;
    }
    throw IoError("Blob path is occupied by a non-file entry", target);
  }

  if (ec == std::errc::operation_not_permitted || ec == std::errc::operation_not_supported ||
      ec == std::errc::function_not_supported) {
    BOOST_LOG_TRIVIAL(warning) << "BlobStore: Hard links unavailable (" << ec.message()
                               << "), publishing by rename: " << target.string();
    publish_by_rename(staged, target);
    return;
  }

  BOOST_LOG_TRIVIAL(error) << "BlobStore: Failed to link " << staged.string() << " to " << target.string();
  throw IoError("Failed to publish blob", target, ec);
}

void BlobStore::publish_by_rename(const std::filesystem::path& staged, const std::filesystem::path& target) const {
  // RENAME_NOREPLACE keeps the first published inode, like link() does
  if (::renameat2(AT_FDCWD, staged.c_str(), AT_FDCWD, target.c_str(), RENAME_NOREPLACE) == 0) {
    BOOST_LOG_TRIVIAL(debug) << "BlobStore: Published " << target.string() << " by rename";
    return;
  }

  const std::error_code ec = last_error();
  if (ec == std::errc::file_exists) {
    if (is_published_file(target)) {
      BOOST_LOG_TRIVIAL(debug) << "BlobStore: Blob already published by another writer: " << target.string();
      return;
    }
    throw IoError("Blob path is occupied by a non-file entry", target);
  }

  BOOST_LOG_TRIVIAL(error) << "BlobStore: Failed to rename " << staged.string() << " to " << target.string();
  throw IoError("Failed to publish blob by rename", target, ec);
}

} // namespace store
} // namespace bulk
