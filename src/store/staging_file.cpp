#include "store/staging_file.hpp"
#include "store/digest.hpp"
#include "store/store_error.hpp"
#include <openssl/rand.h>
#include <array>
#include <cerrno>
#include <system_error>
#include <utility>
#include <fcntl.h>
#include <unistd.h>
#include <boost/log/trivial.hpp>

namespace bulk::store {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

StagingFile::StagingFile(const std::filesystem::path& directory) {
  std::error_code ec;
  std::filesystem::create_directories(directory, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "StagingFile: Failed to create staging directory: " << directory.string();
    throw IoError("Failed to create staging directory", directory, ec);
  }

  for (int attempt = 0; attempt < MAX_ATTEMPTS; ++attempt) {
    std::filesystem::path candidate = directory / random_name();
    if (create_exclusive(candidate)) {
      path_ = std::move(candidate);
      BOOST_LOG_TRIVIAL(trace) << "StagingFile: Acquired " << path_.string();
      return;
    }
    BOOST_LOG_TRIVIAL(debug) << "StagingFile: Name collision on " << candidate.string() << ", retrying";
  }

  throw IoError("Failed to allocate a unique staging file", directory);
}

StagingFile::StagingFile(StagingFile&& other) noexcept
  : path_(std::move(other.path_)) {
  other.path_.clear();
}

StagingFile::~StagingFile() {
  if (path_.empty()) {
    return;
  }

  // The file may already be gone if it was renamed into place
  std::error_code ec;
  std::filesystem::remove(path_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "StagingFile: Failed to remove " << path_.string() << ": " << ec.message();
  } else {
    BOOST_LOG_TRIVIAL(trace) << "StagingFile: Released " << path_.string();
  }
}


//==============================================
// NAME GENERATION
//==============================================

std::string StagingFile::random_name() {
  std::array<unsigned char, RANDOM_BYTES> bytes{};
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    throw StoreError("StagingFile: Failed to generate random bytes");
  }
  return to_hex(bytes.data(), bytes.size());
}

bool StagingFile::create_exclusive(const std::filesystem::path& path) {
  int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
  if (fd == -1) {
    const int err = errno;
    if (err == EEXIST) {
      return false;
    }
    throw IoError("Failed to create staging file", path, std::error_code(err, std::generic_category()));
  }
  ::close(fd);
  return true;
}

} // namespace bulk::store
