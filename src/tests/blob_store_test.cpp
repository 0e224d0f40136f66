#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>
#include <thread>
#include <vector>
#include <sys/stat.h>
#include "store/blob_store.hpp"
#include "test_utils.hpp"

using namespace bulk::store;

namespace {
const std::string HELLO_SHA256 = "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824";

// Store whose write primitives can be made to misbehave
class FaultyBlobStore : public BlobStore {
public:
  enum class CopyFault { NONE, FAIL_MIDWAY, ALTER_CONTENT, RACE_OTHER_WRITER };

  explicit FaultyBlobStore(const std::filesystem::path& root) : BlobStore(root) {}

  CopyFault copy_fault = CopyFault::NONE;
  bool hard_links = true;
  mutable ino_t rival_inode = 0;

protected:
  void copy_content(const std::filesystem::path& source, const std::filesystem::path& target) const override {
    switch (copy_fault) {
    case CopyFault::FAIL_MIDWAY:
      write_file(target, "trunc");
      throw IoError("Disk full", target);
    case CopyFault::ALTER_CONTENT:
      write_file(target, "changed under our feet");
      return;
    case CopyFault::RACE_OTHER_WRITER: {
      // Another writer publishes the same content before this one does
      BlobStore rival(root());
      const Digest digest = rival.store(source);
      struct stat st{};
      if (::stat(rival.blob_path(digest).c_str(), &st) == 0) {
        rival_inode = st.st_ino;
      }
      break;
    }
    case CopyFault::NONE:
      break;
    }
    BlobStore::copy_content(source, target);
  }

  std::error_code link_blob(const std::filesystem::path& staged, const std::filesystem::path& target) const override {
    if (!hard_links) {
      return std::make_error_code(std::errc::operation_not_permitted);
    }
    return BlobStore::link_blob(staged, target);
  }
};

bool is_read_only(const std::filesystem::path& path) {
  using std::filesystem::perms;
  const auto mode = std::filesystem::status(path).permissions();
  return (mode & perms::all) == (perms::owner_read | perms::group_read | perms::others_read);
}
}

class BlobStoreTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::filesystem::path root;
  std::filesystem::path source_dir;
  std::unique_ptr<BlobStore> store;

  void SetUp() override {
    init_test_logging();
    test_dir = make_test_dir("blob_store_test");
    root = test_dir / "store";
    source_dir = test_dir / "sources";
    std::filesystem::create_directories(source_dir);
    store = std::make_unique<BlobStore>(root);
  }

  void TearDown() override {
    store.reset();
    std::filesystem::remove_all(test_dir);
  }

  std::filesystem::path make_source(const std::string& name, const std::string& content) {
    const auto path = source_dir / name;
    write_file(path, content);
    return path;
  }

  // Store a file and check it is immediately readable under its digest
  Digest store_and_verify(const std::string& name, const std::string& content) {
    const auto source = make_source(name, content);
    const Digest digest = store->store(source);
    EXPECT_EQ(digest, hash_bytes(content));
    EXPECT_TRUE(store->exists(digest));
    EXPECT_TRUE(store->verify(digest));
    EXPECT_EQ(read_file(store->blob_path(digest)), content);
    return digest;
  }
};

TEST_F(BlobStoreTest, LayoutPaths) {
  EXPECT_EQ(store->root().string(), root.string());
  EXPECT_EQ(store->blob_dir().string(), (root / "blobs").string());
  EXPECT_EQ(store->partial_dir().string(), (root / "partial").string());
  EXPECT_EQ(store->blob_path(HELLO_SHA256).string(),
            (root / "blobs" / "2cf" / HELLO_SHA256.substr(3)).string());
  // Deriving paths touches nothing
  EXPECT_FALSE(std::filesystem::exists(root));
}

TEST_F(BlobStoreTest, InitCreatesLayout) {
  store->init();
  EXPECT_TRUE(std::filesystem::is_directory(store->blob_dir()));
  EXPECT_TRUE(std::filesystem::is_directory(store->partial_dir()));
  // Idempotent
  EXPECT_NO_THROW(store->init());
}

TEST_F(BlobStoreTest, HelloScenario) {
  const auto source = make_source("hello.txt", "hello");
  const Digest digest = store->store(source);

  EXPECT_EQ(digest.hex(), HELLO_SHA256);
  const auto expected_path = root / "blobs" / "2cf" / HELLO_SHA256.substr(3);
  EXPECT_TRUE(std::filesystem::is_regular_file(expected_path));
  EXPECT_EQ(read_file(expected_path), "hello");
  EXPECT_TRUE(store->exists(HELLO_SHA256));
  EXPECT_TRUE(store->verify(HELLO_SHA256));

  // Out-of-band tampering is detected
  std::filesystem::permissions(expected_path, std::filesystem::perms::owner_write,
                               std::filesystem::perm_options::add);
  write_file(expected_path, "jello");
  EXPECT_TRUE(store->exists(HELLO_SHA256));
  EXPECT_FALSE(store->verify(HELLO_SHA256));
}

TEST_F(BlobStoreTest, RoundTripVariousContents) {
  store_and_verify("empty", "");
  store_and_verify("text", "Hello, Store!");
  store_and_verify("binary", std::string("\0\1\2\3\xff", 5));
  store_and_verify("large", std::string(1024 * 1024 + 17, 'X'));
}

TEST_F(BlobStoreTest, MissingBlobIsNotPresent) {
  EXPECT_FALSE(store->exists(HELLO_SHA256));
  EXPECT_FALSE(store->verify(HELLO_SHA256));
}

TEST_F(BlobStoreTest, DeduplicatesIdenticalContent) {
  const auto first = make_source("first", "same bytes");
  const auto second = make_source("second", "same bytes");

  const Digest digest = store->store(first);
  const auto blob = store->blob_path(digest);

  struct stat before{};
  ASSERT_EQ(::stat(blob.c_str(), &before), 0);

  // Make a rewrite observable through the modification time
  std::this_thread::sleep_for(std::chrono::milliseconds(20));

  EXPECT_EQ(store->store(second), digest);

  struct stat after{};
  ASSERT_EQ(::stat(blob.c_str(), &after), 0);
  EXPECT_EQ(before.st_ino, after.st_ino);
  EXPECT_EQ(before.st_mtim.tv_sec, after.st_mtim.tv_sec);
  EXPECT_EQ(before.st_mtim.tv_nsec, after.st_mtim.tv_nsec);
  EXPECT_EQ(count_entries(store->blob_dir() / digest.prefix()), 1u);
}

TEST_F(BlobStoreTest, PublishedBlobIsReadOnly) {
  const Digest digest = store_and_verify("ro", "immutable");
  const auto mode = std::filesystem::status(store->blob_path(digest)).permissions();
  using std::filesystem::perms;
  EXPECT_EQ(mode & perms::all, perms::owner_read | perms::group_read | perms::others_read);
}

TEST_F(BlobStoreTest, SourcePermissionsAreNotCopied) {
  const auto source = make_source("exec.sh", "#!/bin/sh\n");
  std::filesystem::permissions(source, std::filesystem::perms::all);
  const Digest digest = store->store(source);
  const auto mode = std::filesystem::status(store->blob_path(digest)).permissions();
  EXPECT_EQ(mode & std::filesystem::perms::all,
            std::filesystem::perms::owner_read | std::filesystem::perms::group_read |
            std::filesystem::perms::others_read);
}

TEST_F(BlobStoreTest, StagingAreaEmptyAfterStore) {
  store_and_verify("a", "alpha");
  store_and_verify("b", "beta");
  EXPECT_EQ(count_entries(store->partial_dir()), 0u);
}

TEST_F(BlobStoreTest, StagingAreaEmptyAfterFailedPublish) {
  const auto source = make_source("blocked", "blocked content");
  const Digest expected = hash_bytes("blocked content");

  // A directory squatting on the blob path makes the publish step fail
  std::filesystem::create_directories(store->blob_path(expected));

  EXPECT_THROW(store->store(source), IoError);
  EXPECT_EQ(count_entries(store->partial_dir()), 0u);
  EXPECT_FALSE(store->exists(expected));
}

TEST_F(BlobStoreTest, StagingAreaEmptyAfterFailedCopy) {
  FaultyBlobStore faulty(root);
  faulty.copy_fault = FaultyBlobStore::CopyFault::FAIL_MIDWAY;
  const auto source = make_source("doomed", "never fully copied");
  const Digest expected = hash_bytes("never fully copied");

  EXPECT_THROW(faulty.store(source), IoError);
  EXPECT_EQ(count_entries(store->partial_dir()), 0u);
  EXPECT_FALSE(store->exists(expected));
  EXPECT_EQ(count_entries(store->blob_dir() / expected.prefix()), 0u);
}

TEST_F(BlobStoreTest, SourceChangedDuringCopyPublishesNothing) {
  FaultyBlobStore faulty(root);
  faulty.copy_fault = FaultyBlobStore::CopyFault::ALTER_CONTENT;
  const auto source = make_source("moving", "original bytes");
  const Digest expected = hash_bytes("original bytes");

  try {
    faulty.store(source);
    FAIL() << "Expected IoError";
  } catch (const IoError& e) {
    EXPECT_NE(std::string(e.what()).find("Source changed"), std::string::npos);
    EXPECT_EQ(e.path().string(), source.string());
  }

  EXPECT_FALSE(store->exists(expected));
  EXPECT_FALSE(store->exists(hash_bytes("changed under our feet")));
  EXPECT_EQ(count_entries(store->blob_dir() / expected.prefix()), 0u);
  EXPECT_EQ(count_entries(store->partial_dir()), 0u);
}

TEST_F(BlobStoreTest, RenamePublishesReadOnlyBlob) {
  FaultyBlobStore faulty(root);
  faulty.hard_links = false;
  const auto source = make_source("hello.txt", "hello");

  const Digest digest = faulty.store(source);
  EXPECT_EQ(digest.hex(), HELLO_SHA256);
  EXPECT_TRUE(store->exists(digest));
  EXPECT_TRUE(store->verify(digest));
  EXPECT_TRUE(is_read_only(store->blob_path(digest)));
  EXPECT_EQ(count_entries(store->partial_dir()), 0u);
}

TEST_F(BlobStoreTest, RenameKeepsBlobPublishedByOtherWriter) {
  FaultyBlobStore faulty(root);
  faulty.hard_links = false;
  faulty.copy_fault = FaultyBlobStore::CopyFault::RACE_OTHER_WRITER;
  const auto source = make_source("contended", "contended bytes");

  const Digest digest = faulty.store(source);
  ASSERT_NE(faulty.rival_inode, 0u);

  struct stat st{};
  ASSERT_EQ(::stat(store->blob_path(digest).c_str(), &st), 0);
  EXPECT_EQ(st.st_ino, faulty.rival_inode);
  EXPECT_TRUE(store->verify(digest));
  EXPECT_EQ(count_entries(store->blob_dir() / digest.prefix()), 1u);
  EXPECT_EQ(count_entries(store->partial_dir()), 0u);
}

TEST_F(BlobStoreTest, RenameRefusesNonFileAtBlobPath) {
  FaultyBlobStore faulty(root);
  faulty.hard_links = false;
  const auto source = make_source("blocked", "blocked content");
  const Digest expected = hash_bytes("blocked content");
  std::filesystem::create_directories(store->blob_path(expected));

  EXPECT_THROW(faulty.store(source), IoError);
  EXPECT_TRUE(std::filesystem::is_directory(store->blob_path(expected)));
  EXPECT_EQ(count_entries(store->partial_dir()), 0u);
}

TEST_F(BlobStoreTest, UnreadableSourceThrowsIoError) {
  EXPECT_THROW(store->store(source_dir / "does_not_exist"), IoError);
  EXPECT_EQ(count_entries(store->blob_dir()), 0u);
  EXPECT_EQ(count_entries(store->partial_dir()), 0u);
}

TEST_F(BlobStoreTest, InvalidDigestsTouchNothing) {
  std::string upper = HELLO_SHA256;
  upper[5] = 'F';
  const std::vector<std::string> bad = {"", "12345", "xyz", HELLO_SHA256.substr(1), upper,
                                        "../../etc/passwd"};

  for (const auto& candidate : bad) {
    EXPECT_THROW(store->blob_path(candidate), InvalidDigestFormat) << candidate;
    EXPECT_THROW(store->exists(candidate), InvalidDigestFormat) << candidate;
    EXPECT_THROW(store->verify(candidate), InvalidDigestFormat) << candidate;
  }
  EXPECT_FALSE(std::filesystem::exists(root));
}

TEST_F(BlobStoreTest, NonFileAtBlobPathIsNotABlob) {
  std::filesystem::create_directories(store->blob_path(HELLO_SHA256));
  EXPECT_FALSE(store->exists(HELLO_SHA256));
  EXPECT_FALSE(store->verify(HELLO_SHA256));
}

TEST_F(BlobStoreTest, CleanIsNotImplemented) {
  EXPECT_THROW(store->clean(), NotImplemented);
}

TEST_F(BlobStoreTest, ErrorsShareBaseClass) {
  EXPECT_THROW(store->exists("nope"), StoreError);
  EXPECT_THROW(store->store(source_dir / "missing"), StoreError);
  EXPECT_THROW(store->clean(), StoreError);
}

TEST_F(BlobStoreTest, ConcurrentWritersConverge) {
  const size_t num_threads = 8;
  const std::string content(256 * 1024, 'c');
  std::vector<std::filesystem::path> sources;
  for (size_t i = 0; i < num_threads; ++i) {
    sources.push_back(make_source("copy_" + std::to_string(i), content));
  }

  std::vector<std::string> results(num_threads);
  std::atomic<size_t> failures{0};
  std::vector<std::thread> threads;
  for (size_t i = 0; i < num_threads; ++i) {
    threads.emplace_back([this, i, &sources, &results, &failures]() {
      try {
        // Each thread gets its own instance, as separate processes would
        BlobStore local(root);
        results[i] = local.store(sources[i]).hex();
      } catch (const StoreError&) {
        ++failures;
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(failures.load(), 0u);
  const std::string expected = hash_bytes(content).hex();
  for (const auto& result : results) {
    EXPECT_EQ(result, expected);
  }
  EXPECT_TRUE(store->verify(expected));
  EXPECT_EQ(count_entries(store->partial_dir()), 0u);
}

TEST_F(BlobStoreTest, ConcurrentRenamingWritersConverge) {
  const size_t num_threads = 8;
  const std::string content(128 * 1024, 'r');
  std::vector<std::filesystem::path> sources;
  for (size_t i = 0; i < num_threads; ++i) {
    sources.push_back(make_source("rename_" + std::to_string(i), content));
  }

  std::atomic<size_t> failures{0};
  std::vector<std::thread> threads;
  for (size_t i = 0; i < num_threads; ++i) {
    threads.emplace_back([this, i, &sources, &failures]() {
      try {
        FaultyBlobStore local(root);
        local.hard_links = false;
        local.store(sources[i]);
      } catch (const StoreError&) {
        ++failures;
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  const Digest digest = hash_bytes(content);
  EXPECT_EQ(failures.load(), 0u);
  EXPECT_TRUE(store->verify(digest));
  EXPECT_TRUE(is_read_only(store->blob_path(digest)));
  EXPECT_EQ(count_entries(store->blob_dir() / digest.prefix()), 1u);
  EXPECT_EQ(count_entries(store->partial_dir()), 0u);
}

TEST_F(BlobStoreTest, ReadersNeverSeePartialBlobs) {
  const size_t num_blobs = 16;
  std::vector<std::filesystem::path> sources;
  std::vector<Digest> digests;
  for (size_t i = 0; i < num_blobs; ++i) {
    const std::string content(512 * 1024, static_cast<char>('a' + i));
    sources.push_back(make_source("blob_" + std::to_string(i), content));
    digests.push_back(hash_bytes(content));
  }

  std::atomic<bool> writing{true};
  std::atomic<size_t> torn_reads{0};
  std::atomic<size_t> writer_failures{0};

  std::thread reader([this, &digests, &writing, &torn_reads]() {
    BlobStore observer(root);
    while (writing) {
      for (const auto& digest : digests) {
        if (observer.exists(digest) && !observer.verify(digest)) {
          ++torn_reads;
        }
      }
    }
  });

  std::thread writer([this, &sources, &writer_failures]() {
    for (const auto& source : sources) {
      try {
        store->store(source);
      } catch (const StoreError&) {
        ++writer_failures;
      }
    }
  });

  writer.join();
  writing = false;
  reader.join();

  EXPECT_EQ(writer_failures.load(), 0u);
  EXPECT_EQ(torn_reads.load(), 0u);
  for (const auto& digest : digests) {
    EXPECT_TRUE(store->verify(digest));
  }
}
