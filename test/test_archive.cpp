#include "archive.hpp"
#include "exception.hpp"
#include "fake_remote.hpp"
#include "sink.hpp"
#include "store.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <archive.h>
#include <archive_entry.h>

using namespace repostore;
namespace fs = std::filesystem;

namespace {

using entry_list = std::vector<std::pair<std::string, std::string>>;

// Read all entries of a zip archive held in memory.
entry_list read_zip(const std::string& data) {
  entry_list entries;

  struct archive* a = archive_read_new();
  archive_read_support_format_zip(a);
  if (archive_read_open_memory(a, data.data(), data.size()) != ARCHIVE_OK) {
    std::string message = archive_error_string(a) ? archive_error_string(a) : "unknown error";
    archive_read_free(a);
    throw std::runtime_error("failed to open archive: " + message);
  }

  struct archive_entry* entry;
  while (archive_read_next_header(a, &entry) == ARCHIVE_OK) {
    std::string content;
    char buffer[4096];
    la_ssize_t n;
    while ((n = archive_read_data(a, buffer, sizeof(buffer))) > 0) {
      content.append(buffer, static_cast<size_t>(n));
    }
    entries.emplace_back(archive_entry_pathname(entry), content);
  }

  archive_read_free(a);
  return entries;
}

// Sink that fails after a number of bytes.
class failing_sink : public sink {
  size_t _remaining;

 public:
  explicit failing_sink(size_t limit) : _remaining(limit) {}

  bool closed = false;
  bool aborted = false;

  void write(const void*, size_t size) override {
    if (size > _remaining) throw repostore::exception("disk full");
    _remaining -= size;
  }
  void close() override { closed = true; }
  void abort() noexcept override { aborted = true; }
};

}  // namespace

class ArchiveTest : public ::testing::Test {
 protected:
  void SetUp() override {
    test_dir = fs::temp_directory_path() / "repostore_test_archive";
    fs::remove_all(test_dir);
  }

  void TearDown() override { fs::remove_all(test_dir); }

  std::string read_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(file), {});
  }

  fake_remote remote;
  fs::path test_dir;
};

TEST_F(ArchiveTest, DocsScenario) {
  remote.add_file("docs/a.txt", "hello");
  remote.add_file("docs/sub/b.txt", "world");

  std::ostringstream buffer;
  ostream_sink out(buffer);
  size_t count = archive_assembler(remote).assemble("docs", out);

  EXPECT_EQ(count, 2u);
  entry_list entries = read_zip(buffer.str());
  ASSERT_EQ(entries.size(), 2u);
  EXPECT_EQ(entries[0], (std::pair<std::string, std::string>{"a.txt", "hello"}));
  EXPECT_EQ(entries[1], (std::pair<std::string, std::string>{"b.txt", "world"}));
}

TEST_F(ArchiveTest, OneEntryPerFileWithRawBytes) {
  std::string binary;
  for (int i = 0; i < 256; i++) binary += static_cast<char>(i);
  std::string large(200000, 'x');

  remote.add_file("data/bin.dat", binary);
  remote.add_file("data/empty", "");
  remote.add_file("data/nested/large.txt", large);

  std::ostringstream buffer;
  ostream_sink out(buffer);
  EXPECT_EQ(archive_assembler(remote).assemble("data", out), 3u);

  entry_list entries = read_zip(buffer.str());
  ASSERT_EQ(entries.size(), 3u);
  EXPECT_EQ(entries[0].first, "bin.dat");
  EXPECT_EQ(entries[0].second, binary);
  EXPECT_EQ(entries[1].first, "empty");
  EXPECT_EQ(entries[1].second, "");
  EXPECT_EQ(entries[2].first, "large.txt");
  EXPECT_EQ(entries[2].second, large);

  // Deflate at maximum compression
  EXPECT_LT(buffer.str().size(), large.size() / 10);
}

TEST_F(ArchiveTest, FilesRetrievedInTraversalOrder) {
  remote.add_file("r/z.txt", "z");
  remote.add_file("r/d/m.txt", "m");
  remote.add_file("r/a.txt", "a");

  std::ostringstream buffer;
  ostream_sink out(buffer);
  archive_assembler(remote).assemble("r", out);

  EXPECT_EQ(
      remote.fetched, (std::vector<std::string>{"fake://raw/r/z.txt", "fake://raw/r/d/m.txt", "fake://raw/r/a.txt"}));
}

TEST_F(ArchiveTest, EmptyDirectoryTree) {
  std::ostringstream buffer;
  ostream_sink out(buffer);
  EXPECT_EQ(archive_assembler(remote).assemble("", out), 0u);

  // Only the end of central directory record
  ASSERT_EQ(buffer.str().size(), 22u);
  EXPECT_EQ(buffer.str().substr(0, 4), std::string("PK\x05\x06", 4));
}

TEST_F(ArchiveTest, RetrievalFailureAbortsJob) {
  remote.add_file("docs/a.txt", "hello");
  remote.add_file("docs/b.txt", "world");
  remote.add_file("docs/c.txt", "!");
  remote.fail_fetch.insert("fake://raw/docs/b.txt");

  fs::path output = test_dir / "output.zip";
  {
    file_sink out(output);
    EXPECT_THROW(archive_assembler(remote).assemble("docs", out), transport_error);
  }

  // Nothing after the failing file is retrieved, and no archive is left behind
  EXPECT_EQ(remote.fetched.size(), 2u);
  EXPECT_FALSE(fs::exists(output));
  EXPECT_TRUE(fs::is_empty(test_dir));
}

TEST_F(ArchiveTest, RetrievalFailureLeavesNoFinalizedArchiveInStream) {
  remote.add_file("docs/a.txt", "hello");
  remote.add_file("docs/b.txt", "world");
  remote.add_file("docs/c.txt", "!");
  remote.fail_fetch.insert("fake://raw/docs/b.txt");

  std::ostringstream buffer;
  ostream_sink out(buffer);
  EXPECT_THROW(archive_assembler(remote).assemble("docs", out), transport_error);

  // The entries written before the failure never get a central directory
  EXPECT_EQ(buffer.str().find(std::string("PK\x05\x06", 4)), std::string::npos);
  EXPECT_EQ(buffer.str().find(std::string("PK\x01\x02", 4)), std::string::npos);
}

TEST_F(ArchiveTest, FileWithoutUrlAbortsJob) {
  remote.add_file("docs/a.txt", "hello");
  remote.omit_url.insert("docs/a.txt");

  failing_sink out(1 << 20);
  EXPECT_THROW(archive_assembler(remote).assemble("docs", out), data_integrity_error);
  EXPECT_TRUE(out.aborted);
  EXPECT_FALSE(out.closed);
}

TEST_F(ArchiveTest, WalkFailureAbortsJob) {
  remote.add_file("docs/sub/a.txt", "hello");
  remote.fail_list.insert("docs/sub");

  failing_sink out(1 << 20);
  EXPECT_THROW(archive_assembler(remote).assemble("docs", out), transport_error);
  EXPECT_TRUE(out.aborted);
  EXPECT_TRUE(remote.fetched.empty());
}

TEST_F(ArchiveTest, SinkFailureSurfacesOriginalError) {
  remote.add_file("docs/a.txt", std::string(100000, 'a'));

  failing_sink out(16);
  try {
    archive_assembler(remote).assemble("docs", out);
    FAIL() << "expected failure";
  }
  catch (const repostore::exception& e) {
    EXPECT_NE(std::string(e.what()).find("disk full"), std::string::npos);
  }
  EXPECT_TRUE(out.aborted);
  EXPECT_FALSE(out.closed);
}

TEST_F(ArchiveTest, DownloadArchiveToFile) {
  remote.add_file("docs/a.txt", "hello");
  remote.add_file("docs/sub/b.txt", "world");

  fs::path output = test_dir / "downloads" / "output.zip";
  file_store store(remote);
  file_sink out(output);

  EXPECT_EQ(store.download_archive("docs", out), 2u);
  ASSERT_TRUE(fs::exists(output));

  entry_list entries = read_zip(read_file(output));
  ASSERT_EQ(entries.size(), 2u);
  EXPECT_EQ(entries[0].second, "hello");
  EXPECT_EQ(entries[1].second, "world");
}
