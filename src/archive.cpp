#include "archive.hpp"

#include "exception.hpp"
#include "log.hpp"
#include "tree_walker.hpp"

#include <cerrno>
#include <ctime>
#include <exception>
#include <string>
#include <vector>

#include <archive.h>
#include <archive_entry.h>

namespace repostore {

namespace {

// Streaming zip writer bound to a sink.
class zip_writer {
  struct archive* _archive;
  sink& _sink;
  std::exception_ptr _sink_error;
  bool _finished = false;

 public:
  explicit zip_writer(sink& out) : _archive(archive_write_new()), _sink(out) {
    if (!_archive) {
      throw repostore::exception("failed to initialize libarchive");
    }
    try {
      check(archive_write_set_format_zip(_archive), "failed to select zip format");
      check(
          archive_write_set_options(_archive, "zip:compression=deflate,zip:compression-level=9"),
          "failed to set zip compression");
      // disable internal buffering
      check(archive_write_set_bytes_per_block(_archive, 0), "failed to set block size");
      check(
          archive_write_open(_archive, this, nullptr, zip_writer::callback_write, nullptr), "failed to open archive");
    }
    catch (...) {
      archive_write_free(_archive);
      throw;
    }
  }

  ~zip_writer() {
    if (!_archive) return;
    // An unfinished archive must not get a central directory written on free
    if (!_finished) archive_write_fail(_archive);
    archive_write_free(_archive);
  }

  zip_writer(const zip_writer&) = delete;
  zip_writer& operator=(const zip_writer&) = delete;

  void add(const std::string& name, const std::string& data) {
    struct archive_entry* entry = archive_entry_new();
    if (!entry) {
      throw repostore::exception("failed to allocate archive entry");
    }
    archive_entry_set_pathname(entry, name.c_str());
    archive_entry_set_filetype(entry, AE_IFREG);
    archive_entry_set_perm(entry, 0644);
    archive_entry_set_size(entry, static_cast<la_int64_t>(data.size()));
    archive_entry_set_mtime(entry, std::time(nullptr), 0);

    int err = archive_write_header(_archive, entry);
    archive_entry_free(entry);
    check(err, "failed to write archive entry: " + name);

    if (!data.empty()) {
      la_ssize_t written = archive_write_data(_archive, data.data(), data.size());
      if (written < 0 || static_cast<size_t>(written) != data.size()) {
        check(ARCHIVE_FATAL, "failed to write archive data: " + name);
      }
    }
    check(archive_write_finish_entry(_archive), "failed to finish archive entry: " + name);
  }

  // Write the central directory and release the sink.
  void finish() {
    _finished = true;
    check(archive_write_close(_archive), "failed to finalize archive");
  }

 private:
  void check(int err, const std::string& reason) {
    if (err >= ARCHIVE_WARN) {
      return;
    }
    // A failing sink surfaces as a libarchive error; report the original cause
    if (_sink_error) {
      std::rethrow_exception(_sink_error);
    }
    const char* message = archive_error_string(_archive);
    throw repostore::exception(reason + ": " + (message ? message : "unknown error"));
  }

  static la_ssize_t callback_write(struct archive* archive, void* self, const void* buffer, size_t length) {
    auto writer = static_cast<zip_writer*>(self);
    try {
      writer->_sink.write(buffer, length);
      return static_cast<la_ssize_t>(length);
    }
    catch (const std::exception& e) {
      writer->_sink_error = std::current_exception();
      archive_set_error(archive, EIO, "%s", e.what());
      return -1;
    }
  }
};

}  // namespace

size_t archive_assembler::assemble(const std::string& root, sink& out) {
  size_t entries = 0;

  try {
    std::vector<file_descriptor> files = tree_walker(_remote).walk(root);
    log(log_level::debug) << "archiving " << files.size() << " files from: " << (root.empty() ? "/" : root)
                          << std::endl;

    zip_writer writer(out);
    for (const auto& file : files) {
      if (!file.url) {
        throw data_integrity_error("archive: " + file.path + ": download URL not found");
      }

      std::string data = _remote.fetch_binary(*file.url);
      writer.add(file.name, data);
      entries++;
    }

    writer.finish();
    out.close();
  }
  catch (const std::exception&) {
    out.abort();
    throw;
  }

  log(log_level::info) << "archived " << entries << " files from: " << (root.empty() ? "/" : root) << std::endl;
  return entries;
}

}  // namespace repostore
