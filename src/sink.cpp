#include "sink.hpp"

#include "exception.hpp"
#include "filesystem.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <string>
#include <system_error>

namespace repostore {

// file_sink

file_sink::file_sink(const std::filesystem::path& path) : _path(path) {
  std::filesystem::path dir = _path.parent_path();
  if (dir.empty()) {
    dir = ".";
  }
  repostore::create_directories(dir);

  _temp_path = dir;
  _file = repostore::mkstemp(_temp_path);
  if (!_file) {
    throw repostore::exception("failed to create temporary file in: " + dir.string() + ": " + std::strerror(errno));
  }
}

file_sink::~file_sink() {
  if (!_done) {
    abort();
  }
}

void file_sink::write(const void* data, size_t size) {
  if (_done) {
    throw repostore::exception("write to finished file: " + _path.string());
  }
  if (size > 0 && fwrite(data, 1, size, _file) != size) {
    throw repostore::exception("failed to write file: " + _temp_path.string() + ": " + std::strerror(errno));
  }
}

void file_sink::close() {
  if (_done) {
    throw repostore::exception("file already finished: " + _path.string());
  }

  int flushed = fflush(_file);
  int closed = fclose(_file);
  _file = nullptr;
  if (flushed != 0 || closed != 0) {
    abort();
    throw repostore::exception("failed to flush file: " + _temp_path.string() + ": " + std::strerror(errno));
  }

  std::error_code ec;
  std::filesystem::permissions(
      _temp_path,
      std::filesystem::perms::owner_read | std::filesystem::perms::owner_write | std::filesystem::perms::group_read |
          std::filesystem::perms::others_read,
      ec);

  std::filesystem::rename(_temp_path, _path, ec);
  if (ec) {
    abort();
    throw repostore::exception("failed to rename temporary file: " + _temp_path.string() + ": " + ec.message());
  }

  _done = true;
}

void file_sink::abort() noexcept {
  if (_file) {
    fclose(_file);
    _file = nullptr;
  }

  std::error_code ec;
  std::filesystem::remove(_temp_path, ec);
  _done = true;
}

// ostream_sink

void ostream_sink::write(const void* data, size_t size) {
  _stream.write(static_cast<const char*>(data), static_cast<std::streamsize>(size));
  if (!_stream) {
    throw repostore::exception("failed to write to output stream");
  }
}

void ostream_sink::close() {
  _stream.flush();
  if (!_stream) {
    throw repostore::exception("failed to flush output stream");
  }
}

void ostream_sink::abort() noexcept {}

}  // namespace repostore
