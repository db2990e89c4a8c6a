#pragma once

#include <cstddef>
#include <cstdio>
#include <filesystem>
#include <ostream>

namespace repostore {

// A writable destination for a stream of bytes.
// A sink is finished either by close(), which returns only once every byte
// written has been handed to the destination, or by abort(), which discards
// whatever the destination allows to be discarded.
class sink {
 public:
  virtual ~sink() = default;

  virtual void write(const void* data, size_t size) = 0;

  // Flush and complete the destination. Throws if that fails.
  virtual void close() = 0;

  // Give up on the destination. Never throws.
  virtual void abort() noexcept = 0;
};

// Writes to a temporary file in the target directory and renames it to the
// target path on close. Nothing appears at the target path unless close succeeds.
class file_sink : public sink {
  std::filesystem::path _path;
  std::filesystem::path _temp_path;
  FILE* _file = nullptr;
  bool _done = false;

 public:
  explicit file_sink(const std::filesystem::path& path);
  ~file_sink() override;

  file_sink(const file_sink&) = delete;
  file_sink& operator=(const file_sink&) = delete;

  void write(const void* data, size_t size) override;
  void close() override;
  void abort() noexcept override;

  const std::filesystem::path& path() const { return _path; }
};

// Writes to an existing output stream, such as stdout.
class ostream_sink : public sink {
  std::ostream& _stream;

 public:
  explicit ostream_sink(std::ostream& stream) : _stream(stream) {}

  void write(const void* data, size_t size) override;
  void close() override;
  void abort() noexcept override;
};

}  // namespace repostore
