#include "filesystem.hpp"

#include "exception.hpp"

#include <cstdio>
#include <filesystem>
#include <string>
#include <system_error>

#include <errno.h>
#include <stdlib.h>
#include <unistd.h>

namespace repostore {

FILE* mkstemp(std::filesystem::path& dir) {
  std::string temp_path = (dir / ".repostore-XXXXXXXXXX").string();

  // Create a temporary file
  int fd = ::mkstemp(temp_path.data());
  if (fd == -1) {
    return NULL;
  }

  FILE* file = ::fdopen(fd, "wb");
  if (!file) {
    int saved_errno = errno;
    ::close(fd);
    ::unlink(temp_path.c_str());
    errno = saved_errno;
    return NULL;
  }

  dir = std::filesystem::path(temp_path);
  return file;
}

void create_directories(const std::filesystem::path& dir) {
  if (dir.empty()) {
    return;
  }

  std::error_code ec;
  if (std::filesystem::is_directory(dir, ec)) {
    return;
  }

  std::filesystem::create_directories(dir, ec);
  if (ec) {
    throw repostore::exception("failed to create directory: " + dir.string() + ": " + ec.message());
  }
}

}  // namespace repostore
