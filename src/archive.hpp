#pragma once

#include "remote.hpp"
#include "sink.hpp"

#include <string>

namespace repostore {

// Packages the files below a remote directory into a zip archive.
//
// Files are retrieved one at a time, in traversal order, and appended to a
// single archive stream, so at most one file's content is held in memory.
// A failure at any point aborts the sink; no partial archive is completed.
class archive_assembler {
  remote& _remote;

 public:
  explicit archive_assembler(remote& remote) : _remote(remote) {}

  // Write an archive of all files below root to the sink.
  // Each entry is named after the file's name. Returns once the sink has
  // been closed, with the number of entries written.
  size_t assemble(const std::string& root, sink& out);
};

}  // namespace repostore
