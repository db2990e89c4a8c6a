#pragma once

#include "descriptor.hpp"
#include "remote.hpp"

#include <string>
#include <vector>

namespace repostore {

// Enumerates the files below a remote directory.
class tree_walker {
  remote& _remote;

 public:
  explicit tree_walker(remote& remote) : _remote(remote) {}

  // Returns all files below the given directory, depth first, in the order
  // the remote lists them. Directories are descended into but not returned.
  // A failure to list any directory aborts the whole walk.
  std::vector<file_descriptor> walk(const std::string& root);
};

}  // namespace repostore
