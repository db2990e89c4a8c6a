#include "tree_walker.hpp"

#include "log.hpp"

#include <iterator>
#include <string>
#include <utility>
#include <vector>

namespace repostore {

std::vector<file_descriptor> tree_walker::walk(const std::string& root) {
  log(log_level::debug) << "listing directory: " << (root.empty() ? "/" : root) << std::endl;

  std::vector<file_descriptor> files;
  for (auto& entry : _remote.list(root)) {
    if (entry.is_directory()) {
      std::vector<file_descriptor> children = walk(entry.path);
      files.insert(files.end(), std::make_move_iterator(children.begin()), std::make_move_iterator(children.end()));
    }
    else {
      files.push_back(std::move(entry));
    }
  }

  return files;
}

}  // namespace repostore
