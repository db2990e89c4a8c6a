#pragma once

#include <functional>
#include <sstream>
#include <string>
#include <utility>

namespace repostore {

// A string stream that hands its whole content to a commit function when
// destroyed, so that a record built piecewise is written in one piece.

class commit_ostream : public std::ostringstream {
  std::function<void(const std::string&)> _commit;

 public:
  commit_ostream() = default;

  explicit commit_ostream(std::function<void(const std::string&)> commit) : _commit(std::move(commit)) {}

  commit_ostream(commit_ostream&& other) : std::ostringstream(std::move(other)), _commit(std::move(other._commit)) {
    other._commit = nullptr;
  }

  ~commit_ostream() override {
    if (_commit) {
      _commit(str());
    }
  }
};

}  // namespace repostore
