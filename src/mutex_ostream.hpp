#pragma once

#include <iostream>
#include <mutex>

namespace repostore {

// An output stream holding a lock on a shared mutex for its lifetime,
// so that a log line written through it is never interleaved with another.
// A default constructed stream has no buffer and discards everything.

class mutex_ostream : public std::ostream {
  std::unique_lock<std::mutex> _lock;

 public:
  mutex_ostream() : std::ostream(nullptr) {}

  // Construct a mutex_ostream from an existing std::ostream and a mutex
  mutex_ostream(std::ostream& stream, std::mutex& mutex) : std::ostream(stream.rdbuf()), _lock(mutex) {}

  // Move constructor
  mutex_ostream(mutex_ostream&& other) : std::ostream(other.rdbuf()), _lock(std::move(other._lock)) {}
};

}  // namespace repostore
