#pragma once

#include <stdexcept>
#include <string>

namespace repostore {

class exception : public std::runtime_error {
 public:
  explicit exception(const std::string& message) : std::runtime_error(message) {}
};

// The remote item does not exist.
class not_found : public exception {
 public:
  explicit not_found(const std::string& message) : exception(message) {}
};

// The remote rejected a write or delete because the revision precondition
// did not match its current state.
class conflict_error : public exception {
 public:
  explicit conflict_error(const std::string& message) : exception(message) {}
};

// Network, authentication, rate limit or protocol failure.
// The status is the HTTP response code, or 0 if no response was received.
class transport_error : public exception {
  long _status;

 public:
  transport_error(const std::string& message, long status = 0) : exception(message), _status(status) {}

  long status() const { return _status; }
};

// The remote returned an item that cannot be used as a file.
class data_integrity_error : public exception {
 public:
  explicit data_integrity_error(const std::string& message) : exception(message) {}
};

}  // namespace repostore
