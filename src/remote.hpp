#pragma once

#include "descriptor.hpp"

#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace repostore {

// Result of looking up a single remote item.
// A missing item is an expected outcome and is reported as not_found,
// any other failure is captured as an error and must be rethrown by the caller.
class lookup_result {
 public:
  enum class status { found, not_found, error };

  static lookup_result make_found(content_item item);
  static lookup_result make_not_found();
  static lookup_result make_error(std::exception_ptr error);

  status state() const { return _status; }
  bool found() const { return _status == status::found; }
  bool not_found() const { return _status == status::not_found; }
  bool failed() const { return _status == status::error; }

  // Returns the item. Throws if the lookup did not find one.
  const content_item& item() const;

  // Rethrows the captured error. Does nothing unless the lookup failed.
  void rethrow() const;

 private:
  status _status = status::not_found;
  std::optional<content_item> _item;
  std::exception_ptr _error;
};

// Response of a successful write.
struct put_result {
  std::string revision;
};

struct remote_options {
  std::string api_url = "https://api.github.com";
  std::string repository;
  std::string token;
  std::string branch;
};

// Single-item access to a remote tree of files keyed by repository path.
class remote {
 public:
  static std::unique_ptr<remote> create(const remote_options& options);

  virtual ~remote() = default;

  // Look up the item at the given path.
  virtual lookup_result get(const std::string& path) = 0;

  // Write encoded content to the given path.
  // With a revision the write replaces the current item, which must still have that revision.
  // Without a revision the write creates a new item.
  virtual put_result put(
      const std::string& path,
      const std::string& message,
      const std::string& encoded_content,
      const std::optional<std::string>& revision) = 0;

  // Delete the item at the given path, which must still have the given revision.
  virtual void remove(const std::string& path, const std::string& message, const std::string& revision) = 0;

  // List the immediate children of the directory at the given path, in remote order.
  virtual std::vector<file_descriptor> list(const std::string& path) = 0;

  // Retrieve the raw bytes behind a retrieval URL.
  virtual std::string fetch_binary(const std::string& url) = 0;
};

}  // namespace repostore
