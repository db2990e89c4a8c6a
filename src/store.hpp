#pragma once

#include "descriptor.hpp"
#include "remote.hpp"
#include "sink.hpp"

#include <string>
#include <vector>

namespace repostore {

// Strip a data URI prefix ("data:<type>;base64,") from base64 content.
// Content without the prefix is returned unchanged.
std::string strip_transport_envelope(const std::string& content);

// File operations on top of a remote.
//
// Writes and deletes use optimistic concurrency: the current revision of the
// target is looked up immediately before the mutation and passed to the
// remote as a precondition. Revisions and listings are never cached, the
// remote is always authoritative. No operation retries.
class file_store {
  remote& _remote;

 public:
  explicit file_store(remote& remote) : _remote(remote) {}

  // Create or update the file <path>/<name> with base64 content.
  // If the file exists and the policy is reject, nothing is written and the
  // outcome is skipped_exists with the revision of the existing file.
  upload_outcome upload(
      const std::string& content,
      const std::string& path = "",
      const std::string& name = "uploaded_file.txt",
      overwrite_policy policy = overwrite_policy::allow);

  // Look up the metadata of <path>/<name>.
  lookup_result fetch_metadata(const std::string& path, const std::string& name);

  // Returns the inline encoded content of <path>/<name>, or if the remote
  // omitted it, the URL where the raw content can be retrieved.
  fetched_content fetch_content(const std::string& path, const std::string& name);

  // Returns the inline encoded content of <path>/<name>.
  encoded_file fetch_content_base64(const std::string& path, const std::string& name);

  // Delete <path>/<name> at its current revision.
  void delete_file(const std::string& path, const std::string& name);

  // List the immediate children of a directory.
  std::vector<file_descriptor> list_files(const std::string& path = "");

  // List all files below a directory.
  std::vector<file_descriptor> list_all_files(const std::string& path = "");

  // Write a zip archive of all files below a directory to the sink.
  // Returns the number of archive entries.
  size_t download_archive(const std::string& path, sink& out);

 private:
  // Returns the metadata of an existing file, rethrowing lookup failures.
  content_item require_file(const std::string& operation, const std::string& target);
};

}  // namespace repostore
