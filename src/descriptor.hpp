#ifndef DESCRIPTOR_HPP
#define DESCRIPTOR_HPP

#include <optional>
#include <string>

namespace repostore {

enum class entry_kind {
  file,
  directory,
};

// Returns "file" or "dir", the names used by the remote API.
std::string to_string(entry_kind kind);

// Parses a remote entry type. Anything but "dir" is treated as a file.
entry_kind parse_entry_kind(const std::string& type);

// A single entry of a remote listing.
// The revision is an opaque token used only as a write precondition.
struct file_descriptor {
  std::string name;
  std::string path;
  entry_kind kind = entry_kind::file;
  std::string revision;
  std::optional<std::string> url;

  bool is_file() const { return kind == entry_kind::file; }
  bool is_directory() const { return kind == entry_kind::directory; }
};

// Metadata of a single remote item as returned by a lookup.
// Large files may come without inline content, only with a retrieval URL.
struct content_item {
  entry_kind kind = entry_kind::file;
  std::string revision;
  std::optional<std::string> encoded_content;
  std::optional<std::string> url;
};

enum class overwrite_policy {
  allow,
  reject,
};

enum class upload_status {
  created,
  updated,
  skipped_exists,
};

std::string to_string(upload_status status);

struct upload_outcome {
  upload_status status;
  std::string revision;
};

// Content of a file, either inline and base64 encoded, or as a URL.
// Exactly one of the two is set.
struct fetched_content {
  std::optional<std::string> encoded_content;
  std::optional<std::string> url;
};

// Inline encoded content of a file together with its name.
struct encoded_file {
  std::string content;
  std::string name;
};

}  // namespace repostore

#endif  // DESCRIPTOR_HPP
