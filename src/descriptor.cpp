#include "descriptor.hpp"

#include <string>

namespace repostore {

std::string to_string(entry_kind kind) {
  switch (kind) {
    case entry_kind::directory:
      return "dir";
    default:
      return "file";
  }
}

entry_kind parse_entry_kind(const std::string& type) {
  if (type == "dir") {
    return entry_kind::directory;
  }
  return entry_kind::file;
}

std::string to_string(upload_status status) {
  switch (status) {
    case upload_status::created:
      return "created";
    case upload_status::updated:
      return "updated";
    case upload_status::skipped_exists:
      return "skipped";
  }
  return "unknown";
}

}  // namespace repostore
