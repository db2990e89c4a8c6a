#include "store.hpp"

#include "archive.hpp"
#include "exception.hpp"
#include "log.hpp"
#include "tree_walker.hpp"
#include "url.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace repostore {

namespace {

const std::string _envelope_prefix = "data:";
const std::string _envelope_marker = "base64,";

void require_name(const std::string& operation, const std::string& name) {
  if (name.empty()) {
    throw std::invalid_argument(operation + ": file name is required");
  }
}

}  // namespace

std::string strip_transport_envelope(const std::string& content) {
  if (content.compare(0, _envelope_prefix.size(), _envelope_prefix) != 0) {
    return content;
  }

  size_t pos = content.find(_envelope_marker);
  if (pos == std::string::npos) {
    throw std::invalid_argument("data URI content is not base64 encoded");
  }

  return content.substr(pos + _envelope_marker.size());
}

upload_outcome file_store::upload(
    const std::string& content, const std::string& path, const std::string& name, overwrite_policy policy) {
  if (content.empty()) {
    throw std::invalid_argument("upload: content is required");
  }
  require_name("upload", name);

  std::string payload = strip_transport_envelope(content);
  std::string target = join_path({path, name});

  lookup_result existing = _remote.get(target);
  if (existing.failed()) {
    existing.rethrow();
  }

  if (existing.found()) {
    const content_item& item = existing.item();
    if (item.kind == entry_kind::directory) {
      throw data_integrity_error("upload: " + target + ": is a directory");
    }

    if (policy == overwrite_policy::reject) {
      log(log_level::info) << "skipping existing file: " << target << std::endl;
      return upload_outcome{upload_status::skipped_exists, item.revision};
    }

    put_result result = _remote.put(target, "Update " + name, payload, item.revision);
    log(log_level::info) << "updated file: " << target << " " << result.revision << std::endl;
    return upload_outcome{upload_status::updated, result.revision};
  }

  put_result result = _remote.put(target, "Upload " + name, payload, std::nullopt);
  log(log_level::info) << "created file: " << target << " " << result.revision << std::endl;
  return upload_outcome{upload_status::created, result.revision};
}

lookup_result file_store::fetch_metadata(const std::string& path, const std::string& name) {
  require_name("get", name);
  return _remote.get(join_path({path, name}));
}

content_item file_store::require_file(const std::string& operation, const std::string& target) {
  lookup_result existing = _remote.get(target);
  switch (existing.state()) {
    case lookup_result::status::error:
      existing.rethrow();
      break;
    case lookup_result::status::not_found:
      throw not_found(operation + ": " + target + ": not found");
    case lookup_result::status::found:
      break;
  }

  const content_item& item = existing.item();
  if (item.kind == entry_kind::directory) {
    throw data_integrity_error(operation + ": " + target + ": is a directory");
  }
  return item;
}

fetched_content file_store::fetch_content(const std::string& path, const std::string& name) {
  require_name("download", name);
  std::string target = join_path({path, name});
  content_item item = require_file("download", target);

  fetched_content content;
  if (item.encoded_content) {
    content.encoded_content = item.encoded_content;
  }
  else if (item.url) {
    content.url = item.url;
  }
  else {
    throw data_integrity_error("download: " + target + ": file content or download URL not found");
  }
  return content;
}

encoded_file file_store::fetch_content_base64(const std::string& path, const std::string& name) {
  require_name("download", name);
  std::string target = join_path({path, name});
  content_item item = require_file("download", target);

  if (!item.encoded_content) {
    throw data_integrity_error("download: " + target + ": file content not available inline");
  }
  return encoded_file{*item.encoded_content, name};
}

void file_store::delete_file(const std::string& path, const std::string& name) {
  require_name("delete", name);
  std::string target = join_path({path, name});
  content_item item = require_file("delete", target);

  _remote.remove(target, "Delete " + name, item.revision);
  log(log_level::info) << "deleted file: " << target << std::endl;
}

std::vector<file_descriptor> file_store::list_files(const std::string& path) { return _remote.list(path); }

std::vector<file_descriptor> file_store::list_all_files(const std::string& path) {
  return tree_walker(_remote).walk(path);
}

size_t file_store::download_archive(const std::string& path, sink& out) {
  return archive_assembler(_remote).assemble(path, out);
}

}  // namespace repostore
