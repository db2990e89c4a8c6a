#include "remote.hpp"

#include "exception.hpp"
#include "remote_github.hpp"
#include "url.hpp"

#include <memory>
#include <stdexcept>
#include <utility>

namespace repostore {

// lookup_result

lookup_result lookup_result::make_found(content_item item) {
  lookup_result result;
  result._status = status::found;
  result._item = std::move(item);
  return result;
}

lookup_result lookup_result::make_not_found() {
  lookup_result result;
  result._status = status::not_found;
  return result;
}

lookup_result lookup_result::make_error(std::exception_ptr error) {
  lookup_result result;
  result._status = status::error;
  result._error = error;
  return result;
}

const content_item& lookup_result::item() const {
  rethrow();
  if (!_item) {
    throw repostore::not_found("item not found");
  }
  return *_item;
}

void lookup_result::rethrow() const {
  if (_status == status::error && _error) {
    std::rethrow_exception(_error);
  }
}

// remote::create

std::unique_ptr<remote> remote::create(const remote_options& options) {
  if (options.repository.empty()) {
    throw std::invalid_argument("repository is required");
  }
  if (options.token.empty()) {
    throw std::invalid_argument("token is required");
  }

  url address(options.api_url);
  if (address.scheme() == "http" || address.scheme() == "https") {
    return std::make_unique<remote_github>(options);
  }

  throw std::invalid_argument("unsupported remote scheme: " + address.scheme());
}

}  // namespace repostore
