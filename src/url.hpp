#ifndef URL_HPP
#define URL_HPP

#include <string>
#include <vector>

namespace repostore {

class url {
  std::string _url;

 public:
  explicit url(const std::string& url) : _url(url) {}

  std::string scheme() const {
    size_t pos = _url.find("://");
    if (pos == std::string::npos) return "";
    return _url.substr(0, pos);
  }

  std::string host() const {
    size_t pos = _url.find("://");
    pos = pos == std::string::npos ? 0 : pos + 3;
    size_t end = _url.find_first_of("/?", pos);
    if (end == std::string::npos) return _url.substr(pos);
    return _url.substr(pos, end - pos);
  }

  std::string path() const {
    size_t pos = _url.find("://");
    pos = pos == std::string::npos ? 0 : pos + 3;
    size_t start = _url.find('/', pos);
    if (start == std::string::npos) return "/";
    size_t end = _url.find('?', start);
    if (end == std::string::npos) return _url.substr(start);
    return _url.substr(start, end - start);
  }

  const std::string& string() const { return _url; }

  // Returns a new url with the given repository path appended.
  // Each segment of the path is percent-encoded.
  url append(const std::string& path) const;

  // Returns a new url with a query parameter added.
  url with_query(const std::string& key, const std::string& value) const;
};

// Percent-encode everything except unreserved characters.
std::string escape(const std::string& str);

// Join repository path components with '/', skipping empty components
// and collapsing leading and trailing slashes.
std::string join_path(const std::vector<std::string>& components);

}  // namespace repostore

#endif  // URL_HPP
