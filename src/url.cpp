#include "url.hpp"

#include <cctype>
#include <cstdio>
#include <string>
#include <vector>

namespace repostore {

std::string escape(const std::string& str) {
  std::string escaped;
  escaped.reserve(str.size());

  for (unsigned char c : str) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      escaped += static_cast<char>(c);
    }
    else {
      char buf[4];
      std::snprintf(buf, sizeof(buf), "%%%02X", c);
      escaped += buf;
    }
  }

  return escaped;
}

std::string join_path(const std::vector<std::string>& components) {
  std::string joined;

  for (const auto& component : components) {
    size_t start = 0;
    while (start < component.size()) {
      size_t end = component.find('/', start);
      if (end == std::string::npos) end = component.size();
      if (end > start) {
        if (!joined.empty()) joined += '/';
        joined += component.substr(start, end - start);
      }
      start = end + 1;
    }
  }

  return joined;
}

url url::append(const std::string& path) const {
  std::string result = _url;
  while (!result.empty() && result.back() == '/') {
    result.pop_back();
  }

  std::string normalized = join_path({path});
  size_t start = 0;
  while (start < normalized.size()) {
    size_t end = normalized.find('/', start);
    if (end == std::string::npos) end = normalized.size();
    result += '/';
    result += escape(normalized.substr(start, end - start));
    start = end + 1;
  }

  return url(result);
}

url url::with_query(const std::string& key, const std::string& value) const {
  char separator = _url.find('?') == std::string::npos ? '?' : '&';
  return url(_url + separator + escape(key) + "=" + escape(value));
}

}  // namespace repostore
