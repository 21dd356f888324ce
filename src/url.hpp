#ifndef OBJXFER_URL_HPP
#define OBJXFER_URL_HPP

#include <string>

namespace objxfer {

class url {
  std::string _url;

  // Offset of the authority component
  size_t authority() const {
    size_t pos = _url.find("://");
    if (pos == std::string::npos) return 0;
    return pos + 3;
  }

 public:
  url() = default;
  explicit url(const std::string& url) : _url(url) {
    // Drop trailing slashes so that paths can be appended
    while (_url.size() > 1 && _url.back() == '/' && _url.size() > authority()) {
      _url.pop_back();
    }
  }

  bool empty() const { return _url.empty(); }

  const std::string& string() const { return _url; }

  std::string scheme() const {
    size_t pos = _url.find("://");
    if (pos == std::string::npos) return "";
    return _url.substr(0, pos);
  }

  std::string host() const {
    size_t pos = authority();
    size_t end = _url.find("/", pos);
    if (end == std::string::npos) return _url.substr(pos);
    return _url.substr(pos, end - pos);
  }

  std::string path() const {
    size_t end = _url.find("/", authority());
    if (end == std::string::npos) return "/";
    return _url.substr(end);
  }

  // Scheme and host, without any path
  std::string origin() const {
    std::string s = scheme();
    return (s.empty() ? "https" : s) + "://" + host();
  }
};

}  // namespace objxfer

#endif  // OBJXFER_URL_HPP
