#include "remote_object.hpp"

#include <string>

namespace objxfer {

std::string key_basename(const std::string& key) {
  size_t pos = key.find_last_of('/');
  if (pos == std::string::npos) return key;
  return key.substr(pos + 1);
}

std::string join_key(const std::string& prefix, const std::string& name) {
  if (prefix.empty() || prefix.back() == '/') {
    return prefix + name;
  }
  return prefix + "/" + name;
}

}  // namespace objxfer
