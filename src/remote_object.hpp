#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace objxfer {

// Object found by a listing
struct remote_object {
  using time_type = std::chrono::system_clock::time_point;

  std::string key;          // Full path within the store
  uint64_t size = 0;        // Size in bytes
  time_type modified_time;  // Last modification
};

// Result of one listing, keyed by the full object key
using remote_file_set = std::map<std::string, remote_object>;

// Listing result.
// std::nullopt means that nothing at all exists under the prefix, while an
// empty set means that objects exist but none matched the pattern.
using list_result = std::optional<remote_file_set>;

// Returns the final path segment of a key or path
std::string key_basename(const std::string& key);

// Joins a prefix and a name with a single '/'.
// The separator is omitted if the prefix is empty or already ends with '/'.
std::string join_key(const std::string& prefix, const std::string& name);

}  // namespace objxfer
