#pragma once

#include "remote_object.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace objxfer {

// One page of a ListObjectsV2 response
struct list_page {
  // Number of keys in this page as reported by the store
  size_t key_count = 0;

  std::vector<std::string> keys;

  // Absent on the last page
  std::optional<std::string> next_continuation_token;
};

// Metadata returned by HeadObject
struct object_head {
  uint64_t size = 0;
  remote_object::time_type last_modified;
};

struct upload_options {
  // Canned ACL, e.g. bucket-owner-full-control
  std::optional<std::string> acl;
};

// Key that a DeleteObjects request failed to remove
struct delete_failure {
  std::string key;
  std::string code;
  std::string message;
};

// Client of an S3 compatible object store.
// Every call blocks until the store has answered and throws remote_error on
// failure.
class object_store {
 public:
  virtual ~object_store() = default;

  // Returns up to max_keys keys under the prefix, starting at the continuation token.
  virtual list_page list_objects(
      const std::string& bucket,
      const std::string& prefix,
      size_t max_keys,
      const std::optional<std::string>& continuation_token) = 0;

  virtual object_head head_object(const std::string& bucket, const std::string& key) = 0;

  // Uploads the local file to bucket/key.
  virtual void upload_file(
      const std::filesystem::path& path,
      const std::string& bucket,
      const std::string& key,
      const upload_options& options) = 0;

  // Downloads bucket/key and writes it to the given local path.
  virtual void download_file(const std::string& bucket, const std::string& key, const std::filesystem::path& path) = 0;

  // Server side copy.
  virtual void copy_object(
      const std::string& source_bucket,
      const std::string& source_key,
      const std::string& bucket,
      const std::string& key) = 0;

  // Deletes the keys with a single quiet request.
  // Returns the keys the store reported as not deleted.
  virtual std::vector<delete_failure> delete_objects(const std::string& bucket, const std::vector<std::string>& keys) = 0;

  // Releases connections. The client must not be used afterwards.
  virtual void close() = 0;
};

}  // namespace objxfer
