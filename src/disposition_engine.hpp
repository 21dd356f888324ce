#pragma once

#include "log.hpp"
#include "object_store.hpp"
#include "transfer_spec.hpp"

#include <regex>
#include <string>
#include <vector>

namespace objxfer {

// Maximum number of keys in one DeleteObjects request
constexpr size_t max_keys_per_delete = 1000;

// Applies the post copy action to objects that have been transferred.
//
// Move and rename copy each object within the bucket and delete the
// original once the copy has succeeded. A failure between the two leaves
// both objects in place.
class disposition_engine {
  object_store& _store;
  std::string _bucket;
  logger _log;

 public:
  disposition_engine(object_store& store, const std::string& bucket, const logger& log);

  // Returns 0 if the action succeeded for all keys and 1 otherwise
  int apply(const std::vector<std::string>& keys, const post_copy_action& action);

  // Returns the key an object is moved to
  static std::string destination_key(const std::string& key, const post_copy_action& action);

  // Same as above with the rename pattern already compiled
  static std::string destination_key(
      const std::string& key, const post_copy_action& action, const std::regex& pattern);

 private:
  int remove(const std::vector<std::string>& keys);
  int relocate(const std::vector<std::string>& keys, const post_copy_action& action);
};

}  // namespace objxfer
