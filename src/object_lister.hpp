#pragma once

#include "log.hpp"
#include "object_store.hpp"
#include "remote_object.hpp"

#include <string>

namespace objxfer {

// Maximum number of keys requested per listing round trip
constexpr size_t max_objects_per_query = 100;

// Enumerates the objects of a bucket
class object_lister {
  object_store& _store;
  std::string _bucket;
  logger _log;

 public:
  object_lister(object_store& store, const std::string& bucket, const logger& log);

  // Lists the objects under the prefix whose base name fully matches the
  // pattern. An empty pattern matches everything.
  //
  // Returns std::nullopt if no object at all exists under the prefix.
  // Store errors are not caught.
  list_result list(const std::string& prefix = "", const std::string& pattern = "");
};

}  // namespace objxfer
