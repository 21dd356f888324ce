#include "object_lister.hpp"

#include <optional>
#include <regex>

namespace objxfer {

object_lister::object_lister(object_store& store, const std::string& bucket, const logger& log)
    : _store(store), _bucket(bucket), _log(log.child("lister")) {}

list_result object_lister::list(const std::string& prefix, const std::string& pattern) {
  std::optional<std::regex> filter;
  if (!pattern.empty()) {
    filter.emplace(pattern);
  }

  remote_file_set files;
  std::optional<std::string> token;

  while (true) {
    list_page page = _store.list_objects(_bucket, prefix, max_objects_per_query, token);
    if (page.key_count == 0) {
      if (token) {
        break;
      }
      _log.debug() << "no objects found under s3://" << _bucket << "/" << prefix;
      return std::nullopt;
    }

    for (const auto& key : page.keys) {
      std::string filename = key_basename(key);
      _log.debug() << "found file: " << filename;

      if (filter && !std::regex_match(filename, *filter)) {
        continue;
      }

      object_head head = _store.head_object(_bucket, key);
      files[key] = remote_object{key, head.size, head.last_modified};
    }

    // The last page carries no continuation token
    if (!page.next_continuation_token) {
      break;
    }
    token = page.next_continuation_token;
  }

  return files;
}

}  // namespace objxfer
