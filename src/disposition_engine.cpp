#include "disposition_engine.hpp"

#include "remote_object.hpp"

#include <algorithm>
#include <exception>
#include <regex>

namespace objxfer {

disposition_engine::disposition_engine(object_store& store, const std::string& bucket, const logger& log)
    : _store(store), _bucket(bucket), _log(log.child("post-copy")) {}

std::string disposition_engine::destination_key(const std::string& key, const post_copy_action& action) {
  if (action.action == post_copy_action_type::rename) {
    return destination_key(key, action, std::regex(action.pattern));
  }
  return join_key(action.destination, key_basename(key));
}

std::string disposition_engine::destination_key(
    const std::string& key, const post_copy_action& action, const std::regex& pattern) {
  std::string name = key_basename(key);
  if (action.action == post_copy_action_type::rename) {
    name = std::regex_replace(name, pattern, action.sub);
  }
  return join_key(action.destination, name);
}

int disposition_engine::apply(const std::vector<std::string>& keys, const post_copy_action& action) {
  switch (action.action) {
    case post_copy_action_type::none:
      return 0;
    case post_copy_action_type::remove:
      return remove(keys);
    case post_copy_action_type::move:
    case post_copy_action_type::rename:
      return relocate(keys, action);
  }
  return 0;
}

int disposition_engine::remove(const std::vector<std::string>& keys) {
  int result = 0;

  for (size_t begin = 0; begin < keys.size(); begin += max_keys_per_delete) {
    size_t end = std::min(keys.size(), begin + max_keys_per_delete);
    std::vector<std::string> batch(keys.begin() + begin, keys.begin() + end);

    _log.debug() << "deleting " << batch.size() << " objects from s3://" << _bucket;
    try {
      for (const auto& failure : _store.delete_objects(_bucket, batch)) {
        _log.error() << "failed to delete file: " << failure.key << ": " << failure.code << ": " << failure.message;
        result = 1;
      }
    }
    catch (const std::exception& e) {
      _log.error() << "failed to delete files: " << e.what();
      result = 1;
    }
  }

  return result;
}

int disposition_engine::relocate(const std::vector<std::string>& keys, const post_copy_action& action) {
  std::regex pattern;
  if (action.action == post_copy_action_type::rename) {
    try {
      pattern = std::regex(action.pattern);
    }
    catch (const std::regex_error& e) {
      _log.error() << "invalid rename pattern: " << action.pattern << ": " << e.what();
      return 1;
    }
  }

  int result = 0;

  for (const auto& key : keys) {
    std::string new_key = destination_key(key, action, pattern);

    _log.debug() << to_string(action.action) << " s3://" << _bucket << "/" << key << " to s3://" << _bucket << "/"
                 << new_key;
    try {
      _store.copy_object(_bucket, key, _bucket, new_key);
    }
    catch (const std::exception& e) {
      _log.error() << "failed to copy file: " << key << " to " << new_key << ": " << e.what();
      result = 1;
      continue;
    }

    try {
      auto failures = _store.delete_objects(_bucket, {key});
      for (const auto& failure : failures) {
        _log.error() << "failed to delete file: " << failure.key << ": " << failure.code << ": " << failure.message;
        result = 1;
      }
    }
    catch (const std::exception& e) {
      _log.error() << "failed to delete file: " << key << ": " << e.what();
      result = 1;
    }
  }

  return result;
}

}  // namespace objxfer
