#pragma once

#include "log.hpp"
#include "object_store.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace objxfer {

// Moves files between a local staging directory and a bucket, or between
// two buckets of the same store.
//
// Files are transferred one after another. A failing file is logged and the
// remaining files are still attempted. Every operation returns 0 if all files
// were transferred and 1 otherwise.
class transfer_executor {
  object_store& _store;
  std::string _bucket;
  std::string _directory;
  bool _bucket_owner_full_control;
  logger _log;

 public:
  transfer_executor(
      object_store& store,
      const std::string& bucket,
      const std::string& directory,
      bool bucket_owner_full_control,
      const logger& log);

  // Uploads every file directly inside the staging directory to
  // <directory>/<file name>.
  int upload(const std::filesystem::path& staging_dir);

  // Downloads each key to <staging directory>/<base name of key>.
  int download(const std::vector<std::string>& keys, const std::filesystem::path& staging_dir);

  // Copies each key to <directory>/<base name of key> in the destination bucket
  // without going through the local disk.
  int copy(
      const std::vector<std::string>& keys,
      const std::string& destination_bucket,
      const std::string& destination_directory);
};

}  // namespace objxfer
