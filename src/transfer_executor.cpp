#include "transfer_executor.hpp"

#include "filesystem.hpp"
#include "remote_object.hpp"

#include <exception>

namespace objxfer {

constexpr const char* bucket_owner_full_control_acl = "bucket-owner-full-control";

transfer_executor::transfer_executor(
    object_store& store,
    const std::string& bucket,
    const std::string& directory,
    bool bucket_owner_full_control,
    const logger& log)
    : _store(store),
      _bucket(bucket),
      _directory(directory),
      _bucket_owner_full_control(bucket_owner_full_control),
      _log(log.child("transfer")) {}

int transfer_executor::upload(const std::filesystem::path& staging_dir) {
  int result = 0;

  upload_options options;
  if (_bucket_owner_full_control) {
    options.acl = bucket_owner_full_control_acl;
  }

  for (const auto& file : staged_files(staging_dir)) {
    std::string key = join_key(_directory, file.filename().string());
    _log.debug() << "transferring file: " << file.string() << " to s3://" << _bucket << "/" << key;
    try {
      _store.upload_file(file, _bucket, key, options);
    }
    catch (const std::exception& e) {
      _log.error() << "failed to transfer file: " << file.string() << ": " << e.what();
      result = 1;
    }
  }

  return result;
}

int transfer_executor::download(const std::vector<std::string>& keys, const std::filesystem::path& staging_dir) {
  int result = 0;

  for (const auto& key : keys) {
    std::filesystem::path file = staging_dir / key_basename(key);
    _log.debug() << "transferring file: s3://" << _bucket << "/" << key << " to " << file.string();
    try {
      _store.download_file(_bucket, key, file);
    }
    catch (const std::exception& e) {
      _log.error() << "failed to transfer file: " << key << ": " << e.what();
      result = 1;
    }
  }

  return result;
}

int transfer_executor::copy(
    const std::vector<std::string>& keys,
    const std::string& destination_bucket,
    const std::string& destination_directory) {
  int result = 0;

  for (const auto& key : keys) {
    std::string destination_key = join_key(destination_directory, key_basename(key));
    _log.debug() << "transferring file: s3://" << _bucket << "/" << key << " to s3://" << destination_bucket << "/"
                 << destination_key;
    try {
      _store.copy_object(_bucket, key, destination_bucket, destination_key);
    }
    catch (const std::exception& e) {
      _log.error() << "failed to transfer file: " << key << ": " << e.what();
      result = 1;
    }
  }

  return result;
}

}  // namespace objxfer
