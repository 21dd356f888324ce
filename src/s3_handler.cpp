#include "s3_handler.hpp"

#include "exception.hpp"
#include "s3_object_store.hpp"

#include <exception>

namespace objxfer {

namespace {

std::unique_ptr<object_store> connect(const transfer_spec& spec) {
  const protocol_spec& protocol = spec.protocol;

  credentials creds;
  creds.access_key_id = protocol.access_key_id.value_or("");
  creds.secret_access_key = protocol.secret_access_key.value_or("");
  creds.session_token = protocol.session_token;

  return std::make_unique<s3_object_store>(
      creds, protocol.region_name.value_or(""), protocol.endpoint_url.value_or(""));
}

}  // namespace

s3_handler::s3_handler(const transfer_spec& spec, const logger& log)
    : s3_handler(spec.resolve(), connect(spec.resolve()), log) {}

s3_handler::s3_handler(const transfer_spec& spec, std::unique_ptr<object_store> store, const logger& log)
    : _spec(spec),
      _log(log.child("s3")),
      _store(std::move(store)),
      _lister(*_store, _spec.bucket, _log),
      _executor(*_store, _spec.bucket, _spec.directory, _spec.protocol.bucket_owner_full_control, _log),
      _disposition(*_store, _spec.bucket, _log) {
  _spec.validate();
}

s3_handler::~s3_handler() {
  try {
    tidy();
  }
  catch (const std::exception& e) {
    _log.warn() << "failed to close client: " << e.what();
  }
}

void s3_handler::check_open() const {
  if (_tidy) {
    throw exception("s3 handler for bucket " + _spec.bucket + " has been tidied");
  }
}

bool s3_handler::supports_native_copy(const remote_handler& destination) const {
  return destination.type() == backend_type::s3;
}

list_result s3_handler::list_files(const std::string& directory, const std::string& pattern) {
  check_open();
  return _lister.list(directory, pattern);
}

int s3_handler::push_files_from_worker(const std::filesystem::path& staging_dir) {
  check_open();
  return _executor.upload(staging_dir);
}

int s3_handler::pull_files_to_worker(const std::vector<std::string>& files, const std::filesystem::path& staging_dir) {
  check_open();
  return _executor.download(files, staging_dir);
}

int s3_handler::transfer_files(const std::vector<std::string>& files, remote_handler& destination) {
  check_open();
  if (!supports_native_copy(destination)) {
    throw unsupported_operation(
        std::string("transfer from ") + to_string(type()) + " to " + to_string(destination.type()) +
        " is not supported");
  }
  return _executor.copy(files, destination.spec().bucket, destination.spec().directory);
}

int s3_handler::handle_post_copy_action(const std::vector<std::string>& files) {
  check_open();
  return _disposition.apply(files, _spec.post_copy);
}

int s3_handler::move_files_to_final_location(const std::vector<std::string>&) {
  throw unsupported_operation("s3_handler::move_files_to_final_location is not implemented");
}

void s3_handler::tidy() {
  if (_tidy) {
    return;
  }
  _tidy = true;
  _store->close();
}

}  // namespace objxfer
