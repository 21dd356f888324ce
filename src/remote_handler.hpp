#pragma once

#include "log.hpp"
#include "remote_object.hpp"
#include "transfer_spec.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace objxfer {

enum class backend_type {
  s3,
  local,
};

const char* to_string(backend_type type);

// Transfer endpoint.
// One handler is created per task run and owns its backend connection until
// tidy() is called or the handler is destroyed.
class remote_handler {
 public:
  // Creates the handler for the backend named in the transfer spec
  static std::unique_ptr<remote_handler> create(const transfer_spec& spec, const logger& log);

  virtual ~remote_handler() = default;

  // Backend implemented by this handler
  virtual backend_type type() const = 0;

  // Returns true if files can be copied to the destination handler by the
  // backend itself, without staging through the local disk.
  virtual bool supports_native_copy(const remote_handler& destination) const;

  // Lists the files under the directory whose base name fully matches the
  // pattern. Returns std::nullopt if nothing exists under the directory.
  virtual list_result list_files(const std::string& directory = "", const std::string& pattern = "") = 0;

  // Uploads every file of the local staging directory.
  // Returns 0 if all files were transferred, non-zero otherwise.
  virtual int push_files_from_worker(const std::filesystem::path& staging_dir) = 0;

  // Downloads the files into the local staging directory.
  // Returns 0 if all files were transferred, non-zero otherwise.
  virtual int pull_files_to_worker(const std::vector<std::string>& files, const std::filesystem::path& staging_dir) = 0;

  // Copies the files directly to the destination handler.
  // Throws unsupported_operation unless supports_native_copy(destination).
  virtual int transfer_files(const std::vector<std::string>& files, remote_handler& destination) = 0;

  // Applies the post copy action of the transfer spec to transferred files.
  // Returns 0 if the action succeeded for all files, non-zero otherwise.
  virtual int handle_post_copy_action(const std::vector<std::string>& files) = 0;

  // Moves files from an intermediate location to their final name.
  // Only meaningful for backends that stage uploads.
  virtual int move_files_to_final_location(const std::vector<std::string>& files) = 0;

  // Releases backend connections. Safe to call more than once.
  virtual void tidy() = 0;

  // Specification the handler was created with
  virtual const transfer_spec& spec() const = 0;
};

}  // namespace objxfer
