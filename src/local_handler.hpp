#pragma once

#include "remote_handler.hpp"

namespace objxfer {

// Transfer endpoint backed by a directory on the local disk.
// Files are identified by their path.
class local_handler : public remote_handler {
  const transfer_spec _spec;
  logger _log;

 public:
  local_handler(const transfer_spec& spec, const logger& log);

  backend_type type() const override { return backend_type::local; }
  bool supports_native_copy(const remote_handler& destination) const override;

  // Lists the given directory, or the directory of the transfer spec
  list_result list_files(const std::string& directory = "", const std::string& pattern = "") override;
  int push_files_from_worker(const std::filesystem::path& staging_dir) override;
  int pull_files_to_worker(const std::vector<std::string>& files, const std::filesystem::path& staging_dir) override;
  int transfer_files(const std::vector<std::string>& files, remote_handler& destination) override;
  // A relative move or rename destination is taken relative to the directory
  // of the transfer spec
  int handle_post_copy_action(const std::vector<std::string>& files) override;
  int move_files_to_final_location(const std::vector<std::string>& files) override;
  void tidy() override {}

  const transfer_spec& spec() const override { return _spec; }

 private:
  // Copies each file into the directory, returns 0 if all succeeded
  int copy_files(const std::vector<std::filesystem::path>& files, const std::filesystem::path& directory);
};

}  // namespace objxfer
